/**
 * @file reporter.hpp
 * @brief Reporting capability for DumpVault components.
 *
 * Components that need to report non-fatal conditions (skipped lines, credential
 * conflicts, failed deletions) receive a Reporter instead of writing to a log directly.
 */

#ifndef REPORTER_HPP
#define REPORTER_HPP

#include <string>
#include <mutex>

/**
 * @brief Abstract sink for informational, warning and error messages.
 */
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
};

/**
 * @brief Reporter that appends timestamped lines to log files and echoes them to the console.
 *
 * Info lines go to stdout and the log file. Warnings and errors go to stderr and the log file;
 * errors are also appended to the error log file.
 */
class LogFileReporter : public Reporter {
public:
    /**
     * @brief Constructs a reporter for the given log files.
     *
     * @param logFile Path to the general log file. Parent directories are created on first write.
     * @param errorLogFile Path to the error log file. May be empty to disable it.
     */
    LogFileReporter(const std::string& logFile, const std::string& errorLogFile);

    void info(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;

private:
    void append(const std::string& path, const std::string& entry);

    std::string logFile;       ///< General log file.
    std::string errorLogFile;  ///< Error-only log file.
    std::mutex mutex;          ///< Serializes writes from the daemon and signal paths.
};

#endif // REPORTER_HPP
