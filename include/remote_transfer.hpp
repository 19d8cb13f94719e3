/**
 * @file remote_transfer.hpp
 * @brief Defines remote transports for DumpVault.
 *
 * Provides the capability the sync engine needs from a remote store (list, streamed create and
 * open, remove, directory creation) and its two implementations: SFTP and a locally mounted
 * directory.
 *
 * @note Requires libssh for SFTP transfers.
 */

#ifndef REMOTE_TRANSFER_HPP
#define REMOTE_TRANSFER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <expected>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <filesystem>

namespace fs = std::filesystem;

class Reporter;

/**
 * @brief Remote store settings.
 *
 * An empty backupDir disables the remote side. An empty sshHost with a non-empty backupDir
 * selects a locally mounted directory.
 */
struct RemoteSettings {
    std::string backupDir;           ///< Remote directory holding the artifacts.
    std::string sshHost;             ///< SFTP server; empty = local directory.
    int sshPort = 22;                ///< SFTP port.
    std::string sshUser;             ///< SSH user.
    std::string sshPassword;         ///< Password authentication; may be empty.
    std::string sshKeyFile;          ///< Private key file; may be empty.
    int timeoutSeconds = 30;         ///< Connect and I/O timeout.
    std::string encryptionPassword;  ///< Empty = remote copies are not encrypted.

    bool enabled() const { return !backupDir.empty(); }
    bool usesSftp() const { return !sshHost.empty(); }
};

/**
 * @brief One regular file in a remote directory.
 */
struct RemoteEntry {
    std::string name;                               ///< File name without directory.
    std::chrono::system_clock::time_point modTime;  ///< Modification time as reported by the store.
    std::uintmax_t size = 0;                        ///< Size in bytes.
};

/**
 * @brief Streamed upload of one remote file.
 */
class RemoteWriter {
public:
    virtual ~RemoteWriter() = default;
    virtual std::expected<void, std::string> write(std::string_view data) = 0;

    /// Flushes and closes the file; a writer destroyed without close() leaves a partial file.
    virtual std::expected<void, std::string> close() = 0;
};

/**
 * @brief Streamed download of one remote file.
 */
class RemoteReader {
public:
    virtual ~RemoteReader() = default;

    /// Reads up to @p size bytes; returns 0 at end of file.
    virtual std::expected<std::size_t, std::string> read(char* buffer, std::size_t size) = 0;
};

/**
 * @brief Interface for remote stores.
 *
 * Paths use '/' separators on every platform.
 */
class RemoteTransport {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~RemoteTransport() = default;

    /**
     * @brief Creates @p dir and its missing parents; existing directories are not an error.
     */
    virtual std::expected<void, std::string> makeDirectories(const std::string& dir) = 0;

    /**
     * @brief Lists the regular files in @p dir. A missing directory yields an empty list.
     */
    virtual std::expected<std::vector<RemoteEntry>, std::string> list(const std::string& dir) = 0;

    /**
     * @brief Creates or truncates @p path for writing.
     */
    virtual std::expected<std::unique_ptr<RemoteWriter>, std::string> create(const std::string& path) = 0;

    /**
     * @brief Opens @p path for reading.
     */
    virtual std::expected<std::unique_ptr<RemoteReader>, std::string> open(const std::string& path) = 0;

    virtual std::expected<void, std::string> remove(const std::string& path) = 0;
};

/// Joins a remote directory and a file name with a single '/'.
std::string joinRemotePath(const std::string& dir, const std::string& name);

/**
 * @brief SFTP transport over one authenticated SSH session.
 *
 * The session is opened by connect() and closed by the destructor.
 */
class SftpTransport : public RemoteTransport {
public:
    /**
     * @brief Opens and authenticates the SSH session and starts the SFTP subsystem.
     *
     * Authentication tries the private key file first, then the password. A host key that is
     * not in known_hosts is reported as a warning; a changed host key is an error.
     *
     * @param settings Host, port, user, credentials and timeout.
     * @param reporter Sink for host key warnings.
     * @return std::expected<std::unique_ptr<SftpTransport>, std::string> Connected transport or an error message.
     */
    static std::expected<std::unique_ptr<SftpTransport>, std::string> connect(const RemoteSettings& settings, Reporter& reporter);

    ~SftpTransport() override;
    SftpTransport(const SftpTransport&) = delete;
    SftpTransport& operator=(const SftpTransport&) = delete;

    std::expected<void, std::string> makeDirectories(const std::string& dir) override;
    std::expected<std::vector<RemoteEntry>, std::string> list(const std::string& dir) override;
    std::expected<std::unique_ptr<RemoteWriter>, std::string> create(const std::string& path) override;
    std::expected<std::unique_ptr<RemoteReader>, std::string> open(const std::string& path) override;
    std::expected<void, std::string> remove(const std::string& path) override;

private:
    SftpTransport() = default;
    std::string lastError(const std::string& what) const;

    struct ssh_session_struct* ssh = nullptr;   ///< SSH session.
    struct sftp_session_struct* sftp = nullptr; ///< SFTP subsystem on the session.
};

/**
 * @brief Transport over a locally mounted directory (NFS, SMB, removable disk).
 */
class LocalDirectoryTransport : public RemoteTransport {
public:
    std::expected<void, std::string> makeDirectories(const std::string& dir) override;
    std::expected<std::vector<RemoteEntry>, std::string> list(const std::string& dir) override;
    std::expected<std::unique_ptr<RemoteWriter>, std::string> create(const std::string& path) override;
    std::expected<std::unique_ptr<RemoteReader>, std::string> open(const std::string& path) override;
    std::expected<void, std::string> remove(const std::string& path) override;
};

/**
 * @brief Creates the transport selected by @p settings.
 *
 * @return std::expected<std::unique_ptr<RemoteTransport>, std::string> The transport, or an error
 * if the remote side is disabled or the connection fails.
 */
std::expected<std::unique_ptr<RemoteTransport>, std::string> makeRemoteTransport(const RemoteSettings& settings, Reporter& reporter);

#endif // REMOTE_TRANSFER_HPP
