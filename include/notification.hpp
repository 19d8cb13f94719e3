/**
 * @file notification.hpp
 * @brief Defines notification strategies for DumpVault.
 *
 * Provides the interface for reporting failed backup cycles and its SMTP email implementation.
 *
 * @note Requires libcurl built with SMTP support.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <string>
#include <expected>
#include "backup_config.hpp"

/**
 * @brief Interface for notification strategies.
 *
 * Defines the contract for sending notifications about backup status.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param subject Short summary line.
     * @param message Message body.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& subject, const std::string& message) = 0;
};

/**
 * @brief Email notification strategy.
 *
 * Sends plain-text mail through an SMTP server. smtps:// URLs use implicit TLS; smtp:// URLs
 * upgrade with STARTTLS. Credentials are only sent over TLS.
 */
class EmailNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs an email notification strategy.
     *
     * @param settings Recipient, server URL and credentials.
     */
    explicit EmailNotificationStrategy(EmailSettings settings);

    /**
     * @brief Sends a notification via email.
     *
     * @param subject Mail subject.
     * @param message Mail body.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> notify(const std::string& subject, const std::string& message) override;

private:
    EmailSettings settings; ///< SMTP settings.
};

/**
 * @brief Returns true if the SMTP session must be encrypted before anything is sent.
 *
 * Holds whenever a password is configured; a server without TLS is then an error instead of a
 * cleartext login.
 */
bool requiresTls(const EmailSettings& settings);

/**
 * @brief Builds the RFC 5322 message sent by EmailNotificationStrategy.
 */
std::string composeMail(const std::string& from, const std::string& to, const std::string& subject, const std::string& body);

#endif // NOTIFICATION_HPP
