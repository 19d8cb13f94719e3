#include "notification.hpp"
#include <curl/curl.h>
#include <format>
#include <cstring>
#include <algorithm>

namespace {

struct UploadState {
    const std::string* payload;
    std::size_t offset;
};

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* state = static_cast<UploadState*>(userp);
    std::size_t remaining = state->payload->size() - state->offset;
    std::size_t count = std::min(remaining, size * nitems);
    std::memcpy(buffer, state->payload->data() + state->offset, count);
    state->offset += count;
    return count;
}

} // namespace

std::string composeMail(const std::string& from, const std::string& to, const std::string& subject, const std::string& body) {
    std::string normalized;
    for (std::size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '\n' && (i == 0 || body[i - 1] != '\r')) {
            normalized += '\r';
        }
        normalized += body[i];
    }
    return std::format("From: {}\r\nTo: {}\r\nSubject: {}\r\nContent-Type: text/plain; charset=UTF-8\r\n\r\n{}\r\n",
                       from, to, subject, normalized);
}

EmailNotificationStrategy::EmailNotificationStrategy(EmailSettings settings)
    : settings(std::move(settings)) {}

bool requiresTls(const EmailSettings& settings) {
    return !settings.password.empty();
}

std::expected<void, std::string> EmailNotificationStrategy::notify(const std::string& subject, const std::string& message) {
    if (!settings.enabled()) {
        return std::unexpected("Email notification is not configured");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    const std::string from = settings.from.empty() ? settings.to : settings.from;
    const std::string user = settings.user.empty() ? settings.to : settings.user;
    const std::string payload = composeMail(from, settings.to, subject, message);
    UploadState state{&payload, 0};

    struct curl_slist* recipients = curl_slist_append(nullptr, std::format("<{}>", settings.to).c_str());
    const std::string mailFrom = std::format("<{}>", from);

    curl_easy_setopt(curl, CURLOPT_URL, settings.smtpUrl.c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(requiresTls(settings) ? CURLUSESSL_ALL : CURLUSESSL_TRY));
    if (!settings.password.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERNAME, user.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, settings.password.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mailFrom.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &state);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to send email notification: {}", curl_easy_strerror(res)));
    }
    return {};
}
