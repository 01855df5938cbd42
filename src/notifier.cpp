/*
 * Service Monitor - Notifications
 *
 * SMTP delivery uses libcurl: implicit TLS on smtps:// by default, or
 * STARTTLS on a plain smtp:// connection when configured.
 */

#include "notifier.hpp"
#include "curl_handle.hpp"
#include "env.hpp"
#include "log.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string codes_text(const std::vector<int>& codes) {
    std::vector<std::string> parts;
    for (int c : codes) parts.push_back(std::to_string(c));
    return "[" + join(parts, ", ") + "]";
}

std::string to_crlf(const std::string& text) {
    std::string out;
    out.reserve(text.size() + text.size() / 16);
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n' && (i == 0 || text[i - 1] != '\r')) out += '\r';
        out += c;
    }
    return out;
}

// Header values must stay on one line
std::string header_value(const std::string& value) {
    std::string out = value;
    std::replace(out.begin(), out.end(), '\r', ' ');
    std::replace(out.begin(), out.end(), '\n', ' ');
    return out;
}

struct UploadSource {
    std::string data;
    size_t offset = 0;
};

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* src = static_cast<UploadSource*>(userp);
    size_t room = size * nitems;
    size_t left = src->data.size() - src->offset;
    size_t n = std::min(room, left);
    if (n > 0) {
        std::memcpy(buffer, src->data.data() + src->offset, n);
        src->offset += n;
    }
    return n;
}

class SmtpNotifier : public Notifier {
public:
    SmtpNotifier(const SmtpSettings& s, const Contacts& c) : smtp(s), contacts(c) {}

    void send(const EmailMessage& message) override {
        if (message.to.empty()) {
            throw NotifyError("No recipients for message \"" + message.subject + "\"");
        }

        auto password = Env::get("EMAIL_APP_PASSWORD");
        if (!password) {
            throw NotifyError("EMAIL_APP_PASSWORD is not set, cannot send e-mail");
        }

        std::string url = std::string(smtp.use_starttls ? "smtp://" : "smtps://") +
                          smtp.host + ":" + std::to_string(smtp.port);
        std::string mail_from = "<" + message.from + ">";

        SlistPtr rcpt;
        for (const auto& addr : message.to) {
            if (!slist_append(rcpt, "<" + addr + ">")) {
                throw NotifyError("Could not build recipient list");
            }
        }

        UploadSource upload;
        upload.data = NotificationComposer::render(message, std::time(nullptr));

        char errbuf[CURL_ERROR_SIZE];
        errbuf[0] = '\0';

        CurlPtr handle(curl_easy_init());
        if (!handle) {
            throw NotifyError("Could not initialize curl for e-mail delivery");
        }

        CURL* curl = handle.get();
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
        curl_easy_setopt(curl, CURLOPT_USERNAME, contacts.source_account.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, password->c_str());
        curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mail_from.c_str());
        curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, rcpt.get());
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
        curl_easy_setopt(curl, CURLOPT_READDATA, &upload);
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, smtp.timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            std::string reason = curl_easy_strerror(res);
            if (errbuf[0] != '\0') reason += std::string(": ") + errbuf;
            throw NotifyError("Error sending email: " + reason);
        }

        Log::info("Sent \"" + message.subject + "\" to " + join(message.to, ", "));
    }

private:
    SmtpSettings smtp;
    Contacts contacts;
};

class DryRunNotifier : public Notifier {
public:
    explicit DryRunNotifier(std::ostream& o) : out(o) {}

    // Writes exactly what would go over the wire, with LF line endings
    void send(const EmailMessage& message) override {
        std::string text = NotificationComposer::render(message, std::time(nullptr));
        text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());
        out << text << "\n" << std::endl;
        if (out.fail()) throw NotifyError("Could not write dry-run notification");
    }

private:
    std::ostream& out;
};

} // anonymous namespace

std::unique_ptr<Notifier> create_smtp_notifier(const SmtpSettings& smtp, const Contacts& contacts) {
    return std::make_unique<SmtpNotifier>(smtp, contacts);
}

std::unique_ptr<Notifier> create_dry_run_notifier(std::ostream& out) {
    return std::make_unique<DryRunNotifier>(out);
}

namespace NotificationComposer {

std::string subject_for(NotificationCategory category, const EmailMetadata& email) {
    if (category == NotificationCategory::SERVICE_DOWN) return email.subject;
    if (!email.script_subject.empty()) return email.script_subject;
    return email.subject + " (script error)";
}

std::string format_body(const NotificationRequest& request) {
    const char* label = request.category == NotificationCategory::SERVICE_DOWN ? "Got" : "Error";

    std::vector<std::string> blocks;
    for (const auto& entry : request.entries) {
        std::string name = entry.test_name;
        std::replace(name.begin(), name.end(), '_', ' ');

        std::ostringstream ss;
        ss << "Test `" << name << "`\n";
        // Run-level faults carry no test URL
        if (!entry.url.empty()) {
            ss << "\tURL: " << entry.url << "\n";
            ss << "\tExpected status codes: " << codes_text(entry.accepted_codes) << "\n";
        }
        ss << "\t" << label << ": " << entry.detail << "\n";
        blocks.push_back(ss.str());
    }
    return join(blocks, "\n");
}

EmailMessage compose(const NotificationRequest& request, const MonitorConfig& config) {
    EmailMessage message;
    message.from = config.contacts.from_address();
    message.to = request.recipients;
    message.subject = subject_for(request.category, config.email);
    message.body = format_body(request);
    return message;
}

std::string render(const EmailMessage& message, std::time_t date) {
    char date_buf[64] = "";
    std::tm local{};
    if (localtime_r(&date, &local) != nullptr) {
        std::strftime(date_buf, sizeof(date_buf), "%a, %d %b %Y %H:%M:%S %z", &local);
    }

    std::ostringstream ss;
    ss << "Date: " << date_buf << "\r\n"
       << "To: " << header_value(join(message.to, ", ")) << "\r\n"
       << "From: " << header_value(message.from) << "\r\n"
       << "Subject: " << header_value(message.subject) << "\r\n"
       << "MIME-Version: 1.0\r\n"
       << "Content-Type: text/plain; charset=utf-8\r\n"
       << "Content-Transfer-Encoding: 8bit\r\n"
       << "\r\n"
       << to_crlf(message.body);
    return ss.str();
}

} // namespace NotificationComposer

void deliver_notifications(const std::vector<NotificationRequest>& requests,
                           const MonitorConfig& config,
                           Notifier& notifier) {
    for (const auto& request : requests) {
        Log::warn(std::string(request.category == NotificationCategory::SERVICE_DOWN
                                  ? "API or service tests failed"
                                  : "Script errors occurred") +
                  ", sending alert e-mail (" + to_string(request.category) + ")");
        notifier.send(NotificationComposer::compose(request, config));
    }
}
