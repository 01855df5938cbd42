/*
 * Service Monitor - Notifications
 *
 * Turns notification requests into e-mails and delivers them. Delivery
 * failures throw NotifyError; there is no fallback channel.
 */

#pragma once

#include "monitor_config.hpp"
#include "probe_types.hpp"
#include <ctime>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

class NotifyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EmailMessage {
    std::string from;
    std::vector<std::string> to;
    std::string subject;
    std::string body;
};

class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void send(const EmailMessage& message) = 0;
};

// Password is read from EMAIL_APP_PASSWORD when a message is sent
std::unique_ptr<Notifier> create_smtp_notifier(const SmtpSettings& smtp, const Contacts& contacts);

// Prints messages instead of sending them
std::unique_ptr<Notifier> create_dry_run_notifier(std::ostream& out);

namespace NotificationComposer {
    EmailMessage compose(const NotificationRequest& request, const MonitorConfig& config);

    // One block per entry, in request order
    std::string format_body(const NotificationRequest& request);

    std::string subject_for(NotificationCategory category, const EmailMetadata& email);

    // RFC 5322 message text with CRLF line endings
    std::string render(const EmailMessage& message, std::time_t date);
}

// Composes and sends every request in order; the first failure propagates
void deliver_notifications(const std::vector<NotificationRequest>& requests,
                           const MonitorConfig& config,
                           Notifier& notifier);
