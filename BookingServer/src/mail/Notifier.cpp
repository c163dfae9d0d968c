#include "Notifier.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

namespace mail {

SmtpNotifier::SmtpNotifier(boost::asio::io_context& ioc, config::SmtpSettings settings)
    : ioc_(ioc), settings_(std::move(settings)), tls_(boost::asio::ssl::context::tls_client) {
    tls_.set_default_verify_paths();
    if (!settings_.configured()) {
        observability::log_warn("mail.not_configured", {{"host_set", int64_t(!settings_.host.empty())}});
    }
}

void SmtpNotifier::async_send_confirmation(const booking::Booking& b, const std::string& cancel_link, SendCallback cb) {
    send("confirmation", b.id, confirmation_message(b, settings_.from, settings_.notify, cancel_link), std::move(cb));
}

void SmtpNotifier::async_send_thank_you(const booking::Booking& b, SendCallback cb) {
    send("thank_you", b.id, thank_you_message(b, settings_.from), std::move(cb));
}

void SmtpNotifier::send(const char* kind, int64_t booking_id, MailMessage msg, SendCallback cb) {
    std::string k(kind);
    async_send_mail(ioc_, tls_, settings_, std::move(msg), [k, booking_id, cb](SendResult r) {
        observability::Metrics::instance().inc_mail(k, to_string(r.status));
        switch (r.status) {
            case SendStatus::sent:
                observability::log_info("mail.sent", {{"kind", k}, {"booking_id", booking_id}});
                break;
            case SendStatus::not_configured:
                observability::log_debug("mail.skipped", {{"kind", k}, {"booking_id", booking_id}});
                break;
            case SendStatus::failed:
                observability::log_warn("mail.failed", {{"kind", k}, {"booking_id", booking_id}, {"reason", r.reason}});
                break;
        }
        cb(std::move(r));
    });
}

}
