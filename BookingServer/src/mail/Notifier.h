#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <string>
#include "MailMessage.h"
#include "SmtpClient.h"
#include "../booking/Booking.h"
#include "../config/Config.h"

namespace mail {

// Best-effort booking emails. Callbacks always run on the io_context and never
// carry an error: failures are reported as SendStatus::failed.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void async_send_confirmation(const booking::Booking& b, const std::string& cancel_link, SendCallback cb) = 0;
    virtual void async_send_thank_you(const booking::Booking& b, SendCallback cb) = 0;
};

class SmtpNotifier : public Notifier {
public:
    SmtpNotifier(boost::asio::io_context& ioc, config::SmtpSettings settings);

    void async_send_confirmation(const booking::Booking& b, const std::string& cancel_link, SendCallback cb) override;
    void async_send_thank_you(const booking::Booking& b, SendCallback cb) override;

private:
    void send(const char* kind, int64_t booking_id, MailMessage msg, SendCallback cb);

    boost::asio::io_context& ioc_;
    config::SmtpSettings settings_;
    boost::asio::ssl::context tls_;
};

}
