#include "republisher.hpp"
#include "event_logger.hpp"
#include "errors.hpp"

namespace namesys {

Republisher::Republisher(net::io_context& ioc, const NameSysConfig& config, KeyStore& keys, NamePublisher& publisher)
    : timer_(ioc)
    , initial_delay_(config.republish_initial_delay_sec)
    , interval_(config.republish_interval_sec)
    , keys_(keys)
    , publisher_(publisher) {}

Republisher::~Republisher() {
    stop();
}

void Republisher::start() {
    running_ = true;
    schedule(initial_delay_);
}

void Republisher::stop() {
    running_ = false;
    timer_.cancel();
}

void Republisher::schedule(std::chrono::seconds delay) {
    timer_.expires_after(delay);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) return;
        republish_now();
        ++rounds_;
        schedule(interval_);
    });
}

size_t Republisher::republish_now() {
    size_t count = 0;
    for (const auto& info : keys_.list()) {
        try {
            if (publisher_.republish(info.name)) ++count;
        } catch (const NameSysError& e) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::REPUBLISHED,
                             info.id.to_string(), "Republish of key '" + info.name + "' failed: " + e.what());
        }
    }
    return count;
}

}
