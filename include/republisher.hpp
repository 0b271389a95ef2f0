#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include "namesys_config.hpp"
#include "key_store.hpp"
#include "name_publisher.hpp"

namespace net = boost::asio;

namespace namesys {

// Periodically re-broadcasts the records of every local key so that
// late subscribers converge and validity never lapses.
class Republisher {
public:
    Republisher(net::io_context& ioc, const NameSysConfig& config, KeyStore& keys, NamePublisher& publisher);
    ~Republisher();

    Republisher(const Republisher&) = delete;
    Republisher& operator=(const Republisher&) = delete;

    // Arms the timer with the initial delay. Runs on the io_context's threads.
    void start();
    void stop();

    // One synchronous pass. Returns the number of records re-published.
    size_t republish_now();

    size_t rounds() const { return rounds_; }

private:
    void schedule(std::chrono::seconds delay);

    net::steady_timer timer_;
    std::chrono::seconds initial_delay_;
    std::chrono::seconds interval_;
    KeyStore& keys_;
    NamePublisher& publisher_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> rounds_{0};
};

}
