#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdlib>
#include <csignal>

#include "namesys_config.hpp"
#include "key_store.hpp"
#include "name_system.hpp"
#include "republisher.hpp"
#include "topic_deriver.hpp"
#include "transport/redis_pubsub.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "errors.hpp"
#include "encoding.hpp"

namespace net = boost::asio;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <command> [args]\n"
              << "Commands:\n"
              << "  id                                   Print peer id and record topic\n"
              << "  publish <value> [--key name] [--no-resolve]\n"
              << "  resolve <name> [--timeout ms] [--nocache]\n"
              << "  keygen <name>                        Generate a secondary key\n"
              << "  daemon                               Serve subscriptions and republish\n"
              << "Environment: NAMESYS_REDIS_URL, NAMESYS_PRIVATE_KEY (hex), NAMESYS_RESOLVE_TIMEOUT_MS,\n"
              << "             NAMESYS_CACHE_TRUST_SEC, NAMESYS_RECORD_LIFETIME_SEC, NAMESYS_REPUBLISH_INTERVAL_SEC\n";
}

namesys::Ed25519Key load_node_key(const namesys::NameSysConfig& config) {
    if (config.private_key_hex.empty()) {
        auto key = namesys::Ed25519Key::generate();
        std::cerr << "[*] No NAMESYS_PRIVATE_KEY set; generated ephemeral key "
                  << namesys::encoding::to_hex(key.private_bytes()) << "\n";
        return key;
    }
    try {
        return namesys::Ed25519Key::from_private_hex(config.private_key_hex);
    } catch (const namesys::SigningError& e) {
        throw namesys::ConfigError(std::string("NAMESYS_PRIVATE_KEY: ") + e.what());
    }
}

// Blocks until SIGINT/SIGTERM while the republisher and cache sweeper run.
int run_daemon(namesys::NameSystem& names, namesys::KeyStore& keys, const namesys::NameSysConfig& config) {
    using namesys::EventLogger;

    net::io_context ioc;
    namesys::Republisher republisher(ioc, config, keys, names.publisher());
    republisher.start();

    // Subscribe to our own topic so remote peers can discover us as a subscriber
    names.watch(names.self_id().to_string());

    net::steady_timer sweep_timer(ioc, std::chrono::seconds(config.cache_sweep_interval_sec));
    std::function<void(const boost::system::error_code&)> on_sweep;
    on_sweep = [&](const boost::system::error_code& ec) {
        if (!ec) {
            size_t removed = names.evict_expired();
            if (removed > 0) {
                EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE,
                                 "internal", "Evicted " + std::to_string(removed) + " expired records");
            }
            sweep_timer.expires_after(std::chrono::seconds(config.cache_sweep_interval_sec));
            sweep_timer.async_wait(on_sweep);
        }
    };
    sweep_timer.async_wait(on_sweep);

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE,
                         "internal", "Initiating graceful shutdown");
        republisher.stop();
        sweep_timer.cancel();
        std::cout << namesys::MetricsRegistry::instance().collect_prometheus();
    });

    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE,
                     names.self_id().to_string(), "Daemon running");
    ioc.run();
    return 0;
}

}

int main(int argc, char* argv[]) {
    using namesys::EventLogger;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }
    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    try {
        namesys::NameSysConfig config;
        namesys::apply_env_overrides(config);

        namesys::MemoryKeyStore keys;
        auto node_key = load_node_key(config);
        auto self = keys.import(config.self_key_name, node_key);

        namesys::RedisPubSub transport(config, self.id.to_string(), node_key.public_bytes());
        if (!transport.is_connected()) {
            std::cerr << "[!] Redis transport unavailable at " << config.redis_url << "\n";
            return 1;
        }

        namesys::NameSystem names(config, transport, keys);
        names.initialize_keyspace();

        std::vector<std::string> args(argv + 2, argv + argc);

        if (command == "id") {
            std::cout << self.id.to_string() << "\n"
                      << namesys::TopicDeriver::derive_topic(self.id) << "\n";
            return 0;
        }

        if (command == "keygen") {
            if (args.empty()) {
                print_usage(argv[0]);
                return 1;
            }
            auto info = keys.generate(args[0]);
            std::cout << info.name << " " << info.id.to_string() << "\n"
                      << namesys::encoding::to_hex(keys.get(info.name).private_bytes()) << "\n";
            return 0;
        }

        if (command == "publish") {
            if (args.empty()) {
                print_usage(argv[0]);
                return 1;
            }
            namesys::PublishOptions options;
            options.key = config.self_key_name;
            for (size_t i = 1; i < args.size(); ++i) {
                if (args[i] == "--no-resolve") {
                    options.resolve = false;
                } else if (args[i] == "--key" && i + 1 < args.size()) {
                    options.key = args[++i];
                    if (options.key != config.self_key_name) {
                        keys.generate(options.key);
                    }
                } else {
                    print_usage(argv[0]);
                    return 1;
                }
            }
            auto result = names.publish(args[0], options);
            std::cout << "Published to " << result.name << ": " << result.value << "\n";
            return 0;
        }

        if (command == "resolve") {
            if (args.empty()) {
                print_usage(argv[0]);
                return 1;
            }
            namesys::ResolveOptions options;
            for (size_t i = 1; i < args.size(); ++i) {
                if (args[i] == "--nocache") {
                    options.nocache = true;
                } else if (args[i] == "--timeout" && i + 1 < args.size()) {
                    options.timeout = std::chrono::milliseconds(std::stoll(args[++i]));
                } else {
                    print_usage(argv[0]);
                    return 1;
                }
            }
            std::cout << names.resolve(args[0], options) << "\n";
            return 0;
        }

        if (command == "daemon") {
            return run_daemon(names, keys, config);
        }

        print_usage(argv[0]);
        return 1;

    } catch (const namesys::NameSysError& e) {
        std::cerr << "[!] " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
