#include "transport/redis_pubsub.hpp"
#include "namesys_config.hpp"
#include "input_validator.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "errors.hpp"
#include <boost/json.hpp>
#include <iterator>
#include <unordered_set>

namespace json = boost::json;

namespace namesys {

RedisPubSub::RedisPubSub(const NameSysConfig& config, std::string peer_id, Bytes node_key)
    : peer_id_(std::move(peer_id))
    , node_key_(std::move(node_key))
    , presence_ttl_sec_(config.presence_ttl_sec)
    , heartbeat_interval_(config.presence_heartbeat_sec) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config.redis_url);
        redis_->ping();
        connected_ = true;

        running_ = true;
        subscriber_thread_ = std::thread(&RedisPubSub::subscriber_loop, this);

        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE,
                         peer_id_, "Redis transport connected: " + config.redis_url);
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::TRANSPORT_ERROR,
                         peer_id_, "Redis connection failed: " + std::string(e.what()));
        connected_ = false;
    }
}

RedisPubSub::~RedisPubSub() {
    running_ = false;
    if (subscriber_thread_.joinable()) {
        subscriber_thread_.join();
    }
    if (!connected_) return;

    // Withdraw presence so peers stop counting this node as a subscriber
    std::vector<std::string> topics;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (const auto& [topic, handler] : handlers_) topics.push_back(topic);
    }
    for (const auto& topic : topics) {
        try {
            redis_->srem(PRESENCE_PREFIX + topic, peer_id_);
        } catch (const std::exception& e) {
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::TRANSPORT_ERROR,
                             topic, "Presence withdrawal failed: " + std::string(e.what()));
        }
    }
}

std::string RedisPubSub::encode_envelope(const PubSubMessage& msg) {
    json::object obj;
    obj["from"] = msg.from;
    obj["key"] = encoding::base64_encode(msg.key);
    obj["seqno"] = msg.seqno;
    obj["data"] = encoding::base64_encode(encoding::to_bytes(msg.data));
    return json::serialize(obj);
}

bool RedisPubSub::decode_envelope(const std::string& topic, const std::string& payload, PubSubMessage& out) {
    try {
        auto val = InputValidator::safe_parse_json(payload);
        if (!val.is_object()) return false;
        const auto& obj = val.get_object();

        auto from = obj.if_contains("from");
        auto key = obj.if_contains("key");
        auto seqno = obj.if_contains("seqno");
        auto data = obj.if_contains("data");
        if (!from || !from->is_string() || !key || !key->is_string() ||
            !data || !data->is_string() || !seqno) {
            return false;
        }

        auto key_bytes = encoding::base64_decode(std::string(key->get_string()));
        auto data_bytes = encoding::base64_decode(std::string(data->get_string()));
        if (!key_bytes || !data_bytes) return false;

        out.topic = topic;
        out.from = std::string(from->get_string());
        out.key = *key_bytes;
        if (seqno->is_uint64()) out.seqno = seqno->get_uint64();
        else if (seqno->is_int64() && seqno->get_int64() >= 0) out.seqno = static_cast<uint64_t>(seqno->get_int64());
        else return false;
        out.data = encoding::to_string(*data_bytes);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Registers the handler; the SUBSCRIBE itself is issued by the subscriber thread
// and presence follows its acknowledgement.
void RedisPubSub::subscribe(const std::string& topic, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[topic] = std::move(handler);
    pending_.emplace_back(PendingOp::SUBSCRIBE, topic);
}

void RedisPubSub::unsubscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers_.erase(topic);
        confirmed_.erase(topic);
        pending_.emplace_back(PendingOp::UNSUBSCRIBE, topic);
    }
    // Wait out a handler that was already running for this topic
    { std::lock_guard<std::recursive_mutex> drain(dispatch_mutex_); }

    if (!connected_) return;
    try {
        redis_->srem(PRESENCE_PREFIX + topic, peer_id_);
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::TRANSPORT_ERROR,
                         topic, "Presence withdrawal failed: " + std::string(e.what()));
    }
}

void RedisPubSub::publish(const std::string& topic, const std::string& data) {
    if (!connected_) {
        throw TransportError("Redis transport is not connected");
    }
    PubSubMessage msg;
    msg.topic = topic;
    msg.from = peer_id_;
    msg.key = node_key_;
    msg.seqno = ++seqno_;
    msg.data = data;
    try {
        redis_->publish(CHANNEL_PREFIX + topic, encode_envelope(msg));
    } catch (const std::exception& e) {
        throw TransportError("Redis publish failed: " + std::string(e.what()));
    }
}

std::vector<std::string> RedisPubSub::list_subscribers(const std::string& topic) {
    std::vector<std::string> peers;
    if (!connected_) return peers;
    try {
        std::unordered_set<std::string> members;
        redis_->smembers(PRESENCE_PREFIX + topic, std::inserter(members, members.end()));
        for (const auto& member : members) {
            if (member != peer_id_) peers.push_back(member);
        }
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::TRANSPORT_ERROR,
                         topic, "Subscriber listing failed: " + std::string(e.what()));
    }
    return peers;
}

void RedisPubSub::dispatch(const std::string& channel, const std::string& payload) {
    static const std::string prefix = CHANNEL_PREFIX;
    if (channel.rfind(prefix, 0) != 0) return;
    std::string topic = channel.substr(prefix.size());

    PubSubMessage msg;
    if (!decode_envelope(topic, payload, msg)) {
        MetricsRegistry::instance().increment_counter("messages_malformed_total");
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::MALFORMED_MESSAGE,
                         topic, "Dropping message with invalid envelope");
        return;
    }
    // Redis echoes our own publications back to us
    if (msg.from == peer_id_) return;

    std::lock_guard<std::recursive_mutex> dispatching(dispatch_mutex_);
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(topic);
        if (it == handlers_.end()) return;
        handler = it->second;
    }
    try {
        handler(msg);
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::TRANSPORT_ERROR,
                         topic, "Message handler failed: " + std::string(e.what()));
    }
}

// Applies queued SUBSCRIBE/UNSUBSCRIBE requests. Runs on the subscriber thread only.
void RedisPubSub::apply_pending() {
    std::deque<std::pair<PendingOp, std::string>> ops;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        ops.swap(pending_);
    }
    for (const auto& [op, topic] : ops) {
        if (op == PendingOp::SUBSCRIBE) {
            subscriber_->subscribe(CHANNEL_PREFIX + topic);
        } else {
            subscriber_->unsubscribe(CHANNEL_PREFIX + topic);
        }
    }
}

void RedisPubSub::refresh_presence() {
    std::vector<std::string> topics;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        topics.assign(confirmed_.begin(), confirmed_.end());
    }
    for (const auto& topic : topics) {
        redis_->sadd(PRESENCE_PREFIX + topic, peer_id_);
        redis_->expire(PRESENCE_PREFIX + topic, std::chrono::seconds(presence_ttl_sec_));
    }
}

void RedisPubSub::advertise(const std::string& topic) {
    try {
        redis_->sadd(PRESENCE_PREFIX + topic, peer_id_);
        redis_->expire(PRESENCE_PREFIX + topic, std::chrono::seconds(presence_ttl_sec_));
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::TRANSPORT_ERROR,
                         topic, "Presence registration failed: " + std::string(e.what()));
    }
}

// Runs on the subscriber thread when Redis acknowledges a (un)subscription.
void RedisPubSub::on_subscription_change(sw::redis::Subscriber::MsgType type, const std::string& channel) {
    static const std::string prefix = CHANNEL_PREFIX;
    if (channel.rfind(prefix, 0) != 0) return;
    std::string topic = channel.substr(prefix.size());

    if (type != sw::redis::Subscriber::MsgType::SUBSCRIBE) return;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        // An UNSUBSCRIBE may have been queued after this SUBSCRIBE
        if (!handlers_.count(topic)) return;
        confirmed_.insert(topic);
    }
    advertise(topic);
}

// Subscriber loop responsible for processing messages from Redis.
void RedisPubSub::subscriber_loop() {
    if (!connected_) return;

    while (running_) {
        try {
            subscriber_ = std::make_unique<sw::redis::Subscriber>(redis_->subscriber());
            subscriber_->on_message([this](std::string channel, std::string msg) {
                dispatch(channel, msg);
            });
            subscriber_->on_meta([this](sw::redis::Subscriber::MsgType type,
                                        sw::redis::OptionalString channel, long long) {
                if (channel) on_subscription_change(type, *channel);
            });

            // A fresh connection carries no subscriptions; replay every active topic
            {
                std::lock_guard<std::mutex> lock(handlers_mutex_);
                pending_.clear();
                confirmed_.clear();
                for (const auto& [topic, handler] : handlers_) {
                    pending_.emplace_back(PendingOp::SUBSCRIBE, topic);
                }
            }

            auto last_heartbeat = std::chrono::steady_clock::now();
            while (running_) {
                apply_pending();
                if (std::chrono::steady_clock::now() - last_heartbeat >= heartbeat_interval_) {
                    refresh_presence();
                    last_heartbeat = std::chrono::steady_clock::now();
                }
                try {
                    subscriber_->consume();
                } catch (const sw::redis::TimeoutError&) {
                    continue;
                }
            }
        } catch (const std::exception& e) {
            if (running_) {
                EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::TRANSPORT_ERROR,
                                 peer_id_, "Redis subscriber error (reconnecting...): " + std::string(e.what()));
                std::this_thread::sleep_for(std::chrono::seconds(2));
            }
        }
    }
    subscriber_.reset();
}

}
