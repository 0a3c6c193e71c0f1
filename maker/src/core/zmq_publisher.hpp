#pragma once
#include "cycle_report.hpp"
#include "log.hpp"

#include <zmq.hpp>

#include <string>

// PUB socket broadcasting each requote cycle as JSON on "maker.<symbol>".
// Wildcard binds ("tcp://127.0.0.1:*") are resolved; endpoint() reports the result.
class CyclePublisher {
public:
    CyclePublisher(const std::string& bind_addr, const std::string& symbol)
        : ctx_(1), pub_(ctx_, zmq::socket_type::pub), topic_("maker." + symbol)
    {
        // slow subscribers lose messages, never block the engine
        pub_.set(zmq::sockopt::sndhwm, 1000);
        pub_.set(zmq::sockopt::linger, 0);
        pub_.bind(bind_addr);
        endpoint_ = pub_.get(zmq::sockopt::last_endpoint);
        log_info("PUB", "publishing ", topic_, " on ", endpoint_);
    }

    void publish(const CycleReport& r) {
        const std::string payload = cycle_report_json(r);
        zmq::message_t t(topic_.data(), topic_.size());
        zmq::message_t p(payload.data(), payload.size());

        if (!pub_.send(t, zmq::send_flags::sndmore | zmq::send_flags::dontwait)) return;
        if (!pub_.send(p, zmq::send_flags::dontwait))
            log_debug("PUB", "payload dropped (hwm)");
    }

    const std::string& topic() const { return topic_; }
    const std::string& endpoint() const { return endpoint_; }

private:
    zmq::context_t ctx_;
    zmq::socket_t  pub_;
    std::string    topic_;
    std::string    endpoint_;
};
