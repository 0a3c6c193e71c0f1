#pragma once
#include "PriceSample.hpp"
#include <functional>
#include <optional>

class IPriceStream {
public:
    using Listener = std::function<void(const PriceSample&)>;

    virtual ~IPriceStream() = default;

    // Starts the background connection. Blocks until the first sample arrives
    // or the startup window elapses; check is_healthy() afterwards.
    virtual void start() = 0;

    // Idempotent. Terminates the connection and any pending retry.
    virtual void stop() = 0;

    // Latest sample, or nullopt if none yet or older than the staleness window.
    virtual std::optional<PriceSample> current() const = 0;

    virtual bool is_healthy() const = 0;

    virtual void on_update(Listener cb) = 0;
};
