#pragma once
#include "exchange_client.hpp"

#include <cstdint>
#include <map>
#include <mutex>

// Paper exchange for dry-run mode: accepts every order, never fills.
class DryRunExchange : public IExchangeClient {
public:
    explicit DryRunExchange(double initial_balance, int fee_rate_bps = 0);

    std::optional<std::string> submit(const std::string& token_id, Side side,
                                      double price, double size,
                                      int fee_rate_bps) override;
    bool cancel(const std::string& order_id) override;
    std::optional<std::vector<std::string>> list_open_orders() override;
    std::optional<int> fee_rate(const std::string& token_id) override;
    std::optional<double> balance() override;

    std::size_t open_count() const;

private:
    double balance_;
    int fee_rate_bps_;
    std::uint64_t next_id_ = 1;

    mutable std::mutex mtx_;
    std::map<std::string, RestingOrder> open_;
};
