#include "dry_run_exchange.hpp"
#include "log.hpp"

DryRunExchange::DryRunExchange(double initial_balance, int fee_rate_bps)
    : balance_(initial_balance), fee_rate_bps_(fee_rate_bps) {}

std::optional<std::string> DryRunExchange::submit(const std::string& token_id,
                                                  Side side,
                                                  double price,
                                                  double size,
                                                  int fee_rate_bps) {
    if (size <= 0.0 || price <= 0.0 || price >= 1.0) return std::nullopt;

    std::lock_guard<std::mutex> lk(mtx_);
    std::string id = "dry-run-" + std::to_string(next_id_++);
    open_[id] = RestingOrder{id, side, price, size};

    log_info("DRY-RUN", "Would create ", side_str(side), " order ", id, ": ",
             size, " shares @ $", price, " token=", token_id.substr(0, 16),
             " fee=", fee_rate_bps, "bps");
    return id;
}

bool DryRunExchange::cancel(const std::string& order_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (open_.erase(order_id) == 0) return false;
    log_info("DRY-RUN", "Would cancel order ", order_id);
    return true;
}

std::optional<std::vector<std::string>> DryRunExchange::list_open_orders() {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> ids;
    ids.reserve(open_.size());
    for (const auto& kv : open_) ids.push_back(kv.first);
    return ids;
}

std::optional<int> DryRunExchange::fee_rate(const std::string&) {
    return fee_rate_bps_;
}

std::optional<double> DryRunExchange::balance() {
    return balance_;
}

std::size_t DryRunExchange::open_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return open_.size();
}
