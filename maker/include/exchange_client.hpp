#pragma once
#include "order_types.hpp"

#include <optional>
#include <string>
#include <vector>

// Exchange collaborator consumed by the quoting core. Implementations absorb
// transport errors and report them as nullopt / false; they never throw.
class IExchangeClient {
public:
    virtual ~IExchangeClient() = default;

    // fee_rate_bps must be the value fee_rate() just returned for token_id.
    virtual std::optional<std::string> submit(const std::string& token_id,
                                              Side side,
                                              double price,
                                              double size,
                                              int fee_rate_bps) = 0;

    virtual bool cancel(const std::string& order_id) = 0;

    // nullopt when the listing could not be fetched completely.
    virtual std::optional<std::vector<std::string>> list_open_orders() = 0;

    virtual std::optional<int> fee_rate(const std::string& token_id) = 0;

    // Collateral (USDC) balance.
    virtual std::optional<double> balance() = 0;
};
