#pragma once
#include "config.hpp"
#include "order_submitter.hpp"
#include <string>

// Posts orders to the relay service that holds the signing key:
// POST {order_relay_url}/order with the OrderRequest JSON body.
class OrderRelayClient : public OrderSubmitter {
public:
    explicit OrderRelayClient(const Config& config);

    OrderResult submit(const OrderRequest& request) override;

    // Maps a relay reply to an OrderResult; a 2xx without "success": false is success
    static OrderResult parse_reply(long status_code, const std::string& body);

private:
    std::string order_url_;
    std::string api_key_;
    int timeout_ms_;
};
