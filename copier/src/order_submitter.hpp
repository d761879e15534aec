#pragma once
#include "types.hpp"
#include <memory>
#include <mutex>
#include <string>

enum class SignatureType {
    Eoa = 0,
    GnosisSafe = 2
};

std::string to_string(SignatureType type);

// Places an order on behalf of the controlled account. Implementations report
// failure through OrderResult and must not throw for exchange-side rejections.
class OrderSubmitter {
public:
    virtual ~OrderSubmitter() = default;

    virtual OrderResult submit(const OrderRequest& request) = 0;
};

// Logs the order and reports success without touching the exchange
class DryRunSubmitter : public OrderSubmitter {
public:
    OrderResult submit(const OrderRequest& request) override;

    int submitted() const { return submitted_; }

private:
    int submitted_ = 0;
};

// The single signing identity shared by all executor workers. Submissions go
// through one mutex so orders are never signed concurrently.
class Signer {
public:
    Signer(std::shared_ptr<OrderSubmitter> submitter, std::string funder_address, SignatureType signature_type);

    OrderResult submit(OrderRequest request);

    const std::string& funder_address() const { return funder_address_; }
    SignatureType signature_type() const { return signature_type_; }

    Signer(const Signer&) = delete;
    Signer& operator=(const Signer&) = delete;

private:
    std::shared_ptr<OrderSubmitter> submitter_;
    std::string funder_address_;
    SignatureType signature_type_;
    std::mutex mutex_;
};
