#include "order_submitter.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string to_string(SignatureType type) {
    switch (type) {
        case SignatureType::Eoa: return "EOA";
        case SignatureType::GnosisSafe: return "Gnosis Safe";
    }
    return "unknown";
}

OrderResult DryRunSubmitter::submit(const OrderRequest& request) {
    ++submitted_;
    spdlog::info("[DRY RUN] {} {:.4f} {} of {} @ {:.4f} (market {})",
                 to_string(request.side),
                 request.amount,
                 request.amount_kind == AmountKind::Usd ? "USD" : "shares",
                 request.token_id,
                 request.price,
                 request.condition_id);

    OrderResult result;
    result.success = true;
    result.order_id = "dry-run-" + std::to_string(submitted_);
    result.message = "dry run";
    return result;
}

Signer::Signer(std::shared_ptr<OrderSubmitter> submitter, std::string funder_address, SignatureType signature_type)
    : submitter_(std::move(submitter)),
      funder_address_(std::move(funder_address)),
      signature_type_(signature_type) {
    if (!submitter_) {
        throw std::invalid_argument("Signer requires an order submitter");
    }
}

OrderResult Signer::submit(OrderRequest request) {
    request.funder_address = funder_address_;
    request.signature_type = static_cast<int>(signature_type_);

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return submitter_->submit(request);
    } catch (const std::exception& e) {
        spdlog::error("Order submission for {} threw: {}", request.token_id, e.what());
        OrderResult result;
        result.success = false;
        result.message = e.what();
        return result;
    }
}
