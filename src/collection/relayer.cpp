// MINTGATE - Mint Relayer Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/collection/relayer.h>

#include <mintgate/util/logging.h>

namespace mintgate {
namespace collection {

Relayer::Relayer(const RelayerConfig& config, Collection& collection)
    : config_(config), collection_(collection) {}

bool Relayer::IsMintWindowActive(Timestamp now) const {
    if (config_.presaleStartDate == 0 || now < config_.presaleStartDate) {
        return false;
    }
    return config_.presaleEndDate == 0 || now < config_.presaleEndDate;
}

Status Relayer::MintRelay(const CallContext& ctx, uint64_t amount,
                          const allowlist::MerkleProof& proof,
                          std::vector<TokenId>* tokenIds) {
    Status status;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        status = Status::Error(CollectionError::ReentrantCall, "relay already in progress");
    } else if (!IsMintWindowActive(ctx.timestamp)) {
        status = Status::Error(CollectionError::StageNotReady, "relay window is closed");
    } else if (amount == 0) {
        status = Status::Error(CollectionError::ZeroAmount);
    } else if (!allowlist::VerifyMembership(ctx.caller, proof, config_.merkleRoot)) {
        status = Status::Error(CollectionError::InvalidProof, "not on the relay list");
    } else {
        auto cost = CheckedMul(config_.price, amount);
        if (!cost || ctx.value < *cost) {
            status = Status::Error(CollectionError::InsufficientPayment,
                                   "paid " + FormatAmount(ctx.value));
        }
    }

    if (status.ok()) {
        CallContext forwarded(config_.address, ctx.value, ctx.timestamp);
        status = collection_.OperatorMint(forwarded, ctx.caller, amount, tokenIds);
    }

    if (!status.ok()) {
        LOG_DEBUG(util::LogCategory::RELAYER) << "MintRelay rejected for "
                                              << ctx.caller.ToString() << ": "
                                              << status.ToString();
        return status;
    }

    Event event;
    event.kind = EventKind::MintRelayed;
    event.actor = ctx.caller;
    event.subject = ctx.caller;
    event.amount = ctx.value;
    event.count = amount;
    events_.Append(event);

    LOG_INFO(util::LogCategory::RELAYER) << "Relayed " << amount << " tokens to "
                                         << ctx.caller.ToString();
    return Status::Ok();
}

Status Relayer::CheckOwner(const CallContext& ctx, const char* operation) {
    if (ctx.caller != config_.owner) {
        Status status = Status::Error(CollectionError::Unauthorized,
                                      ctx.caller.ToString() + " is not the relayer owner");
        LOG_DEBUG(util::LogCategory::RELAYER) << operation << " rejected: " << status.ToString();
        return status;
    }
    return Status::Ok();
}

void Relayer::RecordChange(const CallContext& ctx, const char* name, const std::string& value) {
    Event event;
    event.kind = EventKind::ParameterChanged;
    event.actor = ctx.caller;
    event.parameter = name;
    event.value = value;
    events_.Append(event);

    LOG_INFO(util::LogCategory::RELAYER) << name << " set to " << value;
}

Status Relayer::SetPresaleStartDate(const CallContext& ctx, Timestamp date) {
    Status status = CheckOwner(ctx, "SetPresaleStartDate");
    if (status.ok()) {
        config_.presaleStartDate = date;
        RecordChange(ctx, "presaleStartDate", std::to_string(date));
    }
    return status;
}

Status Relayer::SetPresaleEndDate(const CallContext& ctx, Timestamp date) {
    Status status = CheckOwner(ctx, "SetPresaleEndDate");
    if (status.ok()) {
        config_.presaleEndDate = date;
        RecordChange(ctx, "presaleEndDate", std::to_string(date));
    }
    return status;
}

Status Relayer::SetMerkleRoot(const CallContext& ctx, const Hash256& root) {
    Status status = CheckOwner(ctx, "SetMerkleRoot");
    if (status.ok()) {
        config_.merkleRoot = root;
        RecordChange(ctx, "merkleRoot", root.ToString());
    }
    return status;
}

Status Relayer::SetPrice(const CallContext& ctx, Amount price) {
    Status status = CheckOwner(ctx, "SetPrice");
    if (status.ok()) {
        config_.price = price;
        RecordChange(ctx, "price", FormatAmount(price));
    }
    return status;
}

} // namespace collection
} // namespace mintgate
