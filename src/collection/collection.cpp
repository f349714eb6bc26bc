// MINTGATE - Collection Sale Engine Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/collection/collection.h>

#include <mintgate/util/logging.h>

#include <stdexcept>

namespace mintgate {
namespace collection {

namespace {

Status Reject(const char* category, const char* operation,
              const CallContext& ctx, Status status) {
    LOG_DEBUG(category) << operation << " rejected for " << ctx.caller.ToString()
                        << ": " << status.ToString();
    return status;
}

Status ReentrantCall() {
    return Status::Error(CollectionError::ReentrantCall, "call already in progress");
}

Status Unauthorized(const Address& caller, Role role) {
    return Status::Error(CollectionError::Unauthorized,
                         caller.ToString() + " lacks role " + RoleToString(role));
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Collection::Collection(const Address& admin,
                       const std::vector<Address>& approvers,
                       size_t quorum,
                       const CollectionConfig& config,
                       std::shared_ptr<IOwnershipRegistry> registry)
    : admin_(admin)
    , config_(config)
    , registry_(registry ? std::move(registry) : std::make_shared<TokenRegistry>(TOTAL_SUPPLY))
    , treasury_(quorum) {
    if (admin_.IsNull()) {
        throw std::invalid_argument("collection admin must not be the zero address");
    }

    roles_.Grant(Role::DefaultAdmin, admin_);
    for (const auto& approver : approvers) {
        roles_.Grant(Role::Operator, approver);
    }

    // Reserve goes straight to the admin, outside the sale rules
    CallContext deploy(admin_, 0, 0);
    Status status = CommitMint(deploy, admin_, RESERVED_TOKENS, nullptr, nullptr);
    if (!status.ok()) {
        throw std::invalid_argument("cannot mint reserved tokens: " + status.ToString());
    }

    LOG_INFO(util::LogCategory::MINT) << "Collection deployed, admin " << admin_.ToString()
                                      << ", " << approvers.size() << " approvers, quorum "
                                      << quorum;
}

// ============================================================================
// Validation Helpers
// ============================================================================

Status Collection::CheckSupply(uint64_t amount) const {
    uint64_t minted = registry_->TotalSupply();
    if (minted >= TOTAL_SUPPLY || amount > TOTAL_SUPPLY - minted) {
        return Status::Error(CollectionError::SupplyExhausted,
                             std::to_string(minted >= TOTAL_SUPPLY ? 0 : TOTAL_SUPPLY - minted) +
                             " tokens left");
    }
    return Status::Ok();
}

Status Collection::CheckPayment(Amount paid, Amount unitPrice, uint64_t amount) const {
    auto cost = CheckedMul(unitPrice, amount);
    if (!cost || paid < *cost) {
        return Status::Error(CollectionError::InsufficientPayment,
                             "paid " + FormatAmount(paid) + ", need " +
                             (cost ? FormatAmount(*cost) : std::string("more than representable")));
    }
    return Status::Ok();
}

Status Collection::CommitMint(const CallContext& ctx, const Address& recipient, uint64_t amount,
                              const ParticipantRecord* record,
                              std::vector<TokenId>* tokenIds) {
    if (!treasury_.CanDeposit(ctx.value)) {
        return Status::Error(CollectionError::ArithmeticOverflow, "balance overflow");
    }

    std::vector<TokenId> minted;
    Status status = registry_->Mint(recipient, amount, &minted);
    if (!status.ok()) {
        return status;
    }

    if (record) {
        participants_[recipient] = *record;
    }
    // Cannot fail after CanDeposit()
    status = treasury_.Deposit(ctx.value);
    if (!status.ok()) {
        return status;
    }

    Event event;
    event.kind = EventKind::Minted;
    event.actor = ctx.caller;
    event.subject = recipient;
    event.amount = ctx.value;
    event.count = amount;
    events_.Append(event);

    if (tokenIds) {
        *tokenIds = std::move(minted);
    }
    return Status::Ok();
}

// ============================================================================
// Minting
// ============================================================================

Status Collection::OgMint(const CallContext& ctx, uint64_t amount,
                          const allowlist::MerkleProof& proof,
                          std::vector<TokenId>* tokenIds) {
    return AllowlistMint(ctx, Tier::Og, amount, proof, tokenIds);
}

Status Collection::WlMint(const CallContext& ctx, uint64_t amount,
                          const allowlist::MerkleProof& proof,
                          std::vector<TokenId>* tokenIds) {
    return AllowlistMint(ctx, Tier::Wl, amount, proof, tokenIds);
}

Status Collection::AllowlistMint(const CallContext& ctx, Tier tier, uint64_t amount,
                                 const allowlist::MerkleProof& proof,
                                 std::vector<TokenId>* tokenIds) {
    const bool og = tier == Tier::Og;
    const char* op = og ? "OgMint" : "WlMint";
    const auto category = util::LogCategory::MINT;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(category, op, ctx, ReentrantCall());
    }

    const SaleStage required = og ? SaleStage::PresaleOg : SaleStage::PresaleWl;
    const uint64_t cap = og ? PRESALE_MAX_TOKEN_PER_OG : PRESALE_MAX_TOKEN_PER_WL;
    const Amount price = og ? PRESALE_PRICE_OG : PRESALE_PRICE_WL;
    const Hash256& root = og ? config_.ogMerkleRoot : config_.wlMerkleRoot;

    SaleStage stage = GetSaleStage(ctx.timestamp);
    if (stage != required) {
        return Reject(category, op, ctx,
                      Status::Error(CollectionError::StageNotReady,
                                    std::string("stage is ") + SaleStageToString(stage)));
    }

    if (amount == 0) {
        return Reject(category, op, ctx, Status::Error(CollectionError::ZeroAmount));
    }
    if (amount > cap) {
        return Reject(category, op, ctx,
                      Status::Error(CollectionError::AmountExceedsCap,
                                    "at most " + std::to_string(cap) + " per call"));
    }

    ParticipantRecord record = GetParticipant(ctx.caller);
    bool& claimed = og ? record.ogClaimed : record.wlClaimed;
    uint64_t& minted = og ? record.ogMinted : record.wlMinted;

    if (config_.policy.allowlistClaim == ClaimPolicy::ClaimOnce) {
        if (claimed) {
            return Reject(category, op, ctx,
                          Status::Error(CollectionError::AlreadyClaimed,
                                        "allocation already used"));
        }
    } else if (config_.policy.capPolicy == CapPolicy::CumulativePerWallet) {
        if (minted >= cap || amount > cap - minted) {
            return Reject(category, op, ctx,
                          Status::Error(CollectionError::AmountExceedsCap,
                                        std::to_string(minted) + " of " + std::to_string(cap) +
                                        " already minted"));
        }
    }

    Status status = CheckSupply(amount);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }
    status = CheckPayment(ctx.value, price, amount);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }
    if (!allowlist::VerifyMembership(ctx.caller, proof, root)) {
        return Reject(category, op, ctx,
                      Status::Error(CollectionError::InvalidProof,
                                    og ? "not on the OG list" : "not on the WL list"));
    }

    claimed = true;
    minted += amount;

    status = CommitMint(ctx, ctx.caller, amount, &record, tokenIds);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }

    LOG_INFO(category) << op << ": " << ctx.caller.ToString() << " minted " << amount
                       << " for " << FormatAmount(ctx.value);
    return Status::Ok();
}

Status Collection::Mint(const CallContext& ctx, uint64_t amount,
                        std::vector<TokenId>* tokenIds) {
    const char* op = "Mint";
    const auto category = util::LogCategory::MINT;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(category, op, ctx, ReentrantCall());
    }

    SaleStage stage = GetSaleStage(ctx.timestamp);
    if (stage != SaleStage::PublicSale) {
        return Reject(category, op, ctx,
                      Status::Error(CollectionError::StageNotReady,
                                    std::string("stage is ") + SaleStageToString(stage)));
    }

    if (amount == 0) {
        return Reject(category, op, ctx, Status::Error(CollectionError::ZeroAmount));
    }
    if (amount > config_.maxMintPerTx) {
        return Reject(category, op, ctx,
                      Status::Error(CollectionError::AmountExceedsCap,
                                    "at most " + std::to_string(config_.maxMintPerTx) +
                                    " per call"));
    }

    ParticipantRecord record = GetParticipant(ctx.caller);
    const uint64_t walletCap = config_.maxTokenPerWallet;

    if (config_.policy.capPolicy == CapPolicy::CumulativePerWallet) {
        auto total = CheckedAdd(record.publicSaleBalance, amount);
        if (!total || *total > walletCap) {
            return Reject(category, op, ctx,
                          Status::Error(CollectionError::AmountExceedsCap,
                                        std::to_string(record.publicSaleBalance) + " of " +
                                        std::to_string(walletCap) + " already minted"));
        }
    } else if (amount > walletCap) {
        return Reject(category, op, ctx,
                      Status::Error(CollectionError::AmountExceedsCap,
                                    "at most " + std::to_string(walletCap) + " per wallet"));
    }

    Status status = CheckSupply(amount);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }
    status = CheckPayment(ctx.value, config_.price, amount);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }

    record.publicSaleBalance = SaturatingAdd(record.publicSaleBalance, amount);

    status = CommitMint(ctx, ctx.caller, amount, &record, tokenIds);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }

    LOG_INFO(category) << op << ": " << ctx.caller.ToString() << " minted " << amount
                       << " for " << FormatAmount(ctx.value);
    return Status::Ok();
}

Status Collection::OperatorMint(const CallContext& ctx, const Address& recipient,
                                uint64_t amount, std::vector<TokenId>* tokenIds) {
    const char* op = "OperatorMint";
    const auto category = util::LogCategory::MINT;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(category, op, ctx, ReentrantCall());
    }

    if (!roles_.HasRole(Role::Operator, ctx.caller) &&
        !roles_.HasRole(Role::DefaultAdmin, ctx.caller)) {
        return Reject(category, op, ctx, Unauthorized(ctx.caller, Role::Operator));
    }
    if (recipient.IsNull()) {
        return Reject(category, op, ctx,
                      Status::Error(CollectionError::InvalidArgument, "zero recipient"));
    }
    if (amount == 0) {
        return Reject(category, op, ctx, Status::Error(CollectionError::ZeroAmount));
    }

    Status status = CheckSupply(amount);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }

    status = CommitMint(ctx, recipient, amount, nullptr, tokenIds);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }

    LOG_INFO(category) << op << ": " << ctx.caller.ToString() << " minted " << amount
                       << " to " << recipient.ToString();
    return Status::Ok();
}

// ============================================================================
// Withdrawals
// ============================================================================

Status Collection::SubmitWithdrawal(const CallContext& ctx, const Address& to, Amount value,
                                    const std::vector<Byte>& data, uint64_t* index) {
    const char* op = "SubmitWithdrawal";
    const auto category = util::LogCategory::TREASURY;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(category, op, ctx, ReentrantCall());
    }
    if (!roles_.HasRole(Role::Operator, ctx.caller)) {
        return Reject(category, op, ctx, Unauthorized(ctx.caller, Role::Operator));
    }

    uint64_t txIndex = treasury_.Submit(to, value, data);

    Event event;
    event.kind = EventKind::WithdrawalSubmitted;
    event.actor = ctx.caller;
    event.subject = to;
    event.index = txIndex;
    event.amount = value;
    events_.Append(event);

    LOG_INFO(category) << "Withdrawal " << txIndex << " submitted by " << ctx.caller.ToString()
                       << ": " << FormatAmount(value) << " to " << to.ToString();

    if (index) {
        *index = txIndex;
    }
    return Status::Ok();
}

Status Collection::ConfirmWithdrawal(const CallContext& ctx, uint64_t index) {
    const char* op = "ConfirmWithdrawal";
    const auto category = util::LogCategory::TREASURY;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(category, op, ctx, ReentrantCall());
    }
    if (!roles_.HasRole(Role::Operator, ctx.caller)) {
        return Reject(category, op, ctx, Unauthorized(ctx.caller, Role::Operator));
    }

    Status status = treasury_.Confirm(index, ctx.caller);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }

    Event event;
    event.kind = EventKind::WithdrawalConfirmed;
    event.actor = ctx.caller;
    event.index = index;
    events_.Append(event);

    LOG_INFO(category) << "Withdrawal " << index << " confirmed by " << ctx.caller.ToString()
                       << " (" << treasury_.Get(index)->ConfirmationCount() << "/"
                       << treasury_.GetQuorum() << ")";
    return Status::Ok();
}

Status Collection::RevokeConfirmation(const CallContext& ctx, uint64_t index) {
    const char* op = "RevokeConfirmation";
    const auto category = util::LogCategory::TREASURY;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(category, op, ctx, ReentrantCall());
    }
    if (!roles_.HasRole(Role::Operator, ctx.caller)) {
        return Reject(category, op, ctx, Unauthorized(ctx.caller, Role::Operator));
    }

    Status status = treasury_.Revoke(index, ctx.caller);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }

    Event event;
    event.kind = EventKind::ConfirmationRevoked;
    event.actor = ctx.caller;
    event.index = index;
    events_.Append(event);

    LOG_INFO(category) << "Withdrawal " << index << " confirmation revoked by "
                       << ctx.caller.ToString();
    return Status::Ok();
}

Status Collection::ExecuteWithdrawal(const CallContext& ctx, uint64_t index) {
    const char* op = "ExecuteWithdrawal";
    const auto category = util::LogCategory::TREASURY;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(category, op, ctx, ReentrantCall());
    }
    if (!roles_.HasRole(Role::DefaultAdmin, ctx.caller)) {
        return Reject(category, op, ctx, Unauthorized(ctx.caller, Role::DefaultAdmin));
    }

    Status status = treasury_.CheckExecutable(index);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }

    if (config_.policy.withdrawalRequiresPublicSale) {
        SaleStage stage = GetSaleStage(ctx.timestamp);
        if (stage != SaleStage::PublicSale) {
            return Reject(category, op, ctx,
                          Status::Error(CollectionError::StageNotReady,
                                        std::string("stage is ") + SaleStageToString(stage)));
        }
    }

    // Deployment readiness, independent of the funds themselves
    if (config_.metadataBaseURI.empty()) {
        return Reject(category, op, ctx,
                      Status::Error(CollectionError::MetadataNotConfigured,
                                    "metadata base URI is not set"));
    }

    status = treasury_.MarkExecuted(index);
    if (!status.ok()) {
        return Reject(category, op, ctx, status);
    }

    const treasury::WithdrawalTransaction* tx = treasury_.Get(index);
    if (transferHandler_) {
        bool transferred = false;
        try {
            transferred = transferHandler_(tx->to, tx->value, tx->data);
        } catch (const std::exception& e) {
            treasury_.RollbackExecution(index);
            LOG_ERROR(category) << "Transfer handler threw for withdrawal " << index << ": "
                                << e.what();
            throw;
        }
        if (!transferred) {
            treasury_.RollbackExecution(index);
            return Reject(category, op, ctx,
                          Status::Error(CollectionError::TransferFailed,
                                        "transfer to " + tx->to.ToString() + " failed"));
        }
    }

    Event event;
    event.kind = EventKind::WithdrawalExecuted;
    event.actor = ctx.caller;
    event.subject = tx->to;
    event.index = index;
    event.amount = tx->value;
    events_.Append(event);

    LOG_INFO(category) << "Withdrawal " << index << " executed: " << FormatAmount(tx->value)
                       << " to " << tx->to.ToString();
    return Status::Ok();
}

// ============================================================================
// Admin Setters
// ============================================================================

template<typename Apply>
Status Collection::UpdateParameter(const CallContext& ctx, const char* name, bool idleOnly,
                                   const std::string& value, Apply apply) {
    const auto category = util::LogCategory::CONFIG;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(category, name, ctx, ReentrantCall());
    }
    if (!roles_.HasRole(Role::DefaultAdmin, ctx.caller)) {
        return Reject(category, name, ctx, Unauthorized(ctx.caller, Role::DefaultAdmin));
    }
    if (idleOnly) {
        SaleStage stage = GetSaleStage(ctx.timestamp);
        if (stage != SaleStage::Idle) {
            return Reject(category, name, ctx,
                          Status::Error(CollectionError::StageNotReady,
                                        std::string(name) + " is locked once the sale starts"));
        }
    }

    apply(config_);

    Event event;
    event.kind = EventKind::ParameterChanged;
    event.actor = ctx.caller;
    event.parameter = name;
    event.value = value;
    events_.Append(event);

    LOG_INFO(category) << name << " set to " << value;
    return Status::Ok();
}

Status Collection::SetPrice(const CallContext& ctx, Amount price) {
    return UpdateParameter(ctx, "price", false, FormatAmount(price),
                           [price](CollectionConfig& c) { c.price = price; });
}

Status Collection::SetMaxTokenPerWallet(const CallContext& ctx, uint64_t maxTokenPerWallet) {
    return UpdateParameter(ctx, "maxTokenPerWallet", false, std::to_string(maxTokenPerWallet),
                           [maxTokenPerWallet](CollectionConfig& c) {
                               c.maxTokenPerWallet = maxTokenPerWallet;
                           });
}

Status Collection::SetMaxMintPerTx(const CallContext& ctx, uint64_t maxMintPerTx) {
    return UpdateParameter(ctx, "maxMintPerTx", false, std::to_string(maxMintPerTx),
                           [maxMintPerTx](CollectionConfig& c) { c.maxMintPerTx = maxMintPerTx; });
}

Status Collection::SetMetadataBaseURI(const CallContext& ctx, const std::string& uri) {
    return UpdateParameter(ctx, "metadataBaseURI", false, uri,
                           [&uri](CollectionConfig& c) { c.metadataBaseURI = uri; });
}

Status Collection::SetOgMerkleRoot(const CallContext& ctx, const Hash256& root) {
    return UpdateParameter(ctx, "ogMerkleRoot", config_.policy.lockRootsOutsideIdle,
                           root.ToString(),
                           [&root](CollectionConfig& c) { c.ogMerkleRoot = root; });
}

Status Collection::SetWlMerkleRoot(const CallContext& ctx, const Hash256& root) {
    return UpdateParameter(ctx, "wlMerkleRoot", config_.policy.lockRootsOutsideIdle,
                           root.ToString(),
                           [&root](CollectionConfig& c) { c.wlMerkleRoot = root; });
}

Status Collection::SetPresaleDate(const CallContext& ctx, Timestamp date) {
    return UpdateParameter(ctx, "presaleDate", true, std::to_string(date),
                           [date](CollectionConfig& c) { c.presaleDate = date; });
}

Status Collection::SetPublicSaleDate(const CallContext& ctx, Timestamp date) {
    return UpdateParameter(ctx, "publicSaleDate", true, std::to_string(date),
                           [date](CollectionConfig& c) { c.publicSaleDate = date; });
}

Status Collection::SetRevealDate(const CallContext& ctx, Timestamp date) {
    return UpdateParameter(ctx, "revealDate", false, std::to_string(date),
                           [date](CollectionConfig& c) { c.revealDate = date; });
}

// ============================================================================
// Roles
// ============================================================================

void Collection::EmitRoleEvent(EventKind kind, const CallContext& ctx, Role role,
                               const Address& account) {
    Event event;
    event.kind = kind;
    event.actor = ctx.caller;
    event.subject = account;
    event.parameter = RoleToString(role);
    events_.Append(event);

    LOG_INFO(util::LogCategory::ROLES) << EventKindToString(kind) << ": " << RoleToString(role)
                                       << " " << account.ToString() << " by "
                                       << ctx.caller.ToString();
}

Status Collection::GrantRole(const CallContext& ctx, Role role, const Address& account) {
    const char* op = "GrantRole";
    const auto category = util::LogCategory::ROLES;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(category, op, ctx, ReentrantCall());
    }
    if (!roles_.HasRole(Role::DefaultAdmin, ctx.caller)) {
        return Reject(category, op, ctx, Unauthorized(ctx.caller, Role::DefaultAdmin));
    }
    if (account.IsNull()) {
        return Reject(category, op, ctx,
                      Status::Error(CollectionError::InvalidArgument, "zero account"));
    }

    if (roles_.Grant(role, account)) {
        EmitRoleEvent(EventKind::RoleGranted, ctx, role, account);
    }
    return Status::Ok();
}

Status Collection::RevokeRole(const CallContext& ctx, Role role, const Address& account) {
    const char* op = "RevokeRole";
    const auto category = util::LogCategory::ROLES;

    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(category, op, ctx, ReentrantCall());
    }
    if (!roles_.HasRole(Role::DefaultAdmin, ctx.caller)) {
        return Reject(category, op, ctx, Unauthorized(ctx.caller, Role::DefaultAdmin));
    }
    if (role == Role::DefaultAdmin && roles_.HasRole(role, account) &&
        roles_.MemberCount(role) == 1) {
        return Reject(category, op, ctx,
                      Status::Error(CollectionError::InvalidArgument,
                                    "cannot revoke the last admin"));
    }

    if (roles_.Revoke(role, account)) {
        EmitRoleEvent(EventKind::RoleRevoked, ctx, role, account);
    }
    return Status::Ok();
}

Status Collection::RenounceRole(const CallContext& ctx, Role role) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return Reject(util::LogCategory::ROLES, "RenounceRole", ctx, ReentrantCall());
    }

    if (roles_.Revoke(role, ctx.caller)) {
        EmitRoleEvent(EventKind::RoleRevoked, ctx, role, ctx.caller);
    }
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

SaleStage Collection::GetSaleStage(Timestamp now) const {
    return collection::GetSaleStage(config_, now);
}

ParticipantRecord Collection::GetParticipant(const Address& participant) const {
    auto it = participants_.find(participant);
    if (it == participants_.end()) {
        return ParticipantRecord{};
    }
    return it->second;
}

Status Collection::OwnerOf(TokenId tokenId, Address* owner) const {
    auto result = registry_->OwnerOf(tokenId);
    if (!result) {
        return Status::Error(CollectionError::NonExistentToken,
                             "token " + std::to_string(tokenId) + " does not exist");
    }
    if (owner) {
        *owner = *result;
    }
    return Status::Ok();
}

bool Collection::IsRevealed(Timestamp now) const {
    return collection::IsRevealed(config_, now);
}

} // namespace collection
} // namespace mintgate
