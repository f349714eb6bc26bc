// MINTGATE - Collection Sale Engine
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// State machine for a fixed-supply collection sale:
// - Time-gated stages (OG presale, WL presale, public sale)
// - Allowlist membership proofs for the presale stages
// - Per-participant and per-call caps, payment checks
// - Operator mints that bypass the sale rules but not the supply cap
// - Multi-approval withdrawals of the collected funds
//
// Every mutating call takes a CallContext and returns a Status. A call that
// fails changes nothing. Calls on one instance are serialized by a
// re-entrancy guard; a nested call (for example from a transfer handler)
// fails with ReentrantCall.

#ifndef MINTGATE_COLLECTION_COLLECTION_H
#define MINTGATE_COLLECTION_COLLECTION_H

#include <mintgate/allowlist/merkle.h>
#include <mintgate/collection/events.h>
#include <mintgate/collection/guard.h>
#include <mintgate/collection/params.h>
#include <mintgate/collection/registry.h>
#include <mintgate/collection/roles.h>
#include <mintgate/collection/stage.h>
#include <mintgate/core/status.h>
#include <mintgate/core/types.h>
#include <mintgate/treasury/withdrawal.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mintgate {
namespace collection {

/// Moves withdrawn funds out. Returns false if the transfer did not happen.
using TransferHandler =
    std::function<bool(const Address& to, Amount value, const std::vector<Byte>& data)>;

class Collection {
public:
    /**
     * Deploy a collection.
     *
     * The admin receives DefaultAdmin and the RESERVED_TOKENS reserve.
     * Every approver receives Operator.
     *
     * @param admin Administrator and sole withdrawal executor
     * @param approvers Initial withdrawal approvers
     * @param quorum Confirmations needed to execute a withdrawal
     * @param config Initial sale configuration
     * @param registry Ownership store; a TokenRegistry capped at TOTAL_SUPPLY
     *                 is created when null
     * @throws std::invalid_argument for a null admin, a zero quorum or a
     *         registry that cannot hold the reserve
     */
    Collection(const Address& admin,
               const std::vector<Address>& approvers,
               size_t quorum,
               const CollectionConfig& config,
               std::shared_ptr<IOwnershipRegistry> registry = nullptr);

    Collection(const Collection&) = delete;
    Collection& operator=(const Collection&) = delete;

    // ========================================================================
    // Minting
    // ========================================================================

    /// OG presale mint for the caller. Requires stage PresaleOg.
    Status OgMint(const CallContext& ctx, uint64_t amount,
                  const allowlist::MerkleProof& proof,
                  std::vector<TokenId>* tokenIds = nullptr);

    /// WL presale mint for the caller. Requires stage PresaleWl.
    Status WlMint(const CallContext& ctx, uint64_t amount,
                  const allowlist::MerkleProof& proof,
                  std::vector<TokenId>* tokenIds = nullptr);

    /// Public sale mint for the caller. Requires stage PublicSale.
    Status Mint(const CallContext& ctx, uint64_t amount,
                std::vector<TokenId>* tokenIds = nullptr);

    /// Privileged mint to `recipient` at any stage. Any attached value is
    /// credited to the balance.
    Status OperatorMint(const CallContext& ctx, const Address& recipient, uint64_t amount,
                        std::vector<TokenId>* tokenIds = nullptr);

    // ========================================================================
    // Withdrawals
    // ========================================================================

    Status SubmitWithdrawal(const CallContext& ctx, const Address& to, Amount value,
                            const std::vector<Byte>& data, uint64_t* index);
    Status ConfirmWithdrawal(const CallContext& ctx, uint64_t index);
    Status RevokeConfirmation(const CallContext& ctx, uint64_t index);

    /**
     * Transfer the funds of a confirmed withdrawal. Admin only.
     *
     * Checks in order: index, not executed, quorum, public sale (when
     * SalePolicy::withdrawalRequiresPublicSale), metadata base URI configured,
     * balance. The transaction is marked executed and the balance debited
     * before the transfer handler runs; if the handler fails both are
     * restored and TransferFailed is returned.
     */
    Status ExecuteWithdrawal(const CallContext& ctx, uint64_t index);

    /// Install the transfer hook. Without one, transfers always succeed.
    void SetTransferHandler(TransferHandler handler) { transferHandler_ = std::move(handler); }

    // ========================================================================
    // Admin Setters
    // ========================================================================

    Status SetPrice(const CallContext& ctx, Amount price);
    Status SetMaxTokenPerWallet(const CallContext& ctx, uint64_t maxTokenPerWallet);
    Status SetMaxMintPerTx(const CallContext& ctx, uint64_t maxMintPerTx);
    Status SetMetadataBaseURI(const CallContext& ctx, const std::string& uri);
    Status SetOgMerkleRoot(const CallContext& ctx, const Hash256& root);
    Status SetWlMerkleRoot(const CallContext& ctx, const Hash256& root);
    Status SetPresaleDate(const CallContext& ctx, Timestamp date);
    Status SetPublicSaleDate(const CallContext& ctx, Timestamp date);
    Status SetRevealDate(const CallContext& ctx, Timestamp date);

    // ========================================================================
    // Roles
    // ========================================================================

    /// Admin only
    Status GrantRole(const CallContext& ctx, Role role, const Address& account);

    /// Admin only. The last DefaultAdmin cannot be revoked.
    Status RevokeRole(const CallContext& ctx, Role role, const Address& account);

    /// Drop a role held by the caller
    Status RenounceRole(const CallContext& ctx, Role role);

    bool HasRole(Role role, const Address& account) const { return roles_.HasRole(role, account); }

    /// Current Operator holders
    std::vector<Address> GetApprovers() const { return roles_.GetMembers(Role::Operator); }

    // ========================================================================
    // Queries
    // ========================================================================

    SaleStage GetSaleStage(Timestamp now) const;
    ParticipantRecord GetParticipant(const Address& participant) const;
    uint64_t TotalSupply() const { return registry_->TotalSupply(); }
    uint64_t BalanceOf(const Address& owner) const { return registry_->BalanceOf(owner); }

    /// NonExistentToken for ids that were never minted
    Status OwnerOf(TokenId tokenId, Address* owner) const;

    bool IsRevealed(Timestamp now) const;

    const treasury::WithdrawalTransaction* GetTransaction(uint64_t index) const {
        return treasury_.Get(index);
    }
    uint64_t GetTransactionCount() const { return treasury_.Count(); }
    Amount GetBalance() const { return treasury_.GetBalance(); }
    size_t GetQuorum() const { return treasury_.GetQuorum(); }

    const std::vector<Event>& GetEvents() const { return events_.GetEvents(); }
    EventLog& GetEventLog() { return events_; }

    const CollectionConfig& GetConfig() const { return config_; }
    const Address& GetAdmin() const { return admin_; }

private:
    enum class Tier { Og, Wl };

    Status AllowlistMint(const CallContext& ctx, Tier tier, uint64_t amount,
                         const allowlist::MerkleProof& proof,
                         std::vector<TokenId>* tokenIds);

    /// Registry mint, record update, payment credit and event. Validation
    /// must be complete before this is called.
    Status CommitMint(const CallContext& ctx, const Address& recipient, uint64_t amount,
                      const ParticipantRecord* record, std::vector<TokenId>* tokenIds);

    Status CheckSupply(uint64_t amount) const;
    Status CheckPayment(Amount paid, Amount unitPrice, uint64_t amount) const;

    /// Guard and DefaultAdmin check shared by the setters
    template<typename Apply>
    Status UpdateParameter(const CallContext& ctx, const char* name, bool idleOnly,
                           const std::string& value, Apply apply);

    void EmitRoleEvent(EventKind kind, const CallContext& ctx, Role role, const Address& account);

    Address admin_;
    CollectionConfig config_;
    std::shared_ptr<IOwnershipRegistry> registry_;
    AccessControl roles_;
    treasury::MultiApprovalTreasury treasury_;
    std::map<Address, ParticipantRecord> participants_;
    EventLog events_;
    ReentrancyGuard guard_;
    TransferHandler transferHandler_;
};

} // namespace collection
} // namespace mintgate

#endif // MINTGATE_COLLECTION_COLLECTION_H
