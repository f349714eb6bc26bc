// MINTGATE - Deployment Loader Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/collection/loader.h>

#include <mintgate/util/logging.h>

namespace mintgate {
namespace collection {

namespace {

constexpr const char* SECTION_COLLECTION = "collection";
constexpr const char* SECTION_TREASURY = "treasury";
constexpr const char* SECTION_POLICY = "policy";
constexpr const char* SECTION_RELAYER = "relayer";

Status Invalid(const char* section, const char* key, const std::string& reason) {
    return Status::Error(CollectionError::InvalidArgument,
                         std::string(section) + "." + key + ": " + reason);
}

/// Reads typed values from one section, remembering the first error
class SectionReader {
public:
    SectionReader(const util::ConfigManager& config, const char* section)
        : config_(config), section_(section) {}

    const Status& status() const { return status_; }

    void ReadAddress(const char* key, Address* out, bool required) {
        auto str = Raw(key, required);
        if (!str) return;
        auto parsed = ParseAddress(*str);
        if (!parsed) {
            Fail(key, "not a 20-byte hex address");
            return;
        }
        *out = *parsed;
    }

    void ReadHash(const char* key, Hash256* out) {
        auto str = Raw(key, false);
        if (!str) return;
        auto parsed = ParseHash256(*str);
        if (!parsed) {
            Fail(key, "not a 32-byte hex value");
            return;
        }
        *out = *parsed;
    }

    void ReadAmount(const char* key, Amount* out) {
        auto str = Raw(key, false);
        if (!str) return;
        auto parsed = ParseAmount(*str);
        if (!parsed) {
            Fail(key, "not a decimal amount");
            return;
        }
        *out = *parsed;
    }

    void ReadUInt(const char* key, uint64_t* out, bool required) {
        if (!Raw(key, required)) return;
        auto parsed = config_.TryGetUInt(key, section_);
        if (!parsed) {
            Fail(key, "not an unsigned integer");
            return;
        }
        *out = *parsed;
    }

    void ReadBool(const char* key, bool* out) {
        if (!Raw(key, false)) return;
        auto parsed = config_.TryGetBool(key, section_);
        if (!parsed) {
            Fail(key, "not a boolean");
            return;
        }
        *out = *parsed;
    }

    void ReadString(const char* key, std::string* out) {
        auto str = Raw(key, false);
        if (str) *out = *str;
    }

    std::optional<std::string> Raw(const char* key, bool required) {
        if (!status_.ok()) return std::nullopt;
        auto str = config_.TryGetString(key, section_);
        if (!str && required) {
            Fail(key, "required");
        }
        return str;
    }

    void Fail(const char* key, const std::string& reason) {
        if (status_.ok()) {
            status_ = Invalid(section_, key, reason);
        }
    }

private:
    const util::ConfigManager& config_;
    const char* section_;
    Status status_;
};

Status LoadCollection(const util::ConfigManager& config, Deployment* out) {
    SectionReader reader(config, SECTION_COLLECTION);
    CollectionConfig& c = out->config;

    reader.ReadAddress("admin", &out->admin, true);
    reader.ReadAmount("price", &c.price);
    reader.ReadUInt("maxTokenPerWallet", &c.maxTokenPerWallet, false);
    reader.ReadUInt("maxMintPerTx", &c.maxMintPerTx, false);
    reader.ReadUInt("presaleDate", &c.presaleDate, true);
    reader.ReadUInt("publicSaleDate", &c.publicSaleDate, true);
    reader.ReadUInt("revealDate", &c.revealDate, false);
    reader.ReadHash("ogMerkleRoot", &c.ogMerkleRoot);
    reader.ReadHash("wlMerkleRoot", &c.wlMerkleRoot);
    reader.ReadString("metadataBaseURI", &c.metadataBaseURI);

    if (reader.status().ok() && c.presaleDate > c.publicSaleDate) {
        LOG_WARN(util::LogCategory::CONFIG) << "presaleDate " << c.presaleDate
                                            << " is after publicSaleDate " << c.publicSaleDate
                                            << "; presale stages will be skipped";
    }
    return reader.status();
}

Status LoadTreasury(const util::ConfigManager& config, Deployment* out) {
    for (const auto& entry : config.GetList("approver", SECTION_TREASURY)) {
        auto approver = ParseAddress(entry);
        if (!approver) {
            return Invalid(SECTION_TREASURY, "approver", "not a 20-byte hex address: " + entry);
        }
        out->approvers.push_back(*approver);
    }

    SectionReader reader(config, SECTION_TREASURY);
    uint64_t quorum = out->approvers.size();
    reader.ReadUInt("quorum", &quorum, false);
    if (!reader.status().ok()) {
        return reader.status();
    }
    if (quorum == 0) {
        return Invalid(SECTION_TREASURY, "quorum", "must be at least 1");
    }
    if (quorum > out->approvers.size()) {
        LOG_WARN(util::LogCategory::CONFIG) << "quorum " << quorum << " exceeds the "
                                            << out->approvers.size()
                                            << " configured approvers";
    }
    out->quorum = static_cast<size_t>(quorum);
    return Status::Ok();
}

Status LoadPolicy(const util::ConfigManager& config, Deployment* out) {
    SectionReader reader(config, SECTION_POLICY);
    SalePolicy& policy = out->config.policy;

    if (auto str = reader.Raw("capPolicy", false)) {
        auto parsed = ParseCapPolicy(*str);
        if (!parsed) {
            return Invalid(SECTION_POLICY, "capPolicy", "expected cumulative or per-transaction");
        }
        policy.capPolicy = *parsed;
    }
    if (auto str = reader.Raw("allowlistClaim", false)) {
        auto parsed = ParseClaimPolicy(*str);
        if (!parsed) {
            return Invalid(SECTION_POLICY, "allowlistClaim", "expected repeatable or claim-once");
        }
        policy.allowlistClaim = *parsed;
    }
    reader.ReadBool("withdrawalRequiresPublicSale", &policy.withdrawalRequiresPublicSale);
    reader.ReadBool("lockRootsOutsideIdle", &policy.lockRootsOutsideIdle);
    return reader.status();
}

Status LoadRelayer(const util::ConfigManager& config, Deployment* out) {
    if (config.GetKeys(SECTION_RELAYER).empty()) {
        return Status::Ok();
    }

    RelayerConfig relayer;
    SectionReader reader(config, SECTION_RELAYER);
    reader.ReadAddress("address", &relayer.address, true);
    reader.ReadAddress("owner", &relayer.owner, true);
    reader.ReadHash("merkleRoot", &relayer.merkleRoot);
    reader.ReadAmount("price", &relayer.price);
    reader.ReadUInt("presaleStartDate", &relayer.presaleStartDate, false);
    reader.ReadUInt("presaleEndDate", &relayer.presaleEndDate, false);
    if (!reader.status().ok()) {
        return reader.status();
    }
    out->relayer = relayer;
    return Status::Ok();
}

} // anonymous namespace

std::unique_ptr<Collection> Deployment::Deploy(std::shared_ptr<IOwnershipRegistry> registry) const {
    return std::make_unique<Collection>(admin, approvers, quorum, config, std::move(registry));
}

Status LoadDeployment(const util::ConfigManager& config, Deployment* deployment) {
    Deployment loaded;

    Status status = LoadCollection(config, &loaded);
    if (status.ok()) status = LoadTreasury(config, &loaded);
    if (status.ok()) status = LoadPolicy(config, &loaded);
    if (status.ok()) status = LoadRelayer(config, &loaded);

    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Invalid deployment: " << status.message();
        return status;
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded deployment for admin "
                                         << loaded.admin.ToString() << " with "
                                         << loaded.approvers.size() << " approvers";
    if (deployment) {
        *deployment = std::move(loaded);
    }
    return Status::Ok();
}

} // namespace collection
} // namespace mintgate
