// MINTGATE - Call Journal Replay Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/collection/journal.h>

#include <mintgate/allowlist/merkle.h>
#include <mintgate/core/hex.h>
#include <mintgate/util/logging.h>

#include <cctype>
#include <functional>
#include <map>
#include <optional>
#include <sstream>

namespace mintgate {
namespace collection {

namespace {

std::optional<uint64_t> ParseUInt(const std::string& str) {
    if (str.empty() || str.size() > 20) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        auto next = CheckedMul(value, 10);
        if (!next) return std::nullopt;
        next = CheckedAdd(*next, static_cast<uint64_t>(c - '0'));
        if (!next) return std::nullopt;
        value = *next;
    }
    return value;
}

Status BadArgs(const JournalCall& call, const std::string& reason) {
    return Status::Error(CollectionError::InvalidArgument, call.command + ": " + reason);
}

/// Typed access to positional arguments, remembering the first error
class Args {
public:
    explicit Args(const JournalCall& call) : call_(call) {}

    bool Expect(size_t min, size_t max) {
        if (call_.args.size() < min || call_.args.size() > max) {
            status_ = BadArgs(call_, "expected " + std::to_string(min) +
                                     (max != min ? "-" + std::to_string(max) : "") +
                                     " arguments");
            return false;
        }
        return true;
    }

    uint64_t UInt(size_t i) {
        auto value = ParseUInt(Arg(i));
        if (!value) Fail(i, "not an unsigned integer");
        return value.value_or(0);
    }

    Amount Money(size_t i) {
        auto value = ParseAmount(Arg(i));
        if (!value) Fail(i, "not an amount");
        return value.value_or(0);
    }

    Address Account(size_t i) {
        auto value = ParseAddress(Arg(i));
        if (!value) Fail(i, "not an address");
        return value.value_or(Address());
    }

    Hash256 Hash(size_t i) {
        auto value = ParseHash256(Arg(i));
        if (!value) Fail(i, "not a 32-byte hash");
        return value.value_or(Hash256());
    }

    allowlist::MerkleProof Proof(size_t i) {
        auto value = allowlist::ParseProof(Arg(i));
        if (!value) Fail(i, "not a proof");
        return value.value_or(allowlist::MerkleProof());
    }

    Role RoleArg(size_t i) {
        auto value = ParseRole(Arg(i));
        if (!value) Fail(i, "not a role");
        return value.value_or(Role::Operator);
    }

    std::vector<Byte> Bytes(size_t i) {
        if (i >= call_.args.size()) return {};
        if (!IsValidHex(call_.args[i])) {
            Fail(i, "not hex data");
            return {};
        }
        return HexToBytes(call_.args[i]);
    }

    const std::string& Arg(size_t i) const {
        static const std::string empty;
        return i < call_.args.size() ? call_.args[i] : empty;
    }

    bool ok() const { return status_.ok(); }
    const Status& status() const { return status_; }

private:
    void Fail(size_t i, const std::string& reason) {
        if (status_.ok()) {
            status_ = BadArgs(call_, "argument " + std::to_string(i + 1) + " " + reason);
        }
    }

    const JournalCall& call_;
    Status status_;
};

std::string DescribeTokens(const std::vector<TokenId>& ids) {
    if (ids.empty()) {
        return "";
    }
    if (ids.size() == 1) {
        return "token " + std::to_string(ids.front());
    }
    return "tokens " + std::to_string(ids.front()) + ".." + std::to_string(ids.back());
}

Status ApplySet(Collection& collection, const CallContext& ctx, const JournalCall& call) {
    Args args(call);
    if (!args.Expect(2, 2)) return args.status();

    const std::string& name = args.Arg(0);
    Status status;
    if (name == "price") {
        Amount price = args.Money(1);
        if (args.ok()) status = collection.SetPrice(ctx, price);
    } else if (name == "maxTokenPerWallet") {
        uint64_t value = args.UInt(1);
        if (args.ok()) status = collection.SetMaxTokenPerWallet(ctx, value);
    } else if (name == "maxMintPerTx") {
        uint64_t value = args.UInt(1);
        if (args.ok()) status = collection.SetMaxMintPerTx(ctx, value);
    } else if (name == "metadataBaseURI") {
        status = collection.SetMetadataBaseURI(ctx, args.Arg(1));
    } else if (name == "ogMerkleRoot") {
        Hash256 root = args.Hash(1);
        if (args.ok()) status = collection.SetOgMerkleRoot(ctx, root);
    } else if (name == "wlMerkleRoot") {
        Hash256 root = args.Hash(1);
        if (args.ok()) status = collection.SetWlMerkleRoot(ctx, root);
    } else if (name == "presaleDate") {
        uint64_t value = args.UInt(1);
        if (args.ok()) status = collection.SetPresaleDate(ctx, value);
    } else if (name == "publicSaleDate") {
        uint64_t value = args.UInt(1);
        if (args.ok()) status = collection.SetPublicSaleDate(ctx, value);
    } else if (name == "revealDate") {
        uint64_t value = args.UInt(1);
        if (args.ok()) status = collection.SetRevealDate(ctx, value);
    } else {
        return BadArgs(call, "unknown parameter " + name);
    }
    return args.ok() ? status : args.status();
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

Status ParseJournalLine(const std::string& text, int line, JournalCall* call) {
    JournalCall parsed;
    parsed.line = line;

    std::istringstream ss(text);
    std::vector<std::string> tokens;
    std::string token;
    while (ss >> token) {
        if (token[0] == '#') {
            break;
        }
        tokens.push_back(token);
    }

    if (tokens.empty()) {
        if (call) *call = parsed;
        return Status::Ok();
    }
    if (tokens.size() < 3) {
        return Status::Error(CollectionError::InvalidArgument,
                             "line " + std::to_string(line) +
                             ": expected <timestamp> <caller> <command>");
    }

    auto timestamp = ParseUInt(tokens[0]);
    if (!timestamp) {
        return Status::Error(CollectionError::InvalidArgument,
                             "line " + std::to_string(line) + ": bad timestamp " + tokens[0]);
    }
    auto caller = ParseAddress(tokens[1]);
    if (!caller) {
        return Status::Error(CollectionError::InvalidArgument,
                             "line " + std::to_string(line) + ": bad caller " + tokens[1]);
    }

    parsed.timestamp = *timestamp;
    parsed.caller = *caller;
    parsed.command = tokens[2];

    for (size_t i = 3; i < tokens.size(); ++i) {
        if (tokens[i].compare(0, 6, "value=") == 0) {
            auto value = ParseAmount(tokens[i].substr(6));
            if (!value) {
                return Status::Error(CollectionError::InvalidArgument,
                                     "line " + std::to_string(line) + ": bad " + tokens[i]);
            }
            parsed.value = *value;
        } else {
            parsed.args.push_back(tokens[i]);
        }
    }

    if (call) *call = std::move(parsed);
    return Status::Ok();
}

// ============================================================================
// Dispatch
// ============================================================================

Status ApplyJournalCall(Collection& collection, Relayer* relayer,
                        const JournalCall& call, std::string* detail) {
    CallContext ctx(call.caller, call.value, call.timestamp);
    Args args(call);
    std::vector<TokenId> tokenIds;
    std::string info;
    Status status;

    const std::string& cmd = call.command;
    if (cmd == "ogmint" || cmd == "wlmint" || cmd == "relay") {
        if (!args.Expect(2, 2)) return args.status();
        uint64_t amount = args.UInt(0);
        allowlist::MerkleProof proof = args.Proof(1);
        if (!args.ok()) return args.status();
        if (cmd == "ogmint") {
            status = collection.OgMint(ctx, amount, proof, &tokenIds);
        } else if (cmd == "wlmint") {
            status = collection.WlMint(ctx, amount, proof, &tokenIds);
        } else if (!relayer) {
            return BadArgs(call, "no relayer configured");
        } else {
            status = relayer->MintRelay(ctx, amount, proof, &tokenIds);
        }
        info = DescribeTokens(tokenIds);
    } else if (cmd == "mint") {
        if (!args.Expect(1, 1)) return args.status();
        uint64_t amount = args.UInt(0);
        if (!args.ok()) return args.status();
        status = collection.Mint(ctx, amount, &tokenIds);
        info = DescribeTokens(tokenIds);
    } else if (cmd == "operatormint") {
        if (!args.Expect(2, 2)) return args.status();
        Address recipient = args.Account(0);
        uint64_t amount = args.UInt(1);
        if (!args.ok()) return args.status();
        status = collection.OperatorMint(ctx, recipient, amount, &tokenIds);
        info = DescribeTokens(tokenIds);
    } else if (cmd == "submit") {
        if (!args.Expect(2, 3)) return args.status();
        Address to = args.Account(0);
        Amount value = args.Money(1);
        std::vector<Byte> data = args.Bytes(2);
        if (!args.ok()) return args.status();
        uint64_t index = 0;
        status = collection.SubmitWithdrawal(ctx, to, value, data, &index);
        if (status.ok()) info = "index " + std::to_string(index);
    } else if (cmd == "confirm" || cmd == "revoke" || cmd == "execute") {
        if (!args.Expect(1, 1)) return args.status();
        uint64_t index = args.UInt(0);
        if (!args.ok()) return args.status();
        if (cmd == "confirm") {
            status = collection.ConfirmWithdrawal(ctx, index);
        } else if (cmd == "revoke") {
            status = collection.RevokeConfirmation(ctx, index);
        } else {
            status = collection.ExecuteWithdrawal(ctx, index);
        }
    } else if (cmd == "set") {
        status = ApplySet(collection, ctx, call);
    } else if (cmd == "grant" || cmd == "revokerole") {
        if (!args.Expect(2, 2)) return args.status();
        Role role = args.RoleArg(0);
        Address account = args.Account(1);
        if (!args.ok()) return args.status();
        status = cmd == "grant" ? collection.GrantRole(ctx, role, account)
                                : collection.RevokeRole(ctx, role, account);
    } else if (cmd == "renounce") {
        if (!args.Expect(1, 1)) return args.status();
        Role role = args.RoleArg(0);
        if (!args.ok()) return args.status();
        status = collection.RenounceRole(ctx, role);
    } else {
        return BadArgs(call, "unknown command");
    }

    if (detail) {
        *detail = status.ok() ? info : "";
    }
    return status;
}

// ============================================================================
// Replay
// ============================================================================

ReplaySummary ReplayJournal(Collection& collection, Relayer* relayer,
                            std::istream& in, std::ostream& out) {
    ReplaySummary summary;
    std::string text;
    int line = 0;

    while (std::getline(in, text)) {
        ++line;

        JournalCall call;
        Status status = ParseJournalLine(text, line, &call);
        if (status.ok() && call.IsEmpty()) {
            continue;
        }

        ++summary.calls;
        std::string detail;
        if (status.ok()) {
            summary.lastTimestamp = call.timestamp;
            status = ApplyJournalCall(collection, relayer, call, &detail);
        }

        out << "line " << line << ": " << (call.command.empty() ? "?" : call.command)
            << " -> " << status.ToString();
        if (!detail.empty()) {
            out << " (" << detail << ")";
        }
        out << "\n";

        if (!status.ok()) {
            ++summary.failures;
        }
    }

    LOG_DEBUG(util::LogCategory::CLI) << "Replayed " << summary.calls << " calls, "
                                      << summary.failures << " failed";
    return summary;
}

} // namespace collection
} // namespace mintgate
