// MINTGATE CLI - Command Line Interface
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// Offline tooling for collection deployments: allowlist roots and proofs,
// address derivation, stage evaluation and call-journal replay.

#include <mintgate/allowlist/merkle.h>
#include <mintgate/collection/collection.h>
#include <mintgate/collection/journal.h>
#include <mintgate/collection/loader.h>
#include <mintgate/collection/relayer.h>
#include <mintgate/collection/stage.h>
#include <mintgate/crypto/keys.h>
#include <mintgate/util/config.h>
#include <mintgate/util/logging.h>

#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mintgate {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "MINTGATE CLI";

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    // Logging
    util::LogLevel logLevel{util::LogLevel::Warn};
    std::string logFile;

    // Command
    std::string command;
    std::vector<std::string> args;

    // Flags
    bool showHelp{false};
    bool showVersion{false};
};

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: mintgate-cli [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -d, --debug                Log debug output to the console\n";
    std::cout << "  --loglevel=LEVEL           Console log level (default: warn)\n";
    std::cout << "  --logfile=FILE             Also append logs to FILE\n";
    std::cout << "\nCommands:\n";
    std::cout << "  root <list>                          Allowlist root of an address file\n";
    std::cout << "  proof <list> <address>               Proof for an address in the file\n";
    std::cout << "  verify <root> <address> [proof...]   Check an allowlist proof\n";
    std::cout << "  address <private-key>                Address of a secp256k1 key\n";
    std::cout << "  stage <conf> <timestamp>             Sale stage at a time\n";
    std::cout << "  replay <conf> <journal>              Replay a call journal\n";
    std::cout << "\nExamples:\n";
    std::cout << "  mintgate-cli root og.txt\n";
    std::cout << "  mintgate-cli proof og.txt 0x70997970c51812dc3a010c7d01b50e0d17dc79c8\n";
    std::cout << "  mintgate-cli --debug replay collection.conf calls.journal\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 MINTGATE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"debug", no_argument, nullptr, 'd'},
        {"loglevel", required_argument, nullptr, 1001},
        {"logfile", required_argument, nullptr, 1002},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    optind = 1;

    while ((opt = getopt_long(argc, argv, "hvd", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'd':
                config.logLevel = util::LogLevel::Debug;
                break;
            case 1001:  // --loglevel
                config.logLevel = util::LogLevelFromString(optarg);
                break;
            case 1002:  // --logfile
                config.logFile = optarg;
                break;
            case '?':
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        if (config.command.empty()) {
            config.command = argv[i];
        } else {
            config.args.push_back(argv[i]);
        }
    }

    return true;
}

void SetupLogging(const CLIConfig& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::ConsoleSink::Config console;
    console.useStderr = true;
    console.showTimestamp = false;
    console.level = config.logLevel;
    logger.AddSink(std::make_shared<util::ConsoleSink>(console));

    util::LogLevel threshold = config.logLevel;
    if (!config.logFile.empty()) {
        auto file = std::make_shared<util::FileSink>(config.logFile, util::LogLevel::Debug);
        if (file->IsOpen()) {
            logger.AddSink(file);
            threshold = util::LogLevel::Debug;
        } else {
            std::cerr << "Warning: cannot open log file " << config.logFile << "\n";
        }
    }
    logger.SetLevel(threshold);
}

// ============================================================================
// Helpers
// ============================================================================

int PrintError(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
    return 1;
}

std::optional<Timestamp> ParseTimestamp(const std::string& str) {
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<Timestamp>(std::stoull(str));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool LoadAddressFile(const std::string& path, std::vector<Address>* participants) {
    std::ifstream file(path);
    if (!file.is_open()) {
        PrintError("cannot open " + path);
        return false;
    }
    Status status = allowlist::ReadAddressList(file, participants);
    if (!status.ok()) {
        PrintError(path + ": " + status.message());
        return false;
    }
    return true;
}

bool LoadDeploymentFile(const std::string& path, collection::Deployment* deployment) {
    util::ConfigManager config;
    util::ConfigParseResult parsed = config.ParseFile(path);
    if (!parsed.success) {
        std::string where = parsed.errorLine > 0 ? ":" + std::to_string(parsed.errorLine) : "";
        PrintError(path + where + ": " + parsed.errorMessage);
        return false;
    }
    Status status = collection::LoadDeployment(config, deployment);
    if (!status.ok()) {
        PrintError(path + ": " + status.message());
        return false;
    }
    return true;
}

// ============================================================================
// Commands
// ============================================================================

int CmdRoot(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return PrintError("usage: root <list>");
    }
    std::vector<Address> participants;
    if (!LoadAddressFile(args[0], &participants)) {
        return 1;
    }
    auto tree = allowlist::MerkleTree::FromAddresses(participants);
    std::cout << tree.GetRoot().ToString() << "\n";
    return 0;
}

int CmdProof(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return PrintError("usage: proof <list> <address>");
    }
    std::vector<Address> participants;
    if (!LoadAddressFile(args[0], &participants)) {
        return 1;
    }
    auto address = ParseAddress(args[1]);
    if (!address) {
        return PrintError("bad address " + args[1]);
    }
    auto tree = allowlist::MerkleTree::FromAddresses(participants);
    auto proof = tree.GetProof(allowlist::HashLeaf(*address));
    if (!proof) {
        return PrintError(address->ToString() + " is not on the list");
    }
    std::cout << allowlist::FormatProof(*proof) << "\n";
    return 0;
}

int CmdVerify(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return PrintError("usage: verify <root> <address> [proof...]");
    }
    auto root = ParseHash256(args[0]);
    if (!root) {
        return PrintError("bad root " + args[0]);
    }
    auto address = ParseAddress(args[1]);
    if (!address) {
        return PrintError("bad address " + args[1]);
    }

    allowlist::MerkleProof proof;
    for (size_t i = 2; i < args.size(); ++i) {
        auto part = allowlist::ParseProof(args[i]);
        if (!part) {
            return PrintError("bad proof element " + args[i]);
        }
        proof.insert(proof.end(), part->begin(), part->end());
    }

    bool valid = allowlist::VerifyMembership(*address, proof, *root);
    std::cout << (valid ? "valid" : "invalid") << "\n";
    return valid ? 0 : 2;
}

int CmdAddress(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return PrintError("usage: address <private-key>");
    }
    auto key = PrivateKey::FromHex(args[0]);
    if (!key) {
        return PrintError("not a valid secp256k1 private key");
    }
    auto address = key->GetAddress();
    if (!address) {
        return PrintError("public key derivation failed");
    }
    std::cout << address->ToString() << "\n";
    return 0;
}

int CmdStage(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return PrintError("usage: stage <conf> <timestamp>");
    }
    collection::Deployment deployment;
    if (!LoadDeploymentFile(args[0], &deployment)) {
        return 1;
    }
    auto now = ParseTimestamp(args[1]);
    if (!now) {
        return PrintError("bad timestamp " + args[1]);
    }
    std::cout << collection::SaleStageToString(collection::GetSaleStage(deployment.config, *now))
              << "\n";
    return 0;
}

int CmdReplay(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return PrintError("usage: replay <conf> <journal>");
    }
    collection::Deployment deployment;
    if (!LoadDeploymentFile(args[0], &deployment)) {
        return 1;
    }
    std::ifstream journal(args[1]);
    if (!journal.is_open()) {
        return PrintError("cannot open " + args[1]);
    }

    std::unique_ptr<collection::Collection> deployed = deployment.Deploy();
    std::unique_ptr<collection::Relayer> relayer;
    if (deployment.relayer) {
        relayer = std::make_unique<collection::Relayer>(*deployment.relayer, *deployed);
    }

    collection::ReplaySummary summary =
        collection::ReplayJournal(*deployed, relayer.get(), journal, std::cout);

    std::cout << "\n";
    std::cout << "calls:        " << summary.calls << " (" << summary.failures << " failed)\n";
    std::cout << "stage:        "
              << collection::SaleStageToString(deployed->GetSaleStage(summary.lastTimestamp))
              << "\n";
    std::cout << "total supply: " << deployed->TotalSupply() << "\n";
    std::cout << "balance:      " << FormatAmount(deployed->GetBalance()) << "\n";
    std::cout << "withdrawals:  " << deployed->GetTransactionCount() << "\n";
    for (uint64_t i = 0; i < deployed->GetTransactionCount(); ++i) {
        std::cout << "  [" << i << "] " << deployed->GetTransaction(i)->ToString() << "\n";
    }
    return summary.failures == 0 ? 0 : 2;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig config;

    if (!ParseCommandLine(argc, argv, config)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }

    if (config.showHelp) {
        PrintHelp();
        return 0;
    }

    if (config.showVersion) {
        PrintVersion();
        return 0;
    }

    if (config.command.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'mintgate-cli --help' for usage information.\n";
        return 1;
    }

    SetupLogging(config);
    LOG_DEBUG(util::LogCategory::CLI) << "Running " << config.command;

    const std::string& cmd = config.command;
    if (cmd == "root") return CmdRoot(config.args);
    if (cmd == "proof") return CmdProof(config.args);
    if (cmd == "verify") return CmdVerify(config.args);
    if (cmd == "address") return CmdAddress(config.args);
    if (cmd == "stage") return CmdStage(config.args);
    if (cmd == "replay") return CmdReplay(config.args);

    return PrintError("unknown command '" + cmd + "'. Use --help for usage.");
}

} // namespace cli
} // namespace mintgate

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        int result = mintgate::cli::AppMain(argc, argv);
        mintgate::util::Logger::Instance().Flush();
        return result;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
