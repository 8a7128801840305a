// =============================================================================
// merklegate CLI - Eligibility commitment builder
// =============================================================================
//
// Commits a list of account identifiers to a Merkle root and emits a proof per
// identifier, or checks a membership proof against a root.
//
// Usage:
//   merklegate [global options] <command> [options]
//
// Commands:
//   build       Build root and proofs from a CSV identifier list
//   verify      Check a membership proof against a root
//   checksum    Canonicalize identifiers and print their leaf digests
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   merklegate build -i voters.csv -o out/merkle.json
//   merklegate build voters.csv out/voterList.json --format voters --split-proofs
//   merklegate verify --artifact out/merkle.json --address 0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed
//   merklegate checksum 0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed
//
// =============================================================================

#include <algorithm>
#include <chrono>
#include <exception>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "merklegate/address.hpp"
#include "merklegate/commitment.hpp"
#include "merklegate/config.hpp"
#include "merklegate/error.hpp"
#include "merklegate/io/artifact.hpp"
#include "merklegate/leaf_hasher.hpp"
#include "merklegate/logging.hpp"
#include "merklegate/merkle_proof.hpp"
#include "merklegate/record_parser.hpp"
#include "merklegate/util/hex.hpp"

namespace merklegate::cli {
    int cmd_build(int argc, char* argv[]);
    int cmd_verify(int argc, char* argv[]);
    int cmd_checksum(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define MERKLEGATE_VERSION_MAJOR 1
#define MERKLEGATE_VERSION_MINOR 0
#define MERKLEGATE_VERSION_PATCH 0
#define MERKLEGATE_VERSION_STRING "1.0.0"

// Exit statuses
static constexpr int EXIT_OK = 0;
static constexpr int EXIT_FATAL = 1;
static constexpr int EXIT_USAGE = 2;

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"build",    "Build root and proofs from a CSV identifier list", merklegate::cli::cmd_build},
    {"verify",   "Check a membership proof against a root", merklegate::cli::cmd_verify},
    {"checksum", "Canonicalize identifiers and print their leaf digests", merklegate::cli::cmd_checksum},
    {"version",  "Show version information", merklegate::cli::cmd_version},
    {"help",     "Show this help message", merklegate::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

static GlobalOptions g_options;

namespace merklegate::cli {

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "merklegate - Merkle commitment builder for eligibility lists\n";
    std::cout << "Version " << MERKLEGATE_VERSION_STRING << "\n\n";
    std::cout << "Usage: merklegate [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     key=value configuration file\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Warnings and errors only\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "\nBuild Options:\n";
    std::cout << "  -i, --input <path>      Input CSV (default: voters.csv)\n";
    std::cout << "  -o, --output <path>     Output JSON (default: out/merkle.json)\n";
    std::cout << "  -f, --format <fmt>      merkle | voters (default: merkle)\n";
    std::cout << "  -a, --adapter <name>    csv | voters (default: csv)\n";
    std::cout << "  --sort-leaves           Sort leaf digests so the root depends only on the set\n";
    std::cout << "  --split-proofs          Also write merkleRoot.txt and proofs/<address>.json\n";
    std::cout << "  -t, --threads <n>       Leaf hashing threads (0 = auto)\n";
    std::cout << "\nVerify Options:\n";
    std::cout << "  --artifact <path>       merkle-format artifact to take root and proof from\n";
    std::cout << "  --root <hex>            Expected root\n";
    std::cout << "  --address <addr>        Identifier whose leaf is checked\n";
    std::cout << "  --leaf <hex>            Leaf digest, instead of --address\n";
    std::cout << "  --proof <hex,hex,...>   Sibling digests, lowest level first\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  MG_LOG_LEVEL            debug | info | warn | error | fatal\n";
    std::cout << "  MG_LOG_FILE             Append log output to this file\n";
    std::cout << "  MG_INPUT, MG_OUTPUT     Default build paths\n";
    std::cout << "  MG_FORMAT, MG_ADAPTER   Default artifact format and record adapter\n";
    std::cout << "  MG_SORT_LEAVES          true to sort leaves by default\n";
    std::cout << "  MG_MAX_THREADS          Leaf hashing threads (0 = auto)\n";
    std::cout << "\nExamples:\n";
    std::cout << "  merklegate build -i voters.csv -o out/merkle.json\n";
    std::cout << "  merklegate build voters.csv out/voterList.json --format voters --split-proofs\n";
    std::cout << "  merklegate verify --artifact out/merkle.json --address 0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed\n";
    std::cout << "  merklegate checksum 0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed\n";

    return EXIT_OK;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "merklegate " << MERKLEGATE_VERSION_STRING << "\n";
    std::cout << "Leaf hash: keccak256(20-byte identifier)\n";
    std::cout << "Node hash: keccak256(min(a,b) || max(a,b))\n";
    return EXIT_OK;
}

// =============================================================================
// Build Command
// =============================================================================

static void log_report_summary(const CommitmentReport& report) {
    LOG_INFO("Processed ", report.lines_processed, " lines",
             report.header_detected ? " (header skipped)" : "");
    LOG_INFO("Valid identifiers: ", report.accepted.size());

    if (!report.rejections.empty()) {
        LOG_WARN("Rejected lines: ", report.rejections.size());
        for (const auto& r : report.rejections) {
            if (r.detail.empty()) {
                LOG_WARN("  Line ", r.line_number, ": ", to_string(r.reason));
            } else {
                LOG_WARN("  Line ", r.line_number, ": ", to_string(r.reason), " - ", r.detail);
            }
        }
    }

    LOG_INFO("Merkle root: ", report.root.to_hex());
    LOG_INFO("Tree height: ", report.height,
             report.leaf_order == LeafOrder::SORTED ? " (sorted leaves)" : "");
}

int cmd_build(int argc, char* argv[]) {
    Config& config = Config::getInstance();

    std::string input = config.get<std::string>("build.input", "voters.csv");
    std::string output = config.get<std::string>("build.output", "out/merkle.json");
    std::string format_name = config.get<std::string>("build.format", "merkle");
    std::string adapter_name = config.get<std::string>("build.adapter", "csv");
    bool sort_leaves = config.get<bool>("build.sort_leaves", false);
    size_t threads = config.get<size_t>("perf.max_threads", 0);
    bool split_proofs = false;

    std::vector<std::string> positional;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            input = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output = argv[++i];
        } else if ((arg == "-f" || arg == "--format") && i + 1 < argc) {
            format_name = argv[++i];
        } else if ((arg == "-a" || arg == "--adapter") && i + 1 < argc) {
            adapter_name = argv[++i];
        } else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
            try {
                threads = static_cast<size_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid thread count: " << argv[i] << "\n";
                return EXIT_USAGE;
            }
        } else if (arg == "--sort-leaves") {
            sort_leaves = true;
        } else if (arg == "--split-proofs") {
            split_proofs = true;
        } else if (arg == "-h" || arg == "--help") {
            return cmd_help(0, nullptr);
        } else if (!arg.empty() && arg[0] != '-') {
            positional.push_back(arg);
        } else {
            std::cerr << "Unknown build option: " << arg << "\n";
            std::cerr << "Run 'merklegate help' for usage.\n";
            return EXIT_USAGE;
        }
    }

    if (positional.size() > 2) {
        std::cerr << "Usage: merklegate build [options] [INPUT [OUTPUT]]\n";
        return EXIT_USAGE;
    }
    if (!positional.empty()) input = positional[0];
    if (positional.size() == 2) output = positional[1];

    if (threads == 0) {
        threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    LOG_DEBUG("Leaf hashing threads requested: ", threads);

    try {
        auto adapter = make_record_adapter(adapter_name);

        io::ArtifactOptions artifact_options;
        artifact_options.format = io::parse_artifact_format(format_name);
        artifact_options.split_proofs = split_proofs;

        CommitmentOptions options;
        options.leaf_order = sort_leaves ? LeafOrder::SORTED : LeafOrder::INPUT;
        options.hash_threads = threads;

        LOG_INFO("Starting Merkle tree generation");
        LOG_INFO("Input file: ", input);
        LOG_INFO("Output file: ", output);

        auto start = std::chrono::steady_clock::now();

        CommitmentBuilder builder(options);
        CommitmentReport report = builder.build_from_file(input, *adapter);

        log_report_summary(report);

        io::write_artifact(report, output, artifact_options);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        LOG_INFO("Merkle tree saved to: ", output, " (", io::artifact_format_name(artifact_options.format),
                 " format, ", elapsed, " ms)");
        if (split_proofs) {
            LOG_INFO("Per-identifier proof files written beside the artifact");
        }
        return EXIT_OK;
    } catch (const MerklegateException& e) {
        LOG_ERROR("Build failed [", error_code_name(e.code()), "]: ", e.message());
        if (!e.context().empty()) LOG_ERROR("  Context: ", e.context());
        if (!e.suggestion().empty()) LOG_ERROR("  Suggestion: ", e.suggestion());
        LOG_ERROR("No artifact written");
        return e.code() == ErrorCode::INVALID_ARGUMENT ? EXIT_USAGE : EXIT_FATAL;
    } catch (const std::exception& e) {
        LOG_ERROR("Build failed: ", e.what());
        LOG_ERROR("No artifact written");
        return EXIT_FATAL;
    }
}

// =============================================================================
// Verify Command
// =============================================================================

static std::optional<Proof> parse_proof_list(const std::string& list) {
    Proof proof;
    if (list.empty()) return proof;

    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        std::string item = list.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        auto d = Digest::from_hex(std::string(util::trim(item)));
        if (!d) return std::nullopt;
        proof.push_back(*d);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return proof;
}

int cmd_verify(int argc, char* argv[]) {
    std::string artifact_path;
    std::string root_hex;
    std::string address_text;
    std::string leaf_hex;
    std::string proof_list;
    bool have_proof = false;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--artifact" && i + 1 < argc) {
            artifact_path = argv[++i];
        } else if (arg == "--root" && i + 1 < argc) {
            root_hex = argv[++i];
        } else if (arg == "--address" && i + 1 < argc) {
            address_text = argv[++i];
        } else if (arg == "--leaf" && i + 1 < argc) {
            leaf_hex = argv[++i];
        } else if (arg == "--proof" && i + 1 < argc) {
            proof_list = argv[++i];
            have_proof = true;
        } else {
            std::cerr << "Unknown verify option: " << arg << "\n";
            return EXIT_USAGE;
        }
    }

    if (address_text.empty() == leaf_hex.empty() || (artifact_path.empty() && root_hex.empty())) {
        std::cerr << "Usage: merklegate verify (--artifact PATH | --root HEX --proof LIST)\n";
        std::cerr << "                         (--address ADDR | --leaf HEX)\n";
        return EXIT_USAGE;
    }

    try {
        std::optional<Address> address;
        Digest leaf;
        if (!address_text.empty()) {
            address = Address::parse(address_text);
            if (!address) {
                std::cerr << "Invalid identifier: " << address_text << "\n";
                return EXIT_USAGE;
            }
            leaf = hash_leaf(*address);
        } else {
            auto parsed = Digest::from_hex(leaf_hex);
            if (!parsed) {
                std::cerr << "Invalid leaf digest: " << leaf_hex << "\n";
                return EXIT_USAGE;
            }
            leaf = *parsed;
        }

        Digest root;
        Proof proof;

        if (!artifact_path.empty()) {
            io::MerkleArtifact artifact = io::read_merkle_artifact(artifact_path);
            root = artifact.root;
            if (!have_proof) {
                if (!address) {
                    std::cerr << "--artifact lookups need --address\n";
                    return EXIT_USAGE;
                }
                const Proof* found = artifact.find_proof(address->checksummed());
                if (!found) {
                    std::cout << "not eligible: " << address->checksummed() << " has no proof in artifact\n";
                    return EXIT_FATAL;
                }
                proof = *found;
            }
        }

        if (!root_hex.empty()) {
            auto parsed = Digest::from_hex(root_hex);
            if (!parsed) {
                std::cerr << "Invalid root: " << root_hex << "\n";
                return EXIT_USAGE;
            }
            root = *parsed;
        }

        if (have_proof) {
            auto parsed = parse_proof_list(proof_list);
            if (!parsed) {
                std::cerr << "Invalid proof list: " << proof_list << "\n";
                return EXIT_USAGE;
            }
            proof = std::move(*parsed);
        }

        Digest computed = compute_root(leaf, proof);
        LOG_DEBUG("Leaf ", leaf.to_hex(), " with ", proof.size(), " siblings folds to ", computed.to_hex());

        if (computed == root) {
            std::cout << "valid: leaf " << leaf.to_hex() << " is committed under root " << root.to_hex() << "\n";
            return EXIT_OK;
        }
        std::cout << "invalid: proof folds to " << computed.to_hex() << ", expected " << root.to_hex() << "\n";
        return EXIT_FATAL;
    } catch (const MerklegateException& e) {
        LOG_ERROR("Verify failed [", error_code_name(e.code()), "]: ", e.message());
        return EXIT_FATAL;
    } catch (const std::exception& e) {
        LOG_ERROR("Verify failed: ", e.what());
        return EXIT_FATAL;
    }
}

// =============================================================================
// Checksum Command
// =============================================================================

int cmd_checksum(int argc, char* argv[]) {
    bool strict = false;
    std::vector<std::string> inputs;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--strict") {
            strict = true;
        } else {
            inputs.push_back(arg);
        }
    }

    if (inputs.empty()) {
        std::cerr << "Usage: merklegate checksum [--strict] ADDR...\n";
        return EXIT_USAGE;
    }

    int status = EXIT_OK;
    for (const auto& text : inputs) {
        auto address = strict ? Address::parse_strict(text) : Address::parse(text);
        if (!address) {
            std::cout << text << "  invalid\n";
            status = EXIT_FATAL;
            continue;
        }
        std::cout << address->checksummed() << "  " << hash_leaf(*address).to_hex() << "\n";
    }
    return status;
}

}  // namespace merklegate::cli

// =============================================================================
// Main Entry Point
// =============================================================================

static void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            g_options.help = true;
        } else {
            // First non-global token is the command (or a build option)
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (g_options.help) {
        return merklegate::cli::cmd_help(0, nullptr);
    }

    if (!merklegate::init_config(g_options.config_file)) {
        return EXIT_FATAL;
    }

    if (g_options.verbose) {
        merklegate::set_log_level(merklegate::LogLevel::DEBUG);
    } else if (g_options.quiet) {
        merklegate::set_log_level(merklegate::LogLevel::WARN);
    }

    if (argc < 1) {
        merklegate::cli::cmd_help(0, nullptr);
        return EXIT_USAGE;
    }

    const char* cmd_name = argv[0];

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc - 1, argv + 1);
        }
    }

    // No command word: treat the arguments as a build invocation
    if (cmd_name[0] == '-' || std::strchr(cmd_name, '.') || std::strchr(cmd_name, '/')) {
        return merklegate::cli::cmd_build(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'merklegate help' for usage.\n";
    return EXIT_USAGE;
}
