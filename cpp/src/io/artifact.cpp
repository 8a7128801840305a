#include "merklegate/io/artifact.hpp"
#include "merklegate/error.hpp"
#include "merklegate/logging.hpp"
#include "merklegate/util/hex.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <system_error>

namespace merklegate {
namespace io {

namespace {

// Two-space indented array of digests, "[]" when empty
void append_digest_array(std::ostringstream& out, const std::vector<Digest>& digests,
                         const std::string& indent) {
    if (digests.empty()) {
        out << "[]";
        return;
    }
    out << "[\n";
    for (size_t i = 0; i < digests.size(); ++i) {
        out << indent << "  \"" << digests[i].to_hex() << "\"";
        if (i + 1 < digests.size()) out << ",";
        out << "\n";
    }
    out << indent << "]";
}

std::string field_or_empty(const AcceptedIdentifier& id, size_t column) {
    return column < id.fields.size() ? id.fields[column] : std::string();
}

// Body of one voterProofs entry, without surrounding braces
void append_voter_entry(std::ostringstream& out, const CommitmentReport& report, size_t index,
                        const std::string& indent) {
    const auto& id = report.accepted[index];
    out << indent << "\"address\": \"" << id.address.lowercase() << "\",\n";
    out << indent << "\"proof\": ";
    append_digest_array(out, report.proofs[index], indent);

    std::string name = field_or_empty(id, 0);
    std::string email = field_or_empty(id, 1);
    if (!name.empty()) {
        out << ",\n" << indent << "\"name\": \"" << json_escape(name) << "\"";
    }
    if (!email.empty()) {
        out << ",\n" << indent << "\"email\": \"" << json_escape(email) << "\"";
    }
    out << "\n";
}

// Every element of a JSON string array must be a 32-byte hex digest
std::vector<Digest> extract_digests(const std::string& section) {
    static const std::regex string_pattern(R"re("([^"]*)")re");

    std::vector<Digest> out;
    std::string rest;
    size_t last = 0;
    for (std::sregex_iterator it(section.begin(), section.end(), string_pattern), end; it != end; ++it) {
        const size_t pos = static_cast<size_t>(it->position(0));
        rest += section.substr(last, pos - last);
        last = pos + static_cast<size_t>(it->length(0));

        auto d = Digest::from_hex((*it)[1].str());
        if (!d) {
            throw InputError(ErrorCode::MALFORMED_ARTIFACT, "Malformed digest: \"" + (*it)[1].str() + "\"",
                             "parse_merkle_json");
        }
        out.push_back(*d);
    }
    rest += section.substr(last);

    // Only brackets, separators and whitespace may remain
    for (char c : rest) {
        if (c != '[' && c != ']' && c != ',' && !std::isspace(static_cast<unsigned char>(c))) {
            throw InputError(ErrorCode::MALFORMED_ARTIFACT, "Digest array holds a non-string element",
                             "parse_merkle_json");
        }
    }
    return out;
}

// Text between the bracket opening after `key` and its matching close
std::optional<std::string> extract_section(const std::string& content, const std::string& key,
                                           char open, char close) {
    size_t key_pos = content.find("\"" + key + "\"");
    if (key_pos == std::string::npos) return std::nullopt;

    size_t start = content.find(open, key_pos);
    if (start == std::string::npos) return std::nullopt;

    int depth = 1;
    size_t end = start + 1;
    while (end < content.size() && depth > 0) {
        if (content[end] == open) depth++;
        else if (content[end] == close) depth--;
        end++;
    }
    if (depth != 0) return std::nullopt;
    return content.substr(start, end - start);
}

} // anonymous namespace

ArtifactFormat parse_artifact_format(const std::string& name) {
    if (name == "merkle") return ArtifactFormat::MERKLE;
    if (name == "voters") return ArtifactFormat::VOTERS;
    throw InvalidArgumentError("Unknown artifact format: " + name, "parse_artifact_format",
                               "Use 'merkle' or 'voters'");
}

const char* artifact_format_name(ArtifactFormat format) noexcept {
    switch (format) {
        case ArtifactFormat::MERKLE: return "merkle";
        case ArtifactFormat::VOTERS: return "voters";
    }
    return "unknown";
}

std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string utc_timestamp_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc_tm{};
    gmtime_r(&time_t, &utc_tm);

    std::ostringstream ss;
    ss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::string render_merkle_json(const CommitmentReport& report) {
    MERKLEGATE_CHECK(report.proofs.size() == report.accepted.size(), ErrorCode::INTERNAL_ERROR,
                     "Report holds " + std::to_string(report.proofs.size()) + " proofs for " +
                         std::to_string(report.accepted.size()) + " identifiers");

    std::ostringstream out;
    out << "{\n";
    out << "  \"root\": \"" << report.root.to_hex() << "\",\n";
    out << "  \"leaves\": ";
    append_digest_array(out, report.leaves, "  ");
    out << ",\n";
    out << "  \"proofs\": {";
    if (report.accepted.empty()) {
        out << "}\n";
    } else {
        out << "\n";
        for (size_t i = 0; i < report.accepted.size(); ++i) {
            out << "    \"" << report.accepted[i].address.checksummed() << "\": ";
            append_digest_array(out, report.proofs[i], "    ");
            if (i + 1 < report.accepted.size()) out << ",";
            out << "\n";
        }
        out << "  }\n";
    }
    out << "}\n";
    return out.str();
}

std::string render_voters_json(const CommitmentReport& report, const std::string& generated_at) {
    MERKLEGATE_CHECK(report.proofs.size() == report.accepted.size(), ErrorCode::INTERNAL_ERROR,
                     "Report holds " + std::to_string(report.proofs.size()) + " proofs for " +
                         std::to_string(report.accepted.size()) + " identifiers");

    std::ostringstream out;
    out << "{\n";
    out << "  \"merkleRoot\": \"" << report.root.to_hex() << "\",\n";
    out << "  \"totalVoters\": " << report.accepted.size() << ",\n";
    out << "  \"voterProofs\": [";
    if (report.accepted.empty()) {
        out << "],\n";
    } else {
        out << "\n";
        for (size_t i = 0; i < report.accepted.size(); ++i) {
            out << "    {\n";
            append_voter_entry(out, report, i, "      ");
            out << "    }";
            if (i + 1 < report.accepted.size()) out << ",";
            out << "\n";
        }
        out << "  ],\n";
    }
    out << "  \"generatedAt\": \"" << json_escape(generated_at) << "\"\n";
    out << "}\n";
    return out.str();
}

std::string render_voter_proof_json(const CommitmentReport& report, size_t index) {
    MERKLEGATE_CHECK_ARGUMENT(index < report.accepted.size(), "Voter index out of range");

    std::ostringstream out;
    out << "{\n";
    append_voter_entry(out, report, index, "  ");
    out << "}\n";
    return out.str();
}

void write_file_atomic(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError(ErrorCode::WRITE_FAILED,
                          "Cannot create output directory: " + path.parent_path().string(),
                          ec.message());
        }
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw IOError(ErrorCode::WRITE_FAILED, "Cannot open for writing: " + tmp.string(),
                          "write_file_atomic", "Check directory permissions");
        }
        file << content;
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(tmp, ec);
            throw IOError(ErrorCode::WRITE_FAILED, "Write failed: " + tmp.string(),
                          "write_file_atomic", "Check free disk space");
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(tmp, cleanup);
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot move artifact into place: " + path.string(),
                      ec.message());
    }
}

void write_artifact(const CommitmentReport& report, const std::filesystem::path& path,
                    const ArtifactOptions& options) {
    std::string content = (options.format == ArtifactFormat::VOTERS)
        ? render_voters_json(report, utc_timestamp_iso8601())
        : render_merkle_json(report);

    if (!options.split_proofs) {
        write_file_atomic(path, content);
        LOG_DEBUG("Wrote ", artifact_format_name(options.format), " artifact: ", path.string());
        return;
    }

    std::filesystem::path dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    std::filesystem::path proofs_dir = dir / "proofs";
    std::filesystem::path staging_dir = dir / "proofs.tmp";
    std::filesystem::path root_file = dir / "merkleRoot.txt";

    std::error_code ec;
    std::filesystem::remove_all(staging_dir, ec);

    // Companions first, main artifact last; undo everything on failure
    std::vector<std::filesystem::path> written;
    try {
        for (size_t i = 0; i < report.accepted.size(); ++i) {
            write_file_atomic(staging_dir / (report.accepted[i].address.lowercase() + ".json"),
                              render_voter_proof_json(report, i));
        }

        write_file_atomic(root_file, report.root.to_hex());
        written.push_back(root_file);

        replace_directory(staging_dir, proofs_dir);
        written.push_back(proofs_dir);

        write_file_atomic(path, content);
    } catch (const MerklegateException&) {
        std::error_code cleanup;
        std::filesystem::remove_all(staging_dir, cleanup);
        for (const auto& p : written) std::filesystem::remove_all(p, cleanup);
        throw;
    }

    LOG_DEBUG("Wrote ", artifact_format_name(options.format), " artifact: ", path.string());
    LOG_DEBUG("Wrote ", report.accepted.size(), " proof files to ", proofs_dir.string());
}

void replace_directory(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    if (std::filesystem::exists(to, ec) && !std::filesystem::is_directory(to, ec)) {
        throw IOError(ErrorCode::WRITE_FAILED, "Not a directory: " + to.string(),
                      "replace_directory", "Remove or rename the file in the way");
    }

    std::filesystem::remove_all(to, ec);
    if (ec) {
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot clear directory: " + to.string(), ec.message());
    }

    if (!std::filesystem::exists(from, ec)) {
        std::filesystem::create_directories(to, ec);
    } else {
        std::filesystem::rename(from, to, ec);
    }
    if (ec) {
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot move directory into place: " + to.string(),
                      ec.message());
    }
}

const Proof* MerkleArtifact::find_proof(std::string_view address) const {
    std::string wanted = util::to_lower(util::trim(address));
    for (const auto& [key, proof] : proofs) {
        if (util::to_lower(key) == wanted) return &proof;
    }
    return nullptr;
}

MerkleArtifact parse_merkle_json(const std::string& content) {
    static const std::regex root_pattern(R"re("root"\s*:\s*"(0x[0-9a-fA-F]{64})")re");
    static const std::regex proof_entry_pattern(R"re("(0x[0-9a-fA-F]{40})"\s*:\s*\[([^\]]*)\])re");

    MerkleArtifact artifact;

    std::smatch root_match;
    if (!std::regex_search(content, root_match, root_pattern)) {
        throw InputError(ErrorCode::MALFORMED_ARTIFACT, "Artifact has no valid \"root\"",
                         "parse_merkle_json");
    }
    artifact.root = *Digest::from_hex(root_match[1].str());

    auto leaves_section = extract_section(content, "leaves", '[', ']');
    if (!leaves_section) {
        throw InputError(ErrorCode::MALFORMED_ARTIFACT, "Artifact has no \"leaves\" array",
                         "parse_merkle_json");
    }
    artifact.leaves = extract_digests(*leaves_section);

    auto proofs_section = extract_section(content, "proofs", '{', '}');
    if (!proofs_section) {
        throw InputError(ErrorCode::MALFORMED_ARTIFACT, "Artifact has no \"proofs\" object",
                         "parse_merkle_json");
    }

    for (std::sregex_iterator it(proofs_section->begin(), proofs_section->end(), proof_entry_pattern), end;
         it != end; ++it) {
        artifact.proofs.emplace_back((*it)[1].str(), extract_digests((*it)[2].str()));
    }

    if (artifact.proofs.size() != artifact.leaves.size()) {
        throw InputError(ErrorCode::MALFORMED_ARTIFACT,
                         "Artifact lists " + std::to_string(artifact.leaves.size()) + " leaves but " +
                             std::to_string(artifact.proofs.size()) + " proofs",
                         "parse_merkle_json");
    }
    return artifact;
}

MerkleArtifact read_merkle_artifact(const std::filesystem::path& path) {
    return parse_merkle_json(read_text_file(path));
}

} // namespace io
} // namespace merklegate
