#include "merklegate/record_parser.hpp"
#include "merklegate/error.hpp"
#include "merklegate/logging.hpp"
#include "merklegate/util/hex.hpp"

#include <iterator>
#include <utility>

namespace merklegate {

std::vector<std::string> split_columns(std::string_view line) {
    std::vector<std::string> columns;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(',', start);
        std::string_view col = (comma == std::string_view::npos)
            ? line.substr(start)
            : line.substr(start, comma - start);
        columns.emplace_back(util::trim(col));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return columns;
}

bool is_header_line(std::string_view line) {
    return util::to_lower(line).find("address") != std::string::npos;
}

ParsedInput CsvRecordAdapter::parse(std::string_view text) const {
    if (util::trim(text).empty()) {
        throw InputError(ErrorCode::EMPTY_INPUT, "Input is empty",
                         name() + " adapter",
                         "Provide at least one identifier per line");
    }

    // Non-blank lines with their physical line numbers
    std::vector<std::pair<size_t, std::string_view>> lines;
    size_t line_number = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        std::string_view raw = (nl == std::string_view::npos)
            ? text.substr(pos)
            : text.substr(pos, nl - pos);
        ++line_number;

        std::string_view trimmed = util::trim(raw);
        if (!trimmed.empty()) {
            lines.emplace_back(line_number, trimmed);
        }

        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }

    ParsedInput parsed;
    parsed.line_count = lines.size();

    if (is_header_line(lines.front().second)) {
        parsed.header_detected = true;
        parsed.start_offset = 1;
        LOG_DEBUG("Header detected on line ", lines.front().first, ", skipping");
    }

    parsed.records.reserve(lines.size() - parsed.start_offset);
    for (size_t i = parsed.start_offset; i < lines.size(); ++i) {
        auto columns = split_columns(lines[i].second);

        RawRecord record;
        record.line_number = lines[i].first;
        record.identifier = std::move(columns.front());
        record.fields.assign(std::make_move_iterator(columns.begin() + 1),
                             std::make_move_iterator(columns.end()));
        parsed.records.push_back(std::move(record));
    }

    return parsed;
}

ParsedInput VoterRecordAdapter::parse(std::string_view text) const {
    ParsedInput parsed = CsvRecordAdapter::parse(text);

    const size_t max_fields = field_names().size();
    for (auto& record : parsed.records) {
        if (record.fields.size() > max_fields) {
            record.fields.resize(max_fields);
        }
    }
    return parsed;
}

std::unique_ptr<RecordAdapter> make_record_adapter(const std::string& name) {
    if (name == "csv") return std::make_unique<CsvRecordAdapter>();
    if (name == "voters") return std::make_unique<VoterRecordAdapter>();
    throw InvalidArgumentError("Unknown record adapter: " + name, "make_record_adapter",
                               "Use 'csv' or 'voters'");
}

} // namespace merklegate
