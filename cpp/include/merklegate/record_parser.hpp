#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace merklegate {

// One data line of the input
struct RawRecord {
    size_t line_number = 0;            // 1-based physical line in the input text
    std::string identifier;            // first column, trimmed
    std::vector<std::string> fields;   // remaining columns, trimmed, passed through
};

struct ParsedInput {
    std::vector<RawRecord> records;
    size_t start_offset = 0;       // index of the first data line among non-blank lines
    bool header_detected = false;
    size_t line_count = 0;         // non-blank lines, header included
};

/**
 * Turns raw delimited text into candidate records.
 *
 * Adapters differ only in how they label metadata columns; every adapter
 * throws InputError(EMPTY_INPUT) when the text is blank after trimming.
 */
class RecordAdapter {
public:
    virtual ~RecordAdapter() = default;

    virtual std::string name() const = 0;
    virtual ParsedInput parse(std::string_view text) const = 0;

    // Labels for RawRecord::fields, in column order; empty if opaque
    virtual std::vector<std::string> field_names() const { return {}; }
};

// identifier[,metadata...] with metadata left opaque
class CsvRecordAdapter : public RecordAdapter {
public:
    std::string name() const override { return "csv"; }
    ParsedInput parse(std::string_view text) const override;
};

// address,name,email voter roll; metadata columns beyond email are dropped
class VoterRecordAdapter : public CsvRecordAdapter {
public:
    std::string name() const override { return "voters"; }
    ParsedInput parse(std::string_view text) const override;
    std::vector<std::string> field_names() const override { return {"name", "email"}; }
};

// "csv" or "voters"; throws InvalidArgumentError otherwise
std::unique_ptr<RecordAdapter> make_record_adapter(const std::string& name);

// Splits on ',' and trims every column
std::vector<std::string> split_columns(std::string_view line);

// True if the line looks like a column header (contains "address", any case)
bool is_header_line(std::string_view line);

} // namespace merklegate
