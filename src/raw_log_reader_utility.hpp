#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/core/utilities/utility.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include "keylog_error.hpp"
#include "text_file_reader.hpp"

using namespace dftracer::utils;

// One line of the firmware keylog:
//   keycode,row,col,highest_layer,pressed,mods,oneshot_mods,tap_count
struct RawLogRecord {
    std::string keycode;  // Hex keycode or "COMBO"
    std::string row;      // Matrix row, or "NA"/"254" on combo rows
    std::string col;
    std::uint32_t highest_layer = 0;
    std::uint32_t pressed = 0;
    std::string mods;          // Hex
    std::string oneshot_mods;  // Hex
    std::uint32_t tap_count = 0;  // Combo index on COMBO rows
    std::size_t line = 0;         // 1-based line in the log

    bool is_combo() const { return keycode == "COMBO"; }
};

// Strict unsigned parse of a whole field; false on empty/garbage/overflow
inline bool parse_unsigned(std::string_view field, std::uint32_t& out) {
    if (field.empty() || field.size() > 10) return false;
    std::uint64_t value = 0;
    for (char c : field) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (value > UINT32_MAX) return false;
    out = static_cast<std::uint32_t>(value);
    return true;
}

struct RawLogReaderInput {
    std::string file_path;
    std::string content;
    bool from_memory = false;

    static RawLogReaderInput from_file(const std::string& path) {
        RawLogReaderInput input;
        input.file_path = path;
        return input;
    }

    static RawLogReaderInput from_string(const std::string& text) {
        RawLogReaderInput input;
        input.file_path = "<string>";
        input.content = text;
        input.from_memory = true;
        return input;
    }
};

using RawLogReaderOutput = std::vector<RawLogRecord>;

/**
 * @brief Reads the whole keylog into memory and splits it into records.
 *
 * Lines are comma separated with exactly 8 fields; surrounding whitespace is
 * trimmed and blank lines are skipped. Any malformed line fails the read.
 */
class RawLogReaderUtility
    : public utilities::Utility<RawLogReaderInput, RawLogReaderOutput> {
   private:
    static constexpr std::size_t kFieldCount = 8;

    static std::string_view trim(std::string_view s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t' ||
                              s.front() == '\r')) {
            s.remove_prefix(1);
        }
        while (!s.empty() &&
               (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
            s.remove_suffix(1);
        }
        return s;
    }

    static KeylogError malformed(const std::string& source, std::size_t line,
                                 const std::string& what) {
        return KeylogError(ErrorKind::MalformedRecord,
                           source + ":" + std::to_string(line) + ": " + what);
    }

    static std::uint32_t parse_number_field(std::string_view field,
                                            const char* name,
                                            const std::string& source,
                                            std::size_t line) {
        std::uint32_t value = 0;
        if (!parse_unsigned(field, value)) {
            throw malformed(source, line,
                            std::string("field '") + name +
                                "' is not an unsigned integer: '" +
                                std::string(field) + "'");
        }
        return value;
    }

   public:
    RawLogRecord parse_line(std::string_view line, std::size_t line_no,
                            const std::string& source) const {
        std::vector<std::string_view> fields;
        fields.reserve(kFieldCount);

        std::size_t start = 0;
        while (true) {
            std::size_t comma = line.find(',', start);
            if (comma == std::string_view::npos) {
                fields.push_back(trim(line.substr(start)));
                break;
            }
            fields.push_back(trim(line.substr(start, comma - start)));
            start = comma + 1;
        }

        if (fields.size() != kFieldCount) {
            throw malformed(source, line_no,
                            "expected " + std::to_string(kFieldCount) +
                                " fields, found " +
                                std::to_string(fields.size()));
        }

        RawLogRecord record;
        record.keycode = std::string(fields[0]);
        record.row = std::string(fields[1]);
        record.col = std::string(fields[2]);
        record.highest_layer =
            parse_number_field(fields[3], "highest_layer", source, line_no);
        record.pressed =
            parse_number_field(fields[4], "pressed", source, line_no);
        record.mods = std::string(fields[5]);
        record.oneshot_mods = std::string(fields[6]);
        record.tap_count =
            parse_number_field(fields[7], "tap_count", source, line_no);
        record.line = line_no;
        return record;
    }

    RawLogReaderOutput parse(const std::string& text,
                             const std::string& source) const {
        RawLogReaderOutput records;

        const char* data = text.data();
        std::size_t size = text.size();
        std::size_t pos = 0;
        std::size_t line_no = 0;

        while (pos < size) {
            const char* line_start = data + pos;
            const char* newline = static_cast<const char*>(
                std::memchr(line_start, '\n', size - pos));
            std::size_t line_len =
                newline ? static_cast<std::size_t>(newline - line_start)
                        : size - pos;
            line_no++;

            std::string_view line = trim(std::string_view(line_start, line_len));
            if (!line.empty()) {
                records.push_back(parse_line(line, line_no, source));
            }

            pos += line_len + 1;
        }

        return records;
    }

    RawLogReaderOutput process(const RawLogReaderInput& input) override {
        std::string text = input.from_memory ? input.content
                                             : read_text_file(input.file_path);

        DFTRACER_UTILS_LOG_INFO("Reading keylog %s (%zu bytes)",
                                input.file_path.c_str(), text.size());

        RawLogReaderOutput records = parse(text, input.file_path);

        DFTRACER_UTILS_LOG_INFO("Read %zu keylog records from %s",
                                records.size(), input.file_path.c_str());
        return records;
    }
};
