#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/core/utilities/utility.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "keylog_error.hpp"
#include "keystat_config.hpp"
#include "layout_model.hpp"
#include "logical_event.hpp"
#include "raw_log_reader_utility.hpp"

using namespace dftracer::utils;

// Matrix coordinates the firmware writes for non-matrix events
static constexpr std::uint32_t kSentinelMatrixCoord = 254;

/**
 * @brief Input for EventResolverUtility.
 */
struct EventResolverInput {
    std::vector<RawLogRecord> records;
    std::shared_ptr<const LayoutModel> layout;
    LayoutMismatchPolicy on_layout_mismatch = LayoutMismatchPolicy::Fail;

    static EventResolverInput from_records(std::vector<RawLogRecord> records) {
        EventResolverInput input;
        input.records = std::move(records);
        return input;
    }

    EventResolverInput& with_layout(std::shared_ptr<const LayoutModel> model) {
        layout = std::move(model);
        return *this;
    }

    EventResolverInput& with_policy(LayoutMismatchPolicy policy) {
        on_layout_mismatch = policy;
        return *this;
    }
};

struct EventResolverOutput {
    std::vector<LogicalEvent> events;
    std::size_t skipped_records = 0;  // Dropped under LayoutMismatchPolicy::Skip
    // Keeps the keys and combos referenced by events alive
    std::shared_ptr<const LayoutModel> layout;
};

/**
 * @brief Turns raw keylog records into logical key presses.
 *
 * Releases and sentinel (non-matrix) rows are dropped. Combo rows are always
 * kept and look up their combo by index. Key rows are resolved against the
 * active layer, falling through transparent keys to the layers below.
 * Output order follows input order.
 */
class EventResolverUtility
    : public utilities::Utility<EventResolverInput, EventResolverOutput> {
   private:
    static KeylogError mismatch(const RawLogRecord& record,
                                const std::string& what) {
        return KeylogError(ErrorKind::LayoutMismatch,
                           "line " + std::to_string(record.line) + ": " + what);
    }

    static std::uint32_t parse_matrix_coord(const RawLogRecord& record,
                                            const std::string& field,
                                            const char* name) {
        std::uint32_t value = 0;
        if (!parse_unsigned(field, value)) {
            throw KeylogError(ErrorKind::MalformedRecord,
                              "line " + std::to_string(record.line) +
                                  ": field '" + name +
                                  "' is not an unsigned integer: '" + field +
                                  "'");
        }
        return value;
    }

   public:
    /**
     * @brief Resolve a single record.
     * @return std::nullopt when the record is filtered out.
     * @throws KeylogError(LayoutMismatch) for an unknown combo, layer or
     * matrix position; KeylogError(MalformedRecord) for a bad row/col.
     */
    std::optional<LogicalEvent> resolve(const RawLogRecord& record,
                                        const LayoutModel& layout) const {
        if (record.is_combo()) {
            const Combo* combo = layout.combo_at(record.tap_count);
            if (!combo) {
                throw mismatch(record, "combo index " +
                                           std::to_string(record.tap_count) +
                                           " out of range (" +
                                           std::to_string(
                                               layout.combos().size()) +
                                           " combos)");
            }
            return LogicalEvent{ComboEvent{combo}};
        }

        if (record.pressed == 0) return std::nullopt;
        if (record.row == "NA") return std::nullopt;

        std::uint32_t row = parse_matrix_coord(record, record.row, "row");
        std::uint32_t col = parse_matrix_coord(record, record.col, "col");
        if (row == kSentinelMatrixCoord && col == kSentinelMatrixCoord) {
            return std::nullopt;
        }

        std::optional<std::string> layer_id =
            layout.layer_id_of(record.highest_layer);
        if (!layer_id) {
            throw mismatch(record, "layer " +
                                       std::to_string(record.highest_layer) +
                                       " out of range (" +
                                       std::to_string(layout.layers().size()) +
                                       " layers)");
        }

        MatrixPos pos{row, col};
        const Key* key = layout.resolve_key(record.highest_layer, pos);
        if (!key) {
            throw mismatch(record, "no key at matrix position (" +
                                       std::to_string(row) + ", " +
                                       std::to_string(col) + ") from layer " +
                                       *layer_id);
        }

        SingleEvent event;
        event.key = key;
        event.keycode = record.keycode;
        event.highest_layer = *layer_id;
        event.pressed = true;
        event.tap_count = record.tap_count;
        return LogicalEvent{std::move(event)};
    }

    EventResolverOutput process(const EventResolverInput& input) override {
        if (!input.layout) {
            throw KeylogError(ErrorKind::InvalidLayout,
                              "Event resolution needs a layout model");
        }

        DFTRACER_UTILS_LOG_INFO("Resolving %zu keylog records...",
                                input.records.size());

        EventResolverOutput output;
        output.layout = input.layout;
        output.events.reserve(input.records.size());

        for (const auto& record : input.records) {
            try {
                auto event = resolve(record, *input.layout);
                if (event) output.events.push_back(std::move(*event));
            } catch (const KeylogError& e) {
                if (e.kind() != ErrorKind::LayoutMismatch ||
                    input.on_layout_mismatch == LayoutMismatchPolicy::Fail) {
                    throw;
                }
                DFTRACER_UTILS_LOG_WARN("Skipping record: %s", e.what());
                output.skipped_records++;
            }
        }

        DFTRACER_UTILS_LOG_INFO(
            "Resolved %zu logical events (%zu records skipped)",
            output.events.size(), output.skipped_records);
        return output;
    }
};
