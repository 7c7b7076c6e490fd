#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/core/utilities/utility.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "finger_assignment.hpp"
#include "logical_event.hpp"
#include "sfb_detector_utility.hpp"

using namespace dftracer::utils;

/**
 * @brief Frequency tables and sfb views over one keylog.
 */
struct KeylogStats {
    // Combo output or key id -> presses
    std::unordered_map<std::string, std::uint32_t> output_frequency;
    // Counted once per physical key, so a two-key combo counts twice
    std::map<FingerAssignment, std::uint32_t> finger_frequency;

    std::uint32_t total_events = 0;
    std::uint32_t total_key_presses = 0;
    std::uint32_t total_left = 0;
    std::uint32_t total_right = 0;
    std::uint32_t total_sfb_events = 0;
    std::size_t skipped_records = 0;

    std::vector<SfbStats> sfbs;  // Ascending
    std::map<FingerAssignment, SfbIndex> sfbs_by_finger;
    SfbIndex sfbs_by_id;

    // Highest counts first
    std::vector<SfbStats> top_sfbs(std::size_t n, bool include_combos) const {
        std::vector<SfbStats> res;
        for (auto it = sfbs.rbegin(); it != sfbs.rend() && res.size() < n;
             ++it) {
            if (!include_combos && it->sfb.has_combo()) continue;
            res.push_back(*it);
        }
        return res;
    }

    /**
     * @brief Summed sfb presses per finger.
     *
     * A finger whose sfbs are all filtered out is reported with 0; a finger
     * with no sfbs at all is absent.
     */
    std::map<FingerAssignment, std::uint32_t> sfb_frequency_by_finger(
        bool include_combos) const {
        std::map<FingerAssignment, std::uint32_t> res;
        for (const auto& [finger, bucket] : sfbs_by_finger) {
            std::uint32_t sum = 0;
            for (const auto& [id, stats] : bucket) {
                if (!include_combos && stats.sfb.has_combo()) continue;
                sum += stats.presses;
            }
            res[finger] = sum;
        }
        return res;
    }

    // Sfb presses as a percentage of all events
    double sfb_percentage(bool include_combos) const {
        if (total_events == 0) return 0.0;
        std::uint64_t presses = 0;
        for (const auto& stats : sfbs) {
            if (!include_combos && stats.sfb.has_combo()) continue;
            presses += stats.presses;
        }
        return static_cast<double>(presses) * 100.0 / total_events;
    }
};

/**
 * @brief Input for KeylogStatsUtility: resolved events plus the sfbs found
 * in them.
 */
struct KeylogStatsInput {
    std::vector<LogicalEvent> events;
    SfbDetectorOutput sfbs;
    std::size_t skipped_records = 0;

    static KeylogStatsInput from_events(std::vector<LogicalEvent> events) {
        KeylogStatsInput input;
        input.events = std::move(events);
        return input;
    }

    KeylogStatsInput& with_sfbs(SfbDetectorOutput detected) {
        sfbs = std::move(detected);
        return *this;
    }

    KeylogStatsInput& with_skipped_records(std::size_t count) {
        skipped_records = count;
        return *this;
    }
};

/**
 * @brief Builds KeylogStats from logical events and detected sfbs.
 */
class KeylogStatsUtility
    : public utilities::Utility<KeylogStatsInput, KeylogStats> {
   public:
    KeylogStats process(const KeylogStatsInput& input) override {
        DFTRACER_UTILS_LOG_INFO("Aggregating stats over %zu events...",
                                input.events.size());

        KeylogStats stats;

        for (const auto& event : input.events) {
            stats.output_frequency[output_label(event)]++;

            for (const Key* key : event_keys(event)) {
                stats.finger_frequency[key->finger]++;
                stats.total_key_presses++;
                if (key->finger.half == MatrixHalf::Left) {
                    stats.total_left++;
                } else {
                    stats.total_right++;
                }
            }
        }

        stats.total_events = static_cast<std::uint32_t>(input.events.size());
        stats.total_sfb_events =
            static_cast<std::uint32_t>(input.sfbs.sfb_events);
        stats.skipped_records = input.skipped_records;
        stats.sfbs = input.sfbs.sfbs;
        stats.sfbs_by_finger = input.sfbs.sfbs_by_finger;
        stats.sfbs_by_id = input.sfbs.sfbs_by_id;

        DFTRACER_UTILS_LOG_INFO(
            "Stats: %u events, %u key presses (%u left, %u right), %u sfb "
            "events",
            stats.total_events, stats.total_key_presses, stats.total_left,
            stats.total_right, stats.total_sfb_events);
        return stats;
    }
};
