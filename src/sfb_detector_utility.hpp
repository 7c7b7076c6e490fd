#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/core/utilities/utility.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "finger_assignment.hpp"
#include "logical_event.hpp"
#include "sfb.hpp"

using namespace dftracer::utils;

struct SfbStats {
    std::uint32_t presses = 0;
    Sfb sfb;

    bool operator<(const SfbStats& other) const {
        return presses < other.presses;
    }
};

using SfbIndex = std::unordered_map<std::string, SfbStats>;

struct SfbDetectorOutput {
    std::size_t sfb_events = 0;  // Number of consecutive pairs that are sfbs
    SfbIndex sfbs_by_id;
    // Every finger an sfb touches gets the sfb's full count
    std::map<FingerAssignment, SfbIndex> sfbs_by_finger;
    // Ascending by presses, ties by id
    std::vector<SfbStats> sfbs;
};

/**
 * @brief Scans consecutive event pairs for same-finger bigrams.
 *
 * Pairs are grouped by Sfb::id(); the first occurrence is kept as the
 * representative of its group.
 */
class SfbDetectorUtility
    : public utilities::Utility<std::vector<LogicalEvent>, SfbDetectorOutput> {
   public:
    SfbDetectorOutput process(const std::vector<LogicalEvent>& events) override {
        DFTRACER_UTILS_LOG_INFO("Detecting sfbs in %zu events...",
                                events.size());

        SfbDetectorOutput output;

        for (std::size_t i = 0; i + 1 < events.size(); ++i) {
            auto sfb = Sfb::from_pair(events[i], events[i + 1]);
            if (!sfb) continue;

            output.sfb_events++;
            std::string id = sfb->id();
            DFTRACER_UTILS_LOG_DEBUG("sfb at event %zu: %s", i, id.c_str());

            auto it = output.sfbs_by_id.find(id);
            if (it == output.sfbs_by_id.end()) {
                output.sfbs_by_id.emplace(std::move(id),
                                          SfbStats{1, std::move(*sfb)});
            } else {
                it->second.presses++;
            }
        }

        // Sorted ids keep the collections below deterministic
        std::vector<const std::string*> ids;
        ids.reserve(output.sfbs_by_id.size());
        for (const auto& [id, stats] : output.sfbs_by_id) ids.push_back(&id);
        std::sort(ids.begin(), ids.end(),
                  [](const std::string* a, const std::string* b) {
                      return *a < *b;
                  });

        output.sfbs.reserve(ids.size());
        for (const std::string* id : ids) {
            const SfbStats& stats = output.sfbs_by_id.at(*id);
            output.sfbs.push_back(stats);

            for (const auto& finger : stats.sfb.fingers()) {
                auto& bucket = output.sfbs_by_finger[finger];
                auto bucket_it = bucket.find(*id);
                if (bucket_it == bucket.end()) {
                    bucket.emplace(*id, stats);
                } else {
                    bucket_it->second.presses += stats.presses;
                }
            }
        }
        std::stable_sort(output.sfbs.begin(), output.sfbs.end());

        DFTRACER_UTILS_LOG_INFO("Found %zu sfb events, %zu distinct sfbs",
                                output.sfb_events, output.sfbs_by_id.size());
        return output;
    }
};
