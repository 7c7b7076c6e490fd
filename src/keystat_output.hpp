#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "event_resolver_utility.hpp"
#include "keylog_stats.hpp"
#include "keystat_config.hpp"
#include "layout_model.hpp"
#include "raw_log_reader_utility.hpp"
#include "sfb_detector_utility.hpp"

/**
 * @brief Outputs of the keystat pipeline tasks.
 *
 * A task that fails sets success = false and records the message in error;
 * later tasks pass the failure through untouched.
 */

struct LoadLayoutOutput {
    KeystatConfig config;
    std::shared_ptr<const LayoutModel> layout;
    bool success = false;
    std::string error;
};

struct ReadLogOutput {
    KeystatConfig config;
    std::shared_ptr<const LayoutModel> layout;
    std::vector<RawLogRecord> records;
    bool success = false;
    std::string error;
};

struct ResolveEventsOutput {
    KeystatConfig config;
    EventResolverOutput resolved;
    std::size_t records_read = 0;
    bool success = false;
    std::string error;
};

struct DetectSfbsOutput {
    KeystatConfig config;
    EventResolverOutput resolved;
    SfbDetectorOutput sfbs;
    std::size_t records_read = 0;
    bool success = false;
    std::string error;
};

struct AggregateStatsOutput {
    KeystatConfig config;
    std::shared_ptr<const LayoutModel> layout;
    KeylogStats stats;
    std::size_t records_read = 0;
    bool success = false;
    std::string error;
};
