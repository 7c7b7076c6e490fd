#pragma once

#include <dftracer/utils/core/common/logging.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "keylog_stats.hpp"

/**
 * @brief Prints KeylogStats as a plain text report.
 */
class StatsReportWriter {
   private:
    std::FILE* out_;
    std::size_t top_n_;

    static double percent(std::uint64_t part, std::uint64_t whole) {
        return whole == 0 ? 0.0 : static_cast<double>(part) * 100.0 / whole;
    }

    void write_finger_rows(const std::map<FingerAssignment, std::uint32_t>& freq,
                           std::uint64_t whole) const {
        for (const auto& [finger, count] : freq) {
            std::fprintf(out_, "%8s", to_string(finger.finger));
        }
        std::fprintf(out_, "\n");
        for (const auto& [finger, count] : freq) {
            std::fprintf(out_, "%7.2f%%", percent(count, whole));
        }
        std::fprintf(out_, "\n");
    }

   public:
    explicit StatsReportWriter(std::FILE* out = stdout, std::size_t top_n = 10)
        : out_(out), top_n_(top_n) {}

    void write_output_frequency(const KeylogStats& stats) const {
        std::vector<std::pair<std::uint32_t, std::string>> list;
        list.reserve(stats.output_frequency.size());
        for (const auto& [output, count] : stats.output_frequency) {
            list.emplace_back(count, output);
        }
        std::sort(list.begin(), list.end());

        for (const auto& [count, output] : list) {
            std::fprintf(out_, "%10s: %u\n", output.c_str(), count);
        }
    }

    void write_finger_usage(const KeylogStats& stats) const {
        std::fprintf(out_, "\n");
        write_finger_rows(stats.finger_frequency, stats.total_key_presses);
        std::fprintf(out_, "\n");
        std::fprintf(out_, "    left: %7.2f%%\n",
                     percent(stats.total_left, stats.total_key_presses));
        std::fprintf(out_, "   right: %7.2f%%\n",
                     percent(stats.total_right, stats.total_key_presses));
    }

    void write_sfbs(const KeylogStats& stats, const char* title,
                    bool include_combos) const {
        std::fprintf(out_, "\n\n  %s\n", title);
        write_finger_rows(stats.sfb_frequency_by_finger(include_combos),
                          stats.total_events);
        std::fprintf(out_, "\n");
        std::fprintf(out_, "  total: %7.3f%%\n",
                     stats.sfb_percentage(include_combos));

        std::fprintf(out_, "  top sfbs:\n");
        for (const auto& sfb : stats.top_sfbs(top_n_, include_combos)) {
            std::fprintf(out_, "   %-35s     %.2f%%\n", sfb.sfb.id().c_str(),
                         percent(sfb.presses, stats.total_events));
        }
    }

    void write_report(const KeylogStats& stats) const {
        DFTRACER_UTILS_LOG_DEBUG("Writing report for %u events",
                                 stats.total_events);

        write_output_frequency(stats);
        write_finger_usage(stats);
        write_sfbs(stats, "sfbs (without combos)", false);
        write_sfbs(stats, "sfbs (with combos)", true);
        std::fprintf(out_, "\n");
        std::fflush(out_);
    }
};
