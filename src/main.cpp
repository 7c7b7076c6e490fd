#include <dftracer/utils/core/common/config.h>
#include <dftracer/utils/core/common/filesystem.h>
#include <dftracer/utils/core/pipeline/pipeline.h>
#include <dftracer/utils/core/pipeline/pipeline_config_manager.h>
#include <dftracer/utils/core/tasks/task.h>

#include <argparse/argparse.hpp>
#include <chrono>
#include <cstdio>
#include <string>

#include "event_resolver_utility.hpp"
#include "keylog_stats.hpp"
#include "keystat_config.hpp"
#include "keystat_output.hpp"
#include "layout_loader_utility.hpp"
#include "raw_log_reader_utility.hpp"
#include "sfb_detector_utility.hpp"
#include "stats_report_writer.hpp"

using namespace dftracer::utils;

int main(int argc, char** argv) {
    DFTRACER_UTILS_LOGGER_INIT();

    argparse::ArgumentParser program("keystat",
                                     DFTRACER_UTILS_PACKAGE_VERSION);
    program.add_description(
        "Compute key, finger and same-finger bigram statistics from a QMK "
        "keylog");

    program.add_argument("--qmk-root")
        .help("Root of the QMK firmware checkout")
        .required();

    program.add_argument("--keyboard")
        .help("Keyboard name inside <qmk-root>/keyboards (e.g. ferris/sweep)")
        .required();

    program.add_argument("--keymap")
        .help("Keymap name inside the keyboard's keymaps directory")
        .default_value<std::string>("default");

    program.add_argument("--layout-opts")
        .help(
            "JSON file with the physical_layout and finger_assignments grids")
        .required();

    program.add_argument("-l", "--log")
        .help("Keylog file (keycode,row,col,layer,pressed,mods,osm,tap_count)")
        .required();

    program.add_argument("-n", "--top")
        .help("Number of sfbs listed per report section (default: 10)")
        .scan<'d', std::size_t>()
        .default_value(static_cast<std::size_t>(10));

    program.add_argument("--on-layout-mismatch")
        .help(
            "What to do with records the layout can't resolve: fail or skip "
            "(default: fail)")
        .default_value<std::string>("fail");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        DFTRACER_UTILS_LOG_ERROR("Error occurred: %s", err.what());
        std::fprintf(stderr, "%s\n", program.help().str().c_str());
        return 1;
    }

    KeystatConfig config;
    config.qmk_root = program.get<std::string>("--qmk-root");
    config.keyboard = program.get<std::string>("--keyboard");
    config.keymap = program.get<std::string>("--keymap");
    config.layout_opts_path = program.get<std::string>("--layout-opts");
    config.log_path = program.get<std::string>("--log");
    config.top_n = program.get<std::size_t>("--top");

    std::string policy_str = program.get<std::string>("--on-layout-mismatch");
    auto policy = parse_layout_mismatch_policy(policy_str);
    if (!policy) {
        DFTRACER_UTILS_LOG_ERROR("Invalid --on-layout-mismatch value: %s",
                                 policy_str.c_str());
        std::fprintf(stderr, "%s\n", program.help().str().c_str());
        return 1;
    }
    config.on_layout_mismatch = *policy;

    config.qmk_root = fs::absolute(config.qmk_root).string();
    config.layout_opts_path = fs::absolute(config.layout_opts_path).string();
    config.log_path = fs::absolute(config.log_path).string();

    // Print configuration
    std::printf("==========================================\n");
    std::printf("Keystat (Pipeline)\n");
    std::printf("==========================================\n");
    std::printf("Arguments:\n");
    std::printf("  QMK root: %s\n", config.qmk_root.c_str());
    std::printf("  Keyboard: %s\n", config.keyboard.c_str());
    std::printf("  Keymap: %s\n", config.keymap.c_str());
    std::printf("  Layout options: %s\n", config.layout_opts_path.c_str());
    std::printf("  Keylog: %s\n", config.log_path.c_str());
    std::printf("  Top sfbs: %zu\n", config.top_n);
    std::printf("  On layout mismatch: %s\n",
                to_string(config.on_layout_mismatch));
    std::printf("==========================================\n\n");

    // Stages run strictly one after another
    auto pipeline_config = PipelineConfigManager()
                               .with_name("Keystat")
                               .with_executor_threads(1)
                               .with_scheduler_threads(1);

    Pipeline pipeline(pipeline_config);

    auto start_time = std::chrono::high_resolution_clock::now();

    // ========================================================================
    // Task 1: Load Layout
    // ========================================================================
    DFTRACER_UTILS_LOG_INFO("%s", "Task 1: Configuring layout loading...");

    auto load_layout_func = [](const KeystatConfig& cfg) -> LoadLayoutOutput {
        LoadLayoutOutput output;
        output.config = cfg;
        try {
            QmkPaths paths{cfg.qmk_root, cfg.keyboard, cfg.keymap};
            LayoutLoaderUtility loader;
            output.layout = loader.process(
                LayoutLoaderInput::from_qmk(paths, cfg.layout_opts_path));
            output.success = true;
        } catch (const KeylogError& e) {
            DFTRACER_UTILS_LOG_ERROR("Failed to load layout (%s): %s",
                                     to_string(e.kind()), e.what());
            output.error = e.what();
        }
        return output;
    };

    auto task1_load_layout = make_task(load_layout_func, "LoadLayout");

    // ========================================================================
    // Task 2: Read Keylog
    // ========================================================================
    DFTRACER_UTILS_LOG_INFO("%s", "Task 2: Configuring keylog reading...");

    auto read_log_func = [](const LoadLayoutOutput& layout) -> ReadLogOutput {
        ReadLogOutput output;
        output.config = layout.config;
        output.layout = layout.layout;
        if (!layout.success) {
            output.error = layout.error;
            return output;
        }

        try {
            RawLogReaderUtility reader;
            output.records = reader.process(
                RawLogReaderInput::from_file(layout.config.log_path));
            output.success = true;
        } catch (const KeylogError& e) {
            DFTRACER_UTILS_LOG_ERROR("Failed to read keylog (%s): %s",
                                     to_string(e.kind()), e.what());
            output.error = e.what();
        }
        return output;
    };

    auto task2_read_log = make_task(read_log_func, "ReadLog");

    // ========================================================================
    // Task 3: Resolve Events
    // ========================================================================
    DFTRACER_UTILS_LOG_INFO("%s", "Task 3: Configuring event resolution...");

    auto resolve_events_func =
        [](const ReadLogOutput& log) -> ResolveEventsOutput {
        ResolveEventsOutput output;
        output.config = log.config;
        output.records_read = log.records.size();
        if (!log.success) {
            output.error = log.error;
            return output;
        }

        try {
            EventResolverUtility resolver;
            output.resolved = resolver.process(
                EventResolverInput::from_records(log.records)
                    .with_layout(log.layout)
                    .with_policy(log.config.on_layout_mismatch));
            output.success = true;
        } catch (const KeylogError& e) {
            DFTRACER_UTILS_LOG_ERROR("Failed to resolve events (%s): %s",
                                     to_string(e.kind()), e.what());
            output.error = e.what();
        }
        return output;
    };

    auto task3_resolve_events =
        make_task(resolve_events_func, "ResolveEvents");

    // ========================================================================
    // Task 4: Detect Sfbs
    // ========================================================================
    DFTRACER_UTILS_LOG_INFO("%s", "Task 4: Configuring sfb detection...");

    auto detect_sfbs_func =
        [](const ResolveEventsOutput& resolved) -> DetectSfbsOutput {
        DetectSfbsOutput output;
        output.config = resolved.config;
        output.resolved = resolved.resolved;
        output.records_read = resolved.records_read;
        if (!resolved.success) {
            output.error = resolved.error;
            return output;
        }

        SfbDetectorUtility detector;
        output.sfbs = detector.process(resolved.resolved.events);
        output.success = true;
        return output;
    };

    auto task4_detect_sfbs = make_task(detect_sfbs_func, "DetectSfbs");

    // ========================================================================
    // Task 5: Aggregate Stats
    // ========================================================================
    DFTRACER_UTILS_LOG_INFO("%s", "Task 5: Configuring stats aggregation...");

    auto aggregate_stats_func =
        [](const DetectSfbsOutput& detected) -> AggregateStatsOutput {
        AggregateStatsOutput output;
        output.config = detected.config;
        output.layout = detected.resolved.layout;
        output.records_read = detected.records_read;
        if (!detected.success) {
            output.error = detected.error;
            return output;
        }

        KeylogStatsUtility aggregator;
        output.stats = aggregator.process(
            KeylogStatsInput::from_events(detected.resolved.events)
                .with_sfbs(detected.sfbs)
                .with_skipped_records(detected.resolved.skipped_records));
        output.success = true;
        return output;
    };

    auto task5_aggregate_stats =
        make_task(aggregate_stats_func, "AggregateStats");

    // ========================================================================
    // Task 6: Write Report
    // ========================================================================
    DFTRACER_UTILS_LOG_INFO("%s", "Task 6: Configuring report...");

    auto write_report_func = [](const AggregateStatsOutput& agg) -> bool {
        if (!agg.success) {
            DFTRACER_UTILS_LOG_WARN("%s",
                                    "No statistics to report after failure");
            return false;
        }

        StatsReportWriter writer(stdout, agg.config.top_n);
        writer.write_report(agg.stats);
        return true;
    };

    auto task6_write_report = make_task(write_report_func, "WriteReport");

    // ========================================================================
    // Execute Pipeline
    // ========================================================================

    task2_read_log->depends_on(task1_load_layout);
    task3_resolve_events->depends_on(task2_read_log);
    task4_detect_sfbs->depends_on(task3_resolve_events);
    task5_aggregate_stats->depends_on(task4_detect_sfbs);
    task6_write_report->depends_on(task5_aggregate_stats);

    pipeline.set_source(task1_load_layout);
    pipeline.set_destination(task6_write_report);

    pipeline.execute(config);

    auto agg_results = task5_aggregate_stats->get<AggregateStatsOutput>();
    auto write_success = task6_write_report->get<bool>();

    auto end_time = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> duration = end_time - start_time;

    // ========================================================================
    // Print Results
    // ========================================================================

    std::printf("\n");
    std::printf("==========================================\n");
    std::printf("Keystat Results\n");
    std::printf("==========================================\n");
    std::printf("  Execution time: %.2f seconds\n", duration.count() / 1000.0);
    if (agg_results.success) {
        const KeylogStats& stats = agg_results.stats;
        std::printf("  Records read: %zu\n", agg_results.records_read);
        std::printf("  Records skipped: %zu\n", stats.skipped_records);
        std::printf("  Events: %u\n", stats.total_events);
        std::printf("  Key presses: %u\n", stats.total_key_presses);
        std::printf("  Sfb events: %u\n", stats.total_sfb_events);
        std::printf("  Distinct sfbs: %zu\n", stats.sfbs.size());
    } else {
        std::printf("  Error: %s\n", agg_results.error.c_str());
    }
    std::printf("  Status: %s\n",
                agg_results.success && write_success ? "SUCCESS" : "FAILED");
    std::printf("==========================================\n");

    return agg_results.success && write_success ? 0 : 1;
}
