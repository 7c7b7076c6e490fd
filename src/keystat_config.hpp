#pragma once

#include <cstddef>
#include <optional>
#include <string>

// What to do when the log references a layer, matrix position or combo the
// layout does not have
enum class LayoutMismatchPolicy {
    Fail,  // Abort the analysis with a LayoutMismatch error
    Skip,  // Log a warning, drop the record and keep going
};

inline const char* to_string(LayoutMismatchPolicy policy) {
    return policy == LayoutMismatchPolicy::Fail ? "fail" : "skip";
}

inline std::optional<LayoutMismatchPolicy> parse_layout_mismatch_policy(
    const std::string& name) {
    if (name == "fail") return LayoutMismatchPolicy::Fail;
    if (name == "skip") return LayoutMismatchPolicy::Skip;
    return std::nullopt;
}

struct KeystatConfig {
    // Layout sources
    std::string qmk_root;
    std::string keyboard;
    std::string keymap = "default";
    std::string layout_opts_path;  // JSON with physical and finger grids

    // Keylog
    std::string log_path;

    // Analysis
    LayoutMismatchPolicy on_layout_mismatch = LayoutMismatchPolicy::Fail;

    // Report
    std::size_t top_n = 10;  // Number of sfbs listed per section
};
