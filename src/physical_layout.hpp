#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "finger_assignment.hpp"
#include "json_parser_utility.hpp"
#include "keylog_error.hpp"

// A key slot of a physical grid. value is the digit drawn in the grid
// (effort for physical_layout, finger for finger_assignments).
struct PhysicalPos {
    std::size_t col = 0;
    std::size_t row = 0;
    MatrixHalf half = MatrixHalf::Left;
    std::uint32_t value = 0;

    std::pair<std::size_t, std::size_t> pos() const { return {col, row}; }

    bool operator==(const PhysicalPos& other) const {
        return col == other.col && row == other.row && half == other.half &&
               value == other.value;
    }
};

/**
 * @brief Text grid describing where keys sit, one string per row.
 *
 * A row is split into left and right halves on a four-space gap; every
 * non-space character is one key and columns keep counting across the gap:
 *
 *   "54446    64445"   -> cols 0..4 left, cols 5..9 right
 *   " 77"              -> cols 1..2 left
 *
 * Key indices run row by row, left half before right half, matching the
 * order of keys in a keymap LAYOUT(...) call.
 */
class PhysicalLayout {
   private:
    std::vector<PhysicalPos> index_to_pos_;
    std::map<std::pair<std::size_t, std::size_t>, std::size_t> pos_to_index_;

    static void append_half(const std::string& part, std::size_t row,
                            MatrixHalf half, std::size_t& curr_col,
                            std::vector<PhysicalPos>& out) {
        for (char c : part) {
            if (c != ' ') {
                if (c < '0' || c > '9') {
                    throw KeylogError(
                        ErrorKind::InvalidLayout,
                        "Physical layout should contain digits, found '" +
                            std::string(1, c) + "' in row " +
                            std::to_string(row));
                }
                PhysicalPos pos;
                pos.col = curr_col;
                pos.row = row;
                pos.half = half;
                pos.value = static_cast<std::uint32_t>(c - '0');
                out.push_back(pos);
            }
            curr_col++;
        }
    }

   public:
    PhysicalLayout() = default;

    static PhysicalLayout from_rows(const std::vector<std::string>& rows) {
        static const std::string kHalfSeparator = "    ";

        PhysicalLayout layout;
        for (std::size_t row = 0; row < rows.size(); ++row) {
            std::string line = rows[row];
            while (!line.empty() &&
                   (line.back() == ' ' || line.back() == '\t')) {
                line.pop_back();
            }

            std::string left = line;
            std::string right;
            bool has_right = false;
            std::size_t sep = line.find(kHalfSeparator);
            if (sep != std::string::npos) {
                left = line.substr(0, sep);
                right = line.substr(sep + kHalfSeparator.size());
                has_right = true;
                if (right.find(kHalfSeparator) != std::string::npos) {
                    throw KeylogError(ErrorKind::InvalidLayout,
                                      "Physical layout row " +
                                          std::to_string(row) +
                                          " has more than two halves");
                }
            }

            std::size_t curr_col = 0;
            append_half(left, row, MatrixHalf::Left, curr_col,
                        layout.index_to_pos_);
            if (has_right) {
                append_half(right, row, MatrixHalf::Right, curr_col,
                            layout.index_to_pos_);
            }
        }

        for (std::size_t i = 0; i < layout.index_to_pos_.size(); ++i) {
            layout.pos_to_index_[layout.index_to_pos_[i].pos()] = i;
        }
        return layout;
    }

    // Reads a JSON array of row strings, e.g. the "physical_layout" field
    static PhysicalLayout from_json(const JsonValue& rows,
                                    const std::string& field) {
        if (!rows.is_array()) {
            throw KeylogError(ErrorKind::InvalidLayout,
                              "Layout options field '" + field +
                                  "' must be an array of strings");
        }
        std::vector<std::string> lines;
        lines.reserve(rows.size());
        for (std::size_t i = 0; i < rows.size(); ++i) {
            auto line = rows[i].get_optional<std::string>();
            if (!line) {
                throw KeylogError(ErrorKind::InvalidLayout,
                                  "Layout options field '" + field +
                                      "' row " + std::to_string(i) +
                                      " is not a string");
            }
            lines.push_back(*line);
        }
        return from_rows(lines);
    }

    std::size_t size() const { return index_to_pos_.size(); }

    const PhysicalPos* at_index(std::size_t index) const {
        return index < index_to_pos_.size() ? &index_to_pos_[index] : nullptr;
    }

    const PhysicalPos* at_pos(std::size_t col, std::size_t row) const {
        auto it = pos_to_index_.find({col, row});
        return it != pos_to_index_.end() ? &index_to_pos_[it->second]
                                         : nullptr;
    }
};

/**
 * @brief The parts of the layout options file keystat needs: where every
 * key sits (with its effort digit) and which finger presses it.
 */
struct LayoutOptions {
    PhysicalLayout physical_layout;
    PhysicalLayout finger_assignments;

    static LayoutOptions from_json(const JsonValue& root) {
        LayoutOptions opts;
        opts.physical_layout =
            PhysicalLayout::from_json(root["physical_layout"], "physical_layout");
        opts.finger_assignments = PhysicalLayout::from_json(
            root["finger_assignments"], "finger_assignments");
        return opts;
    }

    /**
     * @brief Finger responsible for a physical position.
     * @throws KeylogError(InvalidLayout) if the finger grid has no key there
     * or holds a digit above 4.
     */
    FingerAssignment assigned_finger(std::size_t col, std::size_t row) const {
        const PhysicalPos* spec = finger_assignments.at_pos(col, row);
        if (!spec) {
            throw KeylogError(ErrorKind::InvalidLayout,
                              "No finger assignment for physical position (" +
                                  std::to_string(col) + ", " +
                                  std::to_string(row) + ")");
        }
        Finger finger;
        if (!finger_from_digit(static_cast<int>(spec->value), finger)) {
            throw KeylogError(ErrorKind::InvalidLayout,
                              "Finger value " + std::to_string(spec->value) +
                                  " unknown");
        }
        return FingerAssignment{finger, spec->half};
    }
};
