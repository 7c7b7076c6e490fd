#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "finger_assignment.hpp"
#include "physical_layout.hpp"

// Firmware matrix address as written in keyboard.json: "matrix": [row, col]
struct MatrixPos {
    std::size_t row = 0;
    std::size_t col = 0;

    bool operator==(const MatrixPos& other) const {
        return row == other.row && col == other.col;
    }
};

struct Key {
    std::string id;  // Keycode symbol from keymap.c, e.g. "SE_A"
    float x = 0.0f;
    float y = 0.0f;
    MatrixPos matrix_pos;
    PhysicalPos physical_pos;
    FingerAssignment finger{Finger::Pinky, MatrixHalf::Left};

    std::pair<std::size_t, std::size_t> pos() const {
        return physical_pos.pos();
    }

    // Same finger, different physical position
    bool is_sfb(const Key& other) const {
        return pos() != other.pos() && finger == other.finger;
    }

    bool operator==(const Key& other) const {
        return id == other.id && matrix_pos == other.matrix_pos;
    }
};

// Slots that fall through to the layer below
inline bool is_transparent_key(const std::string& id) {
    return id == "_______" || id == "xxxxxxx";
}

struct Layer {
    std::string id;
    std::vector<Key> keys;

    const Key* find_key_by_matrix(const MatrixPos& pos) const {
        for (const auto& key : keys) {
            if (key.matrix_pos == pos) return &key;
        }
        return nullptr;
    }

    const Key* find_key_by_id(const std::string& key_id) const {
        for (const auto& key : keys) {
            if (key.id == key_id) return &key;
        }
        return nullptr;
    }
};

/**
 * @brief A chord of base-layer keys producing one output.
 *
 * Keys point into the owning LayoutModel and are sorted by physical
 * (col, row); keys sharing a position keep their definition order.
 */
class Combo {
   private:
    std::string id_;
    std::string output_;
    std::vector<const Key*> keys_;

   public:
    Combo(std::string id, std::string output, std::vector<const Key*> keys)
        : id_(std::move(id)), output_(std::move(output)), keys_(std::move(keys)) {
        std::stable_sort(keys_.begin(), keys_.end(),
                         [](const Key* a, const Key* b) {
                             return a->pos() < b->pos();
                         });
    }

    const std::string& id() const { return id_; }
    const std::string& output() const { return output_; }
    const std::vector<const Key*>& keys() const { return keys_; }

    bool contains_input_key(const std::string& key_id) const {
        return std::any_of(keys_.begin(), keys_.end(),
                           [&](const Key* key) { return key->id == key_id; });
    }

    bool contains_physical_pos(
        const std::pair<std::size_t, std::size_t>& pos) const {
        return std::any_of(keys_.begin(), keys_.end(),
                           [&](const Key* key) { return key->pos() == pos; });
    }

    bool contains_finger(const FingerAssignment& finger) const {
        return std::any_of(
            keys_.begin(), keys_.end(),
            [&](const Key* key) { return key->finger == finger; });
    }

    std::set<FingerAssignment> fingers() const {
        std::set<FingerAssignment> res;
        for (const Key* key : keys_) res.insert(key->finger);
        return res;
    }

    std::set<std::pair<std::size_t, std::size_t>> positions() const {
        std::set<std::pair<std::size_t, std::size_t>> res;
        for (const Key* key : keys_) res.insert(key->pos());
        return res;
    }

    // A key inside the combo is never an sfb with it
    bool is_key_sfb(const Key& key) const {
        if (contains_physical_pos(key.pos())) return false;
        return contains_finger(key.finger);
    }

    bool is_combo_sfb(const Combo& other) const {
        auto my_positions = positions();
        for (const auto& pos : other.positions()) {
            if (my_positions.count(pos)) return false;
        }

        auto my_fingers = fingers();
        for (const auto& finger : other.fingers()) {
            if (my_fingers.count(finger)) return true;
        }
        return false;
    }
};

/**
 * @brief Immutable keyboard model: layers of keys plus combos.
 *
 * Owns every Key and Combo; events and sfbs hold plain pointers into it, so
 * it is shared as std::shared_ptr<const LayoutModel> and never copied.
 */
class LayoutModel {
   private:
    std::vector<Layer> layers_;
    std::vector<Combo> combos_;

   public:
    LayoutModel() = default;
    LayoutModel(const LayoutModel&) = delete;
    LayoutModel& operator=(const LayoutModel&) = delete;
    LayoutModel(LayoutModel&&) = default;
    LayoutModel& operator=(LayoutModel&&) = default;

    // Combos must point into layers, so build layers first
    void set_layers(std::vector<Layer> layers) { layers_ = std::move(layers); }
    void set_combos(std::vector<Combo> combos) { combos_ = std::move(combos); }

    const std::vector<Layer>& layers() const { return layers_; }
    const std::vector<Combo>& combos() const { return combos_; }

    const Layer* base_layer() const {
        return layers_.empty() ? nullptr : &layers_.front();
    }

    std::optional<std::string> layer_id_of(std::size_t layer_index) const {
        if (layer_index >= layers_.size()) return std::nullopt;
        return layers_[layer_index].id;
    }

    const Combo* combo_at(std::size_t index) const {
        return index < combos_.size() ? &combos_[index] : nullptr;
    }

    /**
     * @brief Key pressed at a matrix position while highest_layer is active.
     *
     * Scans from highest_layer down to the base layer and returns the first
     * key that is not transparent.
     * @return nullptr if the layer index is out of range or every layer is
     * transparent (or empty) at that position.
     */
    const Key* resolve_key(std::size_t highest_layer,
                           const MatrixPos& pos) const {
        if (highest_layer >= layers_.size()) return nullptr;

        for (std::size_t i = highest_layer + 1; i-- > 0;) {
            const Key* key = layers_[i].find_key_by_matrix(pos);
            if (key && !is_transparent_key(key->id)) return key;
        }
        return nullptr;
    }
};
