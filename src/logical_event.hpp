#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "layout_model.hpp"

struct ComboEvent {
    const Combo* combo;
};

struct SingleEvent {
    const Key* key;
    std::string keycode;
    std::string highest_layer;  // Layer id active when the key was pressed
    bool pressed = true;
    std::uint32_t tap_count = 0;
};

// One logical keypress: a resolved key or a combo activation
using LogicalEvent = std::variant<ComboEvent, SingleEvent>;

// Helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

inline bool is_combo_event(const LogicalEvent& event) {
    return std::holds_alternative<ComboEvent>(event);
}

// Combo output or key id
inline const std::string& output_label(const LogicalEvent& event) {
    return std::visit(
        overloaded{
            [](const ComboEvent& e) -> const std::string& {
                return e.combo->output();
            },
            [](const SingleEvent& e) -> const std::string& {
                return e.key->id;
            },
        },
        event);
}

// Physical keys pressed by the event
inline std::vector<const Key*> event_keys(const LogicalEvent& event) {
    return std::visit(
        overloaded{
            [](const ComboEvent& e) { return e.combo->keys(); },
            [](const SingleEvent& e) {
                return std::vector<const Key*>{e.key};
            },
        },
        event);
}

/**
 * @brief Whether moving from current to next is a same-finger bigram.
 *
 * - key/key: different physical position, same finger
 * - key/combo: key position not in the combo, key finger used by the combo
 * - combo/combo: no shared position, at least one shared finger
 */
inline bool is_entry_sfb(const LogicalEvent& current, const LogicalEvent& next) {
    return std::visit(
        overloaded{
            [](const SingleEvent& a, const SingleEvent& b) {
                return a.key->is_sfb(*b.key);
            },
            [](const SingleEvent& a, const ComboEvent& b) {
                return b.combo->is_key_sfb(*a.key);
            },
            [](const ComboEvent& a, const SingleEvent& b) {
                return a.combo->is_key_sfb(*b.key);
            },
            [](const ComboEvent& a, const ComboEvent& b) {
                return a.combo->is_combo_sfb(*b.combo);
            },
        },
        current, next);
}
