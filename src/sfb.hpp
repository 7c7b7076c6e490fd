#pragma once

#include <cstddef>
#include <cstdio>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "finger_assignment.hpp"
#include "layout_model.hpp"
#include "logical_event.hpp"

// Two consecutive single keys on the same finger
struct SingleSfb {
    const Key* first_key;
    const Key* second_key;
    FingerAssignment finger;
};

// Any sfb where at least one side is a combo
struct ComboSfb {
    std::vector<const Key*> first_keys;
    std::vector<const Key*> second_keys;
    std::set<FingerAssignment> fingers;
};

/**
 * @brief A detected same-finger bigram.
 *
 * Its id() is the aggregation key: first side right aligned, second side
 * left aligned, e.g. "                  SE_C    SE_S                ".
 * (A, B) and (B, A) are different sfbs.
 */
class Sfb {
   private:
    std::variant<SingleSfb, ComboSfb> value_;

    static std::string join_ids(const std::vector<const Key*>& keys) {
        std::string res;
        for (std::size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) res += ',';
            res += keys[i]->id;
        }
        return res;
    }

   public:
    explicit Sfb(SingleSfb sfb) : value_(std::move(sfb)) {}
    explicit Sfb(ComboSfb sfb) : value_(std::move(sfb)) {}

    /**
     * @brief Build the sfb for a pair of consecutive events.
     * @return std::nullopt if the pair is not an sfb.
     */
    static std::optional<Sfb> from_pair(const LogicalEvent& current,
                                        const LogicalEvent& next) {
        if (!is_entry_sfb(current, next)) return std::nullopt;

        if (const auto* a = std::get_if<SingleEvent>(&current)) {
            if (const auto* b = std::get_if<SingleEvent>(&next)) {
                return Sfb(SingleSfb{a->key, b->key, a->key->finger});
            }
        }

        ComboSfb sfb;
        sfb.first_keys = event_keys(current);
        sfb.second_keys = event_keys(next);
        for (const Key* key : sfb.first_keys) sfb.fingers.insert(key->finger);
        for (const Key* key : sfb.second_keys) sfb.fingers.insert(key->finger);
        return Sfb(std::move(sfb));
    }

    bool has_combo() const { return std::holds_alternative<ComboSfb>(value_); }

    std::string first_ids_to_string() const {
        return std::visit(
            overloaded{
                [](const SingleSfb& s) { return s.first_key->id; },
                [](const ComboSfb& s) { return join_ids(s.first_keys); },
            },
            value_);
    }

    std::string second_ids_to_string() const {
        return std::visit(
            overloaded{
                [](const SingleSfb& s) { return s.second_key->id; },
                [](const ComboSfb& s) { return join_ids(s.second_keys); },
            },
            value_);
    }

    std::string id() const {
        std::string first = first_ids_to_string();
        std::string second = second_ids_to_string();

        // %22s / %-20s pad but never truncate
        std::size_t len = first.size() + second.size() + 64;
        std::string buffer(len, '\0');
        int written =
            std::snprintf(buffer.data(), buffer.size(), "%22s    %-20s",
                          first.c_str(), second.c_str());
        buffer.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
        return buffer;
    }

    std::set<FingerAssignment> fingers() const {
        return std::visit(
            overloaded{
                [](const SingleSfb& s) {
                    return std::set<FingerAssignment>{s.finger};
                },
                [](const ComboSfb& s) { return s.fingers; },
            },
            value_);
    }
};
