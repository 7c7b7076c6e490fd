#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <utility>

#include "keyboard_spec.hpp"
#include "keylog_error.hpp"
#include "keymap_source_parser.hpp"
#include "layout_loader_utility.hpp"
#include "test_fixtures.hpp"

namespace {

ErrorKind load_error_kind(const std::string& keymap_c,
                          const std::string& keyboard_json,
                          const std::string& combos_def,
                          const std::string& layout_opts) {
    try {
        LayoutLoaderUtility loader;
        loader.process(LayoutLoaderInput::from_sources(
            keymap_c, keyboard_json, combos_def, layout_opts));
    } catch (const KeylogError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "layout loaded without error";
    return ErrorKind::Io;
}

}  // namespace

TEST(KeymapSourceParserTest, ParsesLayers) {
    KeymapSourceParser parser;
    auto layers = parser.parse(fixtures::kKeymapC);

    ASSERT_EQ(layers.size(), 2u);
    EXPECT_EQ(layers[0].layer_id, "_BASE");
    EXPECT_EQ(layers[0].layout_id, "LAYOUT");
    EXPECT_EQ(layers[0].keys.size(), 35u);
    EXPECT_EQ(layers[0].keys[0], "SE_J");
    EXPECT_EQ(layers[0].keys[34], "SE_E");
    EXPECT_EQ(layers[1].layer_id, "_NUM");
    EXPECT_EQ(layers[1].keys[1], "SE_PLUS");
}

TEST(KeymapSourceParserTest, KeepsNestedKeycodesWhole) {
    KeymapSourceParser parser;
    auto layers = parser.parse(R"(
const uint16_t PROGMEM keymaps[][MATRIX_ROWS][MATRIX_COLS] = {
    [0] = LAYOUT_ortho(LT(1, KC_A), MT(MOD_LSFT, KC_B), KC_C)
};)");

    ASSERT_EQ(layers.size(), 1u);
    ASSERT_EQ(layers[0].keys.size(), 3u);
    EXPECT_EQ(layers[0].keys[0], "LT(1, KC_A)");
    EXPECT_EQ(layers[0].keys[1], "MT(MOD_LSFT, KC_B)");
}

TEST(KeymapSourceParserTest, NoKeymapsBlock) {
    KeymapSourceParser parser;
    EXPECT_TRUE(parser.parse("int main() { return 0; }").empty());
}

TEST(ComboDefParserTest, ParsesCombAndSubs) {
    ComboDefParser parser;
    auto combos = parser.parse(fixtures::kCombosDef);

    ASSERT_EQ(combos.size(), 7u);
    EXPECT_EQ(combos[0].id, "num");
    EXPECT_EQ(combos[0].output, "NUMWORD");
    ASSERT_EQ(combos[0].keys.size(), 2u);
    EXPECT_EQ(combos[0].keys[0], "MT_SPC");
    EXPECT_EQ(combos[0].keys[1], "SE_E");

    EXPECT_EQ(combos[1].output, "https://");
    EXPECT_EQ(combos[2].keys.size(), 5u);
    EXPECT_EQ(combos[4].output, "<=");
    // Not a single quoted string, kept as written
    EXPECT_EQ(combos[5].output, "\"#{}\"SS_TAP(X_LEFT)");
}

TEST(ComboDefParserTest, RejectsComboWithoutKeys) {
    ComboDefParser parser;
    EXPECT_THROW(parser.parse("COMB(lonely, KC_A)"), KeylogError);
}

TEST(KeyboardSpecTest, ResolvesAliases) {
    JsonDocument doc = JsonDocument::parse(R"({
        "layouts": {
            "LAYOUT_split_3x5_2": {
                "layout": [
                    {"matrix": [0, 0], "x": 0, "y": 0},
                    {"matrix": [0, 1], "x": 1, "y": 0.5}
                ]
            }
        },
        "layout_aliases": {
            "LAYOUT": "LAYOUT_split_3x5_2",
            "LOOP_A": "LOOP_B",
            "LOOP_B": "LOOP_A"
        }
    })",
                                           "keyboard.json");
    KeyboardSpec spec = KeyboardSpec::from_json(doc.root());

    const LayoutSpec* layout = spec.get_layout("LAYOUT");
    ASSERT_NE(layout, nullptr);
    ASSERT_EQ(layout->layout.size(), 2u);
    EXPECT_EQ(layout->layout[1].matrix.col, 1u);
    EXPECT_FLOAT_EQ(layout->layout[1].y, 0.5f);

    EXPECT_EQ(spec.get_layout("LAYOUT_missing"), nullptr);
    EXPECT_EQ(spec.get_layout("LOOP_A"), nullptr);
}

TEST(KeyboardSpecTest, RejectsEntryWithoutMatrix) {
    JsonDocument doc = JsonDocument::parse(
        R"({"layouts": {"LAYOUT": {"layout": [{"x": 0, "y": 0}]}}})",
        "keyboard.json");
    EXPECT_THROW(KeyboardSpec::from_json(doc.root()), KeylogError);
}

TEST(LayoutLoaderTest, LoadsReferenceLayout) {
    auto layout = fixtures::load_reference_layout();

    ASSERT_EQ(layout->layers().size(), 2u);
    EXPECT_EQ(layout->combos().size(), 7u);
    EXPECT_EQ(layout->layer_id_of(1).value_or(""), "_NUM");
    EXPECT_FALSE(layout->layer_id_of(2).has_value());

    const Key* j = layout->base_layer()->find_key_by_id("SE_J");
    ASSERT_NE(j, nullptr);
    EXPECT_EQ(j->matrix_pos, (MatrixPos{1, 0}));
    EXPECT_FLOAT_EQ(j->y, 0.93f);
    EXPECT_EQ(j->finger, (FingerAssignment{Finger::Ring, MatrixHalf::Left}));

    const Key* e = layout->base_layer()->find_key_by_id("SE_E");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->pos(), std::make_pair(std::size_t{5}, std::size_t{4}));
    EXPECT_EQ(e->finger, (FingerAssignment{Finger::Thumb, MatrixHalf::Right}));
}

TEST(LayoutLoaderTest, CombosSortKeysByPhysicalPosition) {
    auto layout = fixtures::load_reference_layout();

    const Combo* boot = layout->combo_at(2);
    ASSERT_NE(boot, nullptr);
    EXPECT_EQ(boot->id(), "comb_boot_r");
    EXPECT_EQ(boot->output(), "QK_BOOT");
    ASSERT_EQ(boot->keys().size(), 5u);
    EXPECT_EQ(boot->keys()[0]->id, "SE_E");
    EXPECT_EQ(boot->keys()[1]->id, "SE_L");
    EXPECT_EQ(boot->keys()[4]->id, "SE_UNDS");
    EXPECT_TRUE(boot->contains_input_key("SE_LPRN"));
    EXPECT_FALSE(boot->contains_input_key("SE_N"));

    EXPECT_EQ(layout->combo_at(7), nullptr);
}

TEST(LayoutLoaderTest, ComboKeysAtSamePositionKeepDefinitionOrder) {
    auto layout = fixtures::load_reference_layout();
    // SE_C on _BASE and SE_PLUS on _NUM share a physical slot
    const Key* c = layout->base_layer()->find_key_by_id("SE_C");
    const Key* plus = layout->layers()[1].find_key_by_id("SE_PLUS");
    const Key* j = layout->base_layer()->find_key_by_id("SE_J");
    ASSERT_TRUE(c && plus && j);
    ASSERT_EQ(c->pos(), plus->pos());

    Combo forward("fwd", "X", {plus, c, j});
    ASSERT_EQ(forward.keys().size(), 3u);
    EXPECT_EQ(forward.keys()[0]->id, "SE_J");
    EXPECT_EQ(forward.keys()[1]->id, "SE_PLUS");
    EXPECT_EQ(forward.keys()[2]->id, "SE_C");

    Combo backward("bwd", "X", {c, j, plus});
    EXPECT_EQ(backward.keys()[1]->id, "SE_C");
    EXPECT_EQ(backward.keys()[2]->id, "SE_PLUS");
}

TEST(LayoutLoaderTest, ResolvesThroughTransparentKeys) {
    auto layout = fixtures::load_reference_layout();

    const Key* plus = layout->resolve_key(1, MatrixPos{0, 1});
    ASSERT_NE(plus, nullptr);
    EXPECT_EQ(plus->id, "SE_PLUS");

    // _______ on _NUM falls through to _BASE
    const Key* w = layout->resolve_key(1, MatrixPos{4, 1});
    ASSERT_NE(w, nullptr);
    EXPECT_EQ(w->id, "SE_W");

    // Transparent on every layer
    EXPECT_EQ(layout->resolve_key(1, MatrixPos{3, 1}), nullptr);
    EXPECT_EQ(layout->resolve_key(0, MatrixPos{9, 9}), nullptr);
    EXPECT_EQ(layout->resolve_key(2, MatrixPos{0, 1}), nullptr);
}

TEST(LayoutLoaderTest, ErrorKinds) {
    using fixtures::kCombosDef;
    using fixtures::kKeyboardJson;
    using fixtures::kKeymapC;
    using fixtures::kLayoutOpts;

    EXPECT_EQ(load_error_kind("", kKeyboardJson, kCombosDef, kLayoutOpts),
              ErrorKind::InvalidLayout);
    EXPECT_EQ(load_error_kind(kKeymapC, "{", kCombosDef, kLayoutOpts),
              ErrorKind::InvalidLayout);
    EXPECT_EQ(load_error_kind(kKeymapC, kKeyboardJson,
                              "COMB(bad, KC_X, SE_NOPE, SE_E)", kLayoutOpts),
              ErrorKind::InvalidLayout);

    std::string short_layout = kKeymapC;
    short_layout.replace(short_layout.find("FUN,"), 4, "");
    EXPECT_EQ(load_error_kind(short_layout, kKeyboardJson, kCombosDef,
                              kLayoutOpts),
              ErrorKind::InvalidLayout);

    std::string unknown_layout = kKeymapC;
    unknown_layout.replace(unknown_layout.find("LAYOUT("), 7, "LAYOUT_x(");
    EXPECT_EQ(load_error_kind(unknown_layout, kKeyboardJson, kCombosDef,
                              kLayoutOpts),
              ErrorKind::InvalidLayout);
}

TEST(LayoutLoaderTest, MissingKeyboardSpecIsIoError) {
    QmkPaths paths{"/nonexistent/qmk", "ferris/sweep", "default"};
    EXPECT_EQ(paths.keymap_c().string(),
              "/nonexistent/qmk/keyboards/ferris/keymaps/default/keymap.c");
    EXPECT_EQ(paths.keyboard_json().string(),
              "/nonexistent/qmk/keyboards/ferris/sweep/keyboard.json");

    try {
        LayoutLoaderInput::from_qmk(paths, "/nonexistent/opts.json");
        FAIL() << "expected KeylogError";
    } catch (const KeylogError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
}
