#pragma once

#include <memory>
#include <string>

#include "layout_loader_utility.hpp"
#include "layout_model.hpp"

// Ferris sweep style split keyboard: 3x5 per half plus thumbs, with a
// _NUM layer on top of _BASE.
namespace fixtures {

inline const std::string kKeymapC = R"(
#include QMK_KEYBOARD_H

// clang-format off
const uint16_t PROGMEM keymaps[][MATRIX_ROWS][MATRIX_COLS] = {
    [_BASE] = LAYOUT(
      SE_J,    SE_C,    SE_Y,    SE_F,    SE_P,         SE_X,    SE_W,    SE_O,    SE_U,    SE_DOT,
      SE_R,    SE_S,    SE_T,    SE_H,    SE_K,         SE_M,    SE_N,    SE_A,    SE_I,    REPEAT,
      SE_COMM, SE_V,    SE_G,    SE_D,    SE_B,         SE_SLSH, SE_L,    SE_LPRN, SE_RPRN, SE_UNDS,
               xxxxxxx, xxxxxxx,
                                 FUN,     MT_SPC,       SE_E
    ),
    [_NUM]  = LAYOUT(
      SE_J,    SE_PLUS, SE_ASTR, SE_EXLM, SE_P,         SE_X,    _______, AT_U,    REPEAT,  _______,
      SE_6,    SE_4,    SE_0,    SE_2,    SE_K,         _______, SE_3,    SE_1,    SE_5,    SE_7,
      SE_COMM, _______, NUM_G,   SE_8,    _______,      SE_SLSH, SE_9,    SE_LPRN, SE_RPRN, SE_UNDS,
               _______, _______,
                                 _______, _______,      _______
    )
};
// clang-format on
)";

inline const std::string kKeyboardJson = R"({
    "keyboard_name": "test",
    "layouts": {
        "LAYOUT": {
            "layout": [
                {"matrix": [1, 0], "x": 0, "y": 0.93},
                {"matrix": [0, 1], "x": 1, "y": 0.31},
                {"matrix": [0, 2], "x": 2, "y": 0},
                {"matrix": [0, 3], "x": 3, "y": 0.28},
                {"matrix": [0, 4], "x": 4, "y": 0.42},
                {"matrix": [4, 0], "x": 7, "y": 0.42},
                {"matrix": [4, 1], "x": 8, "y": 0.28},
                {"matrix": [4, 2], "x": 9, "y": 0},
                {"matrix": [4, 3], "x": 10, "y": 0.31},
                {"matrix": [4, 4], "x": 11, "y": 0.93},
                {"matrix": [2, 0], "x": 0, "y": 1.93},
                {"matrix": [1, 1], "x": 1, "y": 1.31},
                {"matrix": [1, 2], "x": 2, "y": 1},
                {"matrix": [1, 3], "x": 3, "y": 1.28},
                {"matrix": [1, 4], "x": 4, "y": 1.42},
                {"matrix": [5, 0], "x": 7, "y": 1.42},
                {"matrix": [5, 1], "x": 8, "y": 1.28},
                {"matrix": [5, 2], "x": 9, "y": 1},
                {"matrix": [5, 3], "x": 10, "y": 1.31},
                {"matrix": [5, 4], "x": 11, "y": 1.93},
                {"matrix": [3, 0], "x": 0, "y": 2.93},
                {"matrix": [2, 1], "x": 1, "y": 2.31},
                {"matrix": [2, 2], "x": 2, "y": 2},
                {"matrix": [2, 3], "x": 3, "y": 2.28},
                {"matrix": [2, 4], "x": 4, "y": 2.42},
                {"matrix": [6, 0], "x": 7, "y": 2.42},
                {"matrix": [6, 1], "x": 8, "y": 2.28},
                {"matrix": [6, 2], "x": 9, "y": 2},
                {"matrix": [6, 3], "x": 10, "y": 2.31},
                {"matrix": [6, 4], "x": 11, "y": 2.93},
                {"matrix": [3, 1], "x": 1, "y": 3.31},
                {"matrix": [3, 2], "x": 2, "y": 3},
                {"matrix": [3, 3], "x": 3.5, "y": 3.75},
                {"matrix": [3, 4], "x": 4.5, "y": 4},
                {"matrix": [7, 0], "x": 6.5, "y": 4}
            ]
        }
    }
})";

inline const std::string kCombosDef = R"(// Comment
COMB(num,               NUMWORD,        MT_SPC, SE_E)

SUBS(https,             "https://",     MT_SPC, SE_SLSH)
COMB(comb_boot_r,       QK_BOOT,        SE_E, SE_L, SE_LPRN, SE_RPRN, SE_UNDS)

COMB(escape_sym,        ESC_SYM,        SE_T, SE_H)
SUBS(lt_eq,             "<=",           SE_F, SE_H)

SUBS(el_str_int,        "#{}"SS_TAP(X_LEFT),  SE_X, SE_W)
COMB(coln_sym,          COLN_SYM,       SE_N, SE_A)
)";

inline const std::string kLayoutOpts = R"({
    "physical_layout": [
        "54446    64445",
        "21005    50012",
        "64436    63446",
        " 77",
        "   80    0"
    ],
    "finger_assignments": [
        "11233    33211",
        "01233    33210",
        "01233    33210",
        " 12",
        "   44    4"
    ]
})";

// Mixes single keys (J, C, S, T, L, W, space) with combo activations
inline const std::string kReferenceLog = R"(0x0001,3,4,0,1,0x00,0x00,1
COMBO,NA,NA,0,0,0,0,0
0x0001,1,0,0,1,0x00,0x00,1
0x0001,0,1,0,1,0x00,0x00,1
0x0001,1,1,0,1,0x00,0x00,1
0x0001,1,1,0,1,0x00,0x00,1
0x0001,1,1,0,1,0x00,0x00,1
0x0001,0,1,0,1,0x00,0x00,1
0x0001,1,1,0,1,0x00,0x00,1
0x0001,1,2,0,1,0x00,0x00,1
COMBO,NA,NA,0,0,0,0,3
COMBO,NA,NA,0,0,0,0,4
0x0001,6,1,0,1,0x00,0x00,1
0x0001,4,1,0,1,0x00,0x00,1
COMBO,NA,NA,0,0,0,0,6
COMBO,NA,NA,0,0,0,0,2
COMBO,NA,NA,0,0,0,0,6
)";

inline std::shared_ptr<const LayoutModel> load_reference_layout() {
    LayoutLoaderUtility loader;
    return loader.process(LayoutLoaderInput::from_sources(
        kKeymapC, kKeyboardJson, kCombosDef, kLayoutOpts));
}

}  // namespace fixtures
