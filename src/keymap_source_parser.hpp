#pragma once

#include <cstddef>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include "keylog_error.hpp"

// One [LAYER] = LAYOUT(...) entry of keymap.c
struct LayerDef {
    std::string layer_id;
    std::string layout_id;
    std::vector<std::string> keys;
};

// One COMB(...) or SUBS(...) line of combos.def
struct ComboDef {
    std::string id;
    std::string output;
    std::vector<std::string> keys;
};

namespace keymap_text {

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    std::size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    std::size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// Index just past the bracket closing the one at open_pos, or npos
inline std::size_t find_closing(const std::string& src, std::size_t open_pos,
                                char open, char close) {
    int depth = 0;
    for (std::size_t i = open_pos; i < src.size(); ++i) {
        if (src[i] == open) {
            depth++;
        } else if (src[i] == close) {
            depth--;
            if (depth == 0) return i + 1;
        }
    }
    return std::string::npos;
}

// Split on commas that are not nested inside parentheses
inline std::vector<std::string> split_top_level(const std::string& s) {
    std::vector<std::string> res;
    std::string current;
    int depth = 0;
    for (char c : s) {
        if (c == '(') depth++;
        if (c == ')') depth--;
        if (c == ',' && depth == 0) {
            res.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    std::string last = trim(current);
    if (!last.empty()) res.push_back(last);
    return res;
}

}  // namespace keymap_text

/**
 * @brief Extracts layer definitions from a QMK keymap.c.
 *
 * Regular expressions locate the keymaps array and every layer header;
 * bracket matching finds where each block ends.
 */
class KeymapSourceParser {
   private:
    std::regex keymaps_re_;
    std::regex layer_re_;

   public:
    KeymapSourceParser()
        : keymaps_re_(
              R"(const\s+uint16_t\s+PROGMEM\s+keymaps\s*\[\s*\]\s*\[\s*\w+\s*\]\s*\[\s*\w+\s*\]\s*=\s*\{)"),
          layer_re_(R"(\[\s*(\w+)\s*\]\s*=\s*(\w+)\s*\()") {}

    /**
     * @brief Parse all layers, in source order.
     * @return Empty vector if the file has no keymaps array.
     * @throws KeylogError(InvalidLayout) on unbalanced brackets.
     */
    std::vector<LayerDef> parse(const std::string& src) const {
        std::vector<LayerDef> layers;

        std::smatch keymaps;
        if (!std::regex_search(src, keymaps, keymaps_re_)) return layers;

        std::size_t open_brace =
            static_cast<std::size_t>(keymaps.position(0) + keymaps.length(0)) -
            1;
        std::size_t block_end =
            keymap_text::find_closing(src, open_brace, '{', '}');
        if (block_end == std::string::npos) {
            throw KeylogError(ErrorKind::InvalidLayout,
                              "Unterminated keymaps array in keymap source");
        }
        const std::string block =
            src.substr(open_brace + 1, block_end - open_brace - 2);

        auto begin = block.cbegin();
        std::smatch header;
        while (std::regex_search(begin, block.cend(), header, layer_re_)) {
            std::size_t header_end = static_cast<std::size_t>(
                (begin - block.cbegin()) + header.position(0) +
                header.length(0));
            std::size_t open_paren = header_end - 1;
            std::size_t close = keymap_text::find_closing(block, open_paren,
                                                          '(', ')');
            if (close == std::string::npos) {
                throw KeylogError(ErrorKind::InvalidLayout,
                                  "Unterminated layer " + header[1].str() +
                                      " in keymap source");
            }

            LayerDef def;
            def.layer_id = header[1].str();
            def.layout_id = header[2].str();
            def.keys = keymap_text::split_top_level(
                block.substr(header_end, close - 1 - header_end));
            layers.push_back(std::move(def));

            begin = block.cbegin() + static_cast<std::ptrdiff_t>(close);
        }

        return layers;
    }
};

/**
 * @brief Parses combos.def lines of the form
 *
 *   COMB(id, OUTPUT_KEYCODE, KEY, KEY, ...)
 *   SUBS(id, "text", KEY, KEY, ...)
 *
 * Other lines (comments, blanks) are ignored. A SUBS output that is a single
 * quoted string is unquoted.
 */
class ComboDefParser {
   private:
    std::regex spec_re_;
    std::regex quoted_re_;

   public:
    ComboDefParser()
        : spec_re_(R"(^\s*(COMB|SUBS)\((.+)\)\s*$)"),
          quoted_re_(R"re(^"([^"]+)"$)re") {}

    std::vector<ComboDef> parse(const std::string& src) const {
        std::vector<ComboDef> combos;

        std::istringstream stream(src);
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(stream, line)) {
            line_no++;
            if (!line.empty() && line.back() == '\r') line.pop_back();

            std::smatch spec;
            if (!std::regex_match(line, spec, spec_re_)) continue;

            std::vector<std::string> args;
            std::istringstream arg_stream(spec[2].str());
            std::string arg;
            while (std::getline(arg_stream, arg, ',')) {
                args.push_back(keymap_text::trim(arg));
            }
            if (args.size() < 3) {
                throw KeylogError(ErrorKind::InvalidLayout,
                                  "Combo definition on line " +
                                      std::to_string(line_no) +
                                      " needs an id, an output and keys");
            }

            ComboDef def;
            def.id = args[0];
            def.output = args[1];
            if (spec[1] == "SUBS") {
                std::smatch quoted;
                if (std::regex_match(args[1], quoted, quoted_re_)) {
                    def.output = quoted[1].str();
                }
            }
            def.keys.assign(args.begin() + 2, args.end());
            combos.push_back(std::move(def));
        }

        return combos;
    }
};
