#pragma once

#include <dftracer/utils/core/common/filesystem.h>
#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/core/utilities/utility.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "json_parser_utility.hpp"
#include "keyboard_spec.hpp"
#include "keylog_error.hpp"
#include "keymap_source_parser.hpp"
#include "layout_model.hpp"
#include "physical_layout.hpp"
#include "text_file_reader.hpp"

using namespace dftracer::utils;

/**
 * @brief Where the layout sources live inside a QMK checkout.
 *
 *   <qmk_root>/keyboards/<keyboard>/keyboard.json   (or info.json)
 *   <qmk_root>/keyboards/<base>/keymaps/<keymap>/keymap.c
 *   <qmk_root>/keyboards/<base>/keymaps/<keymap>/combos.def
 *
 * where <base> is the part of <keyboard> before the first '/'.
 */
struct QmkPaths {
    std::string qmk_root;
    std::string keyboard;
    std::string keymap = "default";

    fs::path keyboard_dir() const {
        return fs::path(qmk_root) / "keyboards" / keyboard;
    }

    fs::path base_keyboard_dir() const {
        std::string base = keyboard.substr(0, keyboard.find('/'));
        return fs::path(qmk_root) / "keyboards" / base;
    }

    fs::path keymap_dir() const {
        return base_keyboard_dir() / "keymaps" / keymap;
    }

    fs::path keymap_c() const { return keymap_dir() / "keymap.c"; }
    fs::path combos_def() const { return keymap_dir() / "combos.def"; }
    fs::path keyboard_json() const { return keyboard_dir() / "keyboard.json"; }
    fs::path info_json() const { return keyboard_dir() / "info.json"; }
};

// Input: the four layout sources, either as file paths or as text
struct LayoutLoaderInput {
    std::string keymap_c;
    std::string keyboard_json;
    std::string combos_def;
    std::string layout_opts_json;
    std::string keyboard_json_name = "keyboard.json";
    std::string layout_opts_name = "layout options";

    static LayoutLoaderInput from_qmk(const QmkPaths& paths,
                                      const std::string& layout_opts_path) {
        LayoutLoaderInput input;

        fs::path spec_path = paths.keyboard_json();
        if (!fs::is_regular_file(spec_path)) {
            spec_path = paths.info_json();
        }
        if (!fs::is_regular_file(spec_path)) {
            throw KeylogError(ErrorKind::Io,
                              "Couldn't find keyboard.json or info.json at " +
                                  paths.keyboard_json().string() + " nor " +
                                  paths.info_json().string());
        }

        input.keymap_c = read_text_file(paths.keymap_c().string());
        input.keyboard_json = read_text_file(spec_path.string());
        input.combos_def = read_text_file(paths.combos_def().string());
        input.layout_opts_json = read_text_file(layout_opts_path);
        input.keyboard_json_name = spec_path.string();
        input.layout_opts_name = layout_opts_path;
        return input;
    }

    static LayoutLoaderInput from_sources(const std::string& keymap_c,
                                          const std::string& keyboard_json,
                                          const std::string& combos_def,
                                          const std::string& layout_opts) {
        LayoutLoaderInput input;
        input.keymap_c = keymap_c;
        input.keyboard_json = keyboard_json;
        input.combos_def = combos_def;
        input.layout_opts_json = layout_opts;
        return input;
    }
};

using LayoutLoaderOutput = std::shared_ptr<const LayoutModel>;

/**
 * @brief Builds the LayoutModel from keymap.c, keyboard.json, combos.def and
 * the layout options grids.
 *
 * Key i of every layer takes its matrix position and x/y from entry i of the
 * layer's keyboard.json layout, and its physical slot from index i of the
 * physical_layout grid.
 */
class LayoutLoaderUtility
    : public utilities::Utility<LayoutLoaderInput, LayoutLoaderOutput> {
   private:
    KeymapSourceParser keymap_parser_;
    ComboDefParser combo_parser_;
    StringJsonParserUtility json_parser_;

    Layer build_layer(const LayerDef& def, const KeyboardSpec& spec,
                      const LayoutOptions& opts) const {
        const LayoutSpec* layout = spec.get_layout(def.layout_id);
        if (!layout) {
            throw KeylogError(ErrorKind::InvalidLayout,
                              "Failed to find layout spec for " +
                                  def.layout_id);
        }

        if (def.keys.size() != layout->layout.size()) {
            throw KeylogError(
                ErrorKind::InvalidLayout,
                "Layer and its spec have a mismatched number of keys " +
                    std::to_string(def.keys.size()) +
                    " != " + std::to_string(layout->layout.size()) +
                    " for layer " + def.layer_id);
        }

        Layer layer;
        layer.id = def.layer_id;
        layer.keys.reserve(def.keys.size());
        for (std::size_t i = 0; i < def.keys.size(); ++i) {
            const PhysicalPos* physical = opts.physical_layout.at_index(i);
            if (!physical) {
                throw KeylogError(ErrorKind::InvalidLayout,
                                  "Physical layout has " +
                                      std::to_string(
                                          opts.physical_layout.size()) +
                                      " keys but layer " + def.layer_id +
                                      " has " +
                                      std::to_string(def.keys.size()));
            }

            Key key;
            key.id = def.keys[i];
            key.x = layout->layout[i].x;
            key.y = layout->layout[i].y;
            key.matrix_pos = layout->layout[i].matrix;
            key.physical_pos = *physical;
            key.finger = opts.assigned_finger(physical->col, physical->row);
            layer.keys.push_back(std::move(key));
        }
        return layer;
    }

    std::vector<Combo> build_combos(const std::vector<ComboDef>& defs,
                                    const Layer& base_layer) const {
        std::unordered_map<std::string, const Key*> key_lookup;
        for (const auto& key : base_layer.keys) {
            key_lookup.emplace(key.id, &key);
        }

        std::vector<Combo> combos;
        combos.reserve(defs.size());
        for (const auto& def : defs) {
            std::vector<const Key*> keys;
            for (const auto& key_id : def.keys) {
                auto it = key_lookup.find(key_id);
                if (it == key_lookup.end()) {
                    throw KeylogError(ErrorKind::InvalidLayout,
                                      "Couldn't find combo key `" + key_id +
                                          "` of combo " + def.id +
                                          " in base layer");
                }
                keys.push_back(it->second);
            }
            combos.emplace_back(def.id, def.output, std::move(keys));
        }
        return combos;
    }

   public:
    LayoutLoaderOutput process(const LayoutLoaderInput& input) override {
        DFTRACER_UTILS_LOG_INFO("%s", "Loading layout model...");

        JsonDocument opts_doc = json_parser_.process(
            StringJsonParserInput::from_string(input.layout_opts_json,
                                               input.layout_opts_name));
        LayoutOptions opts = LayoutOptions::from_json(opts_doc.root());

        JsonDocument spec_doc = json_parser_.process(
            StringJsonParserInput::from_string(input.keyboard_json,
                                               input.keyboard_json_name));
        KeyboardSpec spec = KeyboardSpec::from_json(spec_doc.root());

        std::vector<LayerDef> layer_defs = keymap_parser_.parse(input.keymap_c);
        if (layer_defs.empty()) {
            throw KeylogError(ErrorKind::InvalidLayout,
                              "No layers found in keymap source");
        }

        std::vector<Layer> layers;
        layers.reserve(layer_defs.size());
        for (const auto& def : layer_defs) {
            layers.push_back(build_layer(def, spec, opts));
        }

        auto model = std::make_shared<LayoutModel>();
        model->set_layers(std::move(layers));
        model->set_combos(build_combos(combo_parser_.parse(input.combos_def),
                                       *model->base_layer()));

        DFTRACER_UTILS_LOG_INFO(
            "Layout model loaded: %zu layers, %zu keys per layer, %zu combos",
            model->layers().size(), model->base_layer()->keys.size(),
            model->combos().size());

        return model;
    }
};
