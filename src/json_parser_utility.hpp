#pragma once

#include <dftracer/utils/core/utilities/utility.h>
#include <dftracer/utils/utilities/io/file_reader.h>
#include <yyjson.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "keylog_error.hpp"

using namespace dftracer::utils;

/**
 * @brief Thin non-owning view over a yyjson_val* used by the layout parsers.
 *
 * Missing fields navigate to a null JsonValue instead of failing, so lookups
 * can be chained: json["layouts"]["LAYOUT"]["layout"][0]["x"].
 *
 * IMPORTANT: a JsonValue is only valid while its JsonDocument is alive.
 */
class JsonValue {
   private:
    yyjson_val* val_;

   public:
    explicit JsonValue(yyjson_val* val = nullptr) : val_(val) {}

    bool is_object() const { return val_ && yyjson_is_obj(val_); }
    bool is_array() const { return val_ && yyjson_is_arr(val_); }

    JsonValue operator[](const char* key) const {
        return JsonValue(is_object() ? yyjson_obj_get(val_, key) : nullptr);
    }

    JsonValue operator[](const std::string& key) const {
        return (*this)[key.c_str()];
    }

    // Array element access; out of range yields a null JsonValue
    JsonValue operator[](std::size_t index) const {
        return JsonValue(is_array() ? yyjson_arr_get(val_, index) : nullptr);
    }

    // Number of array elements or object members (0 for scalars)
    std::size_t size() const {
        if (is_array()) return yyjson_arr_size(val_);
        if (is_object()) return yyjson_obj_size(val_);
        return 0;
    }

    /**
     * @brief Call fn(key, value) for every member of an object, in document
     * order. Does nothing for non-objects.
     */
    template <typename Fn>
    void for_each_member(Fn&& fn) const {
        if (!is_object()) return;
        yyjson_obj_iter iter;
        yyjson_obj_iter_init(val_, &iter);
        yyjson_val* key = nullptr;
        while ((key = yyjson_obj_iter_next(&iter)) != nullptr) {
            fn(std::string_view(yyjson_get_str(key), yyjson_get_len(key)),
               JsonValue(yyjson_obj_iter_get_val(key)));
        }
    }

    // std::nullopt when the field is missing or holds another type
    template <typename T>
    std::optional<T> get_optional() const {
        if (!val_) return std::nullopt;

        if constexpr (std::is_same_v<T, std::string>) {
            if (!yyjson_is_str(val_)) return std::nullopt;
            return std::string(yyjson_get_str(val_), yyjson_get_len(val_));
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            if (yyjson_is_uint(val_)) return yyjson_get_uint(val_);
            if (yyjson_is_sint(val_) && yyjson_get_sint(val_) >= 0) {
                return static_cast<std::uint64_t>(yyjson_get_sint(val_));
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!yyjson_is_num(val_)) return std::nullopt;
            return yyjson_get_num(val_);
        } else {
            static_assert(!sizeof(T),
                          "Unsupported type for JsonValue::get_optional<T>()");
        }
    }
};

/**
 * @brief Owns a parsed yyjson document together with the text it was read
 * from. Copies share the same document.
 */
class JsonDocument {
   private:
    std::shared_ptr<std::string> content_;
    std::shared_ptr<yyjson_doc> doc_;

   public:
    JsonDocument() = default;

    /**
     * @brief Parse JSON text.
     * @param text JSON source
     * @param source_name Used in the error message (file name or label)
     * @throws KeylogError(InvalidLayout) when the text is not valid JSON
     */
    static JsonDocument parse(std::string text,
                              const std::string& source_name) {
        JsonDocument document;
        document.content_ = std::make_shared<std::string>(std::move(text));

        yyjson_read_err err;
        yyjson_doc* doc = yyjson_read_opts(document.content_->data(),
                                           document.content_->size(),
                                           YYJSON_READ_NOFLAG, nullptr, &err);
        if (!doc) {
            throw KeylogError(ErrorKind::InvalidLayout,
                              "Failed to parse JSON in " + source_name +
                                  " at byte " + std::to_string(err.pos) +
                                  ": " + (err.msg ? err.msg : "unknown"));
        }

        document.doc_ = std::shared_ptr<yyjson_doc>(doc, [](yyjson_doc* d) {
            if (d) yyjson_doc_free(d);
        });
        return document;
    }

    JsonValue root() const {
        return JsonValue(doc_ ? yyjson_doc_get_root(doc_.get()) : nullptr);
    }
};

/**
 * @brief Input for StringJsonParserUtility.
 *
 * Keeps the text content alive while the document is parsed.
 */
struct StringJsonParserInput {
    utilities::text::Text content;
    std::string source_name = "<string>";

    // Factory: From string buffer (copies into Text)
    static StringJsonParserInput from_string(
        const std::string& json_str, const std::string& name = "<string>") {
        StringJsonParserInput input;
        input.content.content = json_str;
        input.source_name = name;
        return input;
    }
};

/**
 * @brief Utility that parses JSON text into an owned JsonDocument.
 */
class StringJsonParserUtility
    : public utilities::Utility<StringJsonParserInput, JsonDocument> {
   public:
    JsonDocument process(const StringJsonParserInput& input) override {
        return JsonDocument::parse(input.content.content, input.source_name);
    }
};
