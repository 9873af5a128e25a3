#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pdpl::json {

/**
 * @brief Thin helpers around nlohmann::ordered_json
 *
 * ordered_json keeps object keys in document order and stores integers as
 * int64/uint64, so values no rule touches serialize back as they came in.
 * The rewriter mutates Json directly; these helpers cover parsing,
 * serialization and the value predicates the strategies share.
 */
using Json = nlohmann::ordered_json;
using array_t = Json::array_t;
using object_t = Json::object_t;
using parse_error = Json::parse_error;

// ===== Construction =====

[[nodiscard]] inline Json make_string(std::string value) {
    return Json(std::move(value));
}

[[nodiscard]] inline Json make_object() {
    return Json::object();
}

[[nodiscard]] inline Json make_array() {
    return Json::array();
}

// ===== Parse / Serialize =====

[[nodiscard]] inline Json parse(const std::string& text) {
    return Json::parse(text);
}

[[nodiscard]] inline std::optional<Json> try_parse(const std::string& text) {
    auto result = Json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (result.is_discarded()) {
        return std::nullopt;
    }
    return result;
}

/**
 * @brief Compact serialization
 *
 * Invalid UTF-8 is replaced instead of throwing; parsed input never
 * contains any.
 */
[[nodiscard]] inline std::string dump(const Json& value) {
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

/**
 * @brief Same text as dump(), built with an explicit stack
 *
 * For trees whose depth has not been bounded yet.
 */
[[nodiscard]] inline std::string dump_iterative(const Json& root) {
    struct Frame {
        const Json* node;
        Json::const_iterator it;
        bool first;
    };

    std::string out;
    std::vector<Frame> stack;

    const auto open = [&](const Json& node) {
        if (node.is_object() || node.is_array()) {
            out += node.is_object() ? '{' : '[';
            stack.push_back({&node, node.cbegin(), true});
        } else {
            out += dump(node);
        }
    };

    open(root);
    while (!stack.empty()) {
        auto& frame = stack.back();
        if (frame.it == frame.node->cend()) {
            out += frame.node->is_object() ? '}' : ']';
            stack.pop_back();
            continue;
        }

        if (!frame.first) out += ',';
        frame.first = false;
        if (frame.node->is_object()) {
            out += dump(Json(frame.it.key()));
            out += ':';
        }

        const Json& child = *frame.it;
        ++frame.it;
        open(child);    // may reallocate stack; frame is not used past this point
    }
    return out;
}

// ===== Predicates =====

/**
 * @brief Blank: null, false, whitespace-only string, empty array or object
 */
[[nodiscard]] inline bool is_blank(const Json& value) {
    if (value.is_null()) return true;
    if (value.is_boolean()) return !value.get<bool>();
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        return s.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
    }
    if (value.is_array() || value.is_object()) return value.empty();
    return false;
}

/**
 * @brief Textual form used as hash / mask input
 *
 * Strings are returned raw, everything else in its JSON encoding
 * (42 → "42", true → "true", {"a":1} → "{\"a\":1}").
 */
[[nodiscard]] inline std::string to_text(const Json& value) {
    if (value.is_string()) return value.get<std::string>();
    return dump(value);
}

/**
 * @brief Scan raw text for bracket nesting deeper than max_depth
 *
 * Brackets inside string literals are ignored. Runs before parsing so the
 * parser never recurses on adversarial input.
 */
[[nodiscard]] inline bool nesting_exceeds(std::string_view text, size_t max_depth) {
    size_t depth = 0;
    bool in_string = false;
    bool escaped = false;

    for (const char c : text) {
        if (in_string) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') in_string = false;
            continue;
        }
        switch (c) {
            case '"':
                in_string = true;
                break;
            case '{':
            case '[':
                if (++depth > max_depth) return true;
                break;
            case '}':
            case ']':
                if (depth > 0) --depth;
                break;
            default:
                break;
        }
    }
    return false;
}

/**
 * @brief Same check on an already-built tree, without recursion
 *
 * The root container counts as depth 1.
 */
[[nodiscard]] inline bool depth_exceeds(const Json& root, size_t max_depth) {
    std::vector<std::pair<const Json*, size_t>> pending{{&root, 1}};

    while (!pending.empty()) {
        const auto [node, depth] = pending.back();
        pending.pop_back();

        if (node->is_object() || node->is_array()) {
            if (depth > max_depth) return true;
            for (const auto& child : *node) {
                if (child.is_object() || child.is_array()) pending.emplace_back(&child, depth + 1);
            }
        }
    }
    return false;
}

} // namespace pdpl::json
