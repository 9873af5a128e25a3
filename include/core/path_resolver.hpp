#pragma once

#include "core/json.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdpl {

/**
 * @brief One segment of a dot-path
 *
 * A segment made only of decimal digits addresses an array element,
 * anything else an object key. There is no escape syntax, so keys that
 * contain '.' or consist only of digits cannot be addressed.
 */
struct PathSegment {
    std::string key;
    std::optional<size_t> index;

    [[nodiscard]] bool is_index() const { return index.has_value(); }
};

/**
 * @brief Dot-notation addressing into a JSON tree
 *
 * Never throws on structural anomalies: absent keys, out-of-range indices
 * and type mismatches read as "not found" and make writes a no-op.
 */
class PathResolver {
public:
    [[nodiscard]] static std::vector<PathSegment> parse(std::string_view path);

    /**
     * @brief Resolve a path
     * @return Pointer into root, or nullptr when the path does not resolve
     */
    [[nodiscard]] static const json::Json* get(const json::Json& root, std::string_view path);
    [[nodiscard]] static const json::Json* get(const json::Json& root,
                                               const std::vector<PathSegment>& segments);

    /**
     * @brief Write value at path
     *
     * Missing or null intermediate keys under an object become empty objects.
     * Array elements are never created: an out-of-range index, or a segment
     * that does not match its node's type, drops the write.
     *
     * @return true if the value was written
     */
    static bool set(json::Json& root, std::string_view path, json::Json value);
    static bool set(json::Json& root, const std::vector<PathSegment>& segments, json::Json value);
};

} // namespace pdpl
