#include "core/path_resolver.hpp"
#include "core/utils.hpp"

#include <limits>

namespace pdpl {

static constexpr char kPathSeparator = '.';

std::vector<PathSegment> PathResolver::parse(std::string_view path) {
    std::vector<PathSegment> segments;
    for (auto& part : utils::split(path, kPathSeparator)) {
        PathSegment segment;
        if (utils::is_all_digits(part)) {
            // Overflowing indices can never be in range
            segment.index = utils::try_parse_int<size_t>(part)
                .value_or(std::numeric_limits<size_t>::max());
        }
        segment.key = std::move(part);
        segments.push_back(std::move(segment));
    }
    return segments;
}

// ============================================================================
// Read
// ============================================================================

const json::Json* PathResolver::get(const json::Json& root, std::string_view path) {
    return get(root, parse(path));
}

const json::Json* PathResolver::get(const json::Json& root,
                                    const std::vector<PathSegment>& segments) {
    const json::Json* current = &root;

    for (const auto& segment : segments) {
        if (segment.is_index()) {
            if (!current->is_array()) return nullptr;
            if (*segment.index >= current->size()) return nullptr;
            current = &(*current)[*segment.index];
        } else {
            if (!current->is_object()) return nullptr;
            const auto it = current->find(segment.key);
            if (it == current->end()) return nullptr;
            current = &*it;
        }
    }
    return current;
}

// ============================================================================
// Write
// ============================================================================

bool PathResolver::set(json::Json& root, std::string_view path, json::Json value) {
    return set(root, parse(path), std::move(value));
}

bool PathResolver::set(json::Json& root, const std::vector<PathSegment>& segments,
                       json::Json value) {
    if (segments.empty()) return false;

    json::Json* current = &root;

    // Walk to the parent of the target
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const auto& segment = segments[i];
        if (segment.is_index()) {
            if (!current->is_array()) return false;
            if (*segment.index >= current->size()) return false;
            current = &(*current)[*segment.index];
        } else {
            if (!current->is_object()) return false;
            auto& child = (*current)[segment.key];
            if (child.is_null()) {
                child = json::make_object();
            }
            current = &child;
        }
    }

    const auto& last = segments.back();
    if (last.is_index()) {
        if (!current->is_array()) return false;
        if (*last.index >= current->size()) return false;
        (*current)[*last.index] = std::move(value);
        return true;
    }

    // Existing keys keep their position; new keys are appended
    if (!current->is_object()) return false;
    (*current)[last.key] = std::move(value);
    return true;
}

} // namespace pdpl
