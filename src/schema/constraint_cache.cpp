#include "schema/constraint_cache.hpp"
#include "schema/ischema_catalog.hpp"
#include "core/utils.hpp"

#include <format>

namespace pdpl {

ConstraintCache::ConstraintCache(const ISchemaCatalog& catalog)
    : catalog_(catalog),
      tables_(std::make_shared<TableMap>()) {}

// ============================================================================
// Read Operations (lock-free via RCU)
// ============================================================================

std::shared_ptr<const TableFacts> ConstraintCache::table(const std::string& name) const {
    const auto snapshot = std::atomic_load_explicit(&tables_, std::memory_order_acquire);
    const auto it = snapshot->find(name);
    if (it != snapshot->end()) {
        return it->second;
    }
    return populate(name);
}

bool ConstraintCache::table_exists(const std::string& name) const {
    return table(name)->exists;
}

std::optional<ConstraintInfo> ConstraintCache::column_info(const std::string& table_name,
                                                           const std::string& column) const {
    const auto facts = table(table_name);
    if (!facts->exists) return std::nullopt;

    const auto* info = facts->find_column(column);
    if (!info) return std::nullopt;
    return *info;
}

size_t ConstraintCache::table_count() const {
    return std::atomic_load_explicit(&tables_, std::memory_order_acquire)->size();
}

// ============================================================================
// Write Operations (mutex-protected)
// ============================================================================

std::shared_ptr<const TableFacts> ConstraintCache::populate(const std::string& name) const {
    std::lock_guard<std::mutex> lock(populate_mutex_);

    // Another thread may have published it while we waited
    const auto current = std::atomic_load_explicit(&tables_, std::memory_order_acquire);
    const auto it = current->find(name);
    if (it != current->end()) {
        return it->second;
    }

    auto facts = std::make_shared<TableFacts>();
    facts->name = name;
    facts->exists = catalog_.table_exists(name);
    if (facts->exists) {
        for (auto& column : catalog_.describe_table(name)) {
            facts->columns.insert_or_assign(std::move(column.name), column.constraints);
        }
    }

    auto next = std::make_shared<TableMap>(*current);
    std::shared_ptr<const TableFacts> published = std::move(facts);
    next->emplace(name, published);
    std::atomic_store_explicit(&tables_, std::shared_ptr<const TableMap>(std::move(next)),
                               std::memory_order_release);
    return published;
}

void ConstraintCache::invalidate() {
    std::lock_guard<std::mutex> lock(populate_mutex_);
    const size_t dropped = table_count();
    std::atomic_store_explicit(&tables_, std::shared_ptr<const TableMap>(std::make_shared<TableMap>()),
                               std::memory_order_release);
    utils::log::info(std::format("Schema fact cache invalidated ({} tables dropped)", dropped));
}

} // namespace pdpl
