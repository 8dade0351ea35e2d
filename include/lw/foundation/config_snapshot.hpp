#pragma once

/// @file config_snapshot.hpp
/// @brief YAML-based configuration snapshot with typed dotted-key access.

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "lw/foundation/watch_result.hpp"

namespace lw::foundation {

/// One parsed configuration document.
///
/// Supports loading from file, dotted-key access (e.g., "debounce.interval_ms"),
/// and setting values, which validation handlers use to amend a freshly loaded
/// document. Snapshots are values: copying one and calling set() on the copy
/// leaves the original untouched.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigSnapshot {
public:
    ConfigSnapshot() = default;

    /// Load a snapshot from a YAML file.
    /// @return The snapshot, or ConfigLoadFailed / ConfigParseFailed.
    static WatchResult<ConfigSnapshot> fromFile(const std::filesystem::path& path);

    /// Build a snapshot from an in-memory YAML node.
    static ConfigSnapshot fromNode(const YAML::Node& root);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    WatchResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when the key is missing or mistyped.
    template <typename T>
    T getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Check if a key exists in this snapshot.
    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All keys in lexicographic order.
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Return @p base overlaid with every entry of this snapshot.
    [[nodiscard]] ConfigSnapshot mergedOver(const ConfigSnapshot& base) const;

    /// Keys present here but absent from @p reference, sorted.
    [[nodiscard]] std::vector<std::string> unknownKeys(const ConfigSnapshot& reference) const;

    /// Keys added, removed or changed between @p previous and this snapshot, sorted.
    [[nodiscard]] std::vector<std::string> changedKeys(const ConfigSnapshot& previous) const;

private:
    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);
    void replace(const std::string& key, YAML::Node node);

    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
WatchResult<T> ConfigSnapshot::get(std::string_view key) const {
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return WatchResult<T>::err(
            WatchError(ErrorCode::ConfigKeyNotFound,
                       std::string("config key not found: ") + std::string(key)));
    }
    try {
        return WatchResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return WatchResult<T>::err(
            WatchError(ErrorCode::ConfigTypeMismatch,
                       std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
T ConfigSnapshot::getOr(std::string_view key, T fallback) const {
    return get<T>(key).valueOr(std::move(fallback));
}

template <typename T>
void ConfigSnapshot::set(std::string_view key, const T& value) {
    replace(std::string(key), YAML::Node(value));
}

} // namespace lw::foundation
