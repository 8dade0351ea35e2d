/// @file config_snapshot.cpp
/// @brief ConfigSnapshot implementation: YAML loading and flattening.

#include "lw/foundation/config_snapshot.hpp"

#include <algorithm>
#include <utility>

namespace lw::foundation {

WatchResult<ConfigSnapshot> ConfigSnapshot::fromFile(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        return WatchResult<ConfigSnapshot>::ok(fromNode(root));
    } catch (const YAML::BadFile&) {
        return WatchResult<ConfigSnapshot>::err(
            WatchError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return WatchResult<ConfigSnapshot>::err(
            WatchError(ErrorCode::ConfigParseFailed, std::string("YAML parse error: ") + e.what()));
    } catch (const YAML::Exception& e) {
        // Non-scalar map keys and similar shapes that cannot be flattened.
        return WatchResult<ConfigSnapshot>::err(
            WatchError(ErrorCode::ConfigParseFailed, std::string("invalid YAML document: ") + e.what()));
    }
}

ConfigSnapshot ConfigSnapshot::fromNode(const YAML::Node& root) {
    ConfigSnapshot snapshot;
    // An empty document parses to a null root and carries no keys.
    if (root.IsDefined() && !root.IsNull()) {
        snapshot.flatten("", root);
    }
    return snapshot;
}

bool ConfigSnapshot::hasKey(std::string_view key) const {
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigSnapshot::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, node] : entries_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

ConfigSnapshot ConfigSnapshot::mergedOver(const ConfigSnapshot& base) const {
    ConfigSnapshot merged = base;
    for (const auto& [key, node] : entries_) {
        merged.replace(key, YAML::Clone(node));
    }
    return merged;
}

std::vector<std::string> ConfigSnapshot::unknownKeys(const ConfigSnapshot& reference) const {
    std::vector<std::string> result;
    for (const auto& [key, node] : entries_) {
        if (!reference.hasKey(key)) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::string> ConfigSnapshot::changedKeys(const ConfigSnapshot& previous) const {
    std::vector<std::string> result;
    for (const auto& [key, node] : entries_) {
        auto it = previous.entries_.find(key);
        if (it == previous.entries_.end() || YAML::Dump(it->second) != YAML::Dump(node)) {
            result.push_back(key);
        }
    }
    for (const auto& [key, node] : previous.entries_) {
        if (entries_.count(key) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void ConfigSnapshot::replace(const std::string& key, YAML::Node node) {
    // Assigning to an existing YAML::Node rebinds the shared node that other
    // snapshot copies still reference, so swap the map entry instead.
    entries_.erase(key);
    entries_.emplace(key, std::move(node));
}

void ConfigSnapshot::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null): store with its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace lw::foundation
