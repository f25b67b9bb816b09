#pragma once

#include "common/project_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace slngen {

// Reader for the Unity asset records the scanner discovers:
// .asmdef, .asmref, their .meta siblings and ProjectSettings/ProjectVersion.txt
class AssetReader {
public:
    explicit AssetReader(std::string root_path);

    // Decode an .asmdef into a ModuleRecord (directory, guid and category filled in).
    // Returns std::nullopt if the file cannot be read, is not JSON or has no name;
    // last_error() then holds the reason.
    std::optional<ModuleRecord> read_module(const std::string& relative_path);

    // Decode an .asmref. Same failure contract as read_module.
    std::optional<ReferenceExtensionRecord> read_extension(const std::string& relative_path);

    // "guid: 0123..." line of <asset>.meta, lowercased
    std::optional<std::string> read_meta_guid(const std::string& asset_relative_path) const;

    // "m_EditorVersion: 2022.3.10f1" line of ProjectSettings/ProjectVersion.txt
    std::optional<std::string> read_unity_version() const;

    const std::string& last_error() const { return last_error_; }

private:
    // Value of the first "<key>: value" line
    static std::optional<std::string> find_yaml_value(const std::string& content, const std::string& key);

    std::string root_path_;
    std::string last_error_;
};

// Category from an asmdef's includePlatforms / defineConstraints
ProjectCategory infer_category(const std::vector<std::string>& include_platforms,
                               const std::vector<std::string>& define_constraints);

// Category guessed from a project name alone (used when no asmdef is available)
ProjectCategory infer_category_from_name(const std::string& name);

} // namespace slngen
