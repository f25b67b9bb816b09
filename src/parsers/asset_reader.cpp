#include "pch.h"
#include "parsers/asset_reader.hpp"
#include "common/file_utils.hpp"
#include <nlohmann/json.hpp>

namespace slngen {

namespace {

std::vector<std::string> string_array(const nlohmann::json& j, const char* key) {
    std::vector<std::string> values;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return values;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

AssetReader::AssetReader(std::string root_path)
    : root_path_(std::move(root_path)) {}

std::optional<ModuleRecord> AssetReader::read_module(const std::string& relative_path) {
    auto content = read_file(join_path(root_path_, relative_path));
    if (!content) {
        last_error_ = "cannot read " + relative_path;
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        last_error_ = relative_path + ": " + e.what();
        return std::nullopt;
    }

    auto name = j.find("name");
    if (!j.is_object() || name == j.end() || !name->is_string() || name->get<std::string>().empty()) {
        last_error_ = relative_path + ": missing \"name\"";
        return std::nullopt;
    }

    ModuleRecord record;
    record.name = name->get<std::string>();
    record.directory = parent_directory(relative_path);
    record.guid = read_meta_guid(relative_path);
    record.references = string_array(j, "references");
    record.include_platforms = string_array(j, "includePlatforms");
    record.category = infer_category(record.include_platforms, string_array(j, "defineConstraints"));
    return record;
}

std::optional<ReferenceExtensionRecord> AssetReader::read_extension(const std::string& relative_path) {
    auto content = read_file(join_path(root_path_, relative_path));
    if (!content) {
        last_error_ = "cannot read " + relative_path;
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        last_error_ = relative_path + ": " + e.what();
        return std::nullopt;
    }

    auto reference = j.find("reference");
    if (!j.is_object() || reference == j.end() || !reference->is_string()) {
        last_error_ = relative_path + ": missing \"reference\"";
        return std::nullopt;
    }

    return ReferenceExtensionRecord{parent_directory(relative_path), reference->get<std::string>()};
}

std::optional<std::string> AssetReader::read_meta_guid(const std::string& asset_relative_path) const {
    auto content = read_file(join_path(root_path_, asset_relative_path + ".meta"));
    if (!content) {
        return std::nullopt;
    }
    auto guid = find_yaml_value(*content, "guid");
    if (!guid) {
        return std::nullopt;
    }
    return to_lower(*guid);
}

std::optional<std::string> AssetReader::read_unity_version() const {
    auto content = read_file(join_path(root_path_, "ProjectSettings/ProjectVersion.txt"));
    if (!content) {
        return std::nullopt;
    }
    return find_yaml_value(*content, "m_EditorVersion");
}

std::optional<std::string> AssetReader::find_yaml_value(const std::string& content, const std::string& key) {
    const std::string prefix = key + ":";
    for (const auto& line : split_lines(content)) {
        if (!starts_with(line, prefix)) {
            continue;
        }
        std::string value = trim(line.substr(prefix.size()));
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
    return std::nullopt;
}

ProjectCategory infer_category(const std::vector<std::string>& include_platforms,
                               const std::vector<std::string>& define_constraints) {
    if (contains(define_constraints, "UNITY_INCLUDE_TESTS")) {
        return ProjectCategory::Test;
    }
    if (include_platforms.size() == 1 && include_platforms[0] == "Editor") {
        return ProjectCategory::Editor;
    }
    if (contains(define_constraints, "UNITY_EDITOR")) {
        return ProjectCategory::Editor;
    }
    return ProjectCategory::Runtime;
}

ProjectCategory infer_category_from_name(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower.find("editor") != std::string::npos) {
        return ProjectCategory::Editor;
    }
    if (lower.find(".tests.") != std::string::npos || lower.find("testrunner") != std::string::npos) {
        return ProjectCategory::Test;
    }
    return ProjectCategory::Runtime;
}

} // namespace slngen
