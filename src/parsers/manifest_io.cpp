#include "pch.h"
#include "parsers/manifest_io.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace slngen {

namespace {

ProjectEntry parse_project(const nlohmann::json& j) {
    ProjectEntry entry;
    entry.name = j.at("name").get<std::string>();
    entry.csproj_path = j.at("csprojPath").get<std::string>();
    entry.template_path = j.at("templatePath").get<std::string>();

    if (entry.name.empty()) {
        throw std::invalid_argument("project with empty name");
    }

    std::string guid = j.value("guid", std::string());
    entry.guid = guid.empty() ? braced_guid(stable_uuid(entry.name)) : guid;

    std::string kind = j.at("kind").get<std::string>();
    auto parsed_kind = parse_kind(kind);
    if (!parsed_kind) {
        throw std::invalid_argument("project '" + entry.name + "' has unknown kind '" + kind + "'");
    }
    entry.kind = *parsed_kind;

    std::string category = j.value("category", std::string("runtime"));
    auto parsed_category = parse_category(category);
    if (!parsed_category) {
        throw std::invalid_argument("project '" + entry.name + "' has unknown category '" + category + "'");
    }
    entry.category = *parsed_category;
    return entry;
}

} // namespace

GeneratorManifest load_manifest(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw GeneratorError::missing_manifest(path);
    }

    auto content = read_file(path);
    if (!content) {
        throw GeneratorError::missing_manifest(path);
    }

    GeneratorManifest manifest;
    try {
        nlohmann::json j = nlohmann::json::parse(*content);
        manifest.solution_path = j.at("solutionPath").get<std::string>();
        manifest.solution_template_path = j.at("solutionTemplatePath").get<std::string>();
        manifest.project_type_guid = j.value("projectTypeGuid", std::string(CSHARP_PROJECT_TYPE_GUID));

        const auto& projects = j.at("projects");
        if (!projects.is_array()) {
            throw std::invalid_argument("\"projects\" is not an array");
        }

        std::set<std::string> names;
        for (const auto& item : projects) {
            ProjectEntry entry = parse_project(item);
            if (!names.insert(entry.name).second) {
                throw std::invalid_argument("project '" + entry.name + "' listed twice");
            }
            manifest.projects.push_back(std::move(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw GeneratorError::invalid_manifest(path, e.what());
    } catch (const std::invalid_argument& e) {
        throw GeneratorError::invalid_manifest(path, e.what());
    }

    return manifest;
}

std::string serialize_manifest(const GeneratorManifest& manifest) {
    nlohmann::json projects = nlohmann::json::array();
    for (const auto& project : manifest.projects) {
        projects.push_back({
            {"name", project.name},
            {"csprojPath", project.csproj_path},
            {"templatePath", project.template_path},
            {"guid", project.guid},
            {"kind", kind_to_string(project.kind)},
            {"category", category_to_string(project.category)}
        });
    }

    nlohmann::json j = {
        {"solutionPath", manifest.solution_path},
        {"solutionTemplatePath", manifest.solution_template_path},
        {"projectTypeGuid", manifest.project_type_guid},
        {"projects", projects}
    };
    return j.dump(2) + "\n";
}

} // namespace slngen
