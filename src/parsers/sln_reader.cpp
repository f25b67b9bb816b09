#include "pch.h"
#include "parsers/sln_reader.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include <regex>

namespace fs = std::filesystem;

namespace slngen {

std::vector<SlnProjectEntry> SlnReader::read_sln(const std::string& filepath) const {
    auto content = read_file(filepath);
    if (!content) {
        throw GeneratorError::no_solution_found(filepath);
    }

    auto projects = parse_projects(*content);
    if (projects.empty()) {
        throw GeneratorError::no_projects_in_solution(filepath);
    }
    return projects;
}

std::vector<SlnProjectEntry> SlnReader::parse_projects(const std::string& content) const {
    std::vector<SlnProjectEntry> projects;

    // Project("{TYPE-GUID}") = "Name", "Name.csproj", "{PROJECT-GUID}"
    std::regex proj_re(R"xxx(Project\s*\("(\{[^}]+\})"\)\s*=\s*"([^"]+)"\s*,\s*"([^"]+)"\s*,\s*"(\{[^}]+\})")xxx");
    std::smatch match;

    auto it = content.cbegin();
    while (std::regex_search(it, content.cend(), match, proj_re)) {
        SlnProjectEntry entry;
        entry.type_guid = match[1].str();
        entry.name = match[2].str();
        entry.path = match[3].str();
        entry.guid = match[4].str();
        it = match.suffix().first;

        // Solution folders and nested projects are not ours to regenerate
        if (!ends_with(entry.path, ".csproj") ||
            entry.path.find('/') != std::string::npos ||
            entry.path.find('\\') != std::string::npos) {
#ifndef NDEBUG
            std::cout << "[DEBUG] Skipping solution entry: " << entry.name << " (" << entry.path << ")\n";
#endif
            continue;
        }
        projects.push_back(entry);
    }

    return projects;
}

std::optional<std::string> locate_solution_file(const std::string& project_root) {
    std::vector<std::string> candidates;
    std::error_code ec;
    for (fs::directory_iterator it(project_root, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.' || !ends_with(name, ".sln")) {
            continue;
        }
        if (name.find(SLNGEN_VARIANT_SEPARATOR) != std::string::npos) {
            continue;
        }
        std::error_code status_ec;
        if (it->is_regular_file(status_ec)) {
            candidates.push_back(name);
        }
    }

    if (candidates.empty()) {
        return std::nullopt;
    }
    return *std::min_element(candidates.begin(), candidates.end());
}

std::string find_solution_file(const std::string& project_root) {
    auto name = locate_solution_file(project_root);
    if (!name) {
        throw GeneratorError::no_solution_found(project_root);
    }
    return (fs::path(project_root) / *name).generic_string();
}

} // namespace slngen
