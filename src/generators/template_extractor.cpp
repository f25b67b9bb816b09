#include "pch.h"
#include "generators/template_extractor.hpp"
#include "common/file_utils.hpp"
#include "core/ownership_resolver.hpp"
#include "core/project_scanner.hpp"
#include "parsers/asset_reader.hpp"
#include "parsers/manifest_io.hpp"
#include "parsers/sln_reader.hpp"

namespace fs = std::filesystem;

namespace slngen {

namespace {

bool contains(const std::string& line, const char* text) {
    return line.find(text) != std::string::npos;
}

} // namespace

TemplateExtractor::TemplateExtractor(GenerateOptions options)
    : options_(std::move(options)) {}

std::string TemplateExtractor::template_path_for(const std::string& file_name) const {
    return options_.template_root + "/templates/" + file_name + ".template";
}

std::vector<std::string> TemplateExtractor::extract() const {
    std::string root = resolve_real_path(options_.project_root);
    std::string sln_path = find_solution_file(root);
    SlnReader reader;
    auto entries = reader.read_sln(sln_path);

    std::string unity_version = AssetReader(root).read_unity_version().value_or("");
    std::vector<std::string> updated;

    for (const auto& entry : entries) {
        auto content = read_file(join_path(root, entry.path));
        if (!content) {
            std::cerr << "Warning: Project file not found: " << entry.path << "\n";
            continue;
        }

        std::string template_path = template_path_for(entry.path);
        if (write_file_if_changed(join_path(root, template_path),
                                  templatize_csproj(*content, root, unity_version))) {
            updated.push_back(template_path);
        }
    }

    auto sln_content = read_file(sln_path);
    std::string sln_name = fs::path(sln_path).filename().string();
    std::string sln_template_path = template_path_for(sln_name);
    if (sln_content && write_file_if_changed(join_path(root, sln_template_path),
                                             templatize_sln(*sln_content, entries.front().type_guid))) {
        updated.push_back(sln_template_path);
    }

    std::sort(updated.begin(), updated.end());
    return updated;
}

std::string TemplateExtractor::init_manifest(const std::string& manifest_path) const {
    std::string root = resolve_real_path(options_.project_root);
    std::string sln_path = find_solution_file(root);
    SlnReader reader;
    auto entries = reader.read_sln(sln_path);

    // Project kind and category come from the assembly definitions on disk
    ProjectScanner scanner(options_.scan_roots, options_.rules);
    ScanSnapshot snapshot = scanner.scan(root);
    OwnershipResolver resolver(snapshot.modules, snapshot.extensions);

    GeneratorManifest manifest;
    manifest.solution_path = fs::path(sln_path).filename().string();
    manifest.solution_template_path = template_path_for(manifest.solution_path);
    manifest.project_type_guid = entries.front().type_guid;

    for (const auto& entry : entries) {
        ProjectEntry project;
        project.name = entry.name;
        project.csproj_path = entry.path;
        project.template_path = template_path_for(entry.path);
        project.guid = entry.guid;

        auto module = resolver.modules().find(entry.name);
        if (module != resolver.modules().end()) {
            project.kind = ProjectKind::AsmDef;
            project.category = module->second.category;
        } else {
            project.kind = ProjectKind::Legacy;
            project.category = infer_category_from_name(entry.name);
        }
        manifest.projects.push_back(project);
    }

    write_file_if_changed(join_path(root, manifest_path), serialize_manifest(manifest));
    return join_path(root, manifest_path).generic_string();
}

std::string TemplateExtractor::templatize_csproj(const std::string& content, const std::string& project_root,
                                                 const std::string& unity_version) {
    std::vector<std::string> lines;
    bool sources_emitted = false;
    bool references_emitted = false;
    bool in_reference = false;
    bool in_comment = false;

    for (std::string line : split_lines(content)) {
        line = replace_all(line, project_root, PH_PROJECT_ROOT);
        if (!unity_version.empty()) {
            line = replace_all(line, unity_version, PH_UNITY_VER);
        }

        if (in_comment) {
            if (contains(line, "-->")) {
                in_comment = false;
            }
            continue;
        }
        if (contains(line, "<!--")) {
            in_comment = !contains(line, "-->");
            continue;
        }

        if (contains(line, "<None Include=\"")) {
            continue;
        }

        if (in_reference) {
            if (contains(line, "</ProjectReference>")) {
                in_reference = false;
            }
            continue;
        }
        if (contains(line, "<ProjectReference Include=\"")) {
            if (!references_emitted) {
                lines.push_back(std::string("    ") + PH_PROJECT_REFERENCES);
                references_emitted = true;
            }
            // Single-line <ProjectReference ... /> has no closing tag
            in_reference = !contains(line, "/>");
            continue;
        }

        if (contains(line, "<Compile Include=\"")) {
            if (!sources_emitted) {
                lines.push_back(std::string("    ") + PH_SOURCE_FOLDERS);
                sources_emitted = true;
            }
            continue;
        }

        lines.push_back(line);
    }

    return join_strings(lines, "\n");
}

std::string TemplateExtractor::templatize_sln(const std::string& content, const std::string& project_type_guid) {
    std::vector<std::string> lines;
    bool in_project_block = false;
    bool entries_emitted = false;
    bool configs_emitted = false;

    const std::string project_prefix = "Project(\"" + project_type_guid + "\") = ";

    for (const auto& line : split_lines(content)) {
        if (starts_with(line, project_prefix)) {
            if (!entries_emitted) {
                lines.push_back(PH_PROJECT_ENTRIES);
                entries_emitted = true;
            }
            in_project_block = true;
            continue;
        }

        if (in_project_block) {
            if (trim(line) == "Global") {
                in_project_block = false;
                lines.push_back(line);
            }
            continue;
        }

        std::string trimmed = trim(line);
        if (contains(line, ".Debug|Any CPU.") && starts_with(trimmed, "{") &&
            (contains(line, "ActiveCfg") || contains(line, "Build.0"))) {
            if (!configs_emitted) {
                lines.push_back(PH_PROJECT_CONFIGS);
                configs_emitted = true;
            }
            continue;
        }

        lines.push_back(line);
    }

    return join_strings(lines, "\n");
}

} // namespace slngen
