#include "pch.h"
#include "core/solution_planner.hpp"
#include "core/compile_patterns.hpp"
#include "core/project_scanner.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "parsers/asset_reader.hpp"
#include "parsers/manifest_io.hpp"
#include "parsers/sln_reader.hpp"

namespace fs = std::filesystem;

namespace slngen {

SolutionPlanner::SolutionPlanner(GenerateOptions options)
    : options_(std::move(options)) {}

std::string SolutionPlanner::template_directory() const {
    return options_.template_root + "/templates";
}

GeneratorManifest SolutionPlanner::discover_projects(const std::string& root_path,
                                                     const OwnershipResolver& resolver,
                                                     const SourceAssignment& assignment,
                                                     std::vector<std::string>& warnings) const {
    GeneratorManifest manifest;
    // An existing solution keeps its name, matching what extract-templates produced
    manifest.solution_path = locate_solution_file(root_path)
        .value_or(fs::path(root_path).filename().string() + ".sln");
    manifest.solution_template_path = template_directory() + "/" + manifest.solution_path + ".template";

    auto add_project = [&](const std::string& name, ProjectKind kind, ProjectCategory category) {
        std::string template_path = template_directory() + "/" + name + ".csproj.template";
        std::error_code ec;
        if (!fs::is_regular_file(join_path(root_path, template_path), ec)) {
            auto count = assignment.source_count_by_module.find(name);
            if (count != assignment.source_count_by_module.end() && count->second > 0) {
                warnings.push_back("No template for " + name + " (" + template_path +
                                   "); project left out");
            }
            return;
        }

        ProjectEntry entry;
        entry.name = name;
        entry.csproj_path = name + ".csproj";
        entry.template_path = template_path;
        entry.guid = braced_guid(stable_uuid(name));
        entry.kind = kind;
        entry.category = category;
        manifest.projects.push_back(entry);
    };

    for (const auto& [name, module] : resolver.modules()) {
        add_project(name, ProjectKind::AsmDef, module.category);
    }
    for (const auto& [name, dirs] : assignment.dirs_by_module) {
        if (resolver.modules().count(name) || dirs.empty()) {
            continue;
        }
        add_project(name, ProjectKind::Legacy, infer_category_from_name(name));
    }

    std::sort(manifest.projects.begin(), manifest.projects.end(),
              [](const ProjectEntry& a, const ProjectEntry& b) { return a.name < b.name; });
    return manifest;
}

SolutionPlan SolutionPlanner::plan() const {
    SolutionPlan plan;
    plan.project_root = resolve_real_path(options_.project_root);

    // Registry problems are fatal; find them before walking the tree
    std::optional<GeneratorManifest> manifest;
    if (!options_.manifest_path.empty()) {
        manifest = load_manifest(join_path(plan.project_root, options_.manifest_path).string());
    }

    ProjectScanner scanner(options_.scan_roots, options_.rules);
    ScanSnapshot snapshot = scanner.scan(plan.project_root);
    plan.warnings = snapshot.warnings;

    if (snapshot.modules.empty()) {
        throw GeneratorError::no_module_declarations(plan.project_root);
    }

    OwnershipResolver resolver(snapshot.modules, snapshot.extensions);
    plan.warnings.insert(plan.warnings.end(), resolver.warnings().begin(), resolver.warnings().end());

    SourceAssignment assignment = resolver.assign(snapshot.source_dirs);

    AssetReader reader(plan.project_root);
    if (auto version = reader.read_unity_version()) {
        plan.unity_version = *version;
    } else {
        plan.warnings.push_back("Could not read Unity editor version from ProjectSettings/ProjectVersion.txt");
    }

    plan.manifest = manifest ? *manifest
                             : discover_projects(plan.project_root, resolver, assignment, plan.warnings);
    plan.modules = resolver.modules();

    CompilePatternSynthesizer synthesizer(resolver.ownership_map(), snapshot.ignored_dirs,
                                          options_.rules.source_suffix);
    static const std::vector<std::string> no_dirs;

    for (const auto& project : plan.manifest.projects) {
        auto dirs_it = assignment.dirs_by_module.find(project.name);
        const auto& dirs = dirs_it != assignment.dirs_by_module.end() ? dirs_it->second : no_dirs;

        auto count_it = assignment.source_count_by_module.find(project.name);
        plan.stats.source_count_by_project[project.name] =
            count_it != assignment.source_count_by_module.end() ? count_it->second : 0;

        auto patterns = synthesizer.synthesize(project.name, project.kind, dirs, options_.pattern_mode);
        plan.stats.pattern_count_by_project[project.name] = patterns.size();
        plan.patterns_by_project[project.name] = std::move(patterns);

        std::vector<std::string> references;
        if (project.kind == ProjectKind::AsmDef) {
            if (!plan.find_module(project.name)) {
                plan.warnings.push_back("Project '" + project.name +
                                        "' is asmdef-based but no matching .asmdef was found");
            }
            for (const auto& reference : resolver.resolved_references(project.name)) {
                if (reference != project.name && plan.find_project(reference)) {
                    references.push_back(reference);
                }
            }
        }
        plan.references_by_project[project.name] = std::move(references);
    }

    // Owners outside the project set compile nothing here
    std::vector<std::string> unresolved = assignment.unresolved_dirs;
    for (const auto& [owner, dirs] : assignment.dirs_by_module) {
        if (!plan.find_project(owner)) {
            unresolved.insert(unresolved.end(), dirs.begin(), dirs.end());
        }
    }
    std::sort(unresolved.begin(), unresolved.end());

    plan.stats.unresolved_dir_count = unresolved.size();
    if (!unresolved.empty()) {
        plan.warnings.push_back("Unresolved source directories: " + std::to_string(unresolved.size()));
        if (options_.verbose) {
            size_t samples = std::min(unresolved.size(), MAX_UNRESOLVED_SAMPLES);
            for (size_t i = 0; i < samples; i++) {
                plan.warnings.push_back("Unresolved: " + unresolved[i]);
            }
        }
    }

#ifndef NDEBUG
    std::cout << "[DEBUG] Planned " << plan.manifest.projects.size() << " project(s) from "
              << snapshot.source_dirs.size() << " source directories\n";
#endif

    return plan;
}

} // namespace slngen
