#include "pch.h"
#include "generators/variant_generator.hpp"
#include "generators/descriptor_renderer.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include <pugixml.hpp>

namespace slngen {

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::vector<std::string> split_defines(const std::string& defines) {
    std::vector<std::string> tokens;
    std::istringstream stream(defines);
    std::string token;
    while (std::getline(stream, token, ';')) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

const ProjectEntry* find_referenced_project(const SolutionPlan& plan, pugi::xml_node reference) {
    std::string include = replace_all(reference.attribute("Include").as_string(), "\\", "/");
    for (const auto& project : plan.manifest.projects) {
        if (project.csproj_path == include) {
            return &project;
        }
    }
    return plan.find_project(reference.child_value("Name"));
}

} // namespace

VariantGenerator::VariantGenerator(GenerateOptions options, VariantOptions variant)
    : options_(std::move(options)), variant_(variant) {}

std::string VariantGenerator::variant_name() const {
    const auto& registry = VariantRegistry::instance();
    std::string name = registry.platform(variant_.platform).id + "-" + registry.config(variant_.config).id;
    if (variant_.config == BuildConfig::Prod && variant_.debug) {
        name += "-debug";
    }
    return name;
}

std::string VariantGenerator::variant_path(const std::string& base_path, const std::string& variant) {
    size_t slash = base_path.rfind('/');
    size_t dot = base_path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return base_path + SLNGEN_VARIANT_SEPARATOR + variant;
    }
    return base_path.substr(0, dot) + SLNGEN_VARIANT_SEPARATOR + variant + base_path.substr(dot);
}

std::string VariantGenerator::props_path() const {
    return options_.template_root + "/variants/" + variant_name() + ".props";
}

std::string VariantGenerator::output_directory(const std::string& project_root) const {
    return join_path(project_root, options_.template_root + "/" + variant_name()).generic_string();
}

bool VariantGenerator::includes(const ProjectEntry& project, const ModuleRecord* module) const {
    const auto& registry = VariantRegistry::instance();
    if (registry.config(variant_.config).keeps_all_projects) {
        return true;
    }
    if (project.category != ProjectCategory::Runtime) {
        return false;
    }
    if (module && !module->include_platforms.empty()) {
        return contains(module->include_platforms, registry.platform(variant_.platform).unity_name);
    }
    return true;
}

std::string VariantGenerator::rewrite_defines(const std::string& defines) const {
    const auto& registry = VariantRegistry::instance();
    const auto& platform = registry.platform(variant_.platform);
    const auto& config = registry.config(variant_.config);
    bool keep_debug = config.keeps_debug_defines || variant_.debug;

    std::vector<std::string> tokens;
    for (auto token : split_defines(defines)) {
        if (!config.keeps_editor_defines && registry.editor_defines().count(token)) {
            continue;
        }
        if (!keep_debug && registry.debug_defines().count(token)) {
            continue;
        }
        if (contains(platform.dropped_defines, token)) {
            continue;
        }
        if (contains(platform.foreign_defines, token)) {
            token = platform.define;
        }
        tokens.push_back(token);
    }
    return join_strings(deduplicate_preserving_order(tokens), ";");
}

std::string VariantGenerator::rewrite_descriptor(const std::string& content, const std::string& source_path,
                                                 const SolutionPlan& plan,
                                                 const std::set<std::string>& surviving) const {
    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_string(content.c_str(),
        pugi::parse_default | pugi::parse_declaration | pugi::parse_comments);
    if (!parsed) {
        throw GeneratorError::invalid_descriptor(source_path, parsed.description());
    }

    pugi::xml_node root = doc.child("Project");
    if (!root) {
        throw GeneratorError::invalid_descriptor(source_path, "no <Project> element");
    }

    for (pugi::xml_node group : root.children("PropertyGroup")) {
        for (pugi::xml_node property : group.children()) {
            std::string name = property.name();
            if (name == "DefineConstants") {
                property.text().set(rewrite_defines(property.text().as_string()).c_str());
            } else if (name == "OutputPath") {
                property.text().set("$(SlnGenOutputPath)");
            } else if (name == "BaseIntermediateOutputPath" || name == "IntermediateOutputPath") {
                property.text().set("$(SlnGenIntermediateOutputPath)");
            }
        }
    }

    std::string variant = variant_name();
    for (pugi::xml_node group : root.children("ItemGroup")) {
        std::vector<pugi::xml_node> removed;
        for (pugi::xml_node reference : group.children("ProjectReference")) {
            const ProjectEntry* target = find_referenced_project(plan, reference);
            if (!target) {
                continue;
            }
            if (!surviving.count(target->name)) {
                removed.push_back(reference);
                continue;
            }
            reference.attribute("Include").set_value(variant_path(target->csproj_path, variant).c_str());
        }
        for (pugi::xml_node node : removed) {
            group.remove_child(node);
        }
    }

    std::string props = join_path(plan.project_root, props_path()).generic_string();
    pugi::xml_node props_import = root.prepend_child("Import");
    props_import.append_attribute("Project") = props.c_str();
    props_import.append_attribute("Condition") = ("Exists('" + props + "')").c_str();

    std::ostringstream out;
    doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
    return out.str();
}

std::string VariantGenerator::render_props(const std::string& project_root) const {
    const auto& registry = VariantRegistry::instance();
    const auto& config = registry.config(variant_.config);

    std::vector<std::string> defines = {registry.platform(variant_.platform).define};
    if (config.keeps_debug_defines || variant_.debug) {
        defines.push_back("DEBUG");
        defines.push_back("TRACE");
    }
    if (config.keeps_editor_defines) {
        defines.push_back("UNITY_EDITOR");
    }

    std::string output_dir = output_directory(project_root);

    pugi::xml_document doc;
    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "utf-8";

    auto project = doc.append_child("Project");
    auto group = project.append_child("PropertyGroup");
    group.append_child("SlnGenVariant").text().set(variant_name().c_str());
    group.append_child("SlnGenVariantDefines").text().set(join_strings(defines, ";").c_str());
    group.append_child("SlnGenOutputPath").text().set((output_dir + "/bin/").c_str());
    group.append_child("SlnGenIntermediateOutputPath").text().set(
        (output_dir + "/obj/$(MSBuildProjectName)/").c_str());
    group.append_child("BaseIntermediateOutputPath").text().set("$(SlnGenIntermediateOutputPath)");

    std::ostringstream out;
    doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
    return out.str();
}

VariantResult VariantGenerator::prepare(const SolutionPlan& plan) const {
    VariantResult result;
    result.variant = variant_name();

    std::set<std::string> surviving;
    std::vector<const ProjectEntry*> included;
    for (const auto& project : plan.manifest.projects) {
        if (includes(project, plan.find_module(project.name))) {
            surviving.insert(project.name);
            included.push_back(&project);
        } else {
            result.excluded.push_back(project.name);
        }
    }

    // Everything is rendered before the first write so a bad descriptor
    // leaves no partial variant behind
    std::vector<std::pair<std::filesystem::path, std::string>> copies;
    for (const ProjectEntry* project : included) {
        auto source = join_path(plan.project_root, project->csproj_path);
        std::string copy_path = variant_path(project->csproj_path, result.variant);
        auto copy = join_path(plan.project_root, copy_path);

        auto source_time = modification_time(source);
        if (!source_time) {
            continue;
        }

        auto copy_time = modification_time(copy);
        if (copy_time && *copy_time >= *source_time) {
            result.skipped.push_back(copy_path);
            continue;
        }

        auto content = read_file(source);
        if (!content) {
            throw GeneratorError::invalid_descriptor(source.generic_string(), "cannot be read");
        }
        copies.emplace_back(copy, rewrite_descriptor(*content, source.generic_string(), plan, surviving));
        result.generated.push_back(copy_path);
    }

    GeneratorManifest variant_manifest = plan.manifest;
    variant_manifest.projects.clear();
    for (const ProjectEntry* project : included) {
        ProjectEntry entry = *project;
        entry.csproj_path = variant_path(project->csproj_path, result.variant);
        variant_manifest.projects.push_back(entry);
    }

    auto sln_template_path = join_path(plan.project_root, plan.manifest.solution_template_path);
    auto sln_template = read_file(sln_template_path);
    if (!sln_template) {
        throw GeneratorError::missing_solution_template(sln_template_path.generic_string());
    }
    std::string solution = DescriptorRenderer::render_solution(variant_manifest, *sln_template);

    result.props_path = props_path();
    write_file_if_changed(join_path(plan.project_root, result.props_path), render_props(plan.project_root));
    for (const auto& [copy, content] : copies) {
        write_file(copy, content);
    }
    result.solution_path = variant_path(plan.manifest.solution_path, result.variant);
    write_file_if_changed(join_path(plan.project_root, result.solution_path), solution);

    std::sort(result.generated.begin(), result.generated.end());
    std::sort(result.skipped.begin(), result.skipped.end());
    return result;
}

} // namespace slngen
