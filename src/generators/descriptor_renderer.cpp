#include "pch.h"
#include "generators/descriptor_renderer.hpp"
#include "common/file_utils.hpp"
#include <pugixml.hpp>

namespace slngen {

namespace {

// Print the top-level nodes of a fragment document at ItemGroup depth,
// one node per line (child elements indented below their parent).
// The first line takes its indentation from the placeholder in the template.
std::string print_fragment(const pugi::xml_document& doc) {
    std::ostringstream out;
    for (pugi::xml_node node : doc.children()) {
        node.print(out, "  ", pugi::format_indent, pugi::encoding_utf8, 2);
    }
    std::string result = out.str();
    if (!result.empty() && result.back() == '\n') {
        result.pop_back();
    }
    size_t first = result.find_first_not_of(' ');
    result.erase(0, first == std::string::npos ? result.size() : first);
    return result;
}

} // namespace

std::string DescriptorRenderer::render_template(const std::string& template_content,
                                                const Replacements& replacements) {
    std::string result = template_content;
    for (const auto& [placeholder, value] : replacements) {
        result = replace_all(result, placeholder, value);
    }
    return result;
}

std::string DescriptorRenderer::render_compile_items(const std::vector<CompilePattern>& patterns) {
    pugi::xml_document doc;
    for (const auto& pattern : patterns) {
        auto compile = doc.append_child("Compile");
        compile.append_attribute("Include") = pattern.include.c_str();
        if (!pattern.exclude.empty()) {
            compile.append_attribute("Exclude") = join_strings(pattern.exclude, ";").c_str();
        }
    }
    return print_fragment(doc);
}

std::string DescriptorRenderer::render_project_references(const std::vector<const ProjectEntry*>& references) {
    pugi::xml_document doc;
    for (const ProjectEntry* reference : references) {
        auto node = doc.append_child("ProjectReference");
        node.append_attribute("Include") = reference->csproj_path.c_str();
        node.append_child("Project").text().set(reference->guid.c_str());
        node.append_child("Name").text().set(reference->name.c_str());
    }
    return print_fragment(doc);
}

std::string DescriptorRenderer::render_solution_entries(const GeneratorManifest& manifest) {
    std::vector<std::string> entries;
    for (const auto& project : manifest.projects) {
        entries.push_back("Project(\"" + manifest.project_type_guid + "\") = \"" + project.name +
                          "\", \"" + project.csproj_path + "\", \"" + project.guid + "\"\nEndProject");
    }
    return join_strings(entries, "\n");
}

std::string DescriptorRenderer::render_solution_configs(const GeneratorManifest& manifest) {
    std::vector<std::string> lines;
    for (const auto& project : manifest.projects) {
        lines.push_back("\t\t" + project.guid + ".Debug|Any CPU.ActiveCfg = Debug|Any CPU");
        lines.push_back("\t\t" + project.guid + ".Debug|Any CPU.Build.0 = Debug|Any CPU");
    }
    return join_strings(lines, "\n");
}

std::string DescriptorRenderer::render_project(const SolutionPlan& plan, const ProjectEntry& project,
                                               const std::string& template_content) {
    std::vector<const ProjectEntry*> references;
    auto refs_it = plan.references_by_project.find(project.name);
    if (refs_it != plan.references_by_project.end()) {
        for (const auto& name : refs_it->second) {
            if (const ProjectEntry* reference = plan.find_project(name)) {
                references.push_back(reference);
            }
        }
    }

    static const std::vector<CompilePattern> no_patterns;
    auto patterns_it = plan.patterns_by_project.find(project.name);
    const auto& patterns = patterns_it != plan.patterns_by_project.end() ? patterns_it->second : no_patterns;

    return render_template(template_content, {
        {PH_UNITY_VER, plan.unity_version},
        {PH_PROJECT_ROOT, plan.project_root},
        {PH_SOURCE_FOLDERS, render_compile_items(patterns)},
        {PH_PROJECT_REFERENCES, render_project_references(references)}
    });
}

std::string DescriptorRenderer::render_solution(const GeneratorManifest& manifest,
                                                const std::string& template_content) {
    return render_template(template_content, {
        {PH_PROJECT_ENTRIES, render_solution_entries(manifest)},
        {PH_PROJECT_CONFIGS, render_solution_configs(manifest)}
    });
}

} // namespace slngen
