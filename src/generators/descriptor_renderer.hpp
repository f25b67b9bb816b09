#pragma once

#include "common/project_types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace slngen {

// Fills .csproj and .sln templates. Pure string work; no file access.
class DescriptorRenderer {
public:
    using Replacements = std::vector<std::pair<std::string, std::string>>;

    static std::string render_template(const std::string& template_content, const Replacements& replacements);

    // <Compile Include="..." Exclude="..." /> lines at ItemGroup depth
    static std::string render_compile_items(const std::vector<CompilePattern>& patterns);

    // <ProjectReference> blocks at ItemGroup depth
    static std::string render_project_references(const std::vector<const ProjectEntry*>& references);

    // Project(...) = ... / EndProject pairs
    static std::string render_solution_entries(const GeneratorManifest& manifest);

    // Debug|Any CPU ActiveCfg / Build.0 lines
    static std::string render_solution_configs(const GeneratorManifest& manifest);

    // Project template with every {{...}} placeholder filled from the plan
    static std::string render_project(const SolutionPlan& plan, const ProjectEntry& project,
                                      const std::string& template_content);

    static std::string render_solution(const GeneratorManifest& manifest, const std::string& template_content);
};

} // namespace slngen
