#include "pch.h"
#include "generators/csproj_generator.hpp"
#include "generators/descriptor_renderer.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"

namespace slngen {

// Register this generator
REGISTER_GENERATOR(CsprojGenerator, "csproj");

GenerateResult CsprojGenerator::generate(const SolutionPlan& plan, const GenerateOptions& options) {
    GenerateResult result;
    result.warnings = plan.warnings;
    result.stats = plan.stats;

    std::vector<std::pair<std::string, std::string>> outputs;

    for (const auto& project : plan.manifest.projects) {
        auto template_path = join_path(plan.project_root, project.template_path);
        auto template_content = read_file(template_path);
        if (!template_content) {
            throw GeneratorError::missing_template(template_path.generic_string());
        }
        outputs.emplace_back(project.csproj_path,
                             DescriptorRenderer::render_project(plan, project, *template_content));
    }

    auto sln_template_path = join_path(plan.project_root, plan.manifest.solution_template_path);
    auto sln_template = read_file(sln_template_path);
    if (!sln_template) {
        throw GeneratorError::missing_solution_template(sln_template_path.generic_string());
    }
    outputs.emplace_back(plan.manifest.solution_path,
                         DescriptorRenderer::render_solution(plan.manifest, *sln_template));

    for (const auto& [relative_path, content] : outputs) {
        if (write_file_if_changed(join_path(plan.project_root, relative_path), content)) {
            result.updated_files.push_back(relative_path);
        }
        if (options.verbose) {
            std::cout << "  " << relative_path << "\n";
        }
    }

    std::sort(result.updated_files.begin(), result.updated_files.end());
    return result;
}

} // namespace slngen
