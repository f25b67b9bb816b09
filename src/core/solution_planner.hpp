#pragma once

#include "common/project_types.hpp"
#include "core/ownership_resolver.hpp"
#include <string>

namespace slngen {

// Runs scan -> ownership resolution -> pattern synthesis for one project
// root and produces the in-memory SolutionPlan the generators render.
class SolutionPlanner {
public:
    explicit SolutionPlanner(GenerateOptions options);

    // Throws GeneratorError for every fatal condition; nothing is written
    SolutionPlan plan() const;

    // Number of unresolved directories listed in verbose warnings
    static constexpr size_t MAX_UNRESOLVED_SAMPLES = 20;

private:
    // Every declared module plus every legacy module that received sources,
    // limited to modules with a template on disk
    GeneratorManifest discover_projects(const std::string& root_path,
                                        const OwnershipResolver& resolver,
                                        const SourceAssignment& assignment,
                                        std::vector<std::string>& warnings) const;

    std::string template_directory() const;

    GenerateOptions options_;
};

} // namespace slngen
