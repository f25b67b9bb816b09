#pragma once

#include "common/project_types.hpp"
#include <string>
#include <vector>

namespace slngen {

// Turns the .sln/.csproj files Unity generated into templates, and writes an
// initial project registry from the solution
class TemplateExtractor {
public:
    explicit TemplateExtractor(GenerateOptions options);

    // Write <template_root>/templates/<file>.template for the solution and every
    // root-level project it lists. Returns the templates that changed.
    // Throws GeneratorError (NoSolutionFound / NoProjectsInSolution).
    std::vector<std::string> extract() const;

    // Write a registry describing the solution's projects to manifest_path
    // (relative to the project root). Returns the registry path.
    std::string init_manifest(const std::string& manifest_path) const;

    // Replace the dynamic parts of a Unity .csproj with placeholders
    static std::string templatize_csproj(const std::string& content, const std::string& project_root,
                                         const std::string& unity_version);

    // Collapse project blocks and their configuration lines into placeholders
    static std::string templatize_sln(const std::string& content, const std::string& project_type_guid);

private:
    std::string template_path_for(const std::string& file_name) const;

    GenerateOptions options_;
};

} // namespace slngen
