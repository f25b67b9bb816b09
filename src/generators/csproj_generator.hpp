#pragma once

#include "common/generator.hpp"

namespace slngen {

// Renders one .csproj per planned project plus the .sln, writing only files
// whose content changed
class CsprojGenerator : public Generator {
public:
    CsprojGenerator() = default;
    ~CsprojGenerator() override = default;

    // Every template is loaded and rendered before the first write, so a
    // missing template aborts the run with the tree untouched
    GenerateResult generate(const SolutionPlan& plan, const GenerateOptions& options) override;

    std::string name() const override { return "csproj"; }
    std::string description() const override { return "Visual Studio C# projects and solution (.csproj/.sln)"; }
};

} // namespace slngen
