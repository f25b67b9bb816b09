#pragma once

#include "common/project_types.hpp"
#include "common/variant_registry.hpp"
#include <set>
#include <string>
#include <vector>

namespace slngen {

struct VariantOptions {
    BuildPlatform platform = BuildPlatform::IOS;
    BuildConfig config = BuildConfig::Prod;
    bool debug = false;     // Keep DEBUG/TRACE in prod
};

struct VariantResult {
    std::string variant;                    // e.g. "ios-prod"
    std::string solution_path;              // Relative to the project root
    std::string props_path;                 // Relative to the project root
    std::vector<std::string> generated;     // Variant .csproj files rewritten this run
    std::vector<std::string> skipped;       // Variant .csproj files already fresh
    std::vector<std::string> excluded;      // Projects left out of the variant
};

// Derives platform/configuration copies of the rendered descriptors.
//
// A copy "<base>.v.<variant>.csproj" is regenerated only when it is missing
// or older than its base descriptor; the filesystem mtime is the only state
// kept between runs.
class VariantGenerator {
public:
    VariantGenerator(GenerateOptions options, VariantOptions variant);

    // Throws GeneratorError (InvalidDescriptor, MissingSolutionTemplate, WriteFailed)
    VariantResult prepare(const SolutionPlan& plan) const;

    std::string variant_name() const;

    // "Game.csproj" -> "Game.v.ios-prod.csproj"
    static std::string variant_path(const std::string& base_path, const std::string& variant);

    // Category and includePlatforms filter; the editor configuration keeps everything
    bool includes(const ProjectEntry& project, const ModuleRecord* module) const;

    // Token-wise DefineConstants rewrite
    std::string rewrite_defines(const std::string& defines) const;

    // Rewrite a base descriptor: defines, references to surviving projects,
    // output paths and the variant props import
    std::string rewrite_descriptor(const std::string& content, const std::string& source_path,
                                   const SolutionPlan& plan, const std::set<std::string>& surviving) const;

    std::string render_props(const std::string& project_root) const;

    // Template root relative "variants/<variant>.props"
    std::string props_path() const;

private:
    std::string output_directory(const std::string& project_root) const;

    GenerateOptions options_;
    VariantOptions variant_;
};

} // namespace slngen
