#include "config.hpp"
#include "common/generator.hpp"
#include "common/variant_registry.hpp"
#include "core/solution_planner.hpp"
#include "generators/template_extractor.hpp"
#include "generators/variant_generator.hpp"
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void print_usage(const char* program_name) {
    std::cout << "slngen " << SLNGEN_VERSION << " - Unity solution generator\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [generate] [options]\n";
    std::cout << "  " << program_name << " prepare-variant <ios|android> <prod|dev|editor> [options]\n";
    std::cout << "  " << program_name << " extract-templates [options]\n";
    std::cout << "  " << program_name << " init-manifest [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -p, --project-root <dir>  Unity project root (default: current directory)\n";
    std::cout << "      --template-root <dir> Template root relative to the project root\n";
    std::cout << "                            (default: " << SLNGEN_DEFAULT_TEMPLATE_ROOT
              << ", or $SLNGEN_TEMPLATE_ROOT)\n";
    std::cout << "  -m, --manifest <file>     Project registry (JSON) relative to the project root\n";
    std::cout << "  -r, --recursive           Emit recursive compile globs with excludes\n";
    std::cout << "  -g, --generator <type>    Generator type (default: csproj)\n";
    std::cout << "  -d, --debug               Keep DEBUG/TRACE defines in prod variants\n";
    std::cout << "  -v, --verbose             Print unresolved source directory samples\n";
    std::cout << "  -l, --list                List available generators\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "      --version             Show version\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " extract-templates -p MyGame\n";
    std::cout << "  " << program_name << " -p MyGame --recursive\n";
    std::cout << "  " << program_name << " prepare-variant ios prod -p MyGame\n";
}

static void print_warnings(const std::vector<std::string>& warnings) {
    for (const auto& warning : warnings) {
        std::cerr << "Warning: " << warning << "\n";
    }
}

static std::unique_ptr<slngen::Generator> create_generator(const std::string& type) {
    auto& factory = slngen::GeneratorFactory::instance();
    auto generator = factory.create(type);
    if (!generator) {
        std::string message = "Unknown generator type: " + type + " (available:";
        for (const auto& name : factory.available_generators()) {
            message += " " + name;
        }
        throw std::runtime_error(message + ")");
    }
    return generator;
}

int main(int argc, char* argv[]) {
    enum class Command { Generate, PrepareVariant, ExtractTemplates, InitManifest };

    slngen::GenerateOptions options;
    if (const char* template_root = std::getenv("SLNGEN_TEMPLATE_ROOT")) {
        if (*template_root) {
            options.template_root = template_root;
        }
    }

    Command command = Command::Generate;
    bool command_seen = false;
    bool debug_build = false;
    std::vector<std::string> positional;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        auto needs_value = [&](const char* flag) -> bool {
            if (i + 1 < argc) {
                return true;
            }
            std::cerr << "Error: " << flag << " requires an argument\n";
            return false;
        };

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--version") == 0) {
            std::cout << "slngen " << SLNGEN_VERSION << "\n";
            return 0;
        } else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--list") == 0) {
            std::cout << "Available generators:\n";
            auto& factory = slngen::GeneratorFactory::instance();
            for (const auto& name : factory.available_generators()) {
                auto gen = factory.create(name);
                if (gen) {
                    std::cout << "  " << name << " - " << gen->description() << "\n";
                }
            }
            return 0;
        } else if (strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--project-root") == 0) {
            if (!needs_value(argv[i])) return 1;
            options.project_root = argv[++i];
        } else if (strcmp(argv[i], "--template-root") == 0) {
            if (!needs_value(argv[i])) return 1;
            options.template_root = argv[++i];
        } else if (strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--manifest") == 0) {
            if (!needs_value(argv[i])) return 1;
            options.manifest_path = argv[++i];
        } else if (strcmp(argv[i], "-g") == 0 || strcmp(argv[i], "--generator") == 0) {
            if (!needs_value(argv[i])) return 1;
            options.generator = argv[++i];
        } else if (strcmp(argv[i], "-r") == 0 || strcmp(argv[i], "--recursive") == 0) {
            options.pattern_mode = slngen::PatternMode::Recursive;
        } else if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--debug") == 0) {
            debug_build = true;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            options.verbose = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: Unknown option: " << argv[i] << "\n";
            return 1;
        } else if (!command_seen && positional.empty()) {
            command_seen = true;
            if (strcmp(argv[i], "generate") == 0) {
                command = Command::Generate;
            } else if (strcmp(argv[i], "prepare-variant") == 0) {
                command = Command::PrepareVariant;
            } else if (strcmp(argv[i], "extract-templates") == 0) {
                command = Command::ExtractTemplates;
            } else if (strcmp(argv[i], "init-manifest") == 0) {
                command = Command::InitManifest;
            } else {
                std::cerr << "Error: Unknown command: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } else {
            positional.push_back(argv[i]);
        }
    }

    size_t expected_positional = command == Command::PrepareVariant ? 2 : 0;
    if (positional.size() != expected_positional) {
        if (positional.size() > expected_positional) {
            std::cerr << "Error: Unexpected argument: " << positional[expected_positional] << "\n";
        } else {
            std::cerr << "Error: prepare-variant requires a platform and a configuration\n";
        }
        print_usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    if (!fs::is_directory(options.project_root, ec)) {
        std::cerr << "Error: Project root not found: " << options.project_root << "\n";
        return 1;
    }

    try {
        switch (command) {
            case Command::Generate: {
                if (options.verbose) {
                    std::cout << "Project root: " << fs::absolute(options.project_root).string() << "\n";
                }
                auto generator = create_generator(options.generator);
                slngen::SolutionPlanner planner(options);
                slngen::GenerateResult result = generator->generate(planner.plan(), options);

                if (!result.updated_files.empty()) {
                    std::cout << "Updated " << result.updated_files.size() << " file(s):\n";
                    for (const auto& file : result.updated_files) {
                        std::cout << "  - " << file << "\n";
                    }
                } else {
                    std::cout << "No changes.\n";
                }

                std::cout << "Source mapping summary:\n";
                for (const auto& [project, count] : result.stats.pattern_count_by_project) {
                    std::cout << "  - " << project << ": " << count << " patterns, "
                              << result.stats.source_count_by_project[project] << " source file(s)\n";
                }
                if (result.stats.unresolved_dir_count > 0) {
                    std::cout << "Unresolved directories: " << result.stats.unresolved_dir_count << "\n";
                }

                print_warnings(result.warnings);
                return 0;
            }

            case Command::PrepareVariant: {
                const auto& registry = slngen::VariantRegistry::instance();
                auto platform = registry.parse_platform(positional[0]);
                auto config = registry.parse_config(positional[1]);
                if (!platform) {
                    std::cerr << "Error: Unknown platform: " << positional[0] << " (expected one of:";
                    for (const auto& name : registry.platform_names()) {
                        std::cerr << " " << name;
                    }
                    std::cerr << ")\n";
                    return 1;
                }
                if (!config) {
                    std::cerr << "Error: Unknown configuration: " << positional[1] << " (expected one of:";
                    for (const auto& name : registry.config_names()) {
                        std::cerr << " " << name;
                    }
                    std::cerr << ")\n";
                    return 1;
                }

                // Variants derive from freshly rendered base descriptors
                auto generator = create_generator(options.generator);
                slngen::SolutionPlanner planner(options);
                slngen::SolutionPlan plan = planner.plan();
                slngen::GenerateResult base = generator->generate(plan, options);
                print_warnings(base.warnings);

                slngen::VariantOptions variant_options;
                variant_options.platform = *platform;
                variant_options.config = *config;
                variant_options.debug = debug_build;

                slngen::VariantGenerator variants(options, variant_options);
                slngen::VariantResult result = variants.prepare(plan);

                std::cerr << "Variant " << result.variant << ": " << result.generated.size()
                          << " generated, " << result.skipped.size() << " up-to-date, "
                          << result.excluded.size() << " excluded\n";
                if (options.verbose) {
                    for (const auto& file : result.generated) {
                        std::cerr << "  + " << file << "\n";
                    }
                    for (const auto& name : result.excluded) {
                        std::cerr << "  - " << name << "\n";
                    }
                }

                // Solution path on stdout for build scripts
                std::cout << (fs::path(plan.project_root) / result.solution_path).generic_string() << "\n";
                return 0;
            }

            case Command::ExtractTemplates: {
                slngen::TemplateExtractor extractor(options);
                auto updated = extractor.extract();
                if (!updated.empty()) {
                    std::cout << "Extracted " << updated.size() << " template(s):\n";
                    for (const auto& file : updated) {
                        std::cout << "  - " << file << "\n";
                    }
                } else {
                    std::cout << "No changes.\n";
                }
                return 0;
            }

            case Command::InitManifest: {
                std::string manifest_path = options.manifest_path.empty()
                    ? options.template_root + "/manifest.json"
                    : options.manifest_path;
                slngen::TemplateExtractor extractor(options);
                std::cout << "Wrote project registry: " << extractor.init_manifest(manifest_path) << "\n";
                return 0;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
