#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace slngen {

enum class BuildPlatform {
    IOS,
    Android
};

enum class BuildConfig {
    Editor,     // Everything, editor defines kept
    Dev,        // Runtime projects, DEBUG/TRACE kept
    Prod        // Runtime projects, DEBUG/TRACE stripped unless forced
};

// Registry for build-variant define tables
// Maps CLI names ("ios", "prod") to the define tokens each variant adds,
// removes or swaps in DefineConstants, and to the Unity platform name used
// by an asmdef's includePlatforms list.
class VariantRegistry {
public:
    struct PlatformInfo {
        std::string id;                         // CLI name (e.g., "ios")
        std::string unity_name;                 // includePlatforms entry (e.g., "iOS")
        std::string define;                     // Token the variant compiles with
        std::vector<std::string> foreign_defines;   // Other platforms' tokens to swap out
        std::vector<std::string> dropped_defines;   // Aliases removed outright
    };

    struct ConfigInfo {
        std::string id;                         // CLI name (e.g., "prod")
        bool keeps_all_projects;                // No category/platform filtering
        bool keeps_editor_defines;
        bool keeps_debug_defines;
    };

    // Get singleton instance
    static const VariantRegistry& instance();

    std::optional<BuildPlatform> parse_platform(const std::string& input) const;
    std::optional<BuildConfig> parse_config(const std::string& input) const;

    const PlatformInfo& platform(BuildPlatform platform) const;
    const ConfigInfo& config(BuildConfig config) const;

    // Tokens removed from every non-editor variant
    const std::set<std::string>& editor_defines() const { return editor_defines_; }

    // Tokens removed unless debug defines are kept
    const std::set<std::string>& debug_defines() const { return debug_defines_; }

    std::vector<std::string> platform_names() const;
    std::vector<std::string> config_names() const;

private:
    VariantRegistry();
    VariantRegistry(const VariantRegistry&) = delete;
    VariantRegistry& operator=(const VariantRegistry&) = delete;

    std::map<BuildPlatform, PlatformInfo> platforms_;
    std::map<BuildConfig, ConfigInfo> configs_;
    std::set<std::string> editor_defines_;
    std::set<std::string> debug_defines_;
};

} // namespace slngen
