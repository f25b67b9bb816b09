#include "variant_registry.hpp"
#include "project_types.hpp"

namespace slngen {

const VariantRegistry& VariantRegistry::instance() {
    static VariantRegistry registry;
    return registry;
}

VariantRegistry::VariantRegistry() {
    platforms_[BuildPlatform::IOS] = {"ios", "iOS", "UNITY_IOS", {"UNITY_ANDROID"}, {}};
    // UNITY_IPHONE is the legacy alias Unity still emits next to UNITY_IOS
    platforms_[BuildPlatform::Android] = {"android", "Android", "UNITY_ANDROID",
                                          {"UNITY_IOS"}, {"UNITY_IPHONE"}};

    configs_[BuildConfig::Editor] = {"editor", true, true, true};
    configs_[BuildConfig::Dev] = {"dev", false, false, true};
    configs_[BuildConfig::Prod] = {"prod", false, false, false};

    editor_defines_ = {"UNITY_EDITOR", "UNITY_EDITOR_64", "UNITY_EDITOR_OSX",
                       "UNITY_EDITOR_WIN", "UNITY_EDITOR_LINUX"};
    debug_defines_ = {"DEBUG", "TRACE"};
}

std::optional<BuildPlatform> VariantRegistry::parse_platform(const std::string& input) const {
    std::string lower_input = to_lower(input);
    for (const auto& [platform, info] : platforms_) {
        if (info.id == lower_input) {
            return platform;
        }
    }
    return std::nullopt;
}

std::optional<BuildConfig> VariantRegistry::parse_config(const std::string& input) const {
    std::string lower_input = to_lower(input);
    for (const auto& [config, info] : configs_) {
        if (info.id == lower_input) {
            return config;
        }
    }
    return std::nullopt;
}

const VariantRegistry::PlatformInfo& VariantRegistry::platform(BuildPlatform platform) const {
    return platforms_.at(platform);
}

const VariantRegistry::ConfigInfo& VariantRegistry::config(BuildConfig config) const {
    return configs_.at(config);
}

std::vector<std::string> VariantRegistry::platform_names() const {
    std::vector<std::string> names;
    for (const auto& pair : platforms_) {
        names.push_back(pair.second.id);
    }
    return names;
}

std::vector<std::string> VariantRegistry::config_names() const {
    std::vector<std::string> names;
    for (const auto& pair : configs_) {
        names.push_back(pair.second.id);
    }
    return names;
}

} // namespace slngen
