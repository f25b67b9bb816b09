#include "pch.h"
#include "core/compile_patterns.hpp"

namespace slngen {

namespace {

void sort_by_include(std::vector<CompilePattern>& patterns) {
    std::sort(patterns.begin(), patterns.end(),
              [](const CompilePattern& a, const CompilePattern& b) { return a.include < b.include; });
}

} // namespace

CompilePatternSynthesizer::CompilePatternSynthesizer(const std::map<std::string, std::string>& ownership,
                                                     const std::vector<std::string>& ignored_dirs,
                                                     std::string source_suffix)
    : ownership_(ownership), ignored_dirs_(ignored_dirs), source_suffix_(std::move(source_suffix)) {}

std::string CompilePatternSynthesizer::flat_glob(const std::string& directory) const {
    if (directory.empty()) {
        return "*" + source_suffix_;
    }
    return directory + "/*" + source_suffix_;
}

std::string CompilePatternSynthesizer::recursive_glob(const std::string& directory) const {
    if (directory.empty()) {
        return "**/*" + source_suffix_;
    }
    return directory + "/**/*" + source_suffix_;
}

std::vector<CompilePattern> CompilePatternSynthesizer::synthesize(const std::string& module, ProjectKind kind,
                                                                  const std::vector<std::string>& source_dirs,
                                                                  PatternMode mode) const {
    if (kind == ProjectKind::Legacy || mode == PatternMode::Flat) {
        return flat_patterns(source_dirs);
    }

    auto patterns = recursive_patterns(module);
    if (patterns.empty()) {
        return flat_patterns(source_dirs);
    }
    return patterns;
}

std::vector<CompilePattern> CompilePatternSynthesizer::flat_patterns(const std::vector<std::string>& source_dirs) const {
    std::set<std::string> directories(source_dirs.begin(), source_dirs.end());
    std::vector<CompilePattern> patterns;
    patterns.reserve(directories.size());
    for (const auto& directory : directories) {
        patterns.push_back({flat_glob(directory), {}});
    }
    sort_by_include(patterns);
    return patterns;
}

std::vector<CompilePattern> CompilePatternSynthesizer::recursive_patterns(const std::string& module) const {
    std::vector<CompilePattern> patterns;

    for (const auto& root : covering_roots(module)) {
        std::vector<std::string> excludes;
        for (const auto& [directory, owner] : ownership_) {
            if (owner != module && is_descendant_or_same(directory, root)) {
                excludes.push_back(recursive_glob(directory));
            }
        }
        for (const auto& directory : ignored_dirs_) {
            if (is_descendant_or_same(directory, root)) {
                excludes.push_back(recursive_glob(directory));
            }
        }
        patterns.push_back({recursive_glob(root), deduplicate_preserving_order(excludes)});
    }

    sort_by_include(patterns);
    return patterns;
}

std::vector<std::string> CompilePatternSynthesizer::covering_roots(const std::string& module) const {
    std::vector<std::string> roots;
    for (const auto& [directory, owner] : ownership_) {
        if (owner != module) {
            continue;
        }

        std::optional<std::string> enclosing_owner;
        std::string current = directory;
        while (!current.empty()) {
            current = parent_directory(current);
            auto it = ownership_.find(current);
            if (it != ownership_.end()) {
                enclosing_owner = it->second;
                break;
            }
        }

        if (enclosing_owner != module) {
            roots.push_back(directory);
        }
    }
    return roots;
}

} // namespace slngen
