#pragma once

#include "common/project_types.hpp"
#include <map>
#include <string>
#include <vector>

namespace slngen {

// Turns a module's owned directories into <Compile Include/Exclude> globs
class CompilePatternSynthesizer {
public:
    // ownership: directory -> module for every module in the tree
    CompilePatternSynthesizer(const std::map<std::string, std::string>& ownership,
                              const std::vector<std::string>& ignored_dirs,
                              std::string source_suffix = ".cs");

    // Flat: one "dir/*.cs" per source directory.
    // Recursive: one "root/**/*.cs" per covering root, excluding nested roots
    // of other modules and ignored directories. Legacy modules and modules
    // without ownership roots always get flat patterns.
    std::vector<CompilePattern> synthesize(const std::string& module, ProjectKind kind,
                                           const std::vector<std::string>& source_dirs,
                                           PatternMode mode) const;

    std::vector<CompilePattern> flat_patterns(const std::vector<std::string>& source_dirs) const;
    std::vector<CompilePattern> recursive_patterns(const std::string& module) const;

    std::string flat_glob(const std::string& directory) const;
    std::string recursive_glob(const std::string& directory) const;

    // Ownership roots of a module that are not inside another root of the
    // same module. A root nested under a foreign root is kept, since the
    // enclosing pattern excludes the foreign subtree.
    std::vector<std::string> covering_roots(const std::string& module) const;

private:
    const std::map<std::string, std::string>& ownership_;
    const std::vector<std::string>& ignored_dirs_;
    std::string source_suffix_;
};

} // namespace slngen
