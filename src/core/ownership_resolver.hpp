#pragma once

#include "common/project_types.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace slngen {

// Fixed names of the Assembly-CSharp family
constexpr const char* LEGACY_RUNTIME_MODULE = "Assembly-CSharp";
constexpr const char* LEGACY_FIRSTPASS_MODULE = "Assembly-CSharp-firstpass";
constexpr const char* LEGACY_EDITOR_MODULE = "Assembly-CSharp-Editor";
constexpr const char* LEGACY_EDITOR_FIRSTPASS_MODULE = "Assembly-CSharp-Editor-firstpass";

// Source directories grouped by the module that compiles them
struct SourceAssignment {
    std::map<std::string, std::vector<std::string>> dirs_by_module;     // Sorted directories
    std::map<std::string, size_t> source_count_by_module;
    std::vector<std::string> unresolved_dirs;
};

// Maps directories to owning modules.
//
// The ownership map (directory -> module) is built once from the .asmdef
// directories plus every resolvable .asmref directory, and is read-only
// afterwards. Lookups walk towards the root and memoize every directory they
// visit. The memo cache belongs to this instance; do not share one resolver
// between threads.
class OwnershipResolver {
public:
    // Throws GeneratorError (DuplicateModuleName)
    OwnershipResolver(const std::vector<ModuleRecord>& modules,
                      const std::vector<ReferenceExtensionRecord>& extensions);

    // Module named by a raw reference token: exact name, "GUID:<guid>" or a bare GUID
    std::optional<std::string> resolve_reference(const std::string& token) const;

    // Nearest ancestor (or the directory itself) bound in the ownership map
    std::optional<std::string> find_owner(const std::string& directory);

    // Assembly-CSharp family member for a directory under Assets, by convention
    static std::optional<std::string> legacy_module_for(const std::string& directory);

    // find_owner() with the legacy fallback, for every source directory
    SourceAssignment assign(const std::vector<SourceDirectory>& source_dirs);

    // Declared references of a module, resolved to names and de-duplicated.
    // Unresolvable tokens are dropped.
    std::vector<std::string> resolved_references(const std::string& module) const;

    // Sorted ownership roots of one module
    std::vector<std::string> roots_of(const std::string& module) const;

    const std::map<std::string, std::string>& ownership_map() const { return ownership_; }
    const std::map<std::string, ModuleRecord>& modules() const { return modules_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    void bind(const std::string& directory, const std::string& module, const std::string& source);

    std::map<std::string, ModuleRecord> modules_;
    std::unordered_map<std::string, std::string> module_by_guid_;
    std::map<std::string, std::string> ownership_;
    std::unordered_map<std::string, std::optional<std::string>> cache_;
    std::vector<std::string> warnings_;
};

} // namespace slngen
