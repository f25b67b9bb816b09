#include "pch.h"
#include "core/ownership_resolver.hpp"
#include "common/errors.hpp"

namespace slngen {

namespace {

const char* const FIRST_PASS_DIRECTORIES[] = {"Plugins", "Standard Assets", "Pro Standard Assets"};

} // namespace

OwnershipResolver::OwnershipResolver(const std::vector<ModuleRecord>& modules,
                                     const std::vector<ReferenceExtensionRecord>& extensions) {
    for (const auto& module : modules) {
        if (!modules_.emplace(module.name, module).second) {
            throw GeneratorError::duplicate_module(module.name);
        }
        if (module.guid) {
            module_by_guid_[to_lower(*module.guid)] = module.name;
        }
    }

    for (const auto& module : modules) {
        bind(module.directory, module.name, "assembly definition " + module.name);
    }

    for (const auto& extension : extensions) {
        auto module = resolve_reference(extension.reference);
        if (!module) {
            continue;
        }
        bind(extension.directory, *module, "assembly reference to " + *module);
    }
}

void OwnershipResolver::bind(const std::string& directory, const std::string& module,
                             const std::string& source) {
    auto existing = ownership_.find(directory);
    if (existing == ownership_.end()) {
        ownership_[directory] = module;
        return;
    }
    if (existing->second != module) {
        std::string where = directory.empty() ? "<project root>" : directory;
        warnings_.push_back("Ignoring " + source + " in " + where +
                            ": directory already owned by " + existing->second);
    }
}

std::optional<std::string> OwnershipResolver::resolve_reference(const std::string& token) const {
    if (modules_.count(token)) {
        return token;
    }

    if (starts_with(token, GUID_REFERENCE_PREFIX)) {
        std::string guid = to_lower(token.substr(std::string(GUID_REFERENCE_PREFIX).size()));
        auto it = module_by_guid_.find(guid);
        if (it != module_by_guid_.end()) return it->second;
        return std::nullopt;
    }

    if (token.size() == GUID_LENGTH) {
        auto it = module_by_guid_.find(to_lower(token));
        if (it != module_by_guid_.end()) return it->second;
    }

    return std::nullopt;
}

std::optional<std::string> OwnershipResolver::find_owner(const std::string& directory) {
    std::vector<std::string> walked;
    std::optional<std::string> result;
    std::string current = directory;

    while (true) {
        auto cached = cache_.find(current);
        if (cached != cache_.end()) {
            result = cached->second;
            break;
        }

        walked.push_back(current);

        auto owned = ownership_.find(current);
        if (owned != ownership_.end()) {
            result = owned->second;
            break;
        }

        if (current.empty()) {
            break;
        }
        current = parent_directory(current);
    }

    for (const auto& path : walked) {
        cache_[path] = result;
    }
    return result;
}

std::optional<std::string> OwnershipResolver::legacy_module_for(const std::string& directory) {
    auto parts = split_path(directory);
    if (parts.empty() || parts[0] != LEGACY_SOURCE_ROOT) {
        return std::nullopt;
    }

    bool is_editor = std::find(parts.begin(), parts.end(), "Editor") != parts.end();
    bool is_first_pass = false;
    if (parts.size() > 1) {
        for (const char* name : FIRST_PASS_DIRECTORIES) {
            if (parts[1] == name) {
                is_first_pass = true;
                break;
            }
        }
    }

    if (is_editor) {
        return std::string(is_first_pass ? LEGACY_EDITOR_FIRSTPASS_MODULE : LEGACY_EDITOR_MODULE);
    }
    return std::string(is_first_pass ? LEGACY_FIRSTPASS_MODULE : LEGACY_RUNTIME_MODULE);
}

SourceAssignment OwnershipResolver::assign(const std::vector<SourceDirectory>& source_dirs) {
    SourceAssignment assignment;

    for (const auto& dir : source_dirs) {
        auto owner = find_owner(dir.path);
        if (!owner) {
            owner = legacy_module_for(dir.path);
        }
        if (!owner) {
            assignment.unresolved_dirs.push_back(dir.path);
            continue;
        }
        assignment.dirs_by_module[*owner].push_back(dir.path);
        assignment.source_count_by_module[*owner] += dir.file_count;
    }

    for (auto& pair : assignment.dirs_by_module) {
        std::sort(pair.second.begin(), pair.second.end());
    }
    std::sort(assignment.unresolved_dirs.begin(), assignment.unresolved_dirs.end());
    return assignment;
}

std::vector<std::string> OwnershipResolver::resolved_references(const std::string& module) const {
    std::vector<std::string> references;
    auto it = modules_.find(module);
    if (it == modules_.end()) {
        return references;
    }

    for (const auto& token : it->second.references) {
        if (auto resolved = resolve_reference(token)) {
            references.push_back(*resolved);
        }
    }
    return deduplicate_preserving_order(references);
}

std::vector<std::string> OwnershipResolver::roots_of(const std::string& module) const {
    std::vector<std::string> roots;
    for (const auto& [directory, owner] : ownership_) {
        if (owner == module) {
            roots.push_back(directory);
        }
    }
    return roots;
}

} // namespace slngen
