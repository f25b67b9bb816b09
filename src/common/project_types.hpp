#pragma once

#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace slngen {

// Top-level directory that legacy (non-asmdef) sources must live under
constexpr const char* LEGACY_SOURCE_ROOT = "Assets";

// Marker for "GUID:xxxxxxxx..." style assembly references
constexpr const char* GUID_REFERENCE_PREFIX = "GUID:";
constexpr size_t GUID_LENGTH = 32;

// Visual C# project type
constexpr const char* CSHARP_PROJECT_TYPE_GUID = "{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}";

// Placeholders understood by project and solution templates
constexpr const char* PH_SOURCE_FOLDERS = "{{SOURCE_FOLDERS}}";
constexpr const char* PH_PROJECT_REFERENCES = "{{PROJECT_REFERENCES}}";
constexpr const char* PH_PROJECT_ROOT = "{{PROJECT_ROOT}}";
constexpr const char* PH_UNITY_VER = "{{UNITY_VER}}";
constexpr const char* PH_PROJECT_ENTRIES = "{{PROJECT_ENTRIES}}";
constexpr const char* PH_PROJECT_CONFIGS = "{{PROJECT_CONFIGS}}";

enum class ProjectCategory {
    Runtime,
    Editor,
    Test
};

// How a project's sources are owned
enum class ProjectKind {
    AsmDef,     // Declared by an .asmdef (plus any .asmref extensions)
    Legacy      // Assembly-CSharp family, assigned by directory convention
};

enum class PatternMode {
    Flat,       // One non-recursive glob per owned directory
    Recursive   // One recursive glob per top-level ownership root, with excludes
};

// File suffixes the scanner classifies
struct ScanRules {
    std::string source_suffix = ".cs";
    std::string declaration_suffix = ".asmdef";
    std::string extension_suffix = ".asmref";
};

// Module declared by an .asmdef file
struct ModuleRecord {
    std::string name;
    std::string directory;                      // Ownership root (dir of the .asmdef)
    std::optional<std::string> guid;            // Lowercase asset GUID from the .meta file
    std::vector<std::string> references;        // Raw tokens: name, GUID or "GUID:<guid>"
    ProjectCategory category = ProjectCategory::Runtime;
    std::vector<std::string> include_platforms; // Empty = every platform
};

// .asmref: extends a module's ownership into another directory
struct ReferenceExtensionRecord {
    std::string directory;
    std::string reference;
};

// Directory with at least one direct source child
struct SourceDirectory {
    std::string path;
    size_t file_count = 0;
};

// Everything one scan produced; discarded after generation
struct ScanSnapshot {
    std::string root_path;                              // Real (symlink-resolved) root
    std::vector<SourceDirectory> source_dirs;
    std::vector<ModuleRecord> modules;
    std::vector<ReferenceExtensionRecord> extensions;
    std::vector<std::string> ignored_dirs;              // Pruned "." / "~" directories
    std::vector<std::string> warnings;                  // Undecodable asset records
};

struct CompilePattern {
    std::string include;
    std::vector<std::string> exclude;
};

// One descriptor to render
struct ProjectEntry {
    std::string name;
    std::string csproj_path;    // Relative to the project root
    std::string template_path;  // Relative to the project root
    std::string guid;           // "{XXXXXXXX-...}"
    ProjectKind kind = ProjectKind::AsmDef;
    ProjectCategory category = ProjectCategory::Runtime;
};

// Project registry
struct GeneratorManifest {
    std::string solution_path;
    std::string solution_template_path;
    std::string project_type_guid = CSHARP_PROJECT_TYPE_GUID;
    std::vector<ProjectEntry> projects;
};

// Settings threaded through every stage of a generation run
struct GenerateOptions {
    std::string project_root = ".";
    std::string template_root = SLNGEN_DEFAULT_TEMPLATE_ROOT;  // Relative to project_root
    std::string manifest_path;                  // Empty = auto-discover the project set
    std::string generator = "csproj";
    std::vector<std::string> scan_roots = {"Assets", "Packages"};
    PatternMode pattern_mode = PatternMode::Flat;
    ScanRules rules;
    bool verbose = false;
};

struct GenerationStats {
    std::map<std::string, size_t> source_count_by_project;
    std::map<std::string, size_t> pattern_count_by_project;
    size_t unresolved_dir_count = 0;
};

struct GenerateResult {
    std::vector<std::string> updated_files;
    std::vector<std::string> warnings;
    GenerationStats stats;
};

// In-memory result of scan + ownership resolution + pattern synthesis.
// Renderers work from this alone; they never re-scan the tree.
struct SolutionPlan {
    std::string project_root;                                       // Real root path
    std::string unity_version;
    GeneratorManifest manifest;
    std::map<std::string, ModuleRecord> modules;                    // By module name
    std::map<std::string, std::vector<CompilePattern>> patterns_by_project;
    std::map<std::string, std::vector<std::string>> references_by_project;  // Resolved names
    GenerationStats stats;
    std::vector<std::string> warnings;

    const ProjectEntry* find_project(const std::string& name) const {
        for (const auto& project : manifest.projects) {
            if (project.name == name) return &project;
        }
        return nullptr;
    }

    const ModuleRecord* find_module(const std::string& name) const {
        auto it = modules.find(name);
        return it == modules.end() ? nullptr : &it->second;
    }
};

inline std::string category_to_string(ProjectCategory category) {
    switch (category) {
        case ProjectCategory::Editor: return "editor";
        case ProjectCategory::Test: return "test";
        case ProjectCategory::Runtime: return "runtime";
        default: return "runtime";
    }
}

inline std::optional<ProjectCategory> parse_category(const std::string& value) {
    if (value == "runtime") return ProjectCategory::Runtime;
    if (value == "editor") return ProjectCategory::Editor;
    if (value == "test") return ProjectCategory::Test;
    return std::nullopt;
}

inline std::string kind_to_string(ProjectKind kind) {
    return kind == ProjectKind::Legacy ? "legacy" : "asmdef";
}

inline std::optional<ProjectKind> parse_kind(const std::string& value) {
    if (value == "asmdef") return ProjectKind::AsmDef;
    if (value == "legacy") return ProjectKind::Legacy;
    return std::nullopt;
}

// "Assets/Game/Foo" -> "Assets/Game", "Assets" -> ""
inline std::string parent_directory(const std::string& path) {
    size_t slash = path.rfind('/');
    if (slash == std::string::npos) return "";
    return path.substr(0, slash);
}

inline size_t path_depth(const std::string& path) {
    if (path.empty()) return 0;
    return static_cast<size_t>(std::count(path.begin(), path.end(), '/')) + 1;
}

// The empty path is the ancestor of everything
inline bool is_descendant_or_same(const std::string& child, const std::string& ancestor) {
    if (ancestor.empty() || child == ancestor) return true;
    return child.size() > ancestor.size() &&
           child.compare(0, ancestor.size(), ancestor) == 0 &&
           child[ancestor.size()] == '/';
}

inline std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

inline std::vector<std::string> deduplicate_preserving_order(const std::vector<std::string>& values) {
    std::set<std::string> seen;
    std::vector<std::string> result;
    for (const auto& value : values) {
        if (seen.insert(value).second) {
            result.push_back(value);
        }
    }
    return result;
}

inline bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Deterministic UUID derived from a name. Descriptors reference each other by
// this value, so it must not change between runs or across machines.
inline std::string stable_uuid(const std::string& name) {
    const uint64_t prime = 1099511628211ULL;
    uint64_t hi = 14695981039346656037ULL;
    uint64_t lo = 0x84222325CBF29CE4ULL;

    for (unsigned char c : name) {
        hi ^= c;
        hi *= prime;
    }
    for (auto it = name.rbegin(); it != name.rend(); ++it) {
        lo ^= static_cast<unsigned char>(*it);
        lo *= prime;
    }
    lo ^= hi >> 29;
    lo *= prime;

    std::stringstream ss;
    ss << std::uppercase << std::hex << std::setfill('0')
       << std::setw(16) << hi << std::setw(16) << lo;
    std::string hex = ss.str();

    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

inline std::string braced_guid(const std::string& uuid) {
    return "{" + uuid + "}";
}

} // namespace slngen
