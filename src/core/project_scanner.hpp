#pragma once

#include "common/project_types.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace slngen {

// Parallel walk of the Unity source roots.
//
// The immediate children of every sub-root are listed on the calling thread;
// each child directory is then walked by its own ThreadPool task into a
// private bucket. Buckets are merged after every task has finished, so no
// collection is shared between workers.
class ProjectScanner {
public:
    // max_threads == 0 uses every hardware thread
    ProjectScanner(std::vector<std::string> sub_roots, ScanRules rules,
                   size_t max_threads = SLNGEN_MAX_SCAN_THREADS);

    // Walk project_root and decode every .asmdef / .asmref found.
    // Never throws for unreadable directories or records; those become
    // silent omissions and snapshot warnings respectively.
    ScanSnapshot scan(const std::string& project_root) const;

    // Names Unity hides from the asset database
    static bool is_ignored_name(const std::string& name);

private:
    struct ScanBucket {
        std::vector<SourceDirectory> source_dirs;
        std::vector<std::string> declaration_paths;
        std::vector<std::string> extension_paths;
        std::vector<std::string> ignored_dirs;
        std::set<std::string> visited;  // Canonical paths walked by this bucket
    };

    enum class EntryType {
        Directory,
        File,
        Other
    };

    // Entry type with a stat() fallback for symlinks and unknown d_type
    static EntryType classify(const std::filesystem::directory_entry& entry);

    // Symlinked directories are followed unless their target overlaps one of
    // the walked sub-roots; those directories are reached by their real path.
    static bool follow_link(const std::filesystem::directory_entry& entry,
                            const std::vector<std::filesystem::path>& tree_roots);

    void scan_directory(const std::filesystem::path& dir, const std::string& relative,
                        const std::vector<std::filesystem::path>& tree_roots, ScanBucket& bucket) const;

    void collect_file(const std::string& name, const std::string& relative,
                      size_t& source_count, ScanBucket& bucket) const;

    std::vector<std::string> sub_roots_;
    ScanRules rules_;
    size_t max_threads_;
};

} // namespace slngen
