#include "pch.h"
#include "core/project_scanner.hpp"
#include "common/file_utils.hpp"
#include "common/thread_pool.hpp"
#include "parsers/asset_reader.hpp"
#include <future>

namespace fs = std::filesystem;

namespace slngen {

namespace {

std::string child_path(const std::string& relative, const std::string& name) {
    return relative.empty() ? name : relative + "/" + name;
}

bool is_within(const fs::path& path, const fs::path& base) {
    auto mismatch = std::mismatch(base.begin(), base.end(), path.begin(), path.end());
    return mismatch.first == base.end();
}

} // namespace

ProjectScanner::ProjectScanner(std::vector<std::string> sub_roots, ScanRules rules, size_t max_threads)
    : sub_roots_(std::move(sub_roots)), rules_(std::move(rules)), max_threads_(max_threads) {}

bool ProjectScanner::is_ignored_name(const std::string& name) {
    return name.empty() || name.front() == '.' || name.back() == '~';
}

ProjectScanner::EntryType ProjectScanner::classify(const fs::directory_entry& entry) {
    std::error_code ec;
    fs::file_status status = entry.symlink_status(ec);
    if (ec) {
        return EntryType::Other;
    }

    if (fs::is_symlink(status) || status.type() == fs::file_type::unknown) {
        status = entry.status(ec);
        if (ec) {
            return EntryType::Other;
        }
    }

    if (fs::is_directory(status)) return EntryType::Directory;
    if (fs::is_regular_file(status)) return EntryType::File;
    return EntryType::Other;
}

bool ProjectScanner::follow_link(const fs::directory_entry& entry, const std::vector<fs::path>& tree_roots) {
    std::error_code ec;
    if (!entry.is_symlink(ec) || ec) {
        return true;
    }

    fs::path target = fs::canonical(entry.path(), ec);
    if (ec) {
        return false;
    }
    for (const auto& tree_root : tree_roots) {
        if (is_within(target, tree_root) || is_within(tree_root, target)) {
#ifndef NDEBUG
            std::cout << "[DEBUG] Not following " << entry.path().generic_string()
                      << " into the scanned tree\n";
#endif
            return false;
        }
    }
    return true;
}

void ProjectScanner::collect_file(const std::string& name, const std::string& relative,
                                  size_t& source_count, ScanBucket& bucket) const {
    if (ends_with(name, rules_.source_suffix)) {
        source_count++;
    } else if (ends_with(name, rules_.declaration_suffix)) {
        bucket.declaration_paths.push_back(relative);
    } else if (ends_with(name, rules_.extension_suffix)) {
        bucket.extension_paths.push_back(relative);
    }
}

void ProjectScanner::scan_directory(const fs::path& dir, const std::string& relative,
                                    const std::vector<fs::path>& tree_roots, ScanBucket& bucket) const {
    std::error_code ec;
    fs::path real = fs::canonical(dir, ec);
    if (ec || !bucket.visited.insert(real.generic_string()).second) {
        return;
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        return;
    }

    size_t source_count = 0;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }

        std::string name = it->path().filename().string();
        EntryType type = classify(*it);
        std::string child = child_path(relative, name);

        if (is_ignored_name(name)) {
            if (type == EntryType::Directory) {
                bucket.ignored_dirs.push_back(child);
            }
            continue;
        }

        if (type == EntryType::Directory) {
            if (follow_link(*it, tree_roots)) {
                scan_directory(it->path(), child, tree_roots, bucket);
            }
        } else if (type == EntryType::File) {
            collect_file(name, child, source_count, bucket);
        }
    }

    if (source_count > 0) {
        bucket.source_dirs.push_back({relative, source_count});
    }
}

ScanSnapshot ProjectScanner::scan(const std::string& project_root) const {
    ScanSnapshot snapshot;
    snapshot.root_path = resolve_real_path(project_root);

    struct WalkTarget {
        fs::path path;
        std::string relative;
    };
    std::vector<WalkTarget> targets;
    ScanBucket root_bucket;

    std::vector<fs::path> tree_roots;
    for (const auto& sub_root : sub_roots_) {
        std::error_code ec;
        fs::path real = fs::canonical(join_path(snapshot.root_path, sub_root), ec);
        if (!ec) {
            tree_roots.push_back(real);
        }
    }

    for (const auto& sub_root : sub_roots_) {
        fs::path sub_root_path = join_path(snapshot.root_path, sub_root);
        std::error_code ec;
        fs::directory_iterator it(sub_root_path, ec);
        if (ec) {
            continue;
        }

        size_t source_count = 0;
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }

            std::string name = it->path().filename().string();
            EntryType type = classify(*it);
            std::string child = child_path(sub_root, name);

            if (is_ignored_name(name)) {
                if (type == EntryType::Directory) {
                    root_bucket.ignored_dirs.push_back(child);
                }
                continue;
            }

            if (type == EntryType::Directory) {
                if (follow_link(*it, tree_roots)) {
                    targets.push_back({it->path(), child});
                }
            } else if (type == EntryType::File) {
                collect_file(name, child, source_count, root_bucket);
            }
        }

        if (source_count > 0) {
            root_bucket.source_dirs.push_back({sub_root, source_count});
        }
    }

    std::vector<ScanBucket> buckets;
    if (!targets.empty()) {
        size_t thread_count = max_threads_ == 0
            ? std::max<size_t>(1, std::thread::hardware_concurrency())
            : max_threads_;
        thread_count = std::min(thread_count, targets.size());

        ThreadPool pool(thread_count);
        std::vector<std::future<ScanBucket>> futures;
        futures.reserve(targets.size());
        for (const auto& target : targets) {
            futures.push_back(pool.post([this, &target, &tree_roots]() {
                ScanBucket bucket;
                scan_directory(target.path, target.relative, tree_roots, bucket);
                return bucket;
            }));
        }

        buckets.reserve(futures.size());
        for (auto& future : futures) {
            buckets.push_back(future.get());
        }
    }
    buckets.push_back(std::move(root_bucket));

#ifndef NDEBUG
    std::cout << "[DEBUG] Scanned " << targets.size() << " subtree(s) of "
              << snapshot.root_path << "\n";
#endif

    std::vector<std::string> declaration_paths;
    std::vector<std::string> extension_paths;
    for (auto& bucket : buckets) {
        for (auto& dir : bucket.source_dirs) {
            snapshot.source_dirs.push_back(std::move(dir));
        }
        declaration_paths.insert(declaration_paths.end(), bucket.declaration_paths.begin(),
                                 bucket.declaration_paths.end());
        extension_paths.insert(extension_paths.end(), bucket.extension_paths.begin(),
                               bucket.extension_paths.end());
        snapshot.ignored_dirs.insert(snapshot.ignored_dirs.end(), bucket.ignored_dirs.begin(),
                                     bucket.ignored_dirs.end());
    }

    std::sort(snapshot.source_dirs.begin(), snapshot.source_dirs.end(),
              [](const SourceDirectory& a, const SourceDirectory& b) { return a.path < b.path; });
    std::sort(declaration_paths.begin(), declaration_paths.end());
    std::sort(extension_paths.begin(), extension_paths.end());
    std::sort(snapshot.ignored_dirs.begin(), snapshot.ignored_dirs.end());

    AssetReader reader(snapshot.root_path);
    for (const auto& path : declaration_paths) {
        if (auto record = reader.read_module(path)) {
            snapshot.modules.push_back(std::move(*record));
        } else {
            snapshot.warnings.push_back("Skipping assembly definition " + reader.last_error());
        }
    }
    for (const auto& path : extension_paths) {
        if (auto record = reader.read_extension(path)) {
            snapshot.extensions.push_back(std::move(*record));
        } else {
            snapshot.warnings.push_back("Skipping assembly reference " + reader.last_error());
        }
    }

    return snapshot;
}

} // namespace slngen
