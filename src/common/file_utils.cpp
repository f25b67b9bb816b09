#include "pch.h"
#include "common/file_utils.hpp"
#include "common/errors.hpp"

namespace fs = std::filesystem;

namespace slngen {

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_file(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw GeneratorError::write_failed(path.string() + ": " + ec.message());
        }
    }

    fs::path temp_path = path;
    temp_path += ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw GeneratorError::write_failed(temp_path.string());
        }
        file << content;
        if (!file) {
            throw GeneratorError::write_failed(temp_path.string());
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        throw GeneratorError::write_failed(path.string());
    }
}

bool write_file_if_changed(const fs::path& path, const std::string& content) {
    auto current = read_file(path);
    if (current && *current == content) {
        return false;
    }
    write_file(path, content);
    return true;
}

std::optional<fs::file_time_type> modification_time(const fs::path& path) {
    std::error_code ec;
    auto time = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return time;
}

std::string resolve_real_path(const std::string& path) {
    std::error_code ec;
    fs::path resolved = fs::canonical(path, ec);
    if (ec) {
        resolved = fs::absolute(path, ec).lexically_normal();
        if (ec) {
            return path;
        }
    }
    std::string result = resolved.generic_string();
    // lexically_normal() keeps a trailing separator for "dir/"
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

fs::path join_path(const std::string& root, const std::string& relative) {
    if (relative.empty()) {
        return fs::path(root);
    }
    return fs::path(root) / fs::path(relative);
}

std::string replace_all(std::string str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.length(), to);
        pos += to.length();
    }
    return str;
}

std::string join_strings(const std::vector<std::string>& values, const std::string& separator) {
    if (values.empty()) return "";
    std::string result = values[0];
    for (size_t i = 1; i < values.size(); i++) {
        result += separator + values[i];
    }
    return result;
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace slngen
