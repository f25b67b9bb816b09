#pragma once

#include <optional>
#include <string>
#include <vector>

namespace slngen {

// One Project(...) line of a .sln file
struct SlnProjectEntry {
    std::string type_guid;  // "{FAE04EC0-...}"
    std::string name;
    std::string path;       // As written in the solution
    std::string guid;       // "{...}"
};

// Reader for Unity-generated .sln files
class SlnReader {
public:
    SlnReader() = default;

    // Root-level .csproj entries of a solution file.
    // Throws GeneratorError (NoProjectsInSolution) if there are none.
    std::vector<SlnProjectEntry> read_sln(const std::string& filepath) const;

    // Parse Project(...) lines, keeping only .csproj paths without a directory part
    std::vector<SlnProjectEntry> parse_projects(const std::string& content) const;
};

// File name of the first (by name) .sln directly inside project_root,
// ignoring variant solutions
std::optional<std::string> locate_solution_file(const std::string& project_root);

// Full path of locate_solution_file(). Throws GeneratorError (NoSolutionFound).
std::string find_solution_file(const std::string& project_root);

} // namespace slngen
