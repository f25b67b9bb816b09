#pragma once

#include <stdexcept>
#include <string>

namespace slngen {

// Conditions that abort a run
enum class ErrorKind {
    DuplicateModuleName,
    MissingTemplate,
    MissingSolutionTemplate,
    MissingManifest,
    InvalidManifest,
    NoModuleDeclarations,
    NoSolutionFound,
    NoProjectsInSolution,
    InvalidDescriptor,
    WriteFailed
};

class GeneratorError : public std::runtime_error {
public:
    GeneratorError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    static GeneratorError duplicate_module(const std::string& name) {
        return {ErrorKind::DuplicateModuleName, "Duplicate asmdef name: '" + name + "'"};
    }
    static GeneratorError missing_template(const std::string& path) {
        return {ErrorKind::MissingTemplate, "Missing template file: " + path};
    }
    static GeneratorError missing_solution_template(const std::string& path) {
        return {ErrorKind::MissingSolutionTemplate, "Missing solution template file: " + path};
    }
    static GeneratorError missing_manifest(const std::string& path) {
        return {ErrorKind::MissingManifest, "Missing manifest: " + path};
    }
    static GeneratorError invalid_manifest(const std::string& path, const std::string& detail) {
        return {ErrorKind::InvalidManifest, "Invalid manifest JSON: " + path + " (" + detail + ")"};
    }
    static GeneratorError no_module_declarations(const std::string& root) {
        return {ErrorKind::NoModuleDeclarations, "No .asmdef files found under: " + root};
    }
    static GeneratorError no_solution_found(const std::string& root) {
        return {ErrorKind::NoSolutionFound, "No .sln file found in: " + root};
    }
    static GeneratorError no_projects_in_solution(const std::string& path) {
        return {ErrorKind::NoProjectsInSolution, "No C# projects found in solution: " + path};
    }
    static GeneratorError invalid_descriptor(const std::string& path, const std::string& detail) {
        return {ErrorKind::InvalidDescriptor, "Failed to parse descriptor " + path + ": " + detail};
    }
    static GeneratorError write_failed(const std::string& path) {
        return {ErrorKind::WriteFailed, "Failed to write " + path};
    }

private:
    ErrorKind kind_;
};

} // namespace slngen
