#pragma once

#include "common/project_types.hpp"
#include <string>

namespace slngen {

// Load a project registry.
// Throws GeneratorError (MissingManifest / InvalidManifest).
GeneratorManifest load_manifest(const std::string& path);

// Registry as pretty-printed JSON with sorted keys and a trailing newline
std::string serialize_manifest(const GeneratorManifest& manifest);

} // namespace slngen
