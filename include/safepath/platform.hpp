#pragma once

#include <optional>
#include <string>

namespace safepath {

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// ============================================================================
// Files
// ============================================================================

// Read a whole file, nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

} // namespace safepath
