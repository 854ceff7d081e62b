#pragma once

#include <CLI/CLI.hpp>


namespace podkit::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal", "off"});

} // namespace podkit::examples::cli
