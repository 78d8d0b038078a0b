#pragma once

#include <string>

/// Installs the process-wide spdlog logger: coloured stderr, plus a file
/// sink when `file` is set. Returns false on an unknown level or an
/// unwritable file; a stderr-only logger is installed either way.
bool init_logging(const std::string& level, const std::string& file = "");
