#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace diagram_model {

// Shared engine logger ("diagram_forge"), writing to stderr so that a document
// printed on stdout stays clean. Falls back to spdlog's default logger.
std::shared_ptr<spdlog::logger> engine_logger();

// Mirror engine log output into a file (truncated on open).
// Returns false if the file sink could not be created.
bool attach_log_file(const std::string& path);

} // namespace diagram_model
