#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

namespace bpfs::log {

/// Initialize logging with a console sink and, when log_file is non-empty,
/// a file sink. Verbose enables debug-level events.
void init(const std::filesystem::path& log_file = {}, bool verbose = false);

/// Flush and shutdown logging.
void shutdown();

} // namespace bpfs::log
