#pragma once

#include <filesystem>
#include <string>

namespace forksim {
namespace util {

/**
 * Atomic file output for report and graph exports
 *
 * Pattern:
 * 1. Write to temporary file (.tmp suffix)
 * 2. fsync() the file
 * 3. Atomic rename over the target
 *
 * A reader (e.g. a Graphviz watcher) never sees a half-written file.
 */

/**
 * Write string to file atomically
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

} // namespace util
} // namespace forksim
