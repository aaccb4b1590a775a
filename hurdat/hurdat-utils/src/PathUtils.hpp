// Ticket: 0004_track_pipeline

#ifndef HURDAT_UTILS_PATH_UTILS_HPP
#define HURDAT_UTILS_PATH_UTILS_HPP

#include <filesystem>
#include <string>

namespace hurdat_utils
{

/**
 * Directory containing the running executable, read from /proc/self/exe.
 *
 * @throws std::runtime_error if the link cannot be read
 */
std::filesystem::path executableDirectory();

/**
 * Resolve a data file path given on the command line or in a default list.
 *
 * Absolute paths and relative paths that exist from the current working
 * directory are returned as given (normalized). Anything else is taken
 * relative to the directory containing the executable, so the default
 * "resources/..." files are found next to an installed binary.
 *
 * @param path Path string as supplied by the user
 * @return A normalized path; existence is not guaranteed
 *
 * Example:
 *   Executable at /opt/hurdat/bin/hurdat-exe, cwd /home/user
 *   "resources/hurdat2.txt"  -> /opt/hurdat/bin/resources/hurdat2.txt
 *   "/data/hurdat2.txt"      -> /data/hurdat2.txt
 */
std::filesystem::path resolveDataPath(const std::string& path);

}  // namespace hurdat_utils

#endif  // HURDAT_UTILS_PATH_UTILS_HPP
