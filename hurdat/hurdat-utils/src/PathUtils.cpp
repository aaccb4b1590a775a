// Ticket: 0004_track_pipeline

#include "hurdat-utils/src/PathUtils.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace hurdat_utils
{

std::filesystem::path executableDirectory()
{
  // Linux exposes the running image as a symlink in procfs
  std::error_code ec;
  const std::filesystem::path executable =
    std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec)
  {
    throw std::runtime_error("Failed to resolve /proc/self/exe: " +
                             ec.message());
  }
  return executable.parent_path();
}

std::filesystem::path resolveDataPath(const std::string& path)
{
  const std::filesystem::path given{path};
  if (given.is_absolute())
  {
    return given.lexically_normal();
  }

  std::error_code ec;
  if (std::filesystem::exists(given, ec))
  {
    return std::filesystem::absolute(given).lexically_normal();
  }

  // The result may not exist; the caller reports open failures
  return (executableDirectory() / given).lexically_normal();
}

}  // namespace hurdat_utils
