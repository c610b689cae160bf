#pragma once
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace xbelscrub {
namespace util {

  /// \brief Base directory for user data files: $XDG_DATA_HOME when set to an absolute
  /// path, otherwise $HOME/.local/share.
  /// \throws std::runtime_error when neither variable is usable
  inline std::filesystem::path dataHome()
  {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg && std::filesystem::path(xdg).is_absolute())
    {
      return std::filesystem::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home)
    {
      return std::filesystem::path(home) / ".local" / "share";
    }
    throw std::runtime_error("Cannot determine user data directory: neither XDG_DATA_HOME nor HOME is set");
  }

  /// \brief Location of the desktop "recently used" manifest
  inline std::filesystem::path defaultManifestPath()
  {
    return dataHome() / "recently-used.xbel";
  }

  /// \brief RFC 3339 local timestamp with microseconds and a numeric offset,
  /// e.g. 2024-05-01T10:00:00.123456+02:00
  inline std::string rfc3339Timestamp(std::chrono::system_clock::time_point when)
  {
    auto t = std::chrono::system_clock::to_time_t(when);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(when.time_since_epoch()) % 1000000;
    if (micros.count() < 0)
    {
      micros += std::chrono::microseconds(1000000);
    }
    std::tm local{};
    localtime_r(&t, &local);

    char offset[8] = {0};
    std::strftime(offset, sizeof(offset), "%z", &local);
    std::string zone(offset);
    if (zone.size() == 5)
    {
      zone.insert(3, ":");
    }

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(6)
        << micros.count() << zone;
    return oss.str();
  }

  /// \brief Remove all files in the current directory that match the given
  /// prefix
  inline void removeFilesMatchingPrefix(const std::string& prefix)
  {
    for (const auto& file : std::filesystem::directory_iterator("."))
    {
      if (file.path().filename().string().rfind(prefix, 0) == 0)
      {
        std::filesystem::remove(file.path());
      }
    }
  }

} // namespace util
} // namespace xbelscrub
