// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xbelscrub, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xbelscrub/core/logger.hpp>
#include <xbelscrub/filter/stream_filter.hpp>
#include <xbelscrub/util/filesystem.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace xbelscrub
{
namespace storage
{

/// \brief Rewrites a manifest file in place through a filter.
///
/// The filtered document is written to a sibling file named
/// "<manifest>-<RFC 3339 timestamp>" that must not already exist. Only a fully written
/// temporary file is renamed over the manifest; on any failure it is removed and the
/// manifest is left untouched.
class ManifestFile
{
public:
  explicit ManifestFile(std::filesystem::path path) : _path(std::move(path)) {}

  const std::filesystem::path &path() const { return _path; }

  /// \brief Name of the temporary output for a rewrite started at the given time.
  std::filesystem::path temporaryPath(std::chrono::system_clock::time_point when) const
  {
    std::filesystem::path tmp = _path;
    tmp += "-" + util::rfc3339Timestamp(when);
    return tmp;
  }

  /// \brief Filter the manifest and atomically replace it with the result.
  /// \throws filter::FilterError when filtering fails, std::runtime_error or
  /// std::filesystem::filesystem_error on I/O failures.
  filter::FilterStats rewrite(const filter::StreamFilter &filter) const
  {
    return rewrite(filter, std::chrono::system_clock::now());
  }

  filter::FilterStats rewrite(const filter::StreamFilter &filter,
                              std::chrono::system_clock::time_point when) const
  {
    std::ifstream in(_path, std::ios::binary);
    if (!in.is_open())
    {
      throw std::runtime_error("Cannot open manifest: " + _path.string());
    }

    const std::filesystem::path tmp = temporaryPath(when);
    createExclusive(tmp);
    XBELSCRUB_LOG_DEBUG("Writing filtered manifest to " << tmp.string());

    filter::FilterStats stats;
    try
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out.is_open())
      {
        throw std::runtime_error("Cannot open temporary file: " + tmp.string());
      }
      stats = filter.run(in, out);
      out.close();
      if (out.fail())
      {
        throw std::runtime_error("Failed to close temporary file: " + tmp.string());
      }
      copyPermissions(tmp);
      std::filesystem::rename(tmp, _path);
    }
    catch (...)
    {
      discard(tmp);
      throw;
    }

    XBELSCRUB_LOG_DEBUG("Replaced " << _path.string());
    return stats;
  }

private:
  /// Create an empty file, failing if anything already exists at p.
  static void createExclusive(const std::filesystem::path &p)
  {
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
    if (fd < 0)
    {
      int err = errno;
      throw std::system_error(err, std::generic_category(),
                              "Cannot create temporary file " + p.string());
    }
    ::close(fd);
  }

  void copyPermissions(const std::filesystem::path &tmp) const
  {
    std::error_code ec;
    auto perms = std::filesystem::status(_path, ec).permissions();
    if (!ec)
    {
      std::filesystem::permissions(tmp, perms, ec);
    }
    if (ec)
    {
      XBELSCRUB_LOG_WARN("Could not copy permissions of " << _path.string() << ": "
                                                          << ec.message());
    }
  }

  static void discard(const std::filesystem::path &tmp)
  {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    if (ec)
    {
      XBELSCRUB_LOG_WARN("Could not remove temporary file " << tmp.string() << ": "
                                                            << ec.message());
    }
  }

  std::filesystem::path _path;
};

} // namespace storage
} // namespace xbelscrub
