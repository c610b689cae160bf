// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xbelscrub, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "filter/filter_error.hpp"
#include "filter/stream_filter.hpp"
#include "filter/uri_classifier.hpp"
#include "parsers/minimal_toml.hpp"
#include "parsers/xml.hpp"
#include "storage/manifest_file.hpp"
#include "util/filesystem.hpp"
#include "util/utf8.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace xbelscrub
{

/// \brief Settings for one invocation, merged from the command line and an optional TOML
/// file. Command-line values win; prefixes from both sources are combined.
struct Config
{
  std::vector<std::string> prefixes;
  std::optional<std::string> configFile;
  std::optional<std::string> inputFile;
  bool dryRun{false};

  struct LogConfig
  {
    std::optional<std::string> level;
    std::optional<std::string> file;
    std::optional<std::string> format;
  } log;
};

/// \brief Fill unset fields of config from a loaded configuration file.
///
/// Recognized keys: filter.prefixes, input.file, log.level, log.file, log.format.
/// Prefixes from the file are placed before those already in config.
inline void mergeConfigFile(Config &config, const core::ConfigLoader &loader)
{
  if (auto prefixes = loader.getStringArray("filter.prefixes"))
  {
    prefixes->insert(prefixes->end(), config.prefixes.begin(), config.prefixes.end());
    config.prefixes = std::move(*prefixes);
  }
  if (!config.inputFile.has_value())
  {
    config.inputFile = loader.getString("input.file");
  }
  if (!config.log.level.has_value())
  {
    config.log.level = loader.getString("log.level");
  }
  if (!config.log.file.has_value())
  {
    config.log.file = loader.getString("log.file");
  }
  if (!config.log.format.has_value())
  {
    config.log.format = loader.getString("log.format");
  }
}

/// \brief Apply the log settings of config to the global logger.
/// \throws std::runtime_error for an unknown level name.
inline void initLogging(const Config &config)
{
  core::Logger::Level level = core::Logger::Level::Info;
  if (config.log.level.has_value())
  {
    auto parsed = core::Logger::levelFromString(*config.log.level);
    if (!parsed)
    {
      throw std::runtime_error("Invalid log level: " + *config.log.level);
    }
    level = *parsed;
  }
  core::Logger::init(level, config.log.file.value_or(""));
  if (config.log.format.has_value())
  {
    core::Logger::setLogFormat(*config.log.format);
  }
}

/// \brief Run one scrub as described by config.
///
/// In dry-run mode the filtered manifest is written to dryRunOut and the file is left
/// alone; otherwise the manifest is replaced in place.
inline filter::FilterStats scrub(const Config &config, std::ostream &dryRunOut)
{
  std::filesystem::path manifest =
    config.inputFile ? std::filesystem::path(*config.inputFile) : util::defaultManifestPath();

  for (const auto &prefix : config.prefixes)
  {
    if (prefix.empty())
    {
      XBELSCRUB_LOG_WARN("Empty prefix matches every local bookmark");
    }
  }

  filter::StreamFilter streamFilter{filter::PathPrefixSet(config.prefixes)};
  XBELSCRUB_LOG_INFO("Scrubbing " << manifest.string() << " with " << config.prefixes.size()
                                  << " prefix(es)" << (config.dryRun ? " (dry run)" : ""));

  filter::FilterStats stats;
  if (config.dryRun)
  {
    std::ifstream in(manifest, std::ios::binary);
    if (!in.is_open())
    {
      throw std::runtime_error("Cannot open manifest: " + manifest.string());
    }
    stats = streamFilter.run(in, dryRunOut);
  }
  else
  {
    stats = storage::ManifestFile(manifest).rewrite(streamFilter);
  }

  XBELSCRUB_LOG_INFO("Removed " << stats.removed << " of " << stats.bookmarks << " bookmarks");
  return stats;
}

} // namespace xbelscrub
