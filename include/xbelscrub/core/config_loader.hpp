// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xbelscrub, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xbelscrub/parsers/minimal_toml.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace xbelscrub
{
namespace core
{
/// \brief Loads and parses a TOML configuration file.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error when the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Reloads the configuration from disk. On failure the previous table is cleared,
  /// lastError() describes the problem and false is returned.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _lastError.clear();
      _loaded = true;
      return true;
    }
    catch (const std::exception &e)
    {
      _table = parsers::toml::table{};
      _lastError = e.what();
      _loaded = false;
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                               _lastError + ")");
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }
  const std::string &filename() const { return _filename; }
  const std::string &lastError() const { return _lastError; }

  /// \brief Gets the full configuration table.
  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings from the configuration.
  /// \return std::nullopt if the key is missing or not an array.
  /// \throws std::runtime_error if any element is not a string.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node || !node.is_array())
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *node.as_array())
    {
      if (auto *strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  std::string _lastError;
  bool _loaded{false};
};

} // namespace core
} // namespace xbelscrub
