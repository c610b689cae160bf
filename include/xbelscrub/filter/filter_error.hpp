// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xbelscrub, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace xbelscrub
{
namespace filter
{
/// \brief Error codes for a failed filter run. Every code is fatal for the run.
enum class FilterErrorCode
{
  MissingOrAmbiguousHref,
  UnrecognizedScheme,
  MalformedXml,
  StructuralAssumptionViolated,
  OutputFailure
};

inline const char *toString(FilterErrorCode code)
{
  switch (code)
  {
  case FilterErrorCode::MissingOrAmbiguousHref:
    return "MissingOrAmbiguousHref";
  case FilterErrorCode::UnrecognizedScheme:
    return "UnrecognizedScheme";
  case FilterErrorCode::MalformedXml:
    return "MalformedXml";
  case FilterErrorCode::StructuralAssumptionViolated:
    return "StructuralAssumptionViolated";
  case FilterErrorCode::OutputFailure:
    return "OutputFailure";
  }
  return "Unknown";
}

/// \brief Exception thrown by the stream filter and the URI classifier.
///
/// detail() holds the offending value where one exists (the decoded href for
/// UnrecognizedScheme, the rejected text for StructuralAssumptionViolated).
class FilterError : public std::runtime_error
{
public:
  FilterError(FilterErrorCode code, const std::string &message, std::string detail = {})
      : std::runtime_error(std::string(toString(code)) + ": " + message), _code(code),
        _detail(std::move(detail))
  {
  }

  FilterErrorCode code() const noexcept { return _code; }
  const std::string &detail() const noexcept { return _detail; }

private:
  FilterErrorCode _code;
  std::string _detail;
};

} // namespace filter
} // namespace xbelscrub
