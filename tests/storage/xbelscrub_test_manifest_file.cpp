// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xbelscrub, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>
#include <regex>
#include <system_error>

using namespace xbelscrub::test;
using xbelscrub::filter::FilterError;
using xbelscrub::filter::FilterErrorCode;
using xbelscrub::filter::PathPrefixSet;
using xbelscrub::filter::StreamFilter;
using xbelscrub::storage::ManifestFile;

TEST_CASE("Manifest rewrite replaces the file", "[storage][manifest]")
{
  initializeTestLogging();
  TempDirManager dir;
  auto path = dir.filePath("recently-used.xbel");
  writeFile(path, manifest({"file:///media/usb/a.txt", "file:///home/me/b.txt"}));

  StreamFilter filter(PathPrefixSet({"/media/usb"}));
  auto stats = ManifestFile(path).rewrite(filter);

  REQUIRE(readFile(path) == manifest({"file:///home/me/b.txt"}));
  REQUIRE(stats.removed == 1);
  REQUIRE(stats.retained == 1);
  REQUIRE(dir.entries() == std::vector<std::string>{"recently-used.xbel"});
}

TEST_CASE("Manifest rewrite keeps file permissions", "[storage][manifest]")
{
  initializeTestLogging();
  TempDirManager dir;
  auto path = dir.filePath("recently-used.xbel");
  writeFile(path, manifest({"file:///home/me/b.txt"}));
  std::filesystem::permissions(path, std::filesystem::perms::owner_read |
                                       std::filesystem::perms::owner_write);

  ManifestFile(path).rewrite(StreamFilter(PathPrefixSet({"/tmp"})));

  auto perms = std::filesystem::status(path).permissions() & std::filesystem::perms::all;
  REQUIRE(perms == (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write));
}

TEST_CASE("Manifest is untouched when filtering fails", "[storage][manifest][errors]")
{
  initializeTestLogging();
  TempDirManager dir;
  auto path = dir.filePath("recently-used.xbel");

  SECTION("Unrecognized scheme")
  {
    std::string original = manifest({"file:///media/usb/a.txt", "http://example.com/"});
    writeFile(path, original);
    try
    {
      ManifestFile(path).rewrite(StreamFilter(PathPrefixSet({"/media/usb"})));
      FAIL("expected FilterError");
    }
    catch (const FilterError &e)
    {
      REQUIRE(e.code() == FilterErrorCode::UnrecognizedScheme);
    }
    REQUIRE(readFile(path) == original);
    REQUIRE(dir.entries() == std::vector<std::string>{"recently-used.xbel"});
  }

  SECTION("Malformed document")
  {
    std::string original = "<xbel><bookmark href=\"file:///a\"></xbel>";
    writeFile(path, original);
    REQUIRE_THROWS_AS(ManifestFile(path).rewrite(StreamFilter(PathPrefixSet())), FilterError);
    REQUIRE(readFile(path) == original);
    REQUIRE(dir.entries().size() == 1);
  }

  SECTION("Missing manifest")
  {
    REQUIRE_THROWS_AS(ManifestFile(path).rewrite(StreamFilter(PathPrefixSet())),
                      std::runtime_error);
    REQUIRE(dir.entries().empty());
  }
}

TEST_CASE("Manifest rewrite refuses an existing temporary file", "[storage][manifest][errors]")
{
  initializeTestLogging();
  TempDirManager dir;
  auto path = dir.filePath("recently-used.xbel");
  std::string original = manifest({"file:///media/usb/a.txt"});
  writeFile(path, original);

  ManifestFile file(path);
  auto when = std::chrono::system_clock::now();
  writeFile(file.temporaryPath(when), "occupied");

  REQUIRE_THROWS_AS(file.rewrite(StreamFilter(PathPrefixSet({"/media/usb"})), when),
                    std::system_error);
  REQUIRE(readFile(path) == original);
  REQUIRE(readFile(file.temporaryPath(when)) == "occupied");
}

TEST_CASE("Temporary file name carries an RFC 3339 timestamp", "[storage][manifest][naming]")
{
  ManifestFile file("/data/recently-used.xbel");
  std::string tmp = file.temporaryPath(std::chrono::system_clock::now()).string();
  std::regex pattern(
    R"(/data/recently-used\.xbel-\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}[+-]\d{2}:\d{2})");
  INFO(tmp);
  REQUIRE(std::regex_match(tmp, pattern));
  REQUIRE(file.path().string() == "/data/recently-used.xbel");
}

TEST_CASE("Scrub runs against the configured manifest", "[storage][scrub]")
{
  initializeTestLogging();
  TempDirManager dir;
  auto path = dir.filePath("recently-used.xbel");
  std::string original =
    manifest({"file:///media/usb/a.txt", "trash:///b.txt", "file:///home/me/c.txt"});
  writeFile(path, original);

  xbelscrub::Config config;
  config.inputFile = path.string();
  config.prefixes = {"/media/usb", "/home/me"};

  SECTION("Dry run prints and leaves the file alone")
  {
    config.dryRun = true;
    std::ostringstream out;
    auto stats = xbelscrub::scrub(config, out);
    REQUIRE(out.str() ==
            ManifestHeader + bookmarkEntry("trash:///b.txt") + "  " + ManifestFooter);
    REQUIRE(stats.removed == 2);
    REQUIRE(readFile(path) == original);
  }

  SECTION("Normal run rewrites in place")
  {
    std::ostringstream out;
    auto stats = xbelscrub::scrub(config, out);
    REQUIRE(out.str().empty());
    REQUIRE(stats.bookmarks == 3);
    REQUIRE(readFile(path) ==
            ManifestHeader + bookmarkEntry("trash:///b.txt") + "  " + ManifestFooter);
  }

  SECTION("Default location follows XDG_DATA_HOME")
  {
    ::setenv("XDG_DATA_HOME", dir.path().c_str(), 1);
    config.inputFile.reset();
    config.prefixes = {"/media/usb"};
    std::ostringstream out;
    xbelscrub::scrub(config, out);
    ::unsetenv("XDG_DATA_HOME");
    REQUIRE(readFile(path) == manifest({"trash:///b.txt", "file:///home/me/c.txt"}));
  }

  SECTION("Dry run on a missing manifest")
  {
    config.dryRun = true;
    config.inputFile = dir.filePath("absent.xbel").string();
    std::ostringstream out;
    REQUIRE_THROWS_AS(xbelscrub::scrub(config, out), std::runtime_error);
  }
}
