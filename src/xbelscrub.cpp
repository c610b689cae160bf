// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xbelscrub, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <xbelscrub/xbelscrub.hpp>
#include <cstdlib>
#include <iostream>

namespace
{
  /// \brief Bad command line; reported with exit status 2.
  class UsageError : public std::runtime_error
  {
  public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
  };

  /// \brief Print help message
  void printHelp()
  {
    std::cout
        << "Usage: xbelscrub [options] <prefix>...\n"
        << "Remove entries under the given path prefixes from the recently used files list.\n"
        << "\n"
        << "  -h, --help                 Show this help message\n"
        << "  -c, --config <file>        Configuration file path\n"
        << "  -i, --input <file>         Manifest to rewrite (default: "
           "$XDG_DATA_HOME/recently-used.xbel)\n"
        << "  -l, --log-level <level>    Log level (trace, debug, info, "
           "warning, error, fatal)\n"
        << "  -f, --log-file <file>      Log file base path (default: stderr)\n"
        << "  -n, --dry-run              Print the filtered manifest instead of "
           "replacing it\n"
        << "      --                     Treat all following arguments as prefixes\n";
  }

  /// \brief Parse command-line arguments into config. Returns false when help was shown.
  bool parseCliArgs(int argc, char** argv, xbelscrub::Config& config)
  {
    bool optionsDone = false;
    for (int i = 1; i < argc; ++i)
    {
      std::string arg = argv[i];
      const bool hasValue = i + 1 < argc;
      if (optionsDone || arg.empty() || arg[0] != '-')
      {
        config.prefixes.push_back(arg);
      }
      else if (arg == "--")
      {
        optionsDone = true;
      }
      else if (arg == "-h" || arg == "--help")
      {
        printHelp();
        return false;
      }
      else if ((arg == "-c" || arg == "--config") && hasValue)
      {
        config.configFile = argv[++i];
      }
      else if ((arg == "-i" || arg == "--input") && hasValue)
      {
        config.inputFile = argv[++i];
      }
      else if ((arg == "-l" || arg == "--log-level") && hasValue)
      {
        config.log.level = argv[++i];
      }
      else if ((arg == "-f" || arg == "--log-file") && hasValue)
      {
        config.log.file = argv[++i];
      }
      else if (arg == "-n" || arg == "--dry-run")
      {
        config.dryRun = true;
      }
      else
      {
        throw UsageError("Unknown option or missing value: " + arg);
      }
    }
    return true;
  }
} // namespace

int main(int argc, char** argv)
{
  xbelscrub::Config config;
  try
  {
    if (!parseCliArgs(argc, argv, config))
    {
      return EXIT_SUCCESS;
    }
    if (config.configFile)
    {
      xbelscrub::core::ConfigLoader loader(*config.configFile);
      xbelscrub::mergeConfigFile(config, loader);
    }
    xbelscrub::initLogging(config);
  }
  catch (const UsageError& ex)
  {
    std::cerr << "xbelscrub: " << ex.what() << "\n";
    printHelp();
    return 2;
  }
  catch (const std::exception& ex)
  {
    std::cerr << "xbelscrub: " << ex.what() << std::endl;
    return 2;
  }

  int status = EXIT_SUCCESS;
  try
  {
    xbelscrub::scrub(config, std::cout);
  }
  catch (const xbelscrub::filter::FilterError& ex)
  {
    XBELSCRUB_LOG_ERROR("Manifest left unchanged: " << ex.what());
    status = EXIT_FAILURE;
  }
  catch (const std::exception& ex)
  {
    XBELSCRUB_LOG_ERROR(ex.what());
    status = EXIT_FAILURE;
  }

  xbelscrub::core::Logger::shutdown();
  return status;
}
