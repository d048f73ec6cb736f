//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/initialize.h>

#include "nmrbc/tools/command.h"

ABSL_FLAG(std::string, exp_file, "",
          "Experimental template CSV file. Required.");
ABSL_FLAG(std::string, output, "",
          "Output JSON file. Defaults to <subcommand>.json in the current "
          "directory.");
ABSL_FLAG(int, ncores, 1, "Number of structures processed concurrently.");
ABSL_FLAG(std::string, tmpdir, "",
          "Directory for extracted archive members. Must not exist. "
          "Defaults to __tmp<subcommand>__.");

int main(int argc, char *argv[]) {
  absl::SetProgramUsageMessage(nmrbc::usage_message());
  std::vector<char *> positional = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  if (positional.size() < 2) {
    std::cerr << nmrbc::usage_message();
    return EXIT_FAILURE;
  }

  const std::string_view cmd = positional[1];
  if (nmrbc::find_subcommand(cmd) == nullptr) {
    std::cerr << "Unknown subcommand: " << cmd << "\n\n"
              << nmrbc::usage_message();
    return EXIT_FAILURE;
  }

  nmrbc::CommandFlags flags;
  flags.exp_file = absl::GetFlag(FLAGS_exp_file);
  flags.output = absl::GetFlag(FLAGS_output);
  flags.tmpdir = absl::GetFlag(FLAGS_tmpdir);
  flags.ncores = absl::GetFlag(FLAGS_ncores);

  std::vector<std::string> args(positional.begin() + 2, positional.end());
  return nmrbc::run_command(cmd, flags, args);
}
