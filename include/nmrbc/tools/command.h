//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_TOOLS_COMMAND_H_
#define NMRBC_TOOLS_COMMAND_H_

//! @cond
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
//! @endcond

#include "nmrbc/tools/batch.h"

namespace nmrbc {
/**
 * @brief Raw command-line flag values, before defaults are applied.
 */
struct CommandFlags {
  std::string exp_file;
  std::string output;
  std::string tmpdir;
  int ncores = 1;
};

/**
 * @brief Resolved options of a back-calculation subcommand.
 */
struct CommandOptions {
  std::filesystem::path exp_file;
  std::filesystem::path output;
  std::filesystem::path tmpdir;
  BatchOptions batch;
};

/**
 * @brief Apply the subcommand defaults to the flag values.
 *
 * @param cmd The subcommand name.
 * @param flags The flag values.
 * @return The options, or a kInvalidArgument error if the template file is
 *         not given.
 *
 * The output defaults to `<cmd>.json` and the temporary directory to
 * `__tmp<cmd>__`, both relative to the working directory. A core count below 1
 * is replaced by 1.
 */
extern absl::StatusOr<CommandOptions>
resolve_options(std::string_view cmd, const CommandFlags &flags);

/**
 * @brief Run the NOE pipeline: read the template, collect the structures,
 *        back-calculate them, and write the output document.
 *
 * @return Ok, or the first fatal error. Failed structures and records are not
 *         fatal.
 */
extern absl::Status run_noe_command(const CommandOptions &options,
                                    const std::vector<std::string> &args);

/**
 * @brief Run the J-coupling pipeline. Same steps as run_noe_command().
 */
extern absl::Status run_jc_command(const CommandOptions &options,
                                   const std::vector<std::string> &args);

using CommandFn = absl::Status (*)(const CommandOptions &,
                                   const std::vector<std::string> &);

struct Subcommand {
  std::string_view name;
  CommandFn func;
  std::string_view desc;
};

/**
 * @brief Find a subcommand by name.
 * @return The subcommand, or nullptr if there is none with the name.
 */
extern const Subcommand *find_subcommand(std::string_view name);

extern std::string usage_message();

/**
 * @brief Run a subcommand end to end.
 *
 * @return EXIT_SUCCESS, or EXIT_FAILURE on an unknown subcommand or a fatal
 *         error. Errors are logged.
 */
extern int run_command(std::string_view cmd, const CommandFlags &flags,
                       const std::vector<std::string> &args);
}  // namespace nmrbc

#endif /* NMRBC_TOOLS_COMMAND_H_ */
