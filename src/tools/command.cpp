//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/tools/command.h"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "nmrbc/fmt/template.h"
#include "nmrbc/tools/batch.h"
#include "nmrbc/tools/inputs.h"
#include "nmrbc/tools/output.h"

namespace nmrbc {
namespace {
absl::Status finish(const std::filesystem::path &output,
                    const std::string &doc, int nwritten, int ntotal) {
  absl::Status status = write_output_file(output, doc);
  if (!status.ok())
    return status;

  ABSL_LOG(INFO) << "Wrote " << nwritten << " of " << ntotal
                 << " structure(s) to " << output.string();
  return absl::OkStatus();
}

constexpr Subcommand kSubcommands[] = {
  { "noe", &run_noe_command, "back-calculate NOE distances" },
  { "jc", &run_jc_command, "back-calculate backbone 3J(HN,HA) couplings" },
};
}  // namespace

absl::StatusOr<CommandOptions> resolve_options(std::string_view cmd,
                                               const CommandFlags &flags) {
  CommandOptions options;

  if (flags.exp_file.empty())
    return absl::InvalidArgumentError("--exp_file is required");
  options.exp_file = flags.exp_file;

  options.output = flags.output.empty() ? absl::StrCat(cmd, ".json")
                                        : flags.output;
  options.tmpdir = flags.tmpdir.empty() ? absl::StrCat("__tmp", cmd, "__")
                                        : flags.tmpdir;

  options.batch.ncores = flags.ncores;
  if (options.batch.ncores < 1) {
    ABSL_LOG(WARNING) << "--ncores=" << flags.ncores << " is invalid; using 1";
    options.batch.ncores = 1;
  }

  return options;
}

absl::Status run_noe_command(const CommandOptions &options,
                             const std::vector<std::string> &args) {
  absl::StatusOr<NoeTemplate> tmpl = read_noe_template(options.exp_file);
  if (!tmpl.ok())
    return tmpl.status();

  absl::StatusOr<StructureInputs> inputs =
      collect_structures(args, options.tmpdir);
  if (!inputs.ok())
    return inputs.status();

  std::vector<StructureOutcome> outcomes =
      run_noe_batch(*tmpl, inputs->paths, options.batch);

  std::string doc;
  int nwritten = write_noe_json(doc, *tmpl, outcomes);
  return finish(options.output, doc, nwritten,
                static_cast<int>(outcomes.size()));
}

absl::Status run_jc_command(const CommandOptions &options,
                            const std::vector<std::string> &args) {
  absl::StatusOr<JCouplingTemplate> tmpl = read_jc_template(options.exp_file);
  if (!tmpl.ok())
    return tmpl.status();

  absl::StatusOr<StructureInputs> inputs =
      collect_structures(args, options.tmpdir);
  if (!inputs.ok())
    return inputs.status();

  std::vector<StructureOutcome> outcomes =
      run_jc_batch(*tmpl, inputs->paths, options.batch);

  std::string doc;
  int nwritten = write_jc_json(doc, *tmpl, outcomes);
  return finish(options.output, doc, nwritten,
                static_cast<int>(outcomes.size()));
}

const Subcommand *find_subcommand(std::string_view name) {
  for (const Subcommand &sub: kSubcommands) {
    if (sub.name == name)
      return &sub;
  }
  return nullptr;
}

std::string usage_message() {
  std::string msg = "Usage: nmrbc <subcommand> <PDB-FILES...> "
                    "--exp_file=<CSV> [flags]\n\nSubcommands:\n";
  for (const Subcommand &sub: kSubcommands)
    absl::StrAppend(&msg, "  ", sub.name, "\t", sub.desc, "\n");
  return msg;
}

int run_command(std::string_view cmd, const CommandFlags &flags,
                const std::vector<std::string> &args) {
  const Subcommand *sub = find_subcommand(cmd);
  if (sub == nullptr) {
    ABSL_LOG(ERROR) << "Unknown subcommand: " << cmd;
    return EXIT_FAILURE;
  }

  absl::StatusOr<CommandOptions> options = resolve_options(cmd, flags);
  if (!options.ok()) {
    ABSL_LOG(ERROR) << options.status().message();
    return EXIT_FAILURE;
  }

  absl::Status status = sub->func(*options, args);
  if (!status.ok()) {
    ABSL_LOG(ERROR) << status.message();
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
}  // namespace nmrbc
