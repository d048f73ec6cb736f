//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/tools/batch.h"

#include <algorithm>
#include <filesystem>
#include <utility>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/status/statusor.h>

#include "nmrbc/algo/jcoupling.h"
#include "nmrbc/algo/noe.h"
#include "nmrbc/algo/result.h"
#include "nmrbc/core/structure.h"
#include "nmrbc/fmt/pdb.h"
#include "nmrbc/fmt/template.h"

namespace nmrbc {
namespace {
StructureOutcome process_structure(const std::filesystem::path &path,
                                   BackCalcFn fn) {
  StructureOutcome outcome { path, path.stem().string(),
                             BackCalcResult() };

  absl::StatusOr<Structure> structure = parse_structure(path);
  if (!structure.ok()) {
    outcome.result = structure.status();
    return outcome;
  }

  BackCalcResult result = fn(*structure);
  for (const RecordFailure &failure: result.failures()) {
    ABSL_LOG(WARNING) << outcome.id << ": record " << failure.index
                      << " failed: " << failure.status.message();
  }

  outcome.result = std::move(result);
  return outcome;
}
}  // namespace

std::vector<StructureOutcome>
run_batch(const std::vector<std::filesystem::path> &paths,
          const BatchOptions &options, BackCalcFn fn) {
  const int n = static_cast<int>(paths.size());
  std::vector<StructureOutcome> outcomes(n);

  const int nworkers = std::max(1, std::min(options.ncores, n));
  ABSL_LOG(INFO) << "Back-calculating " << n << " structure(s) using "
                 << nworkers << " worker(s)";

#ifdef NMRBC_HAS_OPENMP
#pragma omp parallel for schedule(dynamic) num_threads(nworkers)
#endif
  for (int i = 0; i < n; ++i)
    outcomes[i] = process_structure(paths[i], fn);

  int nfailed = 0;
  for (const StructureOutcome &outcome: outcomes) {
    if (outcome.result.ok())
      continue;

    ++nfailed;
    ABSL_LOG(ERROR) << "Structure " << outcome.path.string()
                    << " failed: " << outcome.result.status().message();
  }

  ABSL_LOG_IF(WARNING, nfailed > 0)
      << nfailed << " of " << n << " structure(s) failed";
  return outcomes;
}

std::vector<StructureOutcome>
run_noe_batch(const NoeTemplate &tmpl,
              const std::vector<std::filesystem::path> &paths,
              const BatchOptions &options) {
  return run_batch(paths, options, [&tmpl](const Structure &structure) {
    return compute_noe(tmpl, structure);
  });
}

std::vector<StructureOutcome>
run_jc_batch(const JCouplingTemplate &tmpl,
             const std::vector<std::filesystem::path> &paths,
             const BatchOptions &options) {
  return run_batch(paths, options, [&tmpl](const Structure &structure) {
    return compute_jc(tmpl, structure);
  });
}
}  // namespace nmrbc
