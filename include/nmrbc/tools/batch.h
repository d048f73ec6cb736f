//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_TOOLS_BATCH_H_
#define NMRBC_TOOLS_BATCH_H_

//! @cond
#include <filesystem>
#include <string>
#include <vector>

#include <absl/functional/function_ref.h>
#include <absl/status/statusor.h>
//! @endcond

#include "nmrbc/algo/result.h"
#include "nmrbc/core/structure.h"
#include "nmrbc/fmt/template.h"

namespace nmrbc {
struct BatchOptions {
  /// Number of structures processed concurrently. Values below 1 are treated
  /// as 1.
  int ncores = 1;
};

/**
 * @brief The outcome of back-calculating a single structure.
 */
struct StructureOutcome {
  std::filesystem::path path;
  /// The structure identifier used as the output key (the file stem).
  std::string id;
  /// The back-calculated values, or the structure-level error.
  absl::StatusOr<BackCalcResult> result;
};

using BackCalcFn = absl::FunctionRef<BackCalcResult(const Structure &)>;

/**
 * @brief Back-calculate every structure in parallel.
 *
 * @param paths The structure files, in output order.
 * @param options The batch options.
 * @param fn The back-calculation applied to every successfully parsed
 *        structure. Called concurrently from multiple threads; must not
 *        mutate shared state.
 * @return One outcome per path, in the order of \p paths. A structure that
 *         fails to parse is reported in its own outcome and does not affect
 *         the others.
 */
extern std::vector<StructureOutcome>
run_batch(const std::vector<std::filesystem::path> &paths,
          const BatchOptions &options, BackCalcFn fn);

extern std::vector<StructureOutcome>
run_noe_batch(const NoeTemplate &tmpl,
              const std::vector<std::filesystem::path> &paths,
              const BatchOptions &options);

extern std::vector<StructureOutcome>
run_jc_batch(const JCouplingTemplate &tmpl,
             const std::vector<std::filesystem::path> &paths,
             const BatchOptions &options);
}  // namespace nmrbc

#endif /* NMRBC_TOOLS_BATCH_H_ */
