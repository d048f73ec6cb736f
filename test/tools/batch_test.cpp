//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/tools/batch.h"

#include <atomic>
#include <filesystem>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

#include <gtest/gtest.h>

#include "nmrbc/algo/noe.h"
#include "nmrbc/algo/result.h"
#include "nmrbc/core/error.h"
#include "nmrbc/core/structure.h"
#include "nmrbc/fmt/pdb.h"
#include "nmrbc/fmt/template.h"

namespace nmrbc {
namespace {
namespace fs = std::filesystem;

const fs::path kTripeptide = "test/test_data/tripeptide.pdb";
const fs::path kMalformed = "test/test_data/malformed.pdb";

NoeTemplate read_test_template() {
  absl::StatusOr<NoeTemplate> tmpl =
      read_noe_template("test/test_data/noe_template.csv");
  EXPECT_TRUE(tmpl.ok()) << tmpl.status();
  return tmpl.ok() ? *std::move(tmpl) : NoeTemplate();
}

TEST(BatchTest, FailedStructureIsIsolated) {
  const NoeTemplate tmpl = read_test_template();
  ASSERT_EQ(tmpl.size(), 4);

  for (int ncores: { 1, 2, 4 }) {
    std::vector<StructureOutcome> outcomes = run_noe_batch(
        tmpl, { kTripeptide, kMalformed, kTripeptide }, { ncores });
    ASSERT_EQ(outcomes.size(), 3) << "ncores=" << ncores;

    EXPECT_EQ(outcomes[0].path, kTripeptide);
    EXPECT_EQ(outcomes[0].id, "tripeptide");
    ASSERT_TRUE(outcomes[0].result.ok()) << outcomes[0].result.status();

    EXPECT_EQ(outcomes[1].id, "malformed");
    ASSERT_FALSE(outcomes[1].result.ok());
    EXPECT_EQ(error_kind(outcomes[1].result.status()),
              ErrorKind::kStructureParse);

    ASSERT_TRUE(outcomes[2].result.ok()) << outcomes[2].result.status();
    EXPECT_EQ(outcomes[2].result->values().size(), 4);

    // Identical to the serial computation
    absl::StatusOr<Structure> structure = parse_structure(kTripeptide);
    ASSERT_TRUE(structure.ok());
    const BackCalcResult expected = compute_noe(tmpl, *structure);
    for (int i = 0; i < expected.size(); ++i) {
      if (BackCalcResult::is_failed(expected[i])) {
        EXPECT_TRUE(BackCalcResult::is_failed((*outcomes[0].result)[i]));
      } else {
        EXPECT_DOUBLE_EQ((*outcomes[0].result)[i], expected[i]);
      }
    }
    EXPECT_EQ(outcomes[0].result->failures().size(), 1);
  }
}

TEST(BatchTest, PreservesInputOrder) {
  std::vector<fs::path> paths;
  for (int i = 0; i < 16; ++i)
    paths.push_back(i % 3 == 1 ? kMalformed : kTripeptide);

  std::atomic<int> calls = 0;
  std::vector<StructureOutcome> outcomes = run_batch(
      paths, { 4 }, [&calls](const Structure &structure) {
        ++calls;
        BackCalcResult result(1);
        result.add_value(structure.size());
        return result;
      });

  ASSERT_EQ(outcomes.size(), paths.size());
  int nok = 0;
  for (int i = 0; i < outcomes.size(); ++i) {
    EXPECT_EQ(outcomes[i].path, paths[i]);
    EXPECT_EQ(outcomes[i].result.ok(), i % 3 != 1) << i;
    if (outcomes[i].result.ok()) {
      EXPECT_EQ((*outcomes[i].result)[0], 23);
      ++nok;
    }
  }
  EXPECT_EQ(calls.load(), nok);
}

TEST(BatchTest, Empty) {
  std::vector<StructureOutcome> outcomes =
      run_noe_batch(read_test_template(), {}, BatchOptions());
  EXPECT_TRUE(outcomes.empty());
}

TEST(BatchTest, InvalidCoreCount) {
  std::vector<StructureOutcome> outcomes =
      run_noe_batch(read_test_template(), { kTripeptide }, { 0 });
  ASSERT_EQ(outcomes.size(), 1);
  EXPECT_TRUE(outcomes[0].result.ok());
}
}  // namespace
}  // namespace nmrbc
