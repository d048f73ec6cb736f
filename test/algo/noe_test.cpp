//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/algo/noe.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/strings/match.h>

#include <gtest/gtest.h>

#include "test_utils.h"
#include "nmrbc/algo/result.h"
#include "nmrbc/core/error.h"
#include "nmrbc/core/structure.h"
#include "nmrbc/eigen_config.h"
#include "nmrbc/fmt/pdb.h"
#include "nmrbc/fmt/template.h"

namespace nmrbc {
namespace {
Structure methyl_structure() {
  return Structure({
      { 1, "N", Vector3d(0, 0, -1) },
      { 1, "H", Vector3d(0, 0, 0) },
      { 1, "HA", Vector3d(0, 1, 0) },
      { 5, "N", Vector3d(4, 0, 0) },
      { 5, "H", Vector3d(5, 0, 0) },
      { 5, "HA", Vector3d(3, 0, 0) },
      { 5, "HB2", Vector3d(1, 0, 0) },
      { 5, "HB3", Vector3d(2, 0, 0) },
      { 5, "HG", Vector3d(6, 0, 0) },
  });
}

NoePairRecord make_record(int res1, std::string atom1, bool ambig1, int res2,
                          std::string atom2, bool ambig2) {
  return { res1, std::move(atom1), ambig1, res2, std::move(atom2), ambig2 };
}

TEST(ResolveAtomsTest, Unambiguous) {
  Structure structure = methyl_structure();

  absl::StatusOr<CandidateAtomSet> atoms =
      resolve_atoms(structure, 5, "HG", false);
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  EXPECT_EQ(*atoms, CandidateAtomSet { 8 });

  atoms = resolve_atoms(structure, 1, "HA", true);
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  EXPECT_EQ(*atoms, CandidateAtomSet { 2 });
}

TEST(ResolveAtomsTest, UnambiguousTakesFirstSubstringMatch) {
  Structure structure = methyl_structure();

  absl::StatusOr<CandidateAtomSet> atoms =
      resolve_atoms(structure, 5, "HB", false);
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  EXPECT_EQ(*atoms, CandidateAtomSet { 6 });
}

TEST(ResolveAtomsTest, AmideProtonMatchesHeavyAtomListedFirst) {
  // Heavy atoms first, as in PDB files with explicit hydrogens
  Structure structure({
      { 7, "N", Vector3d(0, 0, 0), "TYR" },
      { 7, "CA", Vector3d(1, 0, 0), "TYR" },
      { 7, "C", Vector3d(2, 0, 0), "TYR" },
      { 7, "O", Vector3d(3, 0, 0), "TYR" },
      { 7, "CB", Vector3d(1, 1, 0), "TYR" },
      { 7, "CZ", Vector3d(1, 4, 0), "TYR" },
      { 7, "OH", Vector3d(1, 5, 0), "TYR" },
      { 7, "H", Vector3d(-1, 0, 0), "TYR" },
      { 8, "N", Vector3d(4, 0, 0), "ARG" },
      { 8, "NH1", Vector3d(4, 6, 0), "ARG" },
      { 8, "H", Vector3d(4, -1, 0), "ARG" },
  });

  absl::StatusOr<CandidateAtomSet> atoms =
      resolve_atoms(structure, 7, "H", false);
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  EXPECT_EQ(*atoms, CandidateAtomSet { 6 });
  EXPECT_EQ(structure[(*atoms)[0]].name(), "OH");

  atoms = resolve_atoms(structure, 8, "H", true);
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  EXPECT_EQ(*atoms, CandidateAtomSet { 9 });
  EXPECT_EQ(structure[(*atoms)[0]].name(), "NH1");
}

TEST(ResolveAtomsTest, AmideProtonIsSingleton) {
  Structure structure = methyl_structure();

  for (bool ambiguous: { false, true }) {
    absl::StatusOr<CandidateAtomSet> atoms =
        resolve_atoms(structure, 5, "H", ambiguous);
    ASSERT_TRUE(atoms.ok()) << atoms.status();
    EXPECT_EQ(*atoms, CandidateAtomSet { 4 }) << "ambiguous=" << ambiguous;
  }
}

TEST(ResolveAtomsTest, AmideProtonTakesFirstContaining) {
  // "H" is matched as a substring; the first atom of the residue wins
  Structure structure({
      { 2, "N", Vector3d(0, 0, 0) },
      { 2, "HA", Vector3d(1, 0, 0) },
      { 2, "H", Vector3d(2, 0, 0) },
  });

  absl::StatusOr<CandidateAtomSet> atoms =
      resolve_atoms(structure, 2, "H", true);
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  EXPECT_EQ(*atoms, CandidateAtomSet { 1 });
}

TEST(ResolveAtomsTest, AmbiguousPair) {
  Structure structure = methyl_structure();

  absl::StatusOr<CandidateAtomSet> atoms =
      resolve_atoms(structure, 5, "HB", true);
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  EXPECT_EQ(*atoms, (CandidateAtomSet { 6, 7 }));
}

TEST(ResolveAtomsTest, AmbiguousStopsAtTwo) {
  Structure structure({
      { 3, "HD11", Vector3d(0, 0, 0) },
      { 3, "HD12", Vector3d(1, 0, 0) },
      { 3, "HD13", Vector3d(2, 0, 0) },
  });

  absl::StatusOr<CandidateAtomSet> atoms =
      resolve_atoms(structure, 3, "HD1", true);
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  EXPECT_EQ(*atoms, (CandidateAtomSet { 0, 1 }));
}

TEST(ResolveAtomsTest, AmbiguousWithSingleMatch) {
  Structure structure = methyl_structure();

  absl::StatusOr<CandidateAtomSet> atoms =
      resolve_atoms(structure, 5, "HG", true);
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  EXPECT_EQ(*atoms, CandidateAtomSet { 8 });
}

TEST(ResolveAtomsTest, FileOrderNotContiguous) {
  Structure structure({
      { 4, "HB2", Vector3d(0, 0, 0) },
      { 7, "HB2", Vector3d(1, 0, 0) },
      { 4, "HB3", Vector3d(2, 0, 0) },
  });

  absl::StatusOr<CandidateAtomSet> atoms =
      resolve_atoms(structure, 4, "HB", true);
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  EXPECT_EQ(*atoms, (CandidateAtomSet { 0, 2 }));
}

TEST(ResolveAtomsTest, Errors) {
  Structure structure = methyl_structure();

  absl::StatusOr<CandidateAtomSet> atoms =
      resolve_atoms(structure, 9, "H", false);
  ASSERT_FALSE(atoms.ok());
  EXPECT_EQ(error_kind(atoms.status()), ErrorKind::kAtomResolution);
  EXPECT_TRUE(absl::StrContains(atoms.status().message(), "residue 9"));

  atoms = resolve_atoms(structure, 1, "HZ", true);
  ASSERT_FALSE(atoms.ok());
  EXPECT_EQ(error_kind(atoms.status()), ErrorKind::kAtomResolution);
  EXPECT_TRUE(absl::StrContains(atoms.status().message(), "HZ"));
}

TEST(AverageDistanceTest, SinglePair) {
  Structure structure({
      { 1, "H", Vector3d(1.5, -2, 0.25) },
      { 2, "H", Vector3d(-0.5, 3, 4) },
  });

  absl::StatusOr<double> dist =
      average_distance(structure, CandidateAtomSet { 0 }, CandidateAtomSet { 1 });
  ASSERT_TRUE(dist.ok()) << dist.status();
  EXPECT_NEAR(*dist, (structure[0].pos() - structure[1].pos()).norm(), 1e-12);
}

TEST(AverageDistanceTest, BiasedTowardShorter) {
  Structure structure = methyl_structure();

  absl::StatusOr<double> dist = average_distance(
      structure, CandidateAtomSet { 1 }, CandidateAtomSet { 6, 7 });
  ASSERT_TRUE(dist.ok()) << dist.status();

  const double expected = std::pow((1.0 + std::pow(2.0, -6)) / 2, -1.0 / 6);
  EXPECT_NEAR(*dist, expected, 1e-12);
  EXPECT_GT(*dist, 1.0);
  EXPECT_LT(*dist, 2.0);
  // Closer to the short distance than the arithmetic mean
  EXPECT_LT(*dist, 1.5);
}

TEST(AverageDistanceTest, Symmetric) {
  Structure structure = methyl_structure();

  absl::StatusOr<double> ab = average_distance(
      structure, CandidateAtomSet { 1, 2 }, CandidateAtomSet { 6, 7 });
  absl::StatusOr<double> ba = average_distance(
      structure, CandidateAtomSet { 6, 7 }, CandidateAtomSet { 1, 2 });
  ASSERT_TRUE(ab.ok() && ba.ok());
  EXPECT_NEAR(*ab, *ba, 1e-12);
}

TEST(AverageDistanceTest, ZeroDistance) {
  Structure structure({
      { 1, "H", Vector3d(1, 1, 1) },
      { 2, "H", Vector3d(1, 1, 1) },
  });

  absl::StatusOr<double> dist =
      average_distance(structure, CandidateAtomSet { 0 }, CandidateAtomSet { 1 });
  ASSERT_FALSE(dist.ok());
  EXPECT_EQ(error_kind(dist.status()), ErrorKind::kDegenerateGeometry);
}

TEST(ComputeNoeTest, SingleRestraint) {
  Structure structure({
      { 1, "H", Vector3d(0, 0, 0) },
      { 5, "HA", Vector3d(3, 0, 0) },
  });
  NoeTemplate tmpl({ make_record(1, "H", false, 5, "HA", false) });

  BackCalcResult result = compute_noe(tmpl, structure);
  ASSERT_EQ(result.size(), 1);
  EXPECT_TRUE(result.complete());
  EXPECT_DOUBLE_EQ(result[0], 3.0);
}

TEST(ComputeNoeTest, MethylPair) {
  Structure structure({
      { 1, "H", Vector3d(0, 0, 0) },
      { 5, "HB2", Vector3d(1, 0, 0) },
      { 5, "HB3", Vector3d(2, 0, 0) },
  });
  NoeTemplate tmpl({ make_record(1, "H", false, 5, "HB", true) });

  BackCalcResult result = compute_noe(tmpl, structure);
  ASSERT_EQ(result.size(), 1);
  EXPECT_NEAR(result[0], std::pow((1.0 + std::pow(2.0, -6)) / 2, -1.0 / 6),
              1e-12);
}

TEST(ComputeNoeTest, OrderFollowsTemplate) {
  Structure structure = methyl_structure();
  std::vector<NoePairRecord> records {
    make_record(1, "H", false, 5, "HA", false),
    make_record(1, "H", false, 5, "HB", true),
    make_record(1, "HA", false, 5, "HG", false),
    make_record(5, "H", true, 1, "H", false),
  };

  const BackCalcResult reference =
      compute_noe(NoeTemplate(std::vector<NoePairRecord>(records)), structure);
  ASSERT_EQ(reference.size(), 4);

  std::vector<int> perm(records.size());
  std::iota(perm.begin(), perm.end(), 0);
  do {
    std::vector<NoePairRecord> permuted;
    for (int i: perm)
      permuted.push_back(records[i]);

    BackCalcResult result =
        compute_noe(NoeTemplate(std::move(permuted)), structure);
    ASSERT_EQ(result.size(), reference.size());
    for (int i = 0; i < result.size(); ++i)
      EXPECT_DOUBLE_EQ(result[i], reference[perm[i]]);
  } while (std::next_permutation(perm.begin(), perm.end()));
}

TEST(ComputeNoeTest, PartialFailure) {
  Structure structure = methyl_structure();
  NoeTemplate tmpl({
      make_record(1, "H", false, 5, "HA", false),
      make_record(1, "H", false, 42, "HA", false),
      make_record(1, "H", false, 5, "HB", true),
  });

  BackCalcResult result = compute_noe(tmpl, structure);
  ASSERT_EQ(result.size(), 3);
  EXPECT_FALSE(result.complete());

  EXPECT_DOUBLE_EQ(result[0], 3.0);
  EXPECT_TRUE(BackCalcResult::is_failed(result[1]));
  EXPECT_FALSE(BackCalcResult::is_failed(result[2]));

  ASSERT_EQ(result.failures().size(), 1);
  const RecordFailure &failure = result.failures()[0];
  EXPECT_EQ(failure.index, 1);
  EXPECT_EQ(error_kind(failure.status), ErrorKind::kAtomResolution);
  EXPECT_TRUE(absl::StrContains(failure.status.message(), "42"));
  EXPECT_TRUE(absl::StrContains(failure.status.message(), "HA"));
}

TEST(ComputeNoeTest, DegenerateRecord) {
  Structure structure({
      { 1, "H", Vector3d(0, 0, 0) },
      { 2, "H", Vector3d(0, 0, 0) },
      { 3, "H", Vector3d(0, 0, 2) },
  });
  NoeTemplate tmpl({
      make_record(1, "H", false, 2, "H", false),
      make_record(1, "H", false, 3, "H", false),
  });

  BackCalcResult result = compute_noe(tmpl, structure);
  ASSERT_EQ(result.size(), 2);
  EXPECT_TRUE(BackCalcResult::is_failed(result[0]));
  EXPECT_EQ(error_kind(result.failures()[0].status),
            ErrorKind::kDegenerateGeometry);
  EXPECT_DOUBLE_EQ(result[1], 2.0);
}

TEST(ComputeNoeTest, EmptyTemplate) {
  BackCalcResult result = compute_noe(NoeTemplate(), methyl_structure());
  EXPECT_EQ(result.size(), 0);
  EXPECT_TRUE(result.complete());
}

TEST(ComputeNoeTest, TestData) {
  absl::StatusOr<Structure> structure =
      parse_structure("test/test_data/tripeptide.pdb");
  ASSERT_TRUE(structure.ok()) << structure.status();
  absl::StatusOr<NoeTemplate> tmpl =
      read_noe_template("test/test_data/noe_template.csv");
  ASSERT_TRUE(tmpl.ok()) << tmpl.status();

  BackCalcResult result = compute_noe(*tmpl, *structure);
  ASSERT_EQ(result.size(), 4);

  // 1:H - 2:H
  EXPECT_NEAR(result[0], (Vector3d(3.5, -1.8, -1.2) - Vector3d(0.3, -0.9, -0.3))
                             .norm(),
              1e-9);

  // 2:HB{1,2} - 3:HA{2,3}
  const std::vector<Vector3d> hb { Vector3d(1.8, -0.2, 2.0),
                                   Vector3d(0.7, -1.4, 2.6) },
      ha { Vector3d(-0.9, 3.2, 3.8), Vector3d(0.8, 3.2, 3.9) };
  double sum = 0;
  for (const Vector3d &a: hb)
    for (const Vector3d &b: ha)
      sum += std::pow((a - b).norm(), -6);
  EXPECT_NEAR(result[1], std::pow(sum / 4, -1.0 / 6), 1e-9);

  EXPECT_FALSE(BackCalcResult::is_failed(result[2]));
  EXPECT_TRUE(BackCalcResult::is_failed(result[3]));
}
}  // namespace
}  // namespace nmrbc
