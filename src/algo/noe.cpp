//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/algo/noe.h"

#include <cmath>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/base/optimization.h>
#include <absl/log/absl_check.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "nmrbc/algo/result.h"
#include "nmrbc/core/error.h"
#include "nmrbc/core/geometry.h"
#include "nmrbc/core/structure.h"
#include "nmrbc/fmt/template.h"

namespace nmrbc {
namespace {
constexpr std::string_view kAmideProton = "H";

absl::Status with_record_context(const absl::Status &status,
                                 const NoePairRecord &rec) {
  return absl::Status(
      status.code(),
      absl::StrCat("NOE restraint ", rec.res1, ":", rec.atom1, " - ", rec.res2,
                   ":", rec.atom2, ": ", status.message()));
}
}  // namespace

absl::StatusOr<CandidateAtomSet>
resolve_atoms(const Structure &structure, const int res_seq,
              std::string_view atom_name, const bool ambiguous) {
  const bool amide = atom_name == kAmideProton;

  const std::vector<int> residue = structure.residue_atoms(res_seq);

  CandidateAtomSet atoms;
  for (int i: residue) {
    if (!absl::StrContains(structure[i].name(), atom_name))
      continue;

    atoms.push_back(i);

    // Amide proton is never ambiguous; pseudoatoms never exceed a pair
    if (amide || !ambiguous || atoms.size() == 2)
      break;
  }

  if (ABSL_PREDICT_FALSE(atoms.empty())) {
    if (residue.empty())
      return atom_resolution_error(
          absl::StrCat("residue ", res_seq, " not found in structure"));

    return atom_resolution_error(absl::StrCat(
        "no atom matching '", atom_name, "' in residue ", res_seq));
  }

  return atoms;
}

absl::StatusOr<double> average_distance(const Structure &structure,
                                        const CandidateAtomSet &a,
                                        const CandidateAtomSet &b) {
  ABSL_DCHECK(!a.empty() && !b.empty());

  double sum = 0;
  int npairs = 0;
  for (int i: a) {
    for (int j: b) {
      const double d = distance(structure[i].pos(), structure[j].pos());
      if (ABSL_PREDICT_FALSE(d == 0)) {
        return degenerate_geometry_error(absl::StrCat(
            "atoms ", structure[i].res_seq(), ":", structure[i].name(), " and ",
            structure[j].res_seq(), ":", structure[j].name(),
            " are at zero distance"));
      }

      sum += std::pow(d, -6);
      ++npairs;
    }
  }

  if (ABSL_PREDICT_FALSE(npairs == 0))
    return atom_resolution_error("empty candidate atom set");

  return std::pow(sum / npairs, -1.0 / 6);
}

absl::StatusOr<double> compute_noe_record(const Structure &structure,
                                          const NoePairRecord &rec) {
  absl::StatusOr<CandidateAtomSet> first =
      resolve_atoms(structure, rec.res1, rec.atom1, rec.atom1_ambiguous);
  if (!first.ok())
    return with_record_context(first.status(), rec);

  absl::StatusOr<CandidateAtomSet> second =
      resolve_atoms(structure, rec.res2, rec.atom2, rec.atom2_ambiguous);
  if (!second.ok())
    return with_record_context(second.status(), rec);

  absl::StatusOr<double> dist = average_distance(structure, *first, *second);
  if (!dist.ok())
    return with_record_context(dist.status(), rec);

  return dist;
}

BackCalcResult compute_noe(const NoeTemplate &tmpl,
                           const Structure &structure) {
  BackCalcResult result(tmpl.size());

  for (const NoePairRecord &rec: tmpl.records()) {
    absl::StatusOr<double> dist = compute_noe_record(structure, rec);
    if (dist.ok()) {
      result.add_value(*dist);
    } else {
      result.add_failure(std::move(dist).status());
    }
  }

  return result;
}
}  // namespace nmrbc
