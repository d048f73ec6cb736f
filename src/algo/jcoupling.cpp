//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/algo/jcoupling.h"

#include <cmath>
#include <string_view>
#include <utility>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "nmrbc/algo/result.h"
#include "nmrbc/core/error.h"
#include "nmrbc/core/geometry.h"
#include "nmrbc/core/structure.h"
#include "nmrbc/fmt/template.h"

namespace nmrbc {
namespace {
absl::StatusOr<int> find_backbone_atom(const Structure &structure, int res_seq,
                                       std::string_view name) {
  int idx = structure.find_atom(res_seq, name);
  if (idx < 0) {
    return atom_resolution_error(absl::StrCat("backbone atom ", name,
                                              " not found in residue ",
                                              res_seq));
  }
  return idx;
}
}  // namespace

absl::StatusOr<double> backbone_phi(const Structure &structure,
                                    const int res_seq) {
  auto [prev, found] = structure.previous_residue(res_seq);
  if (!found) {
    return atom_resolution_error(
        absl::StrCat("no preceding residue for residue ", res_seq));
  }

  absl::StatusOr<int> c_prev = find_backbone_atom(structure, prev, "C");
  if (!c_prev.ok())
    return c_prev.status();

  absl::StatusOr<int> n = find_backbone_atom(structure, res_seq, "N");
  if (!n.ok())
    return n.status();

  absl::StatusOr<int> ca = find_backbone_atom(structure, res_seq, "CA");
  if (!ca.ok())
    return ca.status();

  absl::StatusOr<int> c = find_backbone_atom(structure, res_seq, "C");
  if (!c.ok())
    return c.status();

  return dihedral(structure[*c_prev].pos(), structure[*n].pos(),
                  structure[*ca].pos(), structure[*c].pos());
}

absl::StatusOr<double> compute_jc_record(const Structure &structure,
                                         const int res_seq) {
  absl::StatusOr<double> phi = backbone_phi(structure, res_seq);
  if (!phi.ok()) {
    return absl::Status(phi.status().code(),
                        absl::StrCat("J-coupling residue ", res_seq, ": ",
                                     phi.status().message()));
  }

  return std::cos(*phi - deg2rad(60.0));
}

BackCalcResult compute_jc(const JCouplingTemplate &tmpl,
                          const Structure &structure) {
  BackCalcResult result(tmpl.size());

  for (int res_seq: tmpl.resnums()) {
    absl::StatusOr<double> jc = compute_jc_record(structure, res_seq);
    if (jc.ok()) {
      result.add_value(*jc);
    } else {
      result.add_failure(std::move(jc).status());
    }
  }

  return result;
}
}  // namespace nmrbc
