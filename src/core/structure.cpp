//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/core/structure.h"

#include <string_view>
#include <utility>
#include <vector>

namespace nmrbc {
std::vector<int> Structure::residue_atoms(int res_seq) const {
  std::vector<int> idxs;
  for (int i = 0; i < size(); ++i) {
    if (atoms_[i].res_seq() == res_seq)
      idxs.push_back(i);
  }
  return idxs;
}

int Structure::find_atom(int res_seq, std::string_view name) const {
  for (int i = 0; i < size(); ++i) {
    if (atoms_[i].res_seq() == res_seq && atoms_[i].name() == name)
      return i;
  }
  return -1;
}

std::pair<int, bool> Structure::previous_residue(int res_seq) const {
  int first = -1;
  for (int i = 0; i < size(); ++i) {
    if (atoms_[i].res_seq() == res_seq) {
      first = i;
      break;
    }
  }
  if (first < 0)
    return { 0, false };

  const char chain = atoms_[first].chain();
  for (int i = first - 1; i >= 0; --i) {
    if (atoms_[i].chain() != chain)
      break;

    if (atoms_[i].res_seq() != res_seq)
      return { atoms_[i].res_seq(), true };
  }

  return { 0, false };
}
}  // namespace nmrbc
