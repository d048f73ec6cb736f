//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_CORE_STRUCTURE_H_
#define NMRBC_CORE_STRUCTURE_H_

//! @cond
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Eigen/Dense>
//! @endcond

#include "nmrbc/eigen_config.h"

namespace nmrbc {
/**
 * @brief A single atom of a parsed structure.
 *
 * Atom records are immutable once the structure is parsed.
 */
class AtomRecord {
public:
  AtomRecord(int res_seq, std::string_view name, const Vector3d &pos,
             std::string_view resname = "", char chain = ' ')
      : res_seq_(res_seq), name_(name), resname_(resname), pos_(pos),
        chain_(chain) { }

  int res_seq() const { return res_seq_; }

  std::string_view name() const { return name_; }

  std::string_view resname() const { return resname_; }

  const Vector3d &pos() const { return pos_; }

  char chain() const { return chain_; }

private:
  int res_seq_;
  std::string name_;
  std::string resname_;
  Vector3d pos_;
  char chain_;
};

/**
 * @brief A linear table of atoms in file order.
 *
 * No index is maintained; residue lookups scan the table. Residue numbers are
 * not required to be sorted or contiguous.
 */
class Structure {
public:
  using const_iterator = std::vector<AtomRecord>::const_iterator;

  Structure() = default;

  explicit Structure(std::vector<AtomRecord> &&atoms, std::string name = "")
      : atoms_(std::move(atoms)), name_(std::move(name)) { }

  int size() const { return static_cast<int>(atoms_.size()); }

  bool empty() const { return atoms_.empty(); }

  const AtomRecord &operator[](int idx) const { return atoms_[idx]; }

  const AtomRecord &atom(int idx) const { return atoms_[idx]; }

  const_iterator begin() const { return atoms_.begin(); }

  const_iterator end() const { return atoms_.end(); }

  std::string_view name() const { return name_; }

  /**
   * @brief Find the atoms of a residue.
   * @param res_seq The residue sequence number.
   * @return Indices of the atoms with the residue number, in file order.
   *         Empty if no atom has the residue number.
   */
  std::vector<int> residue_atoms(int res_seq) const;

  /**
   * @brief Find an atom by exact name within a residue.
   * @return Index of the first matching atom in file order, or -1.
   */
  int find_atom(int res_seq, std::string_view name) const;

  /**
   * @brief Find the residue preceding the given residue in file order.
   * @param res_seq The residue sequence number.
   * @return The residue number of the preceding residue on the same chain, or
   *         false as the second element if there is none.
   */
  std::pair<int, bool> previous_residue(int res_seq) const;

private:
  std::vector<AtomRecord> atoms_;
  std::string name_;
};
}  // namespace nmrbc

#endif /* NMRBC_CORE_STRUCTURE_H_ */
