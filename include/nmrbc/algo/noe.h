//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_ALGO_NOE_H_
#define NMRBC_ALGO_NOE_H_

//! @cond
#include <string_view>

#include <absl/container/inlined_vector.h>
#include <absl/status/statusor.h>
//! @endcond

#include "nmrbc/algo/result.h"
#include "nmrbc/core/structure.h"
#include "nmrbc/fmt/template.h"

namespace nmrbc {
/**
 * @brief Indices of the atoms selected for one side of an NOE restraint.
 *
 * Holds a single atom unless the reference is ambiguous, in which case it may
 * hold two (pseudoatom or methyl pair). Never empty when returned from
 * resolve_atoms().
 */
using CandidateAtomSet = absl::InlinedVector<int, 2>;

/**
 * @brief Select the candidate atoms for an experimental atom reference.
 *
 * @param structure The structure to search.
 * @param res_seq The residue sequence number.
 * @param atom_name The (partial) atom name. Atoms are matched if their name
 *        contains it, e.g. "HB" matches "HB2" and "HB3".
 * @param ambiguous Whether the reference may match two atoms.
 * @return The candidate atoms in file order, or an AtomResolutionError if no
 *         atom matches.
 *
 * The atoms of the residue are scanned in file order. The amide proton "H"
 * always resolves to the first matching atom regardless of \p ambiguous.
 * Since "H" is matched as a substring too, any heavy atom whose name contains
 * "H" and precedes the amide proton wins: with the usual heavy-atoms-first
 * ordering, "H" of TYR, ARG and TRP resolves to OH, NH1 and CH2.
 * Scanning stops once two atoms are collected, or once one atom is collected
 * if the reference is not ambiguous.
 */
extern absl::StatusOr<CandidateAtomSet>
resolve_atoms(const Structure &structure, int res_seq,
              std::string_view atom_name, bool ambiguous);

/**
 * @brief Combine two candidate sets into a single r^-6 averaged distance.
 *
 * @param structure The structure the candidate sets refer to.
 * @param a The candidate atoms of the first side.
 * @param b The candidate atoms of the second side.
 * @return \f$\left(\frac{1}{|a||b|}\sum_{i \in a, j \in b}
 *         r_{ij}^{-6}\right)^{-1/6}\f$, or a DegenerateGeometryError if any
 *         pair is at zero distance.
 */
extern absl::StatusOr<double> average_distance(const Structure &structure,
                                               const CandidateAtomSet &a,
                                               const CandidateAtomSet &b);

/**
 * @brief Back-calculate a single NOE restraint.
 *
 * @return The averaged distance, or the first error with the residue numbers
 *         and atom names of the restraint in its message.
 */
extern absl::StatusOr<double> compute_noe_record(const Structure &structure,
                                                 const NoePairRecord &rec);

/**
 * @brief Back-calculate all NOE restraints of a template for one structure.
 *
 * @param tmpl The experimental template.
 * @param structure The structure.
 * @return One value per record, in record order. A record that fails is
 *         recorded as a failure and the remaining records are still computed.
 */
extern BackCalcResult compute_noe(const NoeTemplate &tmpl,
                                  const Structure &structure);
}  // namespace nmrbc

#endif /* NMRBC_ALGO_NOE_H_ */
