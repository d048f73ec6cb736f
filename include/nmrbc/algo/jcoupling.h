//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_ALGO_JCOUPLING_H_
#define NMRBC_ALGO_JCOUPLING_H_

//! @cond
#include <absl/status/statusor.h>
//! @endcond

#include "nmrbc/algo/result.h"
#include "nmrbc/core/structure.h"
#include "nmrbc/fmt/template.h"

namespace nmrbc {
/**
 * @brief Calculate the backbone phi torsion of a residue.
 *
 * @param structure The structure.
 * @param res_seq The residue sequence number.
 * @return The C(i-1)-N(i)-CA(i)-C(i) dihedral angle in radians, where residue
 *         i-1 is the residue preceding \p res_seq in file order on the same
 *         chain. An AtomResolutionError if any of the four atoms is missing.
 */
extern absl::StatusOr<double> backbone_phi(const Structure &structure,
                                           int res_seq);

/**
 * @brief Back-calculate the J-coupling proxy of a single residue.
 * @return cos(phi - 60 deg) of the residue.
 */
extern absl::StatusOr<double> compute_jc_record(const Structure &structure,
                                                int res_seq);

/**
 * @brief Back-calculate all residues of a J-coupling template for one
 *        structure.
 *
 * @return One value per residue, in template order. Residues that fail are
 *         recorded as failures and the remaining residues are still computed.
 */
extern BackCalcResult compute_jc(const JCouplingTemplate &tmpl,
                                 const Structure &structure);
}  // namespace nmrbc

#endif /* NMRBC_ALGO_JCOUPLING_H_ */
