//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//
#ifndef NMRBC_EIGEN_CONFIG_H_
#define NMRBC_EIGEN_CONFIG_H_

//! @cond
#include <Eigen/Dense>
//! @endcond

namespace nmrbc {
//! @privatesection

// NOLINTNEXTLINE(*-naming)
namespace E = Eigen;

using E::Vector3d;
}  // namespace nmrbc

#endif /* NMRBC_EIGEN_CONFIG_H_ */
