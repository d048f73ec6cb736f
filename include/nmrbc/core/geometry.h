//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//
#ifndef NMRBC_CORE_GEOMETRY_H_
#define NMRBC_CORE_GEOMETRY_H_

//! @cond
#include <cmath>
#include <type_traits>

#include <Eigen/Dense>
//! @endcond

#include "nmrbc/eigen_config.h"

namespace nmrbc {
namespace constants {
  constexpr double kPi =
      3.1415926535897932384626433832795028841971693993751058209749445923078164;
}  // namespace constants

template <class DT, std::enable_if_t<std::is_floating_point_v<DT>, int> = 0>
constexpr DT deg2rad(DT deg) {
  return deg * constants::kPi / 180;
}

template <class DT, std::enable_if_t<std::is_integral_v<DT>, int> = 0>
constexpr double deg2rad(DT deg) {
  return deg * constants::kPi / 180;
}

template <class DT, std::enable_if_t<std::is_floating_point_v<DT>, int> = 0>
constexpr DT rad2deg(DT rad) {
  return rad * 180 / constants::kPi;
}

inline double distance(const Vector3d &a, const Vector3d &b) {
  return (a - b).norm();
}

/**
 * @brief Calculate the signed A -> B -> C -> D dihedral angle.
 * @param a The position of point A.
 * @param b The position of point B.
 * @param c The position of point C.
 * @param d The position of point D.
 * @return The dihedral angle in radians, in range [-pi, pi]. Follows the IUPAC
 *         sign convention (clockwise rotation of A onto D looking down B -> C
 *         is positive).
 *
 * See https://stackoverflow.com/a/34245697 for the implementation(s) in python.
 */
inline double dihedral(const Vector3d &a, const Vector3d &b, const Vector3d &c,
                       const Vector3d &d) {
  Vector3d axis = (c - b).normalized();

  Vector3d v = a - b, w = d - c;
  v -= v.dot(axis) * axis;
  w -= w.dot(axis) * axis;

  double x = v.dot(w), y = axis.cross(v).dot(w);
  return std::atan2(y, x);
}
}  // namespace nmrbc

#endif /* NMRBC_CORE_GEOMETRY_H_ */
