//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_CORE_ERROR_H_
#define NMRBC_CORE_ERROR_H_

//! @cond
#include <ostream>
#include <string_view>

#include <absl/status/status.h>
//! @endcond

namespace nmrbc {
/**
 * @brief Categories of back-calculation failures.
 *
 * Every category is carried by a distinct absl::StatusCode, so the kind of a
 * failure can be recovered from any absl::Status with error_kind().
 */
enum class ErrorKind {
  kNone,
  kTemplateFormat,      ///< Template unreadable or malformed; fatal.
  kStructureParse,      ///< One structure unreadable; isolated.
  kAtomResolution,      ///< Atom not found for one record; isolated.
  kDegenerateGeometry,  ///< Zero-distance pair for one record; isolated.
  kOther,
};

extern std::ostream &operator<<(std::ostream &os, ErrorKind kind);

extern absl::Status template_format_error(std::string_view msg);

extern absl::Status structure_parse_error(std::string_view msg);

extern absl::Status atom_resolution_error(std::string_view msg);

extern absl::Status degenerate_geometry_error(std::string_view msg);

/**
 * @brief Classify a status returned by the library.
 * @param status The status to classify.
 * @return ErrorKind::kNone if the status is ok, the matching category if the
 *         status code is one of the codes used by the library for that
 *         category, ErrorKind::kOther otherwise.
 */
extern ErrorKind error_kind(const absl::Status &status);
}  // namespace nmrbc

#endif /* NMRBC_CORE_ERROR_H_ */
