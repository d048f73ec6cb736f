//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/core/error.h"

#include <ostream>
#include <string_view>

#include <absl/status/status.h>

namespace nmrbc {
std::ostream &operator<<(std::ostream &os, ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return os << "OK";
  case ErrorKind::kTemplateFormat:
    return os << "TemplateFormatError";
  case ErrorKind::kStructureParse:
    return os << "StructureParseError";
  case ErrorKind::kAtomResolution:
    return os << "AtomResolutionError";
  case ErrorKind::kDegenerateGeometry:
    return os << "DegenerateGeometryError";
  case ErrorKind::kOther:
    break;
  }
  return os << "Error";
}

absl::Status template_format_error(std::string_view msg) {
  return absl::InvalidArgumentError(msg);
}

absl::Status structure_parse_error(std::string_view msg) {
  return absl::DataLossError(msg);
}

absl::Status atom_resolution_error(std::string_view msg) {
  return absl::NotFoundError(msg);
}

absl::Status degenerate_geometry_error(std::string_view msg) {
  return absl::OutOfRangeError(msg);
}

ErrorKind error_kind(const absl::Status &status) {
  switch (status.code()) {
  case absl::StatusCode::kOk:
    return ErrorKind::kNone;
  case absl::StatusCode::kInvalidArgument:
    return ErrorKind::kTemplateFormat;
  case absl::StatusCode::kDataLoss:
    return ErrorKind::kStructureParse;
  case absl::StatusCode::kNotFound:
    return ErrorKind::kAtomResolution;
  case absl::StatusCode::kOutOfRange:
    return ErrorKind::kDegenerateGeometry;
  default:
    return ErrorKind::kOther;
  }
}
}  // namespace nmrbc
