//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_UTILS_H_
#define NMRBC_UTILS_H_

//! @cond
#include <cstddef>
#include <filesystem>
#include <string_view>

#include <absl/base/optimization.h>
#include <absl/strings/ascii.h>
//! @endcond

namespace nmrbc {
inline std::string_view extension_no_dot(const std::filesystem::path &ext) {
  const std::string_view ext_view = ext.native();
  if (ABSL_PREDICT_TRUE(!ext_view.empty())) {
    return ext_view.substr(1);
  }
  return ext_view;
}

constexpr std::string_view slice(std::string_view str, std::size_t begin,
                                 std::size_t end) {
  return str.substr(begin, end - begin);
}

inline std::string_view slice_strip(std::string_view str, std::size_t begin,
                                    std::size_t end) {
  return absl::StripAsciiWhitespace(slice(str, begin, end));
}
}  // namespace nmrbc

#endif /* NMRBC_UTILS_H_ */
