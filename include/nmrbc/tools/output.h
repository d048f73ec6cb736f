//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_TOOLS_OUTPUT_H_
#define NMRBC_TOOLS_OUTPUT_H_

//! @cond
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
//! @endcond

#include "nmrbc/fmt/template.h"
#include "nmrbc/tools/batch.h"

namespace nmrbc {
/**
 * @brief Assemble the NOE output document.
 *
 * @param out The string to append the document to.
 * @param tmpl The template whose format projection labels the output.
 * @param outcomes The per-structure outcomes, in output order.
 * @return The number of structures written.
 *
 * The document is {"format": {...}, "<id>": [values...], ...}. Structures that
 * failed entirely are omitted; failed records are written as null.
 */
extern int write_noe_json(std::string &out, const NoeTemplate &tmpl,
                          const std::vector<StructureOutcome> &outcomes);

/**
 * @brief Assemble the J-coupling output document.
 *
 * Same layout as write_noe_json(), with the list of residue numbers as the
 * format.
 */
extern int write_jc_json(std::string &out, const JCouplingTemplate &tmpl,
                         const std::vector<StructureOutcome> &outcomes);

/**
 * @brief Write the document to a file, replacing any existing content.
 */
extern absl::Status write_output_file(const std::filesystem::path &path,
                                      std::string_view content);
}  // namespace nmrbc

#endif /* NMRBC_TOOLS_OUTPUT_H_ */
