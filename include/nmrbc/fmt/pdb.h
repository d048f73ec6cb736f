//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_FMT_PDB_H_
#define NMRBC_FMT_PDB_H_

//! @cond
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/attributes.h>
#include <absl/status/statusor.h>
//! @endcond

#include "nmrbc/core/structure.h"

namespace nmrbc {
/**
 * @brief Read the lines of the first model of a PDB stream.
 *
 * @param is The input stream.
 * @param block The lines up to (not including) the first ENDMDL, END, CONECT or
 *        MASTER record. Pre-existing contents are discarded.
 * @return true if any line was read, false otherwise.
 * @note Subsequent models are not read.
 */
ABSL_MUST_USE_RESULT extern bool
read_pdb_first_model(std::istream &is, std::vector<std::string> &block);

/**
 * @brief Parse the ATOM/HETATM records of a PDB block.
 *
 * @param pdb The lines of a single model.
 * @param name The name of the structure, used for the structure name and in
 *        error messages.
 * @return The parsed structure. A StructureParseError if a coordinate record
 *         is malformed or the block has no atoms.
 */
extern absl::StatusOr<Structure> read_pdb(const std::vector<std::string> &pdb,
                                          std::string_view name = "");

/**
 * @brief Parse the first model of a PDB stream.
 */
extern absl::StatusOr<Structure> read_pdb(std::istream &is,
                                          std::string_view name = "");

/**
 * @brief Parse the first model of a PDB file.
 *
 * @param path Path to the PDB file.
 * @return The parsed structure, named after the file stem. A
 *         StructureParseError if the file cannot be read or is malformed.
 */
extern absl::StatusOr<Structure>
parse_structure(const std::filesystem::path &path);
}  // namespace nmrbc

#endif /* NMRBC_FMT_PDB_H_ */
