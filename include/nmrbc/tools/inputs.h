//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_TOOLS_INPUTS_H_
#define NMRBC_TOOLS_INPUTS_H_

//! @cond
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <absl/base/attributes.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
//! @endcond

namespace nmrbc {
/**
 * @brief A directory that is removed, with its contents, on destruction.
 */
class ScopedTempDir {
public:
  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;
  ScopedTempDir(ScopedTempDir &&) = delete;
  ScopedTempDir &operator=(ScopedTempDir &&) = delete;

  ~ScopedTempDir();

  /**
   * @brief Create the directory.
   *
   * @param path The directory to create. Must not exist yet.
   * @return The owning handle, or a kFailedPrecondition error if the path
   *         already exists or cannot be created.
   */
  static absl::StatusOr<std::unique_ptr<ScopedTempDir>>
  create(const std::filesystem::path &path);

  const std::filesystem::path &path() const { return path_; }

private:
  explicit ScopedTempDir(std::filesystem::path path): path_(std::move(path)) { }

  std::filesystem::path path_;
};

/**
 * @brief The structure files of a batch and the storage backing them.
 */
struct StructureInputs {
  std::vector<std::filesystem::path> paths;
  /// Holds extracted archive members; null when no archive was given.
  std::unique_ptr<ScopedTempDir> tmpdir;
};

/**
 * @brief Expand command-line arguments into a list of structure files.
 *
 * @param args Each argument is a .pdb file, a directory (its .pdb files,
 *        sorted by name, non-recursive), or a .tar archive.
 * @param tmpdir Directory to extract archive members into. Created only if
 *        an archive is given; must not exist yet.
 * @return The deduplicated paths in argument order, or an error if an
 *         argument does not exist, an archive is malformed, or no structure
 *         was found.
 */
extern absl::StatusOr<StructureInputs>
collect_structures(const std::vector<std::string> &args,
                   const std::filesystem::path &tmpdir);

/**
 * @brief Extract the .pdb members of a ustar archive.
 *
 * @param is The archive stream.
 * @param dest The directory to extract into; members are written by their
 *        base name.
 * @param paths Extracted file paths are appended here, in archive order.
 * @return Ok, or a kFailedPrecondition error on a malformed archive.
 */
extern absl::Status extract_pdb_members(std::istream &is,
                                        const std::filesystem::path &dest,
                                        std::vector<std::filesystem::path> &paths);

namespace internal {
  ABSL_MUST_USE_RESULT extern bool
  is_pdb_file(const std::filesystem::path &path);
}  // namespace internal
}  // namespace nmrbc

#endif /* NMRBC_TOOLS_INPUTS_H_ */
