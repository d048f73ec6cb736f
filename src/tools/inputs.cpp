//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/tools/inputs.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <absl/algorithm/container.h>
#include <absl/base/optimization.h>
#include <absl/container/flat_hash_set.h>
#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "nmrbc/utils.h"

namespace nmrbc {
namespace fs = std::filesystem;

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    ABSL_LOG(WARNING) << "Failed to remove temporary directory "
                      << path_.string() << ": " << ec.message();
  }
}

absl::StatusOr<std::unique_ptr<ScopedTempDir>>
ScopedTempDir::create(const fs::path &path) {
  std::error_code ec;
  if (fs::exists(path, ec)) {
    return absl::FailedPreconditionError(absl::StrCat(
        "temporary directory already exists: ", path.string()));
  }

  if (!fs::create_directories(path, ec) || ec) {
    return absl::FailedPreconditionError(
        absl::StrCat("cannot create temporary directory ", path.string(), ": ",
                     ec.message()));
  }

  ABSL_LOG(INFO) << "Created temporary directory " << path.string();
  return std::unique_ptr<ScopedTempDir>(new ScopedTempDir(path));
}

namespace internal {
  bool is_pdb_file(const fs::path &path) {
    return absl::EqualsIgnoreCase(extension_no_dot(path.extension()), "pdb");
  }
}  // namespace internal

namespace {
bool is_tar_file(const fs::path &path) {
  return absl::EqualsIgnoreCase(extension_no_dot(path.extension()), "tar");
}

constexpr std::size_t kTarBlockSize = 512;

using TarBlock = std::array<char, kTarBlockSize>;

struct TarHeaderField {
  std::size_t offset;
  std::size_t size;
};

constexpr TarHeaderField kTarName { 0, 100 };
constexpr TarHeaderField kTarSize { 124, 12 };
constexpr TarHeaderField kTarChecksum { 148, 8 };
constexpr std::size_t kTarTypeflag = 156;
constexpr TarHeaderField kTarMagic { 257, 6 };
constexpr TarHeaderField kTarPrefix { 345, 155 };

std::string_view tar_field(const TarBlock &block, TarHeaderField field) {
  std::string_view str(block.data() + field.offset, field.size);
  return str.substr(0, str.find('\0'));
}

bool parse_tar_octal(const TarBlock &block, TarHeaderField field,
                     std::uint64_t &value) {
  std::string_view str(block.data() + field.offset, field.size);

  std::size_t i = 0;
  while (i < str.size() && str[i] == ' ')
    ++i;

  if (ABSL_PREDICT_FALSE(i == str.size() || str[i] < '0' || str[i] > '7'))
    return false;

  value = 0;
  for (; i < str.size(); ++i) {
    if (str[i] == '\0' || str[i] == ' ')
      break;
    if (ABSL_PREDICT_FALSE(str[i] < '0' || str[i] > '7'))
      return false;
    value = value * 8 + static_cast<std::uint64_t>(str[i] - '0');
  }

  return true;
}

bool tar_checksum_ok(const TarBlock &block) {
  std::uint64_t expected;
  if (!parse_tar_octal(block, kTarChecksum, expected))
    return false;

  std::uint64_t sum = 0;
  for (std::size_t i = 0; i < kTarBlockSize; ++i) {
    if (i >= kTarChecksum.offset
        && i < kTarChecksum.offset + kTarChecksum.size) {
      sum += static_cast<unsigned char>(' ');
    } else {
      sum += static_cast<unsigned char>(block[i]);
    }
  }

  return sum == expected;
}

bool is_zero_block(const TarBlock &block) {
  return absl::c_all_of(block, [](char c) { return c == '\0'; });
}

std::string tar_member_name(const TarBlock &block) {
  std::string name(tar_field(block, kTarName));
  if (absl::StartsWith(tar_field(block, kTarMagic), "ustar")) {
    std::string_view prefix = tar_field(block, kTarPrefix);
    if (!prefix.empty())
      name = absl::StrCat(prefix, "/", name);
  }
  return name;
}

absl::Status copy_member(std::istream &is, std::uint64_t size,
                         const fs::path &dest) {
  std::ofstream ofs(dest, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    return absl::FailedPreconditionError(
        absl::StrCat("cannot write extracted file ", dest.string()));
  }

  std::array<char, 8192> buf;
  while (size > 0) {
    const std::size_t chunk =
        static_cast<std::size_t>(std::min<std::uint64_t>(size, buf.size()));
    if (!is.read(buf.data(), static_cast<std::streamsize>(chunk))) {
      return absl::FailedPreconditionError(
          "truncated archive member data");
    }
    ofs.write(buf.data(), static_cast<std::streamsize>(chunk));
    size -= chunk;
  }

  if (!ofs) {
    return absl::FailedPreconditionError(
        absl::StrCat("failed to write extracted file ", dest.string()));
  }
  return absl::OkStatus();
}

bool skip_bytes(std::istream &is, std::uint64_t size) {
  return static_cast<bool>(is.ignore(static_cast<std::streamsize>(size)))
         && static_cast<std::uint64_t>(is.gcount()) == size;
}

std::uint64_t tar_padding(std::uint64_t size) {
  return (kTarBlockSize - size % kTarBlockSize) % kTarBlockSize;
}

absl::Status add_directory(const fs::path &dir, std::vector<fs::path> &paths) {
  std::vector<fs::path> found;

  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file(ec) && internal::is_pdb_file(it->path()))
      found.push_back(it->path());
  }
  if (ec) {
    return absl::FailedPreconditionError(absl::StrCat(
        "cannot read directory ", dir.string(), ": ", ec.message()));
  }

  absl::c_sort(found);
  ABSL_LOG_IF(WARNING, found.empty())
      << "No PDB files found in directory " << dir.string();

  paths.insert(paths.end(), std::make_move_iterator(found.begin()),
               std::make_move_iterator(found.end()));
  return absl::OkStatus();
}

absl::Status add_archive(const fs::path &archive, const fs::path &tmpdir,
                         std::unique_ptr<ScopedTempDir> &scoped,
                         std::vector<fs::path> &paths) {
  std::ifstream ifs(archive, std::ios::binary);
  if (!ifs) {
    return absl::FailedPreconditionError(
        absl::StrCat("cannot open archive ", archive.string()));
  }

  if (scoped == nullptr) {
    absl::StatusOr<std::unique_ptr<ScopedTempDir>> created =
        ScopedTempDir::create(tmpdir);
    if (!created.ok())
      return created.status();
    scoped = *std::move(created);
  }

  const std::size_t before = paths.size();
  absl::Status status = extract_pdb_members(ifs, scoped->path(), paths);
  if (!status.ok()) {
    return absl::Status(status.code(), absl::StrCat(archive.string(), ": ",
                                                    status.message()));
  }

  ABSL_LOG(INFO) << "Extracted " << paths.size() - before
                 << " PDB file(s) from " << archive.string();
  return absl::OkStatus();
}
}  // namespace

absl::Status extract_pdb_members(std::istream &is, const fs::path &dest,
                                 std::vector<fs::path> &paths) {
  absl::flat_hash_set<std::string> written;

  TarBlock block;
  while (true) {
    is.read(block.data(), kTarBlockSize);
    if (is.gcount() == 0)
      break;

    if (ABSL_PREDICT_FALSE(static_cast<std::size_t>(is.gcount())
                           != kTarBlockSize)) {
      return absl::FailedPreconditionError("truncated archive header");
    }

    if (is_zero_block(block))
      break;

    if (ABSL_PREDICT_FALSE(!tar_checksum_ok(block)))
      return absl::FailedPreconditionError("archive header checksum mismatch");

    std::uint64_t size;
    if (ABSL_PREDICT_FALSE(!parse_tar_octal(block, kTarSize, size)))
      return absl::FailedPreconditionError("invalid archive member size");

    const char type = block[kTarTypeflag];
    const fs::path name = fs::path(tar_member_name(block)).filename();

    const bool regular = type == '0' || type == '\0';
    if (!regular || !internal::is_pdb_file(name)) {
      if (!skip_bytes(is, size + tar_padding(size)))
        return absl::FailedPreconditionError("truncated archive member data");
      continue;
    }

    if (!written.insert(name.string()).second) {
      ABSL_LOG(WARNING) << "Duplicate archive member name " << name.string()
                        << "; skipping";
      if (!skip_bytes(is, size + tar_padding(size)))
        return absl::FailedPreconditionError("truncated archive member data");
      continue;
    }

    fs::path out = dest / name;
    absl::Status status = copy_member(is, size, out);
    if (!status.ok())
      return status;

    if (!skip_bytes(is, tar_padding(size)))
      return absl::FailedPreconditionError("truncated archive member data");

    paths.push_back(std::move(out));
  }

  return absl::OkStatus();
}

absl::StatusOr<StructureInputs>
collect_structures(const std::vector<std::string> &args,
                   const fs::path &tmpdir) {
  StructureInputs inputs;
  std::vector<fs::path> candidates;

  for (const std::string &arg: args) {
    const fs::path path(arg);

    std::error_code ec;
    const fs::file_status st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
      return absl::FailedPreconditionError(
          absl::StrCat("input path does not exist: ", arg));
    }

    absl::Status status;
    if (fs::is_directory(st)) {
      status = add_directory(path, candidates);
    } else if (is_tar_file(path)) {
      status = add_archive(path, tmpdir, inputs.tmpdir, candidates);
    } else {
      ABSL_LOG_IF(WARNING, !internal::is_pdb_file(path))
          << "Input " << arg << " does not have a .pdb extension; "
          << "reading as PDB";
      candidates.push_back(path);
    }

    if (!status.ok())
      return status;
  }

  absl::flat_hash_set<std::string> seen;
  for (fs::path &path: candidates) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    std::string key = ec ? path.lexically_normal().string()
                         : canonical.string();

    if (!seen.insert(std::move(key)).second) {
      ABSL_LOG(INFO) << "Ignoring repeated input " << path.string();
      continue;
    }
    inputs.paths.push_back(std::move(path));
  }

  if (inputs.paths.empty())
    return absl::FailedPreconditionError("no input structures found");

  ABSL_LOG(INFO) << "Collected " << inputs.paths.size()
                 << " structure file(s)";
  return inputs;
}
}  // namespace nmrbc
