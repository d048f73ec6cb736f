//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/fmt/pdb.h"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/base/optimization.h>
#include <absl/container/flat_hash_set.h>
#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <Eigen/Dense>

#include "nmrbc/core/error.h"
#include "nmrbc/core/structure.h"
#include "nmrbc/eigen_config.h"
#include "nmrbc/utils.h"

namespace nmrbc {
namespace {
bool fast_startswith(std::string_view str, std::string_view prefix) {
  ABSL_DCHECK(str.size() >= prefix.size());
  return std::memcmp(str.data(), prefix.data(), prefix.size()) == 0;
}

bool is_model_end(std::string_view line) {
  // END/ENDMDL/MASTER/CONECT: coordinate section is over
  return line.size() >= 3
         && (fast_startswith(line, "END") || fast_startswith(line, "MAS")
             || fast_startswith(line, "CON"));
}

bool has_next_model(std::istream &is, std::string &line) {
  while (std::getline(is, line)) {
    if (absl::StartsWith(line, "MODEL"))
      return true;
  }
  return false;
}
}  // namespace

bool read_pdb_first_model(std::istream &is, std::vector<std::string> &block) {
  block.clear();

  std::string line;
  line.reserve(80);

  while (std::getline(is, line)) {
    if (is_model_end(line)) {
      if (absl::StartsWith(line, "ENDMDL") && has_next_model(is, line))
        ABSL_LOG(INFO) << "Multiple models found; reading the first model only";
      break;
    }

    block.push_back(line);
  }

  return !block.empty();
}

namespace {
struct AtomId {
  int seqnum;
  char chain;
  char icode;
  std::string_view name;
};

template <class Hash>
// NOLINTNEXTLINE(*-identifier-naming,*-unused-function)
Hash AbslHashValue(Hash h, const AtomId &id) {
  return Hash::combine(std::move(h), id.seqnum, id.chain, id.icode, id.name);
}

// NOLINTNEXTLINE(*-unused-function)
bool operator==(const AtomId &lhs, const AtomId &rhs) {
  return lhs.seqnum == rhs.seqnum && lhs.chain == rhs.chain
         && lhs.icode == rhs.icode && lhs.name == rhs.name;
}

bool is_atom_record(std::string_view line) {
  return absl::StartsWith(line, "ATOM") || absl::StartsWith(line, "HETATM");
}

std::string line_error(std::string_view name, int lineno,
                       std::string_view msg) {
  if (name.empty())
    return absl::StrCat("line ", lineno, ": ", msg);
  return absl::StrCat(name, ":", lineno, ": ", msg);
}

class AtomicLine {
public:
  static absl::StatusOr<AtomicLine> parse(std::string_view line,
                                          std::string_view name, int lineno) {
    // At least 54 characters (for three coordinates) required for useful data
    if (line.size() < 54) {
      return structure_parse_error(line_error(
          name, lineno,
          absl::StrCat("invalid ATOM/HETATM record: line too short (",
                       line.size(), " < 54)")));
    }

    AtomId id;
    if (!absl::SimpleAtoi(slice(line, 22, 26), &id.seqnum)) {
      return structure_parse_error(
          line_error(name, lineno,
                     absl::StrCat("invalid residue sequence number: '",
                                  slice_strip(line, 22, 26), "'")));
    }
    id.chain = line[21];
    id.icode = line[26];

    id.name = slice_strip(line, 12, 16);
    if (id.name.empty())
      return structure_parse_error(
          line_error(name, lineno, "empty atom name supplied"));

    Vector3d pos;
    for (int i = 0; i < 3; ++i) {
      std::string_view field = line.substr(30 + i * 8, 8);
      if (!absl::SimpleAtod(field, &pos[i])) {
        return structure_parse_error(line_error(
            name, lineno,
            absl::StrCat("invalid coordinate: '",
                         absl::StripAsciiWhitespace(field), "'")));
      }
    }

    return AtomicLine(id, line, pos);
  }

  const AtomId &id() const { return id_; }

  char altloc() const { return line_[16]; }

  std::string_view resname() const { return slice_strip(line_, 17, 20); }

  const Vector3d &pos() const { return pos_; }

private:
  AtomicLine(AtomId id, std::string_view line, const Vector3d &pos)
      : id_(id), line_(line), pos_(pos) { }

  AtomId id_;
  std::string_view line_;
  Vector3d pos_;
};
}  // namespace

absl::StatusOr<Structure> read_pdb(const std::vector<std::string> &pdb,
                                   std::string_view name) {
  std::vector<AtomRecord> atoms;
  absl::flat_hash_set<AtomId> seen_altloc;

  for (int i = 0; i < pdb.size(); ++i) {
    std::string_view line = pdb[i];
    if (!is_atom_record(line))
      continue;

    absl::StatusOr<AtomicLine> parsed = AtomicLine::parse(line, name, i + 1);
    if (ABSL_PREDICT_FALSE(!parsed.ok()))
      return parsed.status();

    // Only the first alternate location of each atom is kept
    if (parsed->altloc() != ' ') {
      auto [_, first] = seen_altloc.insert(parsed->id());
      if (!first) {
        ABSL_LOG(INFO) << "Ignoring alternate location '" << parsed->altloc()
                       << "' of atom " << parsed->id().name << " in residue "
                       << parsed->id().seqnum;
        continue;
      }
    }

    const AtomId &id = parsed->id();
    atoms.emplace_back(id.seqnum, id.name, parsed->pos(), parsed->resname(),
                       id.chain);
  }

  if (atoms.empty())
    return structure_parse_error(
        absl::StrCat(name.empty() ? "structure" : name,
                     ": no ATOM/HETATM records found"));

  return Structure(std::move(atoms), std::string(name));
}

absl::StatusOr<Structure> read_pdb(std::istream &is, std::string_view name) {
  std::vector<std::string> block;
  if (!read_pdb_first_model(is, block))
    return structure_parse_error(
        absl::StrCat(name.empty() ? "structure" : name, ": empty input"));

  return read_pdb(block, name);
}

absl::StatusOr<Structure> parse_structure(const std::filesystem::path &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    return structure_parse_error(
        absl::StrCat("cannot open structure file: ", path.string()));
  }

  return read_pdb(ifs, path.stem().string());
}
}  // namespace nmrbc
