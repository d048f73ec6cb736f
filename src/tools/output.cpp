//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/tools/output.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include "nmrbc/algo/result.h"
#include "nmrbc/fmt/json.h"
#include "nmrbc/fmt/template.h"
#include "nmrbc/tools/batch.h"

namespace nmrbc {
namespace {
int write_structures(JsonWriter &writer,
                     const std::vector<StructureOutcome> &outcomes) {
  // "format" is reserved for the template projection
  absl::flat_hash_set<std::string_view> written { "format" };
  int count = 0;

  for (const StructureOutcome &outcome: outcomes) {
    if (!outcome.result.ok())
      continue;

    auto [_, first] = written.insert(outcome.id);
    if (!first) {
      ABSL_LOG(WARNING) << "Duplicate or reserved structure identifier '"
                        << outcome.id << "' (" << outcome.path.string()
                        << "); skipping";
      continue;
    }

    writer.key(outcome.id).array(outcome.result->values());
    ++count;
  }

  return count;
}
}  // namespace

int write_noe_json(std::string &out, const NoeTemplate &tmpl,
                   const std::vector<StructureOutcome> &outcomes) {
  const NoeFormat fmt = tmpl.format();

  JsonWriter writer(out);
  writer.begin_object();

  writer.key("format").begin_object();
  writer.key("res1").array(fmt.res1);
  writer.key("atom1").array(fmt.atom1);
  writer.key("atom1_multiple_assignments")
      .array(fmt.atom1_multiple_assignments);
  writer.key("res2").array(fmt.res2);
  writer.key("atom2").array(fmt.atom2);
  writer.key("atom2_multiple_assignments")
      .array(fmt.atom2_multiple_assignments);
  writer.end_object();

  int count = write_structures(writer, outcomes);

  writer.end_object();
  ABSL_DCHECK(writer.done());
  return count;
}

int write_jc_json(std::string &out, const JCouplingTemplate &tmpl,
                  const std::vector<StructureOutcome> &outcomes) {
  JsonWriter writer(out);
  writer.begin_object();
  writer.key("format").array(tmpl.resnums());

  int count = write_structures(writer, outcomes);

  writer.end_object();
  ABSL_DCHECK(writer.done());
  return count;
}

absl::Status write_output_file(const std::filesystem::path &path,
                               std::string_view content) {
  std::ofstream ofs(path, std::ios::out | std::ios::trunc);
  if (!ofs) {
    return absl::UnavailableError(
        absl::StrCat("cannot open output file: ", path.string()));
  }

  ofs << content;
  ofs.close();
  if (!ofs) {
    return absl::UnavailableError(
        absl::StrCat("failed to write output file: ", path.string()));
  }

  return absl::OkStatus();
}
}  // namespace nmrbc
