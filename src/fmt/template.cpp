//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/fmt/template.h"

#include <array>
#include <climits>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <istream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/algorithm/container.h>
#include <absl/base/optimization.h>
#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/strip.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <boost/spirit/home/x3.hpp>

#include "nmrbc/core/error.h"

namespace nmrbc {
namespace x3 = boost::spirit::x3;

// NOLINTBEGIN(readability-identifier-naming)
namespace parser {
constexpr auto csv_quoted_field =
    x3::rule<struct CsvQuotedField, std::string>("") =
        x3::omit[*x3::blank] >> '"'
        >> *(~x3::char_('"') | (x3::lit("\"\"") >> x3::attr('"'))) >> '"'
        >> x3::omit[*x3::blank];

constexpr auto csv_plain_field =
    x3::rule<struct CsvPlainField, std::string>("") = *~x3::char_(",\"");

constexpr auto csv_line = (csv_quoted_field | csv_plain_field) % ',';
}  // namespace parser
// NOLINTEND(readability-identifier-naming)

namespace internal {
  bool split_csv_line(std::string_view line, std::vector<std::string> &fields) {
    fields.clear();

    auto it = line.begin();
    if (!x3::parse(it, line.end(), parser::csv_line, fields)
        || it != line.end()) {
      return false;
    }

    for (std::string &field: fields)
      absl::StripAsciiWhitespace(&field);
    return true;
  }
}  // namespace internal

namespace {
struct CsvRow {
  int lineno;
  std::vector<std::string> fields;
};

template <size_t N>
struct CsvTable {
  std::array<int, N> columns;
  std::vector<CsvRow> rows;
};

template <size_t N>
absl::StatusOr<CsvTable<N>>
read_csv_table(std::istream &is, const std::array<std::string_view, N> &names) {
  CsvTable<N> table;
  std::vector<std::string> header;

  std::string line;
  int lineno = 0;
  while (std::getline(is, line)) {
    ++lineno;
    if (absl::StripAsciiWhitespace(line).empty())
      continue;

    std::string_view content = absl::StripTrailingAsciiWhitespace(line);
    if (header.empty())
      content = absl::StripPrefix(content, "\xEF\xBB\xBF");

    std::vector<std::string> fields;
    if (!internal::split_csv_line(content, fields)) {
      return template_format_error(
          absl::StrCat("line ", lineno, ": malformed comma-delimited record"));
    }

    if (header.empty()) {
      header = std::move(fields);
      continue;
    }

    if (fields.size() != header.size()) {
      return template_format_error(absl::StrCat(
          "line ", lineno, ": expected ", header.size(), " fields, got ",
          fields.size()));
    }

    table.rows.push_back({ lineno, std::move(fields) });
  }

  if (header.empty())
    return template_format_error("template has no header row");

  std::vector<std::string_view> missing;
  for (size_t i = 0; i < N; ++i) {
    auto it = absl::c_find(header, names[i]);
    if (it == header.end()) {
      missing.push_back(names[i]);
      continue;
    }
    table.columns[i] = static_cast<int>(it - header.begin());
  }

  if (!missing.empty()) {
    return template_format_error(absl::StrCat(
        "missing required column(s): ", absl::StrJoin(missing, ", ")));
  }

  return table;
}

absl::Status parse_int_field(const CsvRow &row, int col,
                             std::string_view colname, int &value) {
  std::string_view field = row.fields[col];
  if (absl::SimpleAtoi(field, &value))
    return absl::OkStatus();

  // pandas-style integral floats, e.g. "12.0"
  double dv;
  if (absl::SimpleAtod(field, &dv) && std::isfinite(dv) && std::floor(dv) == dv
      && dv >= INT_MIN && dv <= INT_MAX) {
    value = static_cast<int>(dv);
    return absl::OkStatus();
  }

  return template_format_error(absl::StrCat("line ", row.lineno,
                                            ": invalid integer in column '",
                                            colname, "': '", field, "'"));
}

absl::Status parse_bool_field(const CsvRow &row, int col,
                              std::string_view colname, bool &value) {
  std::string_view field = row.fields[col];
  if (absl::SimpleAtob(field, &value))
    return absl::OkStatus();

  return template_format_error(absl::StrCat("line ", row.lineno,
                                            ": invalid boolean in column '",
                                            colname, "': '", field, "'"));
}

absl::Status parse_name_field(const CsvRow &row, int col,
                              std::string_view colname, std::string &value) {
  value = row.fields[col];
  if (ABSL_PREDICT_TRUE(!value.empty()))
    return absl::OkStatus();

  return template_format_error(absl::StrCat(
      "line ", row.lineno, ": empty atom name in column '", colname, "'"));
}

constexpr std::array<std::string_view, 6> kNoeColumns {
  "res1", "atom1", "atom1_multiple_assignments",
  "res2", "atom2", "atom2_multiple_assignments",
};

constexpr std::array<std::string_view, 1> kJCouplingColumns { "resnum" };
}  // namespace

NoeFormat NoeTemplate::format() const {
  NoeFormat fmt;
  for (const NoePairRecord &rec: records_) {
    fmt.res1.push_back(rec.res1);
    fmt.atom1.push_back(rec.atom1);
    fmt.atom1_multiple_assignments.push_back(rec.atom1_ambiguous);
    fmt.res2.push_back(rec.res2);
    fmt.atom2.push_back(rec.atom2);
    fmt.atom2_multiple_assignments.push_back(rec.atom2_ambiguous);
  }
  return fmt;
}

absl::StatusOr<NoeTemplate> read_noe_template(std::istream &is) {
  absl::StatusOr<CsvTable<6>> table = read_csv_table(is, kNoeColumns);
  if (!table.ok())
    return table.status();

  const auto &c = table->columns;

  std::vector<NoePairRecord> records;
  records.reserve(table->rows.size());
  for (const CsvRow &row: table->rows) {
    NoePairRecord &rec = records.emplace_back();

    for (absl::Status status: {
             parse_int_field(row, c[0], kNoeColumns[0], rec.res1),
             parse_name_field(row, c[1], kNoeColumns[1], rec.atom1),
             parse_bool_field(row, c[2], kNoeColumns[2], rec.atom1_ambiguous),
             parse_int_field(row, c[3], kNoeColumns[3], rec.res2),
             parse_name_field(row, c[4], kNoeColumns[4], rec.atom2),
             parse_bool_field(row, c[5], kNoeColumns[5], rec.atom2_ambiguous),
         }) {
      if (!status.ok())
        return status;
    }
  }

  ABSL_LOG(INFO) << "Read " << records.size() << " NOE restraints";
  return NoeTemplate(std::move(records));
}

absl::StatusOr<NoeTemplate>
read_noe_template(const std::filesystem::path &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    return template_format_error(
        absl::StrCat("cannot open template file: ", path.string()));
  }

  absl::StatusOr<NoeTemplate> tmpl = read_noe_template(ifs);
  if (!tmpl.ok()) {
    return template_format_error(
        absl::StrCat(path.string(), ": ", tmpl.status().message()));
  }
  return tmpl;
}

absl::StatusOr<JCouplingTemplate> read_jc_template(std::istream &is) {
  absl::StatusOr<CsvTable<1>> table = read_csv_table(is, kJCouplingColumns);
  if (!table.ok())
    return table.status();

  std::vector<int> resnums;
  resnums.reserve(table->rows.size());
  for (const CsvRow &row: table->rows) {
    int &resnum = resnums.emplace_back();
    absl::Status status =
        parse_int_field(row, table->columns[0], kJCouplingColumns[0], resnum);
    if (!status.ok())
      return status;
  }

  ABSL_LOG(INFO) << "Read " << resnums.size() << " J-coupling residues";
  return JCouplingTemplate(std::move(resnums));
}

absl::StatusOr<JCouplingTemplate>
read_jc_template(const std::filesystem::path &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    return template_format_error(
        absl::StrCat("cannot open template file: ", path.string()));
  }

  absl::StatusOr<JCouplingTemplate> tmpl = read_jc_template(ifs);
  if (!tmpl.ok()) {
    return template_format_error(
        absl::StrCat(path.string(), ": ", tmpl.status().message()));
  }
  return tmpl;
}
}  // namespace nmrbc
