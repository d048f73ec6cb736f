//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_FMT_TEMPLATE_H_
#define NMRBC_FMT_TEMPLATE_H_

//! @cond
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>
//! @endcond

namespace nmrbc {
/**
 * @brief One experimental NOE restraint between two (possibly ambiguous)
 *        atom references.
 */
struct NoePairRecord {
  int res1;
  std::string atom1;
  bool atom1_ambiguous;
  int res2;
  std::string atom2;
  bool atom2_ambiguous;
};

/**
 * @brief Column-wise projection of the NOE template, used to label the output.
 */
struct NoeFormat {
  std::vector<int> res1;
  std::vector<std::string> atom1;
  std::vector<bool> atom1_multiple_assignments;
  std::vector<int> res2;
  std::vector<std::string> atom2;
  std::vector<bool> atom2_multiple_assignments;
};

/**
 * @brief The parsed NOE experimental template.
 *
 * The order of the records is the output order shared by every structure of a
 * batch. Instances are never mutated after parsing.
 */
class NoeTemplate {
public:
  NoeTemplate() = default;

  explicit NoeTemplate(std::vector<NoePairRecord> &&records)
      : records_(std::move(records)) { }

  const std::vector<NoePairRecord> &records() const { return records_; }

  int size() const { return static_cast<int>(records_.size()); }

  bool empty() const { return records_.empty(); }

  const NoePairRecord &operator[](int i) const { return records_[i]; }

  NoeFormat format() const;

private:
  std::vector<NoePairRecord> records_;
};

/**
 * @brief The parsed J-coupling experimental template: the residue numbers for
 *        which the coupling is back-calculated.
 */
class JCouplingTemplate {
public:
  JCouplingTemplate() = default;

  explicit JCouplingTemplate(std::vector<int> &&resnums)
      : resnums_(std::move(resnums)) { }

  const std::vector<int> &resnums() const { return resnums_; }

  int size() const { return static_cast<int>(resnums_.size()); }

  bool empty() const { return resnums_.empty(); }

  int operator[](int i) const { return resnums_[i]; }

private:
  std::vector<int> resnums_;
};

/**
 * @brief Read a comma-delimited NOE template.
 *
 * The header row must contain the columns res1, atom1,
 * atom1_multiple_assignments, res2, atom2 and atom2_multiple_assignments, in
 * any order. Other columns are ignored.
 *
 * @return The parsed template, or a TemplateFormatError.
 */
extern absl::StatusOr<NoeTemplate> read_noe_template(std::istream &is);

extern absl::StatusOr<NoeTemplate>
read_noe_template(const std::filesystem::path &path);

/**
 * @brief Read a comma-delimited J-coupling template with a resnum column.
 *
 * @return The parsed template, or a TemplateFormatError.
 */
extern absl::StatusOr<JCouplingTemplate> read_jc_template(std::istream &is);

extern absl::StatusOr<JCouplingTemplate>
read_jc_template(const std::filesystem::path &path);

namespace internal {
  /**
   * @brief Split a single CSV line into fields.
   *
   * @param line The line to split.
   * @param fields The fields, whitespace-trimmed and with surrounding double
   *        quotes removed. Pre-existing contents are discarded.
   * @return true if the line was parsed, false otherwise.
   */
  extern bool split_csv_line(std::string_view line,
                             std::vector<std::string> &fields);
}  // namespace internal
}  // namespace nmrbc

#endif /* NMRBC_FMT_TEMPLATE_H_ */
