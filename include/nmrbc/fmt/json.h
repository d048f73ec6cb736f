//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_FMT_JSON_H_
#define NMRBC_FMT_JSON_H_

//! @cond
#include <string>
#include <string_view>
#include <vector>
//! @endcond

namespace nmrbc {
/**
 * @brief Minimal streaming writer for indented JSON documents.
 *
 * The layout matches Python's json.dumps(..., indent=N): every array element
 * and object member on its own line, empty containers as "[]" and "{}".
 * Non-finite doubles are written as null.
 */
class JsonWriter {
public:
  JsonWriter(std::string &out, int indent = 4): out_(&out), indent_(indent) { }

  JsonWriter &begin_object();
  JsonWriter &end_object();

  JsonWriter &begin_array();
  JsonWriter &end_array();

  JsonWriter &key(std::string_view name);

  JsonWriter &value(int val);
  JsonWriter &value(double val);
  JsonWriter &value(bool val);
  JsonWriter &value(std::string_view val);
  JsonWriter &value(const char *val) { return value(std::string_view(val)); }
  JsonWriter &null();

  template <class T>
  JsonWriter &array(const std::vector<T> &vals) {
    begin_array();
    for (const T &val: vals)
      value(val);
    return end_array();
  }

  JsonWriter &array(const std::vector<bool> &vals) {
    begin_array();
    for (bool val: vals)
      value(val);
    return end_array();
  }

  /**
   * @brief Test whether every opened container has been closed.
   */
  bool done() const { return nonempty_.empty(); }

private:
  void prefix();
  void open(char bracket);
  void close(char bracket);

  std::string *out_;
  int indent_;
  std::vector<bool> nonempty_;
  bool after_key_ = false;
};

namespace internal {
  extern void append_json_string(std::string &out, std::string_view str);

  extern void append_json_double(std::string &out, double val);
}  // namespace internal
}  // namespace nmrbc

#endif /* NMRBC_FMT_JSON_H_ */
