//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "nmrbc/fmt/json.h"

#include <charconv>
#include <cmath>
#include <string>
#include <string_view>
#include <system_error>

#include <absl/log/absl_check.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

namespace nmrbc {
namespace internal {
  void append_json_string(std::string &out, std::string_view str) {
    out.push_back('"');
    for (char c: str) {
      switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      case '\b':
        out.append("\\b");
        break;
      case '\f':
        out.append("\\f");
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          absl::StrAppendFormat(&out, "\\u%04x", static_cast<int>(c));
        } else {
          out.push_back(c);
        }
      }
    }
    out.push_back('"');
  }

  void append_json_double(std::string &out, double val) {
    if (!std::isfinite(val)) {
      out.append("null");
      return;
    }

    // Shortest representation that round-trips
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), val);
    ABSL_DCHECK(ec == std::errc());

    std::string_view repr(buf, end - buf);
    out.append(repr);
    if (repr.find_first_of(".e") == std::string_view::npos)
      out.append(".0");
  }
}  // namespace internal

void JsonWriter::prefix() {
  if (after_key_) {
    after_key_ = false;
    return;
  }

  if (nonempty_.empty())
    return;

  if (nonempty_.back())
    out_->push_back(',');
  nonempty_.back() = true;

  out_->push_back('\n');
  out_->append(nonempty_.size() * indent_, ' ');
}

void JsonWriter::open(char bracket) {
  prefix();
  out_->push_back(bracket);
  nonempty_.push_back(false);
}

void JsonWriter::close(char bracket) {
  ABSL_DCHECK(!nonempty_.empty());

  const bool nonempty = nonempty_.back();
  nonempty_.pop_back();
  if (nonempty) {
    out_->push_back('\n');
    out_->append(nonempty_.size() * indent_, ' ');
  }
  out_->push_back(bracket);
}

JsonWriter &JsonWriter::begin_object() {
  open('{');
  return *this;
}

JsonWriter &JsonWriter::end_object() {
  close('}');
  return *this;
}

JsonWriter &JsonWriter::begin_array() {
  open('[');
  return *this;
}

JsonWriter &JsonWriter::end_array() {
  close(']');
  return *this;
}

JsonWriter &JsonWriter::key(std::string_view name) {
  ABSL_DCHECK(!after_key_);

  prefix();
  internal::append_json_string(*out_, name);
  out_->append(": ");
  after_key_ = true;
  return *this;
}

JsonWriter &JsonWriter::value(int val) {
  prefix();
  absl::StrAppend(out_, val);
  return *this;
}

JsonWriter &JsonWriter::value(double val) {
  prefix();
  internal::append_json_double(*out_, val);
  return *this;
}

JsonWriter &JsonWriter::value(bool val) {
  prefix();
  out_->append(val ? "true" : "false");
  return *this;
}

JsonWriter &JsonWriter::value(std::string_view val) {
  prefix();
  internal::append_json_string(*out_, val);
  return *this;
}

JsonWriter &JsonWriter::null() {
  prefix();
  out_->append("null");
  return *this;
}
}  // namespace nmrbc
