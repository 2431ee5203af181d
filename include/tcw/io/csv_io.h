#pragma once
// tcw/io/csv_io.h
//
// CSV/TSV utilities shared by the track, gazetteer, metadata and
// affected-country readers/writers.
//
//  - Writer: streaming, RFC 4180-ish escaping (quotes cells containing the
//    separator, quotes or newlines).
//  - ReadTable: loads a whole small file into memory. Quoted cells are
//    supported within a line; embedded newlines are not.
//  - Blank lines and lines starting with '#' are skipped by the reader.

#include "tcw/core/types.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tcw {
namespace csv {

struct Dialect {
  char sep = ',';          // ',' for CSV, '\t' for TSV
  char quote = '"';
  bool always_quote = false;
};

inline constexpr Dialect kCsv{',', '"', false};
inline constexpr Dialect kTsv{'\t', '"', false};

inline std::string EscapeCell(std::string_view cell, const Dialect& d) {
  bool need_quote = d.always_quote;
  for (char c : cell) {
    if (c == d.sep || c == d.quote || c == '\n' || c == '\r') {
      need_quote = true;
      break;
    }
  }
  if (!need_quote) return std::string(cell);

  std::string out;
  out.reserve(cell.size() + 2);
  out.push_back(d.quote);
  for (char c : cell) {
    if (c == d.quote) out.push_back(d.quote);
    out.push_back(c);
  }
  out.push_back(d.quote);
  return out;
}

class Writer {
 public:
  Writer() = default;

  explicit Writer(const std::string& path, Dialect d = {}, std::string* err = nullptr)
      : d_(d), out_(path) {
    ok_ = static_cast<bool>(out_);
    if (!ok_) SetErr(err, "Cannot open file for writing: " + path);
  }

  bool Ok() const noexcept { return ok_ && static_cast<bool>(out_); }

  bool WriteRow(const std::vector<std::string>& cols, std::string* err = nullptr) {
    if (!Ok()) {
      SetErr(err, "Writer not ok");
      return false;
    }
    for (usize i = 0; i < cols.size(); ++i) {
      if (i) out_ << d_.sep;
      out_ << EscapeCell(cols[i], d_);
    }
    out_ << "\n";
    if (!out_) {
      SetErr(err, "Write failed");
      return false;
    }
    return true;
  }

  bool Close(std::string* err = nullptr) {
    out_.close();
    if (out_.fail()) {
      SetErr(err, "Closing output failed");
      return false;
    }
    return true;
  }

 private:
  Dialect d_{};
  std::ofstream out_;
  bool ok_{false};
};

// --------------------------
// Parsing helpers
// --------------------------

inline std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// Splits one record. Returns false on an unterminated quoted cell.
inline bool SplitRecord(std::string_view line, const Dialect& d, std::vector<std::string>* out) {
  out->clear();
  std::string cell;
  bool in_quotes = false;
  bool was_quoted = false;
  for (usize i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == d.quote) {
        if (i + 1 < line.size() && line[i + 1] == d.quote) {
          cell.push_back(c);
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        cell.push_back(c);
      }
      continue;
    }
    if (c == d.quote && Trim(cell).empty()) {
      cell.clear();
      in_quotes = true;
      was_quoted = true;
    } else if (c == d.sep) {
      out->push_back(was_quoted ? cell : std::string(Trim(cell)));
      cell.clear();
      was_quoted = false;
    } else {
      cell.push_back(c);
    }
  }
  if (in_quotes) return false;
  out->push_back(was_quoted ? cell : std::string(Trim(cell)));
  return true;
}

inline bool ParseDouble(std::string_view s, double* out) {
  if (!out) return false;
  s = Trim(s);
  if (s.empty()) return false;
  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0 || end != tmp.c_str() + tmp.size()) return false;
  *out = v;
  return true;
}

inline bool ParseI64(std::string_view s, i64* out) {
  if (!out) return false;
  s = Trim(s);
  if (s.empty()) return false;
  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(tmp.c_str(), &end, 10);
  if (errno != 0 || end != tmp.c_str() + tmp.size()) return false;
  *out = static_cast<i64>(v);
  return true;
}

// --------------------------
// Table reader
// --------------------------

struct Table {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;
  std::vector<usize> line_numbers;  // 1-based source line of each row

  // Index of a header column (case-insensitive).
  std::optional<usize> ColumnIndex(std::string_view name) const {
    for (usize i = 0; i < header.size(); ++i) {
      if (detail::EqualsIgnoreCase(header[i], name)) return i;
    }
    return std::nullopt;
  }

  std::string Where(usize row) const { return "line " + std::to_string(line_numbers[row]); }
};

inline bool ReadTable(const std::string& path,
                      const Dialect& d,
                      bool has_header,
                      Table* out,
                      std::string* err = nullptr) {
  if (!out) {
    SetErr(err, "ReadTable: out is null");
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    SetErr(err, "Cannot open file for reading: " + path);
    return false;
  }

  Table table;
  std::string line;
  std::vector<std::string> cols;
  usize line_no = 0;
  bool header_pending = has_header;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const std::string_view sv = Trim(line);
    if (sv.empty() || sv.front() == '#') continue;

    if (!SplitRecord(line, d, &cols)) {
      SetErr(err, path + ":" + std::to_string(line_no) + ": unterminated quoted cell");
      return false;
    }
    if (header_pending) {
      table.header = cols;
      header_pending = false;
      continue;
    }
    table.rows.push_back(cols);
    table.line_numbers.push_back(line_no);
  }
  if (in.bad()) {
    SetErr(err, "Read failed: " + path);
    return false;
  }
  *out = std::move(table);
  return true;
}

}  // namespace csv
}  // namespace tcw
