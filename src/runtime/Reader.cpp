/***
 * Name: tether::rt::detail::read_forms
 * Purpose: Recursive-descent reader for the runtime's s-expression syntax.
 * Theory of Operation:
 *   Atoms that fully parse as integers become Int, then Float, otherwise Symbol.
 *   Strings support \n, \t, \" and \\ escapes. ';' starts a comment to end of line.
 */
#include "tether/runtime/detail/Reader.h"
#include "tether/runtime/Runtime.h"
#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tether::rt::detail {
namespace {
class Reader {
 public:
  explicit Reader(std::string_view src) : src_(src) {}

  std::vector<Form> readAll() {
    std::vector<Form> forms;
    skipSpace();
    while (pos_ < src_.size()) {
      forms.push_back(readForm());
      skipSpace();
    }
    return forms;
  }

 private:
  [[noreturn]] void fail(const std::string& what) const {
    raise("ParseError", what + " at line " + std::to_string(line_));
  }

  void skipSpace() {
    while (pos_ < src_.size()) {
      const char c = src_[pos_];
      if (c == ';') {
        while (pos_ < src_.size() && src_[pos_] != '\n') { ++pos_; }
      } else if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        if (c == '\n') { ++line_; }
        ++pos_;
      } else {
        return;
      }
    }
  }

  Form readForm() {
    const char c = src_[pos_];
    if (c == '(') { return readList(); }
    if (c == ')') { fail("unexpected ')'"); }
    if (c == '"') { return readString(); }
    return readAtom();
  }

  Form readList() {
    Form list;
    list.kind = Form::Kind::List;
    list.line = line_;
    ++pos_; // '('
    skipSpace();
    while (pos_ < src_.size() && src_[pos_] != ')') {
      list.items.push_back(readForm());
      skipSpace();
    }
    if (pos_ >= src_.size()) { fail("unexpected end of input"); }
    ++pos_; // ')'
    return list;
  }

  Form readString() {
    Form str;
    str.kind = Form::Kind::String;
    str.line = line_;
    ++pos_; // opening quote
    while (pos_ < src_.size() && src_[pos_] != '"') {
      char c = src_[pos_++];
      if (c == '\\') {
        if (pos_ >= src_.size()) { break; }
        const char esc = src_[pos_++];
        switch (esc) {
          case 'n': c = '\n'; break;
          case 't': c = '\t'; break;
          case '"': c = '"'; break;
          case '\\': c = '\\'; break;
          default: fail(std::string("invalid escape '\\") + esc + "'");
        }
      } else if (c == '\n') {
        ++line_;
      }
      str.text.push_back(c);
    }
    if (pos_ >= src_.size()) { fail("unterminated string"); }
    ++pos_; // closing quote
    return str;
  }

  static bool isDelimiter(char c) {
    return c == '(' || c == ')' || c == '"' || c == ';' || c == ' ' || c == '\t' || c == '\r' || c == '\n';
  }

  Form readAtom() {
    const std::size_t start = pos_;
    while (pos_ < src_.size() && !isDelimiter(src_[pos_])) { ++pos_; }
    const std::string_view token = src_.substr(start, pos_ - start);
    Form atom;
    atom.line = line_;
    const char* first = token.data();
    const char* last = token.data() + token.size(); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (const auto res = std::from_chars(first, last, atom.intValue); res.ec == std::errc{} && res.ptr == last) {
      atom.kind = Form::Kind::Int;
      return atom;
    }
    if (const auto res = std::from_chars(first, last, atom.floatValue); res.ec == std::errc{} && res.ptr == last) {
      atom.kind = Form::Kind::Float;
      return atom;
    }
    atom.kind = Form::Kind::Symbol;
    atom.text = std::string(token);
    return atom;
  }

  std::string_view src_;
  std::size_t pos_{0};
  std::size_t line_{1};
};
} // namespace

std::vector<Form> read_forms(std::string_view source) {
  Reader reader(source);
  return reader.readAll();
}

} // namespace tether::rt::detail
