/***
 * Name: pytdc::lex::Lexer
 * Purpose: Tokenize stub source text into a flat token vector.
 */
#include "lexer/Lexer.h"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pytdc::lex {

namespace {
constexpr size_t kTabWidth = 8;

bool isIdentStart(char chr) { return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
bool isIdentChar(char chr) { return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
bool isDigit(char chr) { return std::isdigit(static_cast<unsigned char>(chr)) != 0; }
bool isBlank(char chr) { return chr == ' ' || chr == '\t' || chr == '\f'; }
bool isStringPrefix(char chr) { return chr == 'b' || chr == 'B' || chr == 'r' || chr == 'R' || chr == 'u' || chr == 'U'; }

// Position just past "type:" when a `#\s*type:` comment starts at idx, npos otherwise.
size_t typeCommentEnd(const std::string& line, size_t idx) {
  size_t pos = idx + 1;
  while (pos < line.size() && isBlank(line[pos])) { ++pos; }
  if (line.compare(pos, 5, "type:") != 0) { return std::string::npos; }
  return pos + 5;
}

// Bytes of the UTF-8 sequence starting at idx, or 0 when it is malformed
size_t utf8Length(const std::string& line, size_t idx) {
  const auto lead = static_cast<unsigned char>(line[idx]);
  size_t len = 0;
  if (lead < 0x80U) {
    len = 1;
  } else if ((lead & 0xE0U) == 0xC0U) {
    len = 2;
  } else if ((lead & 0xF0U) == 0xE0U) {
    len = 3;
  } else if ((lead & 0xF8U) == 0xF0U) {
    len = 4;
  } else {
    return 0;
  }
  if (idx + len > line.size()) { return 0; }
  for (size_t i = 1; i < len; ++i) {
    if ((static_cast<unsigned char>(line[idx + i]) & 0xC0U) != 0x80U) { return 0; }
  }
  return len;
}

// The offending character as text; stray bytes are escaped as \xNN
std::string illegalCharText(const std::string& line, size_t idx) {
  const size_t len = utf8Length(line, idx);
  if (len != 0) { return line.substr(idx, len); }
  constexpr const char* kHex = "0123456789ABCDEF";
  const auto byte = static_cast<unsigned char>(line[idx]);
  return std::string("\\x") + kHex[byte >> 4U] + kHex[byte & 0x0FU];
}

TokenKind keywordKind(const std::string& ident) {
  if (ident == "def") { return TokenKind::Def; }
  if (ident == "class") { return TokenKind::Class; }
  if (ident == "if") { return TokenKind::If; }
  if (ident == "elif") { return TokenKind::Elif; }
  if (ident == "else") { return TokenKind::Else; }
  if (ident == "import") { return TokenKind::Import; }
  if (ident == "from") { return TokenKind::From; }
  if (ident == "as") { return TokenKind::As; }
  if (ident == "pass") { return TokenKind::Pass; }
  if (ident == "raise") { return TokenKind::Raise; }
  if (ident == "or") { return TokenKind::Or; }
  if (ident == "and") { return TokenKind::And; }
  if (ident == "PYTHONCODE") { return TokenKind::PythonCode; }
  if (ident == "True" || ident == "False") { return TokenKind::BoolLit; }
  return TokenKind::Ident;
}
} // namespace

void Lexer::pushString(const std::string& text, const std::string& name) {
  name_ = name;
  splitLines(text);
  tokens_.clear();
  finalized_ = false;
}

std::vector<Token> Lexer::tokens() {
  buildAll();
  return tokens_;
}

const std::string& Lexer::sourceLine(int lineNo) const {
  static const std::string kEmpty;
  if (lineNo < 1 || static_cast<size_t>(lineNo) > lines_.size()) { return kEmpty; }
  return lines_[static_cast<size_t>(lineNo) - 1];
}

void Lexer::splitLines(const std::string& text) {
  lines_.clear();
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) { end = text.size(); }
    std::string line = text.substr(start, end - start);
    // Handle CRLF
    if (!line.empty() && line.back() == '\r') { line.pop_back(); }
    lines_.push_back(std::move(line));
    start = end + 1;
  }
}

void Lexer::emit(TokenKind kind, std::string text, size_t row, size_t col) {
  Token tok;
  tok.kind = kind;
  tok.text = std::move(text);
  tok.line = static_cast<int>(row + 1);
  tok.col = static_cast<int>(col + 1);
  tokens_.push_back(std::move(tok));
}

bool Lexer::fail(const std::string& message, size_t col) {
  emit(TokenKind::Error, message, row_, col);
  emit(TokenKind::End, "", row_, col);
  return false;
}

bool Lexer::emitIndentTokens(std::vector<size_t>& indentStack, size_t width, size_t col) {
  if (width > indentStack.back()) {
    indentStack.push_back(width);
    emit(TokenKind::Indent, "<INDENT>", row_, col);
    return true;
  }
  while (width < indentStack.back()) {
    indentStack.pop_back();
    emit(TokenKind::Dedent, "<DEDENT>", row_, col);
  }
  if (width != indentStack.back()) { return fail("Invalid indentation", col); }
  return true;
}

bool Lexer::scanString(size_t& idx) {
  const size_t startRow = row_;
  const size_t startCol = idx;
  const std::string& line = lines_[row_];
  size_t pos = idx;
  while (pos < line.size() && isStringPrefix(line[pos]) && pos - idx < 2) { ++pos; }
  const char quote = line[pos];
  const bool triple = pos + 2 < line.size() && line[pos + 1] == quote && line[pos + 2] == quote;
  if (!triple) {
    size_t end = pos + 1;
    for (; end < line.size(); ++end) {
      if (line[end] == '\\') { ++end; continue; }
      if (line[end] == quote) { break; }
    }
    if (end >= line.size()) { return fail("Unterminated string", startCol); }
    emit(TokenKind::String, line.substr(idx, end + 1 - idx), startRow, startCol);
    idx = end + 1;
    return true;
  }
  // Triple-quoted strings may span lines
  const std::string closing(3, quote);
  std::string text = line.substr(idx, pos + 3 - idx);
  size_t searchFrom = pos + 3;
  while (true) {
    const std::string& cur = lines_[row_];
    size_t end = searchFrom;
    bool found = false;
    for (; end < cur.size(); ++end) {
      if (cur[end] == '\\') { ++end; continue; }
      if (cur.compare(end, 3, closing) == 0) { found = true; break; }
    }
    if (found) {
      text += cur.substr(searchFrom, end + 3 - searchFrom);
      idx = end + 3;
      break;
    }
    text += cur.substr(std::min(searchFrom, cur.size()));
    text += "\n";
    if (row_ + 1 >= lines_.size()) {
      row_ = startRow;
      return fail("Unterminated string", startCol);
    }
    ++row_;
    searchFrom = 0;
  }
  emit(TokenKind::String, std::move(text), startRow, startCol);
  return true;
}

void Lexer::scanNumber(size_t& idx) {
  const std::string& line = lines_[row_];
  const size_t start = idx;
  size_t pos = idx;
  bool isFloat = false;
  auto digitsWhile = [&](auto pred) {
    while (pos < line.size() && (pred(line[pos]) || line[pos] == '_')) { ++pos; }
  };
  if (line[pos] == '0' && pos + 1 < line.size() && std::isalpha(static_cast<unsigned char>(line[pos + 1])) != 0
      && line[pos + 1] != 'e' && line[pos + 1] != 'E' && line[pos + 1] != 'l' && line[pos + 1] != 'L') {
    pos += 2;
    digitsWhile([](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
  } else {
    digitsWhile(isDigit);
    if (pos < line.size() && line[pos] == '.' && !(pos + 1 < line.size() && line[pos + 1] == '.')) {
      isFloat = true;
      ++pos;
      digitsWhile(isDigit);
    }
    if (pos < line.size() && (line[pos] == 'e' || line[pos] == 'E')) {
      size_t exp = pos + 1;
      if (exp < line.size() && (line[exp] == '+' || line[exp] == '-')) { ++exp; }
      if (exp < line.size() && isDigit(line[exp])) {
        isFloat = true;
        pos = exp;
        digitsWhile(isDigit);
      }
    }
  }
  // Python 2 long suffix
  if (!isFloat && pos < line.size() && (line[pos] == 'l' || line[pos] == 'L')) { ++pos; }
  emit(isFloat ? TokenKind::Float : TokenKind::Int, line.substr(start, pos - start), row_, start);
  idx = pos;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
bool Lexer::scanLine(size_t idx) {
  while (true) {
    const std::string& line = lines_[row_];
    if (idx >= line.size()) { return true; }
    const char chr = line[idx];
    const char nxt = idx + 1 < line.size() ? line[idx + 1] : '\0';
    auto single = [&](TokenKind kind) { emit(kind, std::string(1, chr), row_, idx); ++idx; };
    auto pair = [&](TokenKind kind) { emit(kind, line.substr(idx, 2), row_, idx); idx += 2; };

    if (isBlank(chr)) { ++idx; continue; }
    if (chr == '#') {
      const size_t after = typeCommentEnd(line, idx);
      if (after == std::string::npos) { return true; }
      emit(TokenKind::TypeComment, line.substr(idx, after - idx), row_, idx);
      idx = after;
      continue;
    }
    if (chr == '\\') {
      size_t rest = idx + 1;
      while (rest < line.size() && isBlank(line[rest])) { ++rest; }
      if (rest >= line.size()) { joined_ = true; return true; }
      return fail("Illegal character '\\'", idx);
    }
    if (chr == '"' || chr == '\'') {
      if (!scanString(idx)) { return false; }
      continue;
    }
    if (isStringPrefix(chr)) {
      size_t pos = idx;
      while (pos < line.size() && isStringPrefix(line[pos]) && pos - idx < 2) { ++pos; }
      if (pos < line.size() && (line[pos] == '"' || line[pos] == '\'')) {
        if (!scanString(idx)) { return false; }
        continue;
      }
    }
    if (isDigit(chr) || (chr == '.' && isDigit(nxt))) { scanNumber(idx); continue; }
    // `name` is one identifier, backticks kept; synthesized class names print this way
    if (chr == '`') {
      const size_t close = line.find('`', idx + 1);
      if (close != std::string::npos && close > idx + 1) {
        emit(TokenKind::Ident, line.substr(idx, close - idx + 1), row_, idx);
        idx = close + 1;
        continue;
      }
    }
    if (isIdentStart(chr)) {
      size_t end = idx + 1;
      while (end < line.size() && isIdentChar(line[end])) { ++end; }
      std::string ident = line.substr(idx, end - idx);
      const TokenKind kind = keywordKind(ident);
      emit(kind, std::move(ident), row_, idx);
      idx = end;
      continue;
    }
    switch (chr) {
      case '(': ++depth_; single(TokenKind::LParen); continue;
      case '[': ++depth_; single(TokenKind::LBracket); continue;
      case ')': if (depth_ > 0) { --depth_; } single(TokenKind::RParen); continue;
      case ']': if (depth_ > 0) { --depth_; } single(TokenKind::RBracket); continue;
      case ',': single(TokenKind::Comma); continue;
      case '@': single(TokenKind::At); continue;
      case '?': single(TokenKind::Question); continue;
      case ':':
        if (nxt == '=') { pair(TokenKind::ColonEqual); } else { single(TokenKind::Colon); }
        continue;
      case '-':
        if (nxt == '>') { pair(TokenKind::Arrow); } else { single(TokenKind::Minus); }
        continue;
      case '*':
        if (nxt == '*') { pair(TokenKind::StarStar); } else { single(TokenKind::Star); }
        continue;
      case '=':
        if (nxt == '=') { pair(TokenKind::EqEq); } else { single(TokenKind::Equal); }
        continue;
      case '<':
        if (nxt == '=') { pair(TokenKind::Le); } else { single(TokenKind::Lt); }
        continue;
      case '>':
        if (nxt == '=') { pair(TokenKind::Ge); } else { single(TokenKind::Gt); }
        continue;
      case '!':
        if (nxt == '=') { pair(TokenKind::NotEq); continue; }
        break;
      case '.':
        if (nxt == '.' && idx + 2 < line.size() && line[idx + 2] == '.') {
          emit(TokenKind::Ellipsis, "...", row_, idx);
          idx += 3;
        } else {
          single(TokenKind::Dot);
        }
        continue;
      default:
        break;
    }
    return fail("Illegal character '" + illegalCharText(line, idx) + "'", idx);
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  tokens_.clear();
  row_ = 0;
  depth_ = 0;
  joined_ = false;
  std::vector<size_t> indentStack{0};
  for (; row_ < lines_.size(); ++row_) {
    const std::string& line = lines_[row_];
    size_t idx = 0;
    if (depth_ == 0 && !joined_) {
      size_t width = 0;
      while (idx < line.size() && isBlank(line[idx])) {
        width = (line[idx] == '\t') ? ((width / kTabWidth) + 1) * kTabWidth : width + 1;
        ++idx;
      }
      if (idx >= line.size()) { continue; }
      if (line[idx] == '#') {
        if (typeCommentEnd(line, idx) == std::string::npos) { continue; }
        // A type comment on a line of its own carries no indentation
        if (!scanLine(idx)) { return; }
        emit(TokenKind::Newline, "\n", row_, lines_[row_].size());
        continue;
      }
      if (!emitIndentTokens(indentStack, width, idx)) { return; }
    }
    joined_ = false;
    if (!scanLine(idx)) { return; }
    if (depth_ == 0 && !joined_) { emit(TokenKind::Newline, "\n", row_, lines_[row_].size()); }
  }
  const size_t endRow = lines_.size();
  while (indentStack.size() > 1) {
    indentStack.pop_back();
    emit(TokenKind::Dedent, "<DEDENT>", endRow, 0);
  }
  emit(TokenKind::End, "", endRow, 0);
}

} // namespace pytdc::lex
