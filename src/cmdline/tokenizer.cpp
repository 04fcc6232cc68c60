#include "cmdline/tokenizer.hpp"

#include <cctype>

namespace scenkit::cmdline {

namespace {

bool IsSpace(const char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  char quote = '\0';
  bool escaping = false;

  // Only non-empty tokens are kept, so a bare '' or "" contributes nothing.
  const auto flush = [&tokens, &current]() {
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  };

  for (const char c : text) {
    if (escaping) {
      current.push_back(c);
      escaping = false;
      continue;
    }

    if (c == '\\') {
      escaping = true;
      continue;
    }

    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      } else {
        current.push_back(c);
      }
      continue;
    }

    if (c == '"' || c == '\'') {
      quote = c;
      continue;
    }

    if (IsSpace(c)) {
      flush();
      continue;
    }

    current.push_back(c);
  }

  if (escaping) {
    current.push_back('\\');
  }
  flush();

  return tokens;
}

std::string QuoteIfNeeded(std::string_view token) {
  for (const char c : token) {
    if (IsSpace(c)) {
      return "\"" + std::string(token) + "\"";
    }
  }
  return std::string(token);
}

std::string NormalizeFlags(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool pending_space = false;
  for (const char c : text) {
    if (IsSpace(c)) {
      pending_space = !normalized.empty();
      continue;
    }
    if (pending_space) {
      normalized.push_back(' ');
      pending_space = false;
    }
    normalized.push_back(c);
  }
  return normalized;
}

std::string FormatCommandLine(std::string_view command, const std::vector<std::string>& args) {
  std::string line = QuoteIfNeeded(command);
  for (const auto& arg : args) {
    line.push_back(' ');
    line += QuoteIfNeeded(arg);
  }
  return line;
}

} // namespace scenkit::cmdline
