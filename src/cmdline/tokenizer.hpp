#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace scenkit::cmdline {

// Shell-like argument splitter used for run templates and global flags.
//
// Rules:
// - unescaped whitespace separates tokens
// - '...' and "..." group text; the quote characters are dropped
// - backslash takes the next character literally (inside quotes too)
// - an unterminated quote runs to end of input
// - a trailing lone backslash is kept as a literal '\'
// - empty tokens are dropped, so '' and "" alone yield nothing
std::vector<std::string> Tokenize(std::string_view text);

// Wraps `token` in double quotes iff it contains whitespace. Display only:
// processes always receive argv vectors, never a joined string.
std::string QuoteIfNeeded(std::string_view token);

// Trims and collapses whitespace runs to single spaces.
std::string NormalizeFlags(std::string_view text);

// Human-readable echo of a launch: command followed by quoted args.
std::string FormatCommandLine(std::string_view command, const std::vector<std::string>& args);

} // namespace scenkit::cmdline
