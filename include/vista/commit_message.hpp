#pragma once

#include <string>

namespace vista {

// Drop every line whose first non-indentation character is '#'
std::string strip_comment_lines(const std::string& message);

// Wrap every line after the subject that is longer than `column`, breaking
// at the last whitespace at or before the column. A single word longer than
// the column is left unbroken.
std::string wrap_commit_message(const std::string& message, int column = 72);

// Comment stripping, trailing whitespace trimming, then body wrapping
std::string format_commit_message(const std::string& message, int column = 72);

} // namespace vista
