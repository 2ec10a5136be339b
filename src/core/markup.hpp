#pragma once

#include <string>

// Light inline markup shared by the step tree and network diagnostics:
//
//   [bold]Rate Limit Information:[/bold]
//   [green dim]○[/green dim] [bright_black]label[/bright_black]
//
// An opening tag is recognised only when every word in it is a known style
// (bold, dim, cyan, green, red, yellow, white, bright_black, grey50), so
// ordinary bracketed text like "[path]" passes through untouched. "\[" is a
// literal bracket and "\\" a literal backslash.
namespace markup {

// Escape '[' and '\' so user text (labels, details, URLs) is never read as a tag.
std::string escape(const std::string& text);

// Translate tags to ANSI SGR sequences. Closing a tag restores the styles
// that were active before it.
std::string to_ansi(const std::string& text);

// Remove recognised tags and unescape literal brackets and backslashes.
std::string strip(const std::string& text);

} // namespace markup
