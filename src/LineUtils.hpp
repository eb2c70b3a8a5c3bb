#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

// Split text into lines, each keeping its terminator. "\n", "\r\n" and a lone "\r"
// all end a line; a trailing fragment without terminator is returned as the last line.
std::vector<std::string> split_lines_keep_ends(std::string_view text);

// Calls `visit(line_number, line)` for every line of `data` (1-based, terminator
// stripped). Stops early when `visit` returns false.
void for_each_line(const char* data, size_t total_size, const std::function<bool(size_t, std::string_view)>& visit);

// True if `text` is well-formed UTF-8.
bool is_valid_utf8(std::string_view text);

// Copy of `text` with every byte that is not part of a well-formed UTF-8 sequence dropped.
std::string drop_invalid_utf8(std::string_view text);

// Longest prefix of `text` holding at most `max_chars` UTF-8 characters.
std::string utf8_prefix(std::string_view text, size_t max_chars);
