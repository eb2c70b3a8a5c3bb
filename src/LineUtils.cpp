#include "LineUtils.hpp"
#include <cstddef>

namespace {

// End of the line starting at `pos` including its terminator; `content_end` receives
// the position of the terminator itself.
size_t scan_line(const char* data, size_t total_size, size_t pos, size_t& content_end) {
	while (pos < total_size && data[pos] != '\n' && data[pos] != '\r') ++pos;
	content_end = pos;
	if (pos < total_size) {
		char ch = data[pos++];
		if (ch == '\r' && pos < total_size && data[pos] == '\n') {
			++pos;
		}
	}
	return pos;
}

// Length of the well-formed UTF-8 sequence at `pos`, or 0 if the byte there does not start one.
size_t utf8_sequence_length(const unsigned char* s, size_t size, size_t pos) {
	unsigned char c = s[pos];
	if (c < 0x80) return 1;
	size_t len = 0;
	unsigned char lo = 0x80, hi = 0xBF;
	if (c >= 0xC2 && c <= 0xDF) {
		len = 2;
	} else if (c >= 0xE0 && c <= 0xEF) {
		len = 3;
		if (c == 0xE0) lo = 0xA0;
		if (c == 0xED) hi = 0x9F;
	} else if (c >= 0xF0 && c <= 0xF4) {
		len = 4;
		if (c == 0xF0) lo = 0x90;
		if (c == 0xF4) hi = 0x8F;
	} else {
		return 0;
	}
	if (pos + len > size) return 0;
	if (s[pos + 1] < lo || s[pos + 1] > hi) return 0;
	for (size_t i = 2; i < len; ++i) {
		if (s[pos + i] < 0x80 || s[pos + i] > 0xBF) return 0;
	}
	return len;
}

} // namespace

std::vector<std::string> split_lines_keep_ends(std::string_view text) {
	std::vector<std::string> lines;
	size_t pos = 0;
	size_t content_end = 0;
	while (pos < text.size()) {
		size_t next = scan_line(text.data(), text.size(), pos, content_end);
		lines.emplace_back(text.substr(pos, next - pos));
		pos = next;
	}
	return lines;
}

void for_each_line(const char* data, size_t total_size, const std::function<bool(size_t, std::string_view)>& visit) {
	size_t pos = 0;
	size_t line_number = 0;
	size_t content_end = 0;
	while (pos < total_size) {
		size_t next = scan_line(data, total_size, pos, content_end);
		++line_number;
		if (!visit(line_number, std::string_view(data + pos, content_end - pos))) {
			return;
		}
		pos = next;
	}
}

bool is_valid_utf8(std::string_view text) {
	const auto* s = reinterpret_cast<const unsigned char*>(text.data());
	size_t pos = 0;
	while (pos < text.size()) {
		size_t len = utf8_sequence_length(s, text.size(), pos);
		if (len == 0) return false;
		pos += len;
	}
	return true;
}

std::string drop_invalid_utf8(std::string_view text) {
	const auto* s = reinterpret_cast<const unsigned char*>(text.data());
	std::string out;
	out.reserve(text.size());
	size_t pos = 0;
	while (pos < text.size()) {
		size_t len = utf8_sequence_length(s, text.size(), pos);
		if (len == 0) {
			++pos;
			continue;
		}
		out.append(text.data() + pos, len);
		pos += len;
	}
	return out;
}

std::string utf8_prefix(std::string_view text, size_t max_chars) {
	size_t pos = 0;
	size_t chars = 0;
	while (pos < text.size() && chars < max_chars) {
		++pos;
		while (pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) ++pos;
		++chars;
	}
	return std::string(text.substr(0, pos));
}
