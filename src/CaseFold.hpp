#pragma once
#include <string>

// Unicode case folding of UTF-8 text. Text that is not well-formed UTF-8 is
// folded byte-wise for ASCII letters only.
std::string fold_case(const std::string& text);

// True if `text` contains `folded_needle` ignoring case. The needle must already
// be the result of fold_case, so callers fold it once per search.
bool contains_folded(const std::string& text, const std::string& folded_needle);
