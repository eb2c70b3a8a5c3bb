#include "CaseFold.hpp"
#include "LineUtils.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/locale/conversion.hpp>
#include <boost/locale/generator.hpp>
#include <algorithm>
#include <locale>

namespace {

// Built once; the locale name only selects UTF-8, folding rules come from ICU.
const std::locale& utf8_locale() {
	static const std::locale loc = boost::locale::generator()("en_US.UTF-8");
	return loc;
}

bool is_ascii(const std::string& text) {
	return std::all_of(text.begin(), text.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

} // namespace

std::string fold_case(const std::string& text) {
	if (is_ascii(text) || !is_valid_utf8(text)) {
		return boost::algorithm::to_lower_copy(text, std::locale::classic());
	}
	return boost::locale::fold_case(text, utf8_locale());
}

bool contains_folded(const std::string& text, const std::string& folded_needle) {
	return fold_case(text).find(folded_needle) != std::string::npos;
}
