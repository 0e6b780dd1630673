#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace warden::text {

std::string trim(std::string_view input);

// Split on runs of whitespace, dropping empty words
std::vector<std::string> split_whitespace(std::string_view input);

// Trim and collapse internal whitespace runs to one space
std::string collapse_whitespace(std::string_view input);

std::string to_lower(std::string_view input);

bool is_blank(std::string_view input);

// Decode one level of %XX escapes; malformed escapes are kept verbatim
std::string percent_decode(std::string_view input);

// Decode named (&amp; &lt; &gt; &quot; &apos;) and numeric (&#NN; &#xHH;) entities
std::string decode_html_entities(std::string_view input);

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(std::string_view input);

}  // namespace warden::text
