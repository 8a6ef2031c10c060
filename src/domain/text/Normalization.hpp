#pragma once

#include <string>
#include <vector>

namespace vbe::domain::text {

// Text is UTF-8. Letters and digits of any script and '_' are word
// characters; Latin-1 and General Punctuation marks and symbols are not.
bool is_word_code_point(char32_t cp);

// ASCII whitespace plus no-break and typographic spaces (U+00A0,
// U+2000-U+200A, U+202F, U+205F, U+3000).
bool is_space_code_point(char32_t cp);

std::string to_lower(const std::string& s);
std::string trim(const std::string& s);

// Alias comparison form: trimmed, lower-cased, apostrophes (' and U+2019)
// removed, hyphens kept.
std::string normalize(const std::string& s);

// Bet text form: lower-cased, standalone "&" spelled "and", dashes
// (U+2010-U+2014) turned into '-', everything but word characters,
// whitespace, '.' and '-' dropped, whitespace collapsed.
std::string fully_normalize(const std::string& s);

// Strips leading and trailing non-word characters from a single token.
std::string clean_token(const std::string& token);

std::vector<std::string> split_tokens(const std::string& s);
std::string join_tokens(const std::vector<std::string>& tokens);
std::string collapse_whitespace(const std::string& s);

// Start of the first contiguous occurrence of needle in haystack, or -1.
int find_sequence(const std::vector<std::string>& haystack,
                  const std::vector<std::string>& needle);

// Case-insensitive removal of every occurrence of phrase bounded by word
// boundaries (regex \b semantics) on both sides.
std::string remove_whole_word(const std::string& text, const std::string& phrase);

bool starts_with(const std::string& s, const std::string& prefix);
bool contains(const std::string& s, const std::string& needle);

} // namespace vbe::domain::text
