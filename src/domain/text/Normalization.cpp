#include "domain/text/Normalization.hpp"

#include <cctype>

namespace vbe::domain::text {

namespace {

// UTF-8 encoding of U+2019 RIGHT SINGLE QUOTATION MARK.
const std::string kRightSingleQuote = "\xE2\x80\x99";

std::string strip_right_quotes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s.compare(i, kRightSingleQuote.size(), kRightSingleQuote) == 0) {
            i += kRightSingleQuote.size() - 1;
            continue;
        }
        out.push_back(s[i]);
    }
    return out;
}

// Decodes the UTF-8 sequence at pos into cp and returns its length.
// Malformed or truncated sequences decode as U+FFFD, one byte long.
std::size_t decode(const std::string& s, std::size_t pos, char32_t& cp) {
    auto lead = static_cast<unsigned char>(s[pos]);
    std::size_t length = 0;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        cp = 0xFFFD;
        return 1;
    }
    if (pos + length > s.size()) {
        cp = 0xFFFD;
        return 1;
    }
    for (std::size_t i = 1; i < length; ++i) {
        auto next = static_cast<unsigned char>(s[pos + i]);
        if ((next & 0xC0) != 0x80) {
            cp = 0xFFFD;
            return 1;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    return length;
}

// Hyphen, non-breaking hyphen, figure, en and em dashes.
bool is_dash(char32_t cp) {
    return cp >= 0x2010 && cp <= 0x2014;
}

bool word_before(const std::string& text, std::size_t pos) {
    if (pos == 0) return false;
    std::size_t start = pos - 1;
    while (start > 0 && pos - start < 4 &&
           (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
        --start;
    }
    char32_t cp = 0;
    decode(text, start, cp);
    return is_word_code_point(cp);
}

bool word_after(const std::string& text, std::size_t pos) {
    if (pos >= text.size()) return false;
    char32_t cp = 0;
    decode(text, pos, cp);
    return is_word_code_point(cp);
}

bool boundary_at(const std::string& text, std::size_t pos) {
    return word_before(text, pos) != word_after(text, pos);
}

} // namespace

bool is_space_code_point(char32_t cp) {
    if (cp < 0x80) return std::isspace(static_cast<int>(cp)) != 0;
    return cp == 0x00A0 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000;
}

bool is_word_code_point(char32_t cp) {
    if (cp < 0x80) return std::isalnum(static_cast<int>(cp)) != 0 || cp == '_';
    if (cp < 0xA0 || is_space_code_point(cp)) return false;
    if (cp <= 0xBF) {
        // Latin-1 punctuation and symbols, except ordinals, superscripts, micro and fractions
        return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 || cp == 0xBA ||
               (cp >= 0xBC && cp <= 0xBE);
    }
    if (cp == 0xD7 || cp == 0xF7) return false;
    if (cp >= 0x2000 && cp <= 0x206F) return false;   // General Punctuation
    if (cp >= 0x20A0 && cp <= 0x20CF) return false;   // currency symbols
    if (cp == 0xFEFF) return false;
    return true;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string trim(const std::string& s) {
    std::size_t begin = std::string::npos;
    std::size_t end = 0;
    for (std::size_t pos = 0; pos < s.size();) {
        char32_t cp = 0;
        std::size_t length = decode(s, pos, cp);
        if (!is_space_code_point(cp)) {
            if (begin == std::string::npos) begin = pos;
            end = pos + length;
        }
        pos += length;
    }
    if (begin == std::string::npos) return {};
    return s.substr(begin, end - begin);
}

std::string normalize(const std::string& s) {
    std::string lowered = strip_right_quotes(to_lower(trim(s)));
    std::string out;
    out.reserve(lowered.size());
    for (char c : lowered) {
        if (c != '\'') out.push_back(c);
    }
    return out;
}

std::string fully_normalize(const std::string& s) {
    std::vector<std::string> tokens;
    for (auto& token : split_tokens(to_lower(s))) {
        tokens.push_back(token == "&" ? "and" : token);
    }

    std::string joined = join_tokens(tokens);
    std::string kept;
    kept.reserve(joined.size());
    for (std::size_t pos = 0; pos < joined.size();) {
        char32_t cp = 0;
        std::size_t length = decode(joined, pos, cp);
        if (is_dash(cp) || cp == '-') {
            kept.push_back('-');
        } else if (is_word_code_point(cp) || cp == '.') {
            kept.append(joined, pos, length);
        } else if (is_space_code_point(cp)) {
            kept.push_back(' ');
        }
        pos += length;
    }
    return collapse_whitespace(kept);
}

std::string clean_token(const std::string& token) {
    std::size_t begin = std::string::npos;
    std::size_t end = 0;
    for (std::size_t pos = 0; pos < token.size();) {
        char32_t cp = 0;
        std::size_t length = decode(token, pos, cp);
        if (is_word_code_point(cp)) {
            if (begin == std::string::npos) begin = pos;
            end = pos + length;
        }
        pos += length;
    }
    if (begin == std::string::npos) return {};
    return token.substr(begin, end - begin);
}

std::vector<std::string> split_tokens(const std::string& s) {
    std::vector<std::string> tokens;
    std::string current;
    for (std::size_t pos = 0; pos < s.size();) {
        char32_t cp = 0;
        std::size_t length = decode(s, pos, cp);
        if (is_space_code_point(cp)) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.append(s, pos, length);
        }
        pos += length;
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

std::string collapse_whitespace(const std::string& s) {
    return join_tokens(split_tokens(s));
}

int find_sequence(const std::vector<std::string>& haystack,
                  const std::vector<std::string>& needle) {
    if (needle.size() > haystack.size()) return -1;
    for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
        bool match = true;
        for (std::size_t j = 0; j < needle.size(); ++j) {
            if (haystack[i + j] != needle[j]) {
                match = false;
                break;
            }
        }
        if (match) return static_cast<int>(i);
    }
    return -1;
}

std::string remove_whole_word(const std::string& text, const std::string& phrase) {
    if (phrase.empty()) return text;
    std::string lower_text = to_lower(text);
    std::string lower_phrase = to_lower(phrase);

    std::string out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t found = lower_text.find(lower_phrase, pos);
        while (found != std::string::npos &&
               !(boundary_at(lower_text, found) && boundary_at(lower_text, found + lower_phrase.size()))) {
            found = lower_text.find(lower_phrase, found + 1);
        }
        if (found == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, found - pos);
        pos = found + lower_phrase.size();
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

} // namespace vbe::domain::text
