#include "normalize.hpp"

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <cstring>

namespace screenqa {

namespace {
    constexpr const char* PUNCTUATION = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

    // Only the ASCII punctuation set is removed.
    bool is_punctuation(UChar32 c)
    {
        return c > 0 && c < 0x80
            && std::strchr(PUNCTUATION, static_cast<char>(c)) != nullptr;
    }

    // Space separators plus anything with a whitespace, block or segment
    // separator bidi class (this includes U+001C..U+001F and U+00A0).
    bool is_space(UChar32 c)
    {
        if (u_charType(c) == U_SPACE_SEPARATOR) return true;
        const UCharDirection dir = u_charDirection(c);
        return dir == U_WHITE_SPACE_NEUTRAL || dir == U_BLOCK_SEPARATOR
            || dir == U_SEGMENT_SEPARATOR;
    }

    // Letters, numbers of any kind and the underscore.
    bool is_word_char(UChar32 c)
    {
        return c == '_' || u_isalpha(c)
            || u_getIntPropertyValue(c, UCHAR_NUMERIC_TYPE) != U_NT_NONE;
    }

    icu::UnicodeString remove_punctuation(const icu::UnicodeString& s)
    {
        icu::UnicodeString out;
        for (int32_t i = 0; i < s.length(); i = s.moveIndex32(i, 1)) {
            const UChar32 c = s.char32At(i);
            if (!is_punctuation(c)) out.append(c);
        }
        return out;
    }

    icu::UnicodeString remove_articles(const icu::UnicodeString& s)
    {
        icu::UnicodeString out;
        int32_t i = 0;
        while (i < s.length()) {
            if (!is_word_char(s.char32At(i))) {
                out.append(s.char32At(i));
                i = s.moveIndex32(i, 1);
                continue;
            }
            int32_t j = i;
            while (j < s.length() && is_word_char(s.char32At(j))) {
                j = s.moveIndex32(j, 1);
            }
            const icu::UnicodeString word(s, i, j - i);
            if (word == icu::UnicodeString(u"a")
                || word == icu::UnicodeString(u"an")
                || word == icu::UnicodeString(u"the")) {
                out.append(UChar32(' '));
            } else {
                out.append(word);
            }
            i = j;
        }
        return out;
    }

    std::vector<icu::UnicodeString> split(const icu::UnicodeString& s)
    {
        std::vector<icu::UnicodeString> tokens;
        int32_t i = 0;
        while (i < s.length()) {
            while (i < s.length() && is_space(s.char32At(i))) {
                i = s.moveIndex32(i, 1);
            }
            int32_t j = i;
            while (j < s.length() && !is_space(s.char32At(j))) {
                j = s.moveIndex32(j, 1);
            }
            if (j > i) tokens.emplace_back(s, i, j - i);
            i = j;
        }
        return tokens;
    }

    std::string to_utf8(const icu::UnicodeString& s)
    {
        std::string out;
        s.toUTF8String(out);
        return out;
    }
} // namespace

std::string normalize_answer(const std::string& text)
{
    icu::UnicodeString s = icu::UnicodeString::fromUTF8(text);
    s.toLower(icu::Locale::getRoot());
    s = remove_punctuation(s);
    s = remove_articles(s);

    icu::UnicodeString out;
    for (const auto& token : split(s)) {
        if (!out.isEmpty()) out.append(UChar32(' '));
        out.append(token);
    }
    return to_utf8(out);
}

std::vector<std::string> split_tokens(const std::string& text)
{
    std::vector<std::string> tokens;
    for (const auto& token : split(icu::UnicodeString::fromUTF8(text))) {
        tokens.push_back(to_utf8(token));
    }
    return tokens;
}

} // namespace screenqa
