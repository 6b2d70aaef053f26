#pragma once

#include <memory>
#include <string>
#include <unicode/unistr.h>
#include <unicode/translit.h>
#include <unicode/normlzr.h>

namespace reprise::util {

/// Normalize a display name for identity matching across access modes.
/// Transliterates diacritics to ASCII equivalents (Björk → bjork, José → jose),
/// lowercases, and trims surrounding whitespace.
inline std::string normalize_display_name(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    // NFD splits ö into o + combining diaeresis, the marks are removed,
    // NFC recomposes, Latin-ASCII folds what is left to plain ASCII
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::Transliterator> trans(
        icu::Transliterator::createInstance(
            "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
            UTRANS_FORWARD,
            status
        )
    );

    if (!U_FAILURE(status) && trans) {
        trans->transliterate(unicode_text);
    }

    std::string result;
    unicode_text.toLower().trim().toUTF8String(result);
    return result;
}

/// Case-insensitive string comparison using ICU
/// Returns: <0 if a < b, 0 if a == b, >0 if a > b (like strcmp)
inline int case_insensitive_compare(const std::string& a, const std::string& b) {
    icu::UnicodeString ua = icu::UnicodeString::fromUTF8(a);
    icu::UnicodeString ub = icu::UnicodeString::fromUTF8(b);

    ua.foldCase();
    ub.foldCase();

    return ua.compare(ub);
}

/// Name ordering used by every listing: case-folded first, raw bytes as tie-break
inline bool name_less(const std::string& a, const std::string& b) {
    int cmp = case_insensitive_compare(a, b);
    if (cmp != 0) return cmp < 0;
    return a < b;
}

} // namespace reprise::util
