#pragma once

#include <unicode/unistr.h>
#include <unicode/ustring.h>
#include <unicode/utypes.h>
#include <unicode/uchar.h>
#include <unicode/locid.h>
#include <string>

namespace mwetag {
namespace unicode {

/**
 * Convert std::string (assumed UTF-8) to ICU UnicodeString
 */
inline icu::UnicodeString to_unicode_string(const std::string& utf8_str) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8_str.c_str(), static_cast<int32_t>(utf8_str.length())));
}

/**
 * Convert ICU UnicodeString to std::string (UTF-8)
 */
inline std::string from_unicode_string(const icu::UnicodeString& ustr) {
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

/**
 * Count Unicode characters (code points) in a UTF-8 string
 */
inline size_t char_count(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return 0;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    return static_cast<size_t>(ustr.countChar32());
}

/**
 * Byte-wise suffix test. Safe for UTF-8 as long as both arguments are well formed.
 */
inline bool ends_with(const std::string& utf8_str, const std::string& suffix) {
    return utf8_str.size() >= suffix.size() &&
           utf8_str.compare(utf8_str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * Remove the last n code points
 */
inline std::string drop_chars(const std::string& utf8_str, size_t n) {
    if (utf8_str.empty() || n == 0) {
        return utf8_str;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    int32_t total = ustr.countChar32();
    if (static_cast<int32_t>(n) >= total) {
        return "";
    }
    // Walk code points, not UTF-16 units, so surrogate pairs stay intact
    int32_t cut = ustr.moveIndex32(0, total - static_cast<int32_t>(n));
    return from_unicode_string(ustr.tempSubString(0, cut));
}

/**
 * The n-th code point counted from the end (1 = last), UTF-8 encoded.
 * Empty if the string is shorter than n.
 */
inline std::string char_from_end(const std::string& utf8_str, size_t n) {
    if (utf8_str.empty() || n == 0) {
        return "";
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    int32_t total = ustr.countChar32();
    if (static_cast<int32_t>(n) > total) {
        return "";
    }
    int32_t start = ustr.moveIndex32(0, total - static_cast<int32_t>(n));
    int32_t stop = ustr.moveIndex32(start, 1);
    return from_unicode_string(ustr.tempSubString(start, stop - start));
}

/**
 * Convert string to lowercase (Unicode-aware). Uses the root locale so the
 * result does not depend on the host's default locale (tr_TR maps "I" to "ı").
 */
inline std::string to_lower(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return utf8_str;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    ustr.toLower(icu::Locale::getRoot());
    return from_unicode_string(ustr);
}

/**
 * Sanitize a string to ensure it's valid UTF-8
 * Replaces invalid sequences with replacement character (U+FFFD)
 */
inline std::string sanitize_utf8(const std::string& str) {
    if (str.empty()) {
        return str;
    }
    icu::UnicodeString ustr = to_unicode_string(str);
    return from_unicode_string(ustr);
}

}  // namespace unicode
}  // namespace mwetag
