#include <reconcile/internal/normalization.hpp>

#include <algorithm>
#include <cctype>

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace reconcile {
namespace normalization {

namespace {

icu::UnicodeString to_unicode(std::string_view str) {
    return icu::UnicodeString::fromUTF8(
        icu::StringPiece(str.data(), static_cast<int32_t>(str.size())));
}

// Unicode White_Space plus the byte order mark, which also occurs as padding
bool is_space(UChar32 c) {
    return c == 0xFEFF || u_isUWhiteSpace(c);
}

}  // namespace

bool has_non_ascii(std::string_view str) {
    return std::any_of(
        str.begin(), str.end(), [](unsigned char c) { return c > 127; });
}

std::string to_lower(std::string_view str) {
    if (!has_non_ascii(str)) {
        std::string result(str);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    icu::UnicodeString ustr = to_unicode(str);
    ustr.toLower(icu::Locale::getRoot());

    std::string result;
    ustr.toUTF8String(result);
    return result;
}

std::string trim(std::string_view str) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(str.data());
    const auto length = static_cast<int32_t>(str.size());

    int32_t start = 0;
    while (start < length) {
        int32_t next = start;
        UChar32 c;
        U8_NEXT(bytes, next, length, c);
        if (!is_space(c)) break;
        start = next;
    }

    int32_t end = length;
    while (end > start) {
        int32_t previous = end;
        UChar32 c;
        U8_PREV(bytes, start, previous, c);
        if (!is_space(c)) break;
        end = previous;
    }

    return std::string(str.substr(static_cast<std::size_t>(start),
                                  static_cast<std::size_t>(end - start)));
}

std::string fold(std::string_view str) {
    return trim(to_lower(str));
}

std::u32string to_code_points(std::string_view str) {
    if (!has_non_ascii(str)) {
        return std::u32string(str.begin(), str.end());
    }

    const icu::UnicodeString ustr = to_unicode(str);
    std::u32string result;
    result.reserve(static_cast<std::size_t>(ustr.length()));
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        result.push_back(static_cast<char32_t>(ustr.char32At(i)));
    }
    return result;
}

std::size_t code_point_length(std::string_view str) {
    if (!has_non_ascii(str)) {
        return str.size();
    }
    return static_cast<std::size_t>(to_unicode(str).countChar32());
}

}  // namespace normalization
}  // namespace reconcile
