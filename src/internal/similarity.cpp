#include <reconcile/internal/normalization.hpp>
#include <reconcile/internal/similarity.hpp>

#include <rapidfuzz/distance/Levenshtein.hpp>

#include <algorithm>
#include <cctype>
#include <regex>

namespace reconcile {
namespace similarity {

namespace {

// Regex patterns
const std::regex kDigitRunPattern(R"(\b\d{3,}\b)");
const std::regex kReferenceCodePattern(R"(\b[A-Z]{1,4}-?\d{1,10}\b)", std::regex::icase);

constexpr std::string_view kWordSeparators = " \t\n\r\f\v-_(),";
constexpr std::size_t kMinWordLength = 3;

std::string to_upper_ascii(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return str;
}

void add_words(const std::string& lowered, TokenSet& tokens) {
    std::size_t start = 0;
    while (start <= lowered.size()) {
        std::size_t end = lowered.find_first_of(kWordSeparators, start);
        if (end == std::string::npos) end = lowered.size();

        std::string_view word(lowered.data() + start, end - start);
        if (normalization::code_point_length(word) >= kMinWordLength) {
            tokens.emplace(word);
        }
        start = end + 1;
    }
}

}  // namespace

std::size_t edit_distance(std::string_view a, std::string_view b) {
    const std::u32string s1 = normalization::to_code_points(normalization::fold(a));
    const std::u32string s2 = normalization::to_code_points(normalization::fold(b));

    if (s1.empty()) return s2.size();
    if (s2.empty()) return s1.size();

    return static_cast<std::size_t>(rapidfuzz::levenshtein_distance(s1, s2));
}

double similarity(std::string_view a, std::string_view b) {
    const std::size_t max_length =
        std::max(normalization::code_point_length(a), normalization::code_point_length(b));
    if (max_length == 0) {
        return 1.0;
    }

    const double distance = static_cast<double>(edit_distance(a, b));
    return std::clamp(1.0 - distance / static_cast<double>(max_length), 0.0, 1.0);
}

double subsequence_score(std::string_view pattern, std::string_view target) {
    const std::u32string p = normalization::to_code_points(normalization::fold(pattern));
    const std::u32string t = normalization::to_code_points(normalization::fold(target));

    if (p.empty()) return 1.0;
    if (t.empty()) return 0.0;

    std::size_t pattern_index = 0;
    std::size_t target_index = 0;
    std::size_t matched = 0;

    while (target_index < t.size() && pattern_index < p.size()) {
        if (p[pattern_index] == t[target_index]) {
            ++matched;
            ++pattern_index;
        }
        ++target_index;
    }

    if (pattern_index != p.size()) {
        return 0.0;
    }

    // target_index now sits just past the last matched character
    const double matched_fraction = static_cast<double>(matched) / static_cast<double>(p.size());
    const double position_bonus =
        1.0 - static_cast<double>(target_index) / static_cast<double>(t.size()) / 2.0;
    return std::clamp((matched_fraction + position_bonus) / 2.0, 0.5, 1.0);
}

TokenSet extract_tokens(std::string_view text) {
    TokenSet tokens;
    if (text.empty()) {
        return tokens;
    }

    const std::string input(text);

    for (std::sregex_iterator it(input.begin(), input.end(), kDigitRunPattern), end; it != end;
         ++it) {
        tokens.insert(it->str());
    }

    for (std::sregex_iterator it(input.begin(), input.end(), kReferenceCodePattern), end;
         it != end; ++it) {
        tokens.insert(to_upper_ascii(it->str()));
    }

    add_words(normalization::to_lower(input), tokens);
    return tokens;
}

double compare_token_sets(const TokenSet& lhs, const TokenSet& rhs) {
    if (lhs.empty() && rhs.empty()) return 1.0;
    if (lhs.empty() || rhs.empty()) return 0.0;

    double total = 0.0;
    for (const auto& left : lhs) {
        double best = 0.0;
        for (const auto& right : rhs) {
            if (left == right) {
                best = 1.0;
                break;
            }
            best = std::max({best, similarity(left, right), subsequence_score(left, right)});
        }
        total += best;
    }

    return total / static_cast<double>(lhs.size());
}

}  // namespace similarity
}  // namespace reconcile
