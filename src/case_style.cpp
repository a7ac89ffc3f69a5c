#include "namecraft/case_style.hpp"

#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace namecraft {

namespace {

enum class TokenCase {
    Lower,
    Upper,
    Capitalized
};

struct StyleRule {
    std::string_view separator;
    TokenCase adjective;
    TokenCase noun;
};

StyleRule RuleFor(const CaseStyle style) {
    switch (style) {
        case CaseStyle::Plain:
        case CaseStyle::Numbered:
        case CaseStyle::KebabCase:
            return {"-", TokenCase::Lower, TokenCase::Lower};
        case CaseStyle::TitleCase:
            return {" ", TokenCase::Capitalized, TokenCase::Capitalized};
        case CaseStyle::CamelCase:
            return {"", TokenCase::Lower, TokenCase::Capitalized};
        case CaseStyle::ClassCase:
        case CaseStyle::PascalCase:
            return {"", TokenCase::Capitalized, TokenCase::Capitalized};
        case CaseStyle::TrainCase:
            return {"-", TokenCase::Capitalized, TokenCase::Capitalized};
        case CaseStyle::ScreamingSnakeCase:
            return {"_", TokenCase::Upper, TokenCase::Upper};
        case CaseStyle::TableCase:
        case CaseStyle::SnakeCase:
            return {"_", TokenCase::Lower, TokenCase::Lower};
        case CaseStyle::SentenceCase:
            return {" ", TokenCase::Capitalized, TokenCase::Lower};
    }
    return {"-", TokenCase::Lower, TokenCase::Lower};
}

std::string ApplyCase(const TokenCase token_case, const std::string_view token) {
    switch (token_case) {
        case TokenCase::Lower:
            return CaseFormatter::Lower(token);
        case TokenCase::Upper:
            return CaseFormatter::Upper(token);
        case TokenCase::Capitalized:
            return CaseFormatter::Capitalize(token);
    }
    return std::string(token);
}

bool EqualsIgnoreAsciiCase(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        const auto left = static_cast<unsigned char>(lhs[i]);
        const auto right = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(left) != std::tolower(right)) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string_view ToString(const CaseStyle style) {
    switch (style) {
        case CaseStyle::Plain:
            return "Plain";
        case CaseStyle::Numbered:
            return "Numbered";
        case CaseStyle::TitleCase:
            return "TitleCase";
        case CaseStyle::CamelCase:
            return "CamelCase";
        case CaseStyle::ClassCase:
            return "ClassCase";
        case CaseStyle::KebabCase:
            return "KebabCase";
        case CaseStyle::TrainCase:
            return "TrainCase";
        case CaseStyle::ScreamingSnakeCase:
            return "ScreamingSnakeCase";
        case CaseStyle::TableCase:
            return "TableCase";
        case CaseStyle::SentenceCase:
            return "SentenceCase";
        case CaseStyle::SnakeCase:
            return "SnakeCase";
        case CaseStyle::PascalCase:
            return "PascalCase";
    }
    return "UnknownCaseStyle";
}

NameStatus ParseCaseStyle(const std::string_view name, CaseStyle& out_style) {
    for (const CaseStyle style : AllCaseStyles()) {
        if (EqualsIgnoreAsciiCase(name, ToString(style))) {
            out_style = style;
            return NameStatus::Ok;
        }
    }
    return NameStatus::UnknownCaseStyle;
}

const std::array<CaseStyle, kCaseStyleCount>& AllCaseStyles() {
    static const std::array<CaseStyle, kCaseStyleCount> styles = {
        CaseStyle::Plain,
        CaseStyle::Numbered,
        CaseStyle::TitleCase,
        CaseStyle::CamelCase,
        CaseStyle::ClassCase,
        CaseStyle::KebabCase,
        CaseStyle::TrainCase,
        CaseStyle::ScreamingSnakeCase,
        CaseStyle::TableCase,
        CaseStyle::SentenceCase,
        CaseStyle::SnakeCase,
        CaseStyle::PascalCase,
    };
    return styles;
}

std::string CaseFormatter::Format(
    const CaseStyle style,
    const std::string_view adjective,
    const std::string_view noun,
    const std::optional<std::uint16_t> number) {
    const StyleRule rule = RuleFor(style);

    std::string out = ApplyCase(rule.adjective, adjective);
    out.reserve(adjective.size() + noun.size() + 2U * rule.separator.size() + kSuffixWidth);
    out += rule.separator;
    out += ApplyCase(rule.noun, noun);
    if (number.has_value()) {
        out += rule.separator;
        out += FormatSuffix(*number);
    }
    return out;
}

std::string_view CaseFormatter::Example(const CaseStyle style) {
    switch (style) {
        case CaseStyle::Plain:
        case CaseStyle::KebabCase:
            return "[adjective-noun]";
        case CaseStyle::Numbered:
            return "[adjective-noun-number]";
        case CaseStyle::TitleCase:
            return "[Adjective Noun]";
        case CaseStyle::CamelCase:
            return "[adjectiveNoun]";
        case CaseStyle::ClassCase:
        case CaseStyle::PascalCase:
            return "[AdjectiveNoun]";
        case CaseStyle::TrainCase:
            return "[Adjective-Noun]";
        case CaseStyle::ScreamingSnakeCase:
            return "[ADJECTIVE_NOUN]";
        case CaseStyle::TableCase:
        case CaseStyle::SnakeCase:
            return "[adjective_noun]";
        case CaseStyle::SentenceCase:
            return "[Adjective noun]";
    }
    return "[adjective-noun]";
}

std::string CaseFormatter::Lower(const std::string_view token) {
    std::string out;
    out.reserve(token.size());
    for (const char ch : token) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

std::string CaseFormatter::Upper(const std::string_view token) {
    std::string out;
    out.reserve(token.size());
    for (const char ch : token) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return out;
}

std::string CaseFormatter::Capitalize(const std::string_view token) {
    std::string out = Lower(token);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

// Callers keep the value in [kMinSuffix, kMaxSuffix]; wider values are not
// truncated.
std::string CaseFormatter::FormatSuffix(const std::uint16_t number) {
    std::string digits = std::to_string(number);
    if (digits.size() < kSuffixWidth) {
        digits.insert(0, kSuffixWidth - digits.size(), '0');
    }
    return digits;
}

}  // namespace namecraft
