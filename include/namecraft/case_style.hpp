#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "namecraft/name_status.hpp"

namespace namecraft {

enum class CaseStyle {
    Plain,
    Numbered,
    TitleCase,
    CamelCase,
    ClassCase,
    KebabCase,
    TrainCase,
    ScreamingSnakeCase,
    TableCase,
    SentenceCase,
    SnakeCase,
    PascalCase
};

constexpr CaseStyle kDefaultCaseStyle = CaseStyle::KebabCase;
constexpr std::size_t kCaseStyleCount = 12;

constexpr std::uint16_t kMinSuffix = 1;
constexpr std::uint16_t kMaxSuffix = 9999;
constexpr std::size_t kSuffixWidth = 4;

std::string_view ToString(CaseStyle style);

// Matches the canonical names ignoring ASCII case ("kebabcase" == "KebabCase").
NameStatus ParseCaseStyle(std::string_view name, CaseStyle& out_style);

const std::array<CaseStyle, kCaseStyleCount>& AllCaseStyles();

class CaseFormatter {
public:
    // Joins the two tokens and the optional suffix using the style's separator
    // and token casing.
    static std::string Format(
        CaseStyle style,
        std::string_view adjective,
        std::string_view noun,
        std::optional<std::uint16_t> number);

    // Bracketed shape for help output, e.g. "[Adjective-Noun]".
    static std::string_view Example(CaseStyle style);

    static std::string Lower(std::string_view token);
    static std::string Upper(std::string_view token);
    static std::string Capitalize(std::string_view token);
    static std::string FormatSuffix(std::uint16_t number);
};

}  // namespace namecraft
