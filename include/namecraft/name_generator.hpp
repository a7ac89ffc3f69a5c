#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "namecraft/case_style.hpp"
#include "namecraft/name_status.hpp"
#include "namecraft/random_source.hpp"
#include "namecraft/word_source.hpp"

namespace namecraft {

struct GeneratorOptions {
    CaseStyle style = kDefaultCaseStyle;
    // Appends a 4-digit suffix. Numbered appends its own suffix either way.
    bool numbered = false;
};

// Unbounded sequence of adjective-noun names. Every pull is an independent
// draw, so names may repeat. Not safe to share across threads; give each
// thread its own generator.
class NameGenerator {
public:
    NameGenerator(WordSource words, GeneratorOptions options, std::unique_ptr<IRandomSource> rng);

    static NameStatus Create(
        WordSource words,
        const GeneratorOptions& options,
        const RandomSourceOptions& random_options,
        std::unique_ptr<NameGenerator>& out_generator);

    // Built-in word lists, KebabCase, no suffix.
    static NameStatus CreateDefault(std::unique_ptr<NameGenerator>& out_generator);
    // Built-in word lists without a suffix.
    static NameStatus WithNaming(CaseStyle style, std::unique_ptr<NameGenerator>& out_generator);
    // Built-in word lists with a suffix.
    static NameStatus WithNumbers(CaseStyle style, std::unique_ptr<NameGenerator>& out_generator);

    // Checks the configuration before any draw is made.
    NameStatus Validate() const;

    // Draw order: adjective, noun, generic suffix (when numbered), then the
    // Numbered style's own suffix. On failure out_name is left untouched.
    NameStatus Next(std::string& out_name);

    NameStatus Take(std::size_t count, std::vector<std::string>& out_names);

    NameStatus Generate(std::size_t count, const std::function<void(const std::string&)>& sink);

    const WordSource& Words() const;
    const GeneratorOptions& Options() const;

private:
    NameStatus DrawSuffix(std::uint16_t& out_number);

    WordSource words_;
    GeneratorOptions options_;
    std::unique_ptr<IRandomSource> rng_;
};

}  // namespace namecraft
