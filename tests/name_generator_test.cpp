#include <catch2/catch.hpp>

#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "namecraft/case_style.hpp"
#include "namecraft/name_generator.hpp"
#include "namecraft/random_source.hpp"
#include "namecraft/word_source.hpp"
#include "scripted_random_source.hpp"

using namecraft::CaseStyle;
using namecraft::GeneratorOptions;
using namecraft::NameGenerator;
using namecraft::NameStatus;
using namecraft::RandomSourceOptions;
using namecraft::WordList;
using namecraft::WordSource;
using namecraft::test::FailingRandomSource;
using namecraft::test::ScriptedRandomSource;

namespace {

std::unique_ptr<NameGenerator> MakeTruthGenerator(const CaseStyle style, const bool numbered) {
    GeneratorOptions options;
    options.style = style;
    options.numbered = numbered;

    std::unique_ptr<NameGenerator> generator;
    const NameStatus status = NameGenerator::Create(
        WordSource(WordList{"true"}, WordList{"truth"}), options, RandomSourceOptions{}, generator);
    REQUIRE(status == NameStatus::Ok);
    REQUIRE(generator != nullptr);
    return generator;
}

std::string NextName(NameGenerator& generator) {
    std::string name;
    REQUIRE(generator.Next(name) == NameStatus::Ok);
    return name;
}

// Returns the trailing four digits as a number, or 0 when the name has none.
int TrailingSuffix(const std::string& name) {
    static const std::regex suffix("([0-9]{4})$");
    std::smatch match;
    if (!std::regex_search(name, match, suffix)) {
        return 0;
    }
    return std::stoi(match[1].str());
}

}  // namespace

TEST_CASE("Single-word lists give exact names", "[name_generator]") {
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::KebabCase, false)) == "true-truth");
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::Plain, false)) == "true-truth");
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::PascalCase, false)) == "TrueTruth");
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::ClassCase, false)) == "TrueTruth");
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::SnakeCase, false)) == "true_truth");
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::TableCase, false)) == "true_truth");
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::ScreamingSnakeCase, false)) == "TRUE_TRUTH");
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::TitleCase, false)) == "True Truth");
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::CamelCase, false)) == "trueTruth");
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::TrainCase, false)) == "True-Truth");
    CHECK(NextName(*MakeTruthGenerator(CaseStyle::SentenceCase, false)) == "True truth");
}

TEST_CASE("Numbered shapes per style", "[name_generator]") {
    struct Expectation {
        CaseStyle style;
        const char* pattern;
    };
    const std::vector<Expectation> expectations = {
        {CaseStyle::Plain, "^true-truth-[0-9]{4}$"},
        {CaseStyle::KebabCase, "^true-truth-[0-9]{4}$"},
        {CaseStyle::TitleCase, "^True Truth [0-9]{4}$"},
        {CaseStyle::CamelCase, "^trueTruth[0-9]{4}$"},
        {CaseStyle::ClassCase, "^TrueTruth[0-9]{4}$"},
        {CaseStyle::PascalCase, "^TrueTruth[0-9]{4}$"},
        {CaseStyle::TrainCase, "^True-Truth-[0-9]{4}$"},
        {CaseStyle::ScreamingSnakeCase, "^TRUE_TRUTH_[0-9]{4}$"},
        {CaseStyle::TableCase, "^true_truth_[0-9]{4}$"},
        {CaseStyle::SnakeCase, "^true_truth_[0-9]{4}$"},
        {CaseStyle::SentenceCase, "^True truth [0-9]{4}$"},
    };

    for (const Expectation& expectation : expectations) {
        INFO(namecraft::ToString(expectation.style));
        auto generator = MakeTruthGenerator(expectation.style, true);
        for (int i = 0; i < 50; ++i) {
            const std::string name = NextName(*generator);
            CHECK(std::regex_match(name, std::regex(expectation.pattern)));
            const int suffix = TrailingSuffix(name);
            CHECK(suffix >= 1);
            CHECK(suffix <= 9999);
        }
    }
}

TEST_CASE("Numbered style forces a suffix", "[name_generator]") {
    const bool numbered = GENERATE(false, true);
    auto generator = MakeTruthGenerator(CaseStyle::Numbered, numbered);

    for (int i = 0; i < 50; ++i) {
        const std::string name = NextName(*generator);
        CHECK(std::regex_match(name, std::regex("^true-truth-[0-9]{4}$")));
        CHECK(TrailingSuffix(name) >= 1);
    }
}

TEST_CASE("Suffix bounds come straight from the draw", "[name_generator]") {
    GeneratorOptions options;
    options.style = CaseStyle::KebabCase;
    options.numbered = true;

    std::vector<ScriptedRandomSource::Request> requests;
    NameGenerator generator(
        WordSource(WordList{"true"}, WordList{"truth"}),
        options,
        std::make_unique<ScriptedRandomSource>(std::vector<std::uint32_t>{0, 0, 1, 0, 0, 9999}, &requests));

    CHECK(NextName(generator) == "true-truth-0001");
    CHECK(NextName(generator) == "true-truth-9999");

    REQUIRE(requests.size() == 6);
    CHECK(requests[2].min == namecraft::kMinSuffix);
    CHECK(requests[2].max == namecraft::kMaxSuffix);
}

TEST_CASE("Draw order is adjective, noun, suffix, Numbered suffix", "[name_generator]") {
    const WordList adjectives = {"able", "brave", "calm"};
    const WordList nouns = {"otter", "pine"};

    SECTION("Plain draws only the two words") {
        std::vector<ScriptedRandomSource::Request> requests;
        NameGenerator generator(
            WordSource(adjectives, nouns),
            GeneratorOptions{CaseStyle::Plain, false},
            std::make_unique<ScriptedRandomSource>(std::vector<std::uint32_t>{2, 1}, &requests));

        CHECK(NextName(generator) == "calm-pine");
        REQUIRE(requests.size() == 2);
        CHECK(requests[0].max == 2U);
        CHECK(requests[1].max == 1U);
    }

    SECTION("Numbered with the flag off draws its own suffix") {
        std::vector<ScriptedRandomSource::Request> requests;
        NameGenerator generator(
            WordSource(adjectives, nouns),
            GeneratorOptions{CaseStyle::Numbered, false},
            std::make_unique<ScriptedRandomSource>(std::vector<std::uint32_t>{1, 0, 5602}, &requests));

        CHECK(NextName(generator) == "brave-otter-5602");
        CHECK(requests.size() == 3);
    }

    SECTION("Numbered with the flag on discards the generic suffix") {
        std::vector<ScriptedRandomSource::Request> requests;
        NameGenerator generator(
            WordSource(adjectives, nouns),
            GeneratorOptions{CaseStyle::Numbered, true},
            std::make_unique<ScriptedRandomSource>(std::vector<std::uint32_t>{0, 1, 1111, 2222}, &requests));

        CHECK(NextName(generator) == "able-pine-2222");
        REQUIRE(requests.size() == 4);
        CHECK(requests[2].min == namecraft::kMinSuffix);
        CHECK(requests[3].max == namecraft::kMaxSuffix);
    }
}

TEST_CASE("The sequence never runs dry", "[name_generator]") {
    auto generator = MakeTruthGenerator(CaseStyle::KebabCase, false);

    std::vector<std::string> names;
    REQUIRE(generator->Take(1000, names) == NameStatus::Ok);
    REQUIRE(names.size() == 1000);
    for (const std::string& name : names) {
        CHECK(name == "true-truth");
    }

    std::size_t streamed = 0;
    REQUIRE(generator->Generate(2500, [&streamed](const std::string& name) {
        CHECK_FALSE(name.empty());
        ++streamed;
    }) == NameStatus::Ok);
    CHECK(streamed == 2500);

    std::size_t zero_calls = 0;
    REQUIRE(generator->Generate(0, [&zero_calls](const std::string&) {
        ++zero_calls;
    }) == NameStatus::Ok);
    CHECK(zero_calls == 0);

    std::vector<std::string> none = {"stale"};
    REQUIRE(generator->Take(0, none) == NameStatus::Ok);
    CHECK(none.empty());
}

TEST_CASE("Default generators draw from the built-in lists", "[name_generator]") {
    std::unique_ptr<NameGenerator> generator;

    SECTION("CreateDefault is KebabCase without a suffix") {
        REQUIRE(NameGenerator::CreateDefault(generator) == NameStatus::Ok);
        CHECK(generator->Options().style == CaseStyle::KebabCase);
        CHECK_FALSE(generator->Options().numbered);
        for (int i = 0; i < 100; ++i) {
            CHECK(std::regex_match(NextName(*generator), std::regex("^[a-z]+-[a-z]+$")));
        }
    }

    SECTION("WithNaming") {
        REQUIRE(NameGenerator::WithNaming(CaseStyle::TrainCase, generator) == NameStatus::Ok);
        CHECK(std::regex_match(NextName(*generator), std::regex("^[A-Z][a-z]+-[A-Z][a-z]+$")));
    }

    SECTION("WithNumbers") {
        REQUIRE(NameGenerator::WithNumbers(CaseStyle::SnakeCase, generator) == NameStatus::Ok);
        CHECK(std::regex_match(NextName(*generator), std::regex("^[a-z]+_[a-z]+_[0-9]{4}$")));
    }
}

TEST_CASE("Empty word lists are configuration errors", "[name_generator]") {
    std::unique_ptr<NameGenerator> generator;

    SECTION("Create refuses them") {
        CHECK(NameGenerator::Create(
            WordSource(WordList{}, WordList{"truth"}), GeneratorOptions{}, RandomSourceOptions{}, generator) ==
            NameStatus::EmptyWordList);
        CHECK(NameGenerator::Create(
            WordSource(WordList{"true"}, WordList{}), GeneratorOptions{}, RandomSourceOptions{}, generator) ==
            NameStatus::EmptyWordList);
        CHECK(generator == nullptr);
    }

    SECTION("A directly built generator fails on request") {
        NameGenerator direct(
            WordSource(WordList{"true"}, WordList{}),
            GeneratorOptions{},
            std::make_unique<ScriptedRandomSource>(std::vector<std::uint32_t>{}));
        CHECK(direct.Validate() == NameStatus::EmptyWordList);

        std::string name = "untouched";
        CHECK(direct.Next(name) == NameStatus::EmptyWordList);
        CHECK(name == "untouched");

        std::vector<std::string> names;
        CHECK(direct.Take(3, names) == NameStatus::EmptyWordList);
        CHECK(names.empty());
    }
}

TEST_CASE("Malformed words are configuration errors", "[name_generator]") {
    std::unique_ptr<NameGenerator> generator;

    SECTION("Create refuses them") {
        CHECK(NameGenerator::Create(
            WordSource(WordList{""}, WordList{"truth"}), GeneratorOptions{}, RandomSourceOptions{}, generator) ==
            NameStatus::InvalidWord);
        CHECK(NameGenerator::Create(
            WordSource(WordList{"true"}, WordList{"truth two"}), GeneratorOptions{}, RandomSourceOptions{}, generator) ==
            NameStatus::InvalidWord);
        CHECK(NameGenerator::Create(
            WordSource(WordList{""}, WordList{"Truth Two"}), GeneratorOptions{}, RandomSourceOptions{}, generator) ==
            NameStatus::InvalidWord);
        CHECK(generator == nullptr);
    }

    SECTION("A directly built generator fails on request") {
        NameGenerator direct(
            WordSource(WordList{""}, WordList{"Truth Two"}),
            GeneratorOptions{},
            std::make_unique<ScriptedRandomSource>(std::vector<std::uint32_t>{}));
        CHECK(direct.Validate() == NameStatus::InvalidWord);

        std::string name = "untouched";
        CHECK(direct.Next(name) == NameStatus::InvalidWord);
        CHECK(name == "untouched");
    }
}

TEST_CASE("Generator failures propagate", "[name_generator]") {
    std::string name;

    SECTION("Missing random source") {
        NameGenerator generator(WordSource(WordList{"true"}, WordList{"truth"}), GeneratorOptions{}, nullptr);
        CHECK(generator.Validate() == NameStatus::MissingRandomSource);
        CHECK(generator.Next(name) == NameStatus::MissingRandomSource);
    }

    SECTION("Random source failure") {
        NameGenerator generator(
            WordSource(WordList{"true"}, WordList{"truth"}),
            GeneratorOptions{},
            std::make_unique<FailingRandomSource>());
        CHECK(generator.Validate() == NameStatus::Ok);
        CHECK(generator.Next(name) == NameStatus::MissingRngBytes);
        CHECK(name.empty());
    }
}

TEST_CASE("Seeded generators reproduce their sequence", "[name_generator]") {
    GeneratorOptions options;
    options.style = CaseStyle::TrainCase;
    options.numbered = true;

    RandomSourceOptions seeded;
    seeded.seed = 20240611ULL;

    std::unique_ptr<NameGenerator> first;
    std::unique_ptr<NameGenerator> second;
    REQUIRE(NameGenerator::Create(WordSource(), options, seeded, first) == NameStatus::Ok);
    REQUIRE(NameGenerator::Create(WordSource(), options, seeded, second) == NameStatus::Ok);

    std::vector<std::string> first_names;
    std::vector<std::string> second_names;
    REQUIRE(first->Take(200, first_names) == NameStatus::Ok);
    REQUIRE(second->Take(200, second_names) == NameStatus::Ok);
    CHECK(first_names == second_names);

    seeded.seed = 20240612ULL;
    std::unique_ptr<NameGenerator> other;
    REQUIRE(NameGenerator::Create(WordSource(), options, seeded, other) == NameStatus::Ok);
    std::vector<std::string> other_names;
    REQUIRE(other->Take(200, other_names) == NameStatus::Ok);
    CHECK(other_names != first_names);
}
