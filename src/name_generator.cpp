#include "namecraft/name_generator.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace namecraft {

NameGenerator::NameGenerator(WordSource words, const GeneratorOptions options, std::unique_ptr<IRandomSource> rng)
    : words_(std::move(words)), options_(options), rng_(std::move(rng)) {}

NameStatus NameGenerator::Create(
    WordSource words,
    const GeneratorOptions& options,
    const RandomSourceOptions& random_options,
    std::unique_ptr<NameGenerator>& out_generator) {
    NameStatus status = words.Validate();
    if (status != NameStatus::Ok) {
        return status;
    }

    std::unique_ptr<IRandomSource> rng = RandomSourceFactory::Create(random_options, status);
    if (status != NameStatus::Ok) {
        return status;
    }

    out_generator = std::make_unique<NameGenerator>(std::move(words), options, std::move(rng));
    return NameStatus::Ok;
}

NameStatus NameGenerator::CreateDefault(std::unique_ptr<NameGenerator>& out_generator) {
    return Create(WordSource(), GeneratorOptions{}, RandomSourceOptions{}, out_generator);
}

NameStatus NameGenerator::WithNaming(const CaseStyle style, std::unique_ptr<NameGenerator>& out_generator) {
    GeneratorOptions options;
    options.style = style;
    options.numbered = false;
    return Create(WordSource(), options, RandomSourceOptions{}, out_generator);
}

NameStatus NameGenerator::WithNumbers(const CaseStyle style, std::unique_ptr<NameGenerator>& out_generator) {
    GeneratorOptions options;
    options.style = style;
    options.numbered = true;
    return Create(WordSource(), options, RandomSourceOptions{}, out_generator);
}

NameStatus NameGenerator::Validate() const {
    if (!rng_) {
        return NameStatus::MissingRandomSource;
    }
    return words_.Validate();
}

NameStatus NameGenerator::Next(std::string& out_name) {
    if (!rng_) {
        return NameStatus::MissingRandomSource;
    }

    std::string adjective;
    NameStatus status = words_.PickAdjective(*rng_, adjective);
    if (status != NameStatus::Ok) {
        return status;
    }
    std::string noun;
    status = words_.PickNoun(*rng_, noun);
    if (status != NameStatus::Ok) {
        return status;
    }

    std::optional<std::uint16_t> suffix;
    if (options_.numbered) {
        std::uint16_t number = 0;
        status = DrawSuffix(number);
        if (status != NameStatus::Ok) {
            return status;
        }
        suffix = number;
    }

    // Numbered always carries a fresh suffix of its own and ignores the flag.
    if (options_.style == CaseStyle::Numbered) {
        std::uint16_t number = 0;
        status = DrawSuffix(number);
        if (status != NameStatus::Ok) {
            return status;
        }
        suffix = number;
    }

    out_name = CaseFormatter::Format(options_.style, adjective, noun, suffix);
    return NameStatus::Ok;
}

NameStatus NameGenerator::Take(const std::size_t count, std::vector<std::string>& out_names) {
    std::vector<std::string> names;
    names.reserve(count);
    const NameStatus status = Generate(count, [&names](const std::string& name) {
        names.push_back(name);
    });
    if (status != NameStatus::Ok) {
        return status;
    }
    out_names = std::move(names);
    return NameStatus::Ok;
}

NameStatus NameGenerator::Generate(const std::size_t count, const std::function<void(const std::string&)>& sink) {
    std::string name;
    for (std::size_t i = 0; i < count; ++i) {
        const NameStatus status = Next(name);
        if (status != NameStatus::Ok) {
            return status;
        }
        if (sink) {
            sink(name);
        }
    }
    return NameStatus::Ok;
}

const WordSource& NameGenerator::Words() const {
    return words_;
}

const GeneratorOptions& NameGenerator::Options() const {
    return options_;
}

NameStatus NameGenerator::DrawSuffix(std::uint16_t& out_number) {
    std::uint32_t value = 0;
    const NameStatus status = rng_->Uniform(kMinSuffix, kMaxSuffix, value);
    if (status != NameStatus::Ok) {
        return status;
    }
    out_number = static_cast<std::uint16_t>(value);
    return NameStatus::Ok;
}

}  // namespace namecraft
