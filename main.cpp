#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "namecraft/case_style.hpp"
#include "namecraft/name_generator.hpp"
#include "namecraft/name_status.hpp"
#include "namecraft/random_source.hpp"
#include "namecraft/word_source.hpp"

namespace {

constexpr const char* kVersion = "0.15.0";
constexpr std::size_t kDefaultAmount = 1;

struct CliOptions {
    bool help = false;
    bool version = false;
    bool list_strategies = false;
    bool number = false;
    bool log = false;
    std::string strategy = "Plain";
    std::optional<std::string> adjectives_path;
    std::optional<std::string> nouns_path;
    std::optional<std::uint64_t> seed;
    std::size_t amount = kDefaultAmount;
    bool saw_amount = false;
};

void CliLog(const CliOptions& opts, const std::string& message) {
    if (!opts.log) {
        return;
    }
    std::cerr << "[log] " << message << "\n";
}

bool ParseUnsigned(const std::string& value, unsigned long long& out) {
    if (value.empty() || value.front() == '-' || value.front() == '+') {
        return false;
    }
    std::size_t idx = 0;
    try {
        out = std::stoull(value, &idx);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return idx == value.size();
}

bool ParseArgs(const int argc, char* argv[], CliOptions& opts, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--version" || arg == "-V") {
            opts.version = true;
        } else if (arg == "--list-strategies") {
            opts.list_strategies = true;
        } else if (arg == "--number" || arg == "-n") {
            opts.number = true;
        } else if (arg == "--log") {
            opts.log = true;
        } else if (arg == "--strategy" || arg == "-s") {
            if (!require_value(opts.strategy)) {
                return false;
            }
        } else if (arg == "--adjectives") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            opts.adjectives_path = std::move(value);
        } else if (arg == "--nouns") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            opts.nouns_path = std::move(value);
        } else if (arg == "--seed") {
            std::string value;
            unsigned long long parsed = 0;
            if (!require_value(value)) {
                return false;
            }
            if (!ParseUnsigned(value, parsed) ||
                parsed > static_cast<unsigned long long>(std::numeric_limits<std::uint64_t>::max())) {
                error = "Invalid value for --seed";
                return false;
            }
            opts.seed = static_cast<std::uint64_t>(parsed);
        } else if (!arg.empty() && arg.front() == '-') {
            error = "Unknown argument: " + arg;
            return false;
        } else {
            if (opts.saw_amount) {
                error = "Unexpected argument: " + arg;
                return false;
            }
            unsigned long long parsed = 0;
            if (!ParseUnsigned(arg, parsed) ||
                parsed > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max())) {
                error = "Invalid amount: " + arg;
                return false;
            }
            opts.amount = static_cast<std::size_t>(parsed);
            opts.saw_amount = true;
        }
    }
    return true;
}

void PrintHelp(std::ostream& out) {
    out << "namecraft " << kVersion << " - random name generator with results like \"delirious-pail\"\n\n";
    out << "Usage:\n";
    out << "  namecraft [--number] [--strategy <name>] [--adjectives <file>] [--nouns <file>]\n";
    out << "            [--seed <N>] [--log] [amount]\n";
    out << "  namecraft --list-strategies\n\n";

    out << "Arguments:\n";
    out << "  amount               Number of names to generate (default 1, 0 prints nothing)\n\n";

    out << "Options:\n";
    out << "  --number, -n         Adds a random number to the name(s)\n";
    out << "  --strategy, -s <name>\n";
    out << "                       Use a different naming strategy (default Plain)\n";
    out << "  --adjectives <file>  Replace the built-in adjectives (one word per line)\n";
    out << "  --nouns <file>       Replace the built-in nouns (one word per line)\n";
    out << "  --seed <N>           Reproducible output for the same seed and word lists\n";
    out << "  --list-strategies    Show every naming strategy with its shape\n";
    out << "  --log                Show minimal runtime logs\n";
    out << "  --version, -V        Show version\n";
    out << "  --help, -h           Show this help\n\n";

    out << "Examples:\n";
    out << "  namecraft\n";
    out << "  namecraft --number 5\n";
    out << "  namecraft --strategy TrainCase 3\n";
    out << "  namecraft -s Numbered --seed 42 10\n";
}

void PrintStrategies(std::ostream& out) {
    for (const namecraft::CaseStyle style : namecraft::AllCaseStyles()) {
        out << "  " << namecraft::ToString(style);
        if (style == namecraft::CaseStyle::Plain) {
            out << "*";
        }
        out << " " << namecraft::CaseFormatter::Example(style) << "\n";
    }
    out << "  * default\n";
}

namecraft::NameStatus LoadWords(const CliOptions& opts, namecraft::WordSource& out_words) {
    std::shared_ptr<const namecraft::WordList> adjectives = namecraft::WordSource::DefaultAdjectives();
    std::shared_ptr<const namecraft::WordList> nouns = namecraft::WordSource::DefaultNouns();

    if (opts.adjectives_path.has_value()) {
        namecraft::WordList words;
        const namecraft::NameStatus status = namecraft::WordSource::LoadWordListFile(*opts.adjectives_path, words);
        if (status != namecraft::NameStatus::Ok) {
            return status;
        }
        CliLog(opts, "Loaded " + std::to_string(words.size()) + " adjectives from " + *opts.adjectives_path);
        adjectives = std::make_shared<const namecraft::WordList>(std::move(words));
    }
    if (opts.nouns_path.has_value()) {
        namecraft::WordList words;
        const namecraft::NameStatus status = namecraft::WordSource::LoadWordListFile(*opts.nouns_path, words);
        if (status != namecraft::NameStatus::Ok) {
            return status;
        }
        CliLog(opts, "Loaded " + std::to_string(words.size()) + " nouns from " + *opts.nouns_path);
        nouns = std::make_shared<const namecraft::WordList>(std::move(words));
    }

    out_words = namecraft::WordSource(std::move(adjectives), std::move(nouns));
    return namecraft::NameStatus::Ok;
}

int GenerateFlow(const CliOptions& opts) {
    namecraft::GeneratorOptions generator_options;
    namecraft::NameStatus status = namecraft::ParseCaseStyle(opts.strategy, generator_options.style);
    if (status != namecraft::NameStatus::Ok) {
        std::cerr << namecraft::ToString(status) << ": " << opts.strategy << "\n";
        return 1;
    }
    generator_options.numbered = opts.number;

    namecraft::WordSource words;
    status = LoadWords(opts, words);
    if (status != namecraft::NameStatus::Ok) {
        std::cerr << namecraft::ToString(status) << "\n";
        return 1;
    }

    namecraft::RandomSourceOptions random_options;
    random_options.seed = opts.seed;

    std::unique_ptr<namecraft::NameGenerator> generator;
    status = namecraft::NameGenerator::Create(std::move(words), generator_options, random_options, generator);
    if (status != namecraft::NameStatus::Ok) {
        std::cerr << namecraft::ToString(status) << "\n";
        return 1;
    }

    CliLog(opts, std::string("Strategy: ") + std::string(namecraft::ToString(generator_options.style)) +
        (generator_options.numbered ? " (numbered)" : ""));
    CliLog(opts, "Generating " + std::to_string(opts.amount) + " name(s) from " +
        std::to_string(generator->Words().Adjectives().size()) + " adjectives and " +
        std::to_string(generator->Words().Nouns().size()) + " nouns");

    status = generator->Generate(opts.amount, [](const std::string& name) {
        std::cout << name << "\n";
    });
    if (status != namecraft::NameStatus::Ok) {
        std::cerr << namecraft::ToString(status) << "\n";
        return 1;
    }
    CliLog(opts, "Done");
    return 0;
}

}  // namespace

int RunCliMain(const int argc, char* argv[]) {
    CliOptions opts;
    std::string error;
    if (!ParseArgs(argc, argv, opts, error)) {
        std::cerr << error << "\n";
        return 1;
    }

    if (opts.help) {
        PrintHelp(std::cout);
        return 0;
    }
    if (opts.version) {
        std::cout << "namecraft " << kVersion << "\n";
        return 0;
    }
    if (opts.list_strategies) {
        PrintStrategies(std::cout);
        return 0;
    }
    return GenerateFlow(opts);
}

int main(const int argc, char* argv[]) {
    return RunCliMain(argc, argv);
}
