#include "namecraft/word_source.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace namecraft {

namespace {

const std::shared_ptr<const WordList>& EmptyList() {
    static const std::shared_ptr<const WordList> empty = std::make_shared<const WordList>();
    return empty;
}

bool IsLowerAsciiWord(const std::string& word) {
    if (word.empty()) {
        return false;
    }
    for (const char ch : word) {
        if (ch < 'a' || ch > 'z') {
            return false;
        }
    }
    return true;
}

NameStatus ValidateWords(const WordList& words) {
    if (words.empty()) {
        return NameStatus::EmptyWordList;
    }
    for (const std::string& word : words) {
        if (!IsLowerAsciiWord(word)) {
            return NameStatus::InvalidWord;
        }
    }
    return NameStatus::Ok;
}

}  // namespace

WordSource::WordSource() : adjectives_(DefaultAdjectives()), nouns_(DefaultNouns()) {}

WordSource::WordSource(WordList adjectives, WordList nouns)
    : adjectives_(std::make_shared<const WordList>(std::move(adjectives))),
      nouns_(std::make_shared<const WordList>(std::move(nouns))) {}

WordSource::WordSource(std::shared_ptr<const WordList> adjectives, std::shared_ptr<const WordList> nouns)
    : adjectives_(adjectives ? std::move(adjectives) : EmptyList()),
      nouns_(nouns ? std::move(nouns) : EmptyList()) {}

const WordList& WordSource::Adjectives() const {
    return *adjectives_;
}

const WordList& WordSource::Nouns() const {
    return *nouns_;
}

NameStatus WordSource::Validate() const {
    if (adjectives_->empty() || nouns_->empty()) {
        return NameStatus::EmptyWordList;
    }
    const NameStatus status = ValidateWords(*adjectives_);
    if (status != NameStatus::Ok) {
        return status;
    }
    return ValidateWords(*nouns_);
}

NameStatus WordSource::PickAdjective(IRandomSource& rng, std::string& out_word) const {
    return Pick(*adjectives_, rng, out_word);
}

NameStatus WordSource::PickNoun(IRandomSource& rng, std::string& out_word) const {
    return Pick(*nouns_, rng, out_word);
}

NameStatus WordSource::Pick(const WordList& words, IRandomSource& rng, std::string& out_word) {
    if (words.empty()) {
        return NameStatus::EmptyWordList;
    }
    if (words.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
        return NameStatus::InvalidRange;
    }

    std::uint32_t index = 0;
    const NameStatus status = rng.Uniform(0U, static_cast<std::uint32_t>(words.size() - 1U), index);
    if (status != NameStatus::Ok) {
        return status;
    }
    if (!IsLowerAsciiWord(words[index])) {
        return NameStatus::InvalidWord;
    }
    out_word = words[index];
    return NameStatus::Ok;
}

NameStatus WordSource::LoadWordListFile(const std::string& path, WordList& out_words) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return NameStatus::FileIOError;
    }

    WordList words;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const std::string token = TrimAsciiWhitespace(line);
        if (token.empty() || token.front() == '#') {
            continue;
        }

        bool ascii_ok = true;
        std::string normalized = NormalizeAsciiLower(token, ascii_ok);
        if (!ascii_ok || !IsLowerAsciiWord(normalized)) {
            return NameStatus::InvalidWord;
        }
        words.push_back(std::move(normalized));
    }
    if (file.bad()) {
        return NameStatus::FileIOError;
    }
    if (words.empty()) {
        return NameStatus::EmptyWordList;
    }

    out_words = std::move(words);
    return NameStatus::Ok;
}

std::string WordSource::TrimAsciiWhitespace(const std::string_view input) {
    std::size_t start = 0;
    std::size_t end = input.size();
    while (start < end && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

// Rejects non-ASCII bytes and inner whitespace: a word is one token.
std::string WordSource::NormalizeAsciiLower(const std::string_view input, bool& ascii_ok) {
    ascii_ok = true;
    std::string output;
    output.reserve(input.size());
    for (const char ch : input) {
        const unsigned char value = static_cast<unsigned char>(ch);
        if (value >= 128U || std::isspace(value) != 0 || std::iscntrl(value) != 0) {
            ascii_ok = false;
            return {};
        }
        output.push_back(static_cast<char>(std::tolower(value)));
    }
    return output;
}

}  // namespace namecraft
