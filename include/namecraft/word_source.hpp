#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "namecraft/name_status.hpp"
#include "namecraft/random_source.hpp"

namespace namecraft {

using WordList = std::vector<std::string>;

class WordSource {
public:
    // Built-in curated English lists.
    WordSource();
    WordSource(WordList adjectives, WordList nouns);
    WordSource(std::shared_ptr<const WordList> adjectives, std::shared_ptr<const WordList> nouns);

    const WordList& Adjectives() const;
    const WordList& Nouns() const;

    // Ok only when both lists hold at least one word and every word is
    // non-empty lowercase [a-z].
    NameStatus Validate() const;

    NameStatus PickAdjective(IRandomSource& rng, std::string& out_word) const;
    NameStatus PickNoun(IRandomSource& rng, std::string& out_word) const;

    // Uniform selection with replacement. Fails with EmptyWordList or
    // InvalidWord rather than producing a malformed token.
    static NameStatus Pick(const WordList& words, IRandomSource& rng, std::string& out_word);

    // One word per line; blank lines and '#' comments are skipped. Words are
    // trimmed and folded to lowercase; anything outside [a-z] is InvalidWord.
    static NameStatus LoadWordListFile(const std::string& path, WordList& out_words);

    static const std::shared_ptr<const WordList>& DefaultAdjectives();
    static const std::shared_ptr<const WordList>& DefaultNouns();

private:
    static std::string TrimAsciiWhitespace(std::string_view input);
    static std::string NormalizeAsciiLower(std::string_view input, bool& ascii_ok);

    std::shared_ptr<const WordList> adjectives_;
    std::shared_ptr<const WordList> nouns_;
};

}  // namespace namecraft
