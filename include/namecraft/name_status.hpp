#pragma once

#include <string_view>

namespace namecraft {

enum class NameStatus {
    Ok = 0,
    EmptyWordList,
    InvalidWord,
    UnknownCaseStyle,
    InvalidRange,
    MissingRandomSource,
    MissingRngBytes,
    FileIOError
};

inline std::string_view ToString(const NameStatus status) {
    switch (status) {
        case NameStatus::Ok:
            return "Ok";
        case NameStatus::EmptyWordList:
            return "EmptyWordList";
        case NameStatus::InvalidWord:
            return "InvalidWord";
        case NameStatus::UnknownCaseStyle:
            return "UnknownCaseStyle";
        case NameStatus::InvalidRange:
            return "InvalidRange";
        case NameStatus::MissingRandomSource:
            return "MissingRandomSource";
        case NameStatus::MissingRngBytes:
            return "MissingRngBytes";
        case NameStatus::FileIOError:
            return "FileIOError";
    }
    return "UnknownStatus";
}

}  // namespace namecraft
