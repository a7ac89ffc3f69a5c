#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "namecraft/random_source.hpp"

namespace namecraft::test {

// Replays a fixed list of draws and records each requested range. Once the
// script runs out it keeps returning the low end of the range.
class ScriptedRandomSource final : public IRandomSource {
public:
    struct Request {
        std::uint32_t min;
        std::uint32_t max;
    };

    explicit ScriptedRandomSource(std::vector<std::uint32_t> script, std::vector<Request>* requests = nullptr)
        : script_(std::move(script)), requests_(requests) {}

    NameStatus Uniform(const std::uint32_t min, const std::uint32_t max, std::uint32_t& out_value) override {
        if (requests_ != nullptr) {
            requests_->push_back({min, max});
        }
        if (min > max) {
            return NameStatus::InvalidRange;
        }
        out_value = next_ < script_.size() ? script_[next_++] : min;
        return NameStatus::Ok;
    }

    std::string_view Name() const override {
        return "scripted";
    }

private:
    std::vector<std::uint32_t> script_;
    std::size_t next_ = 0;
    std::vector<Request>* requests_;
};

// Always fails, as an unavailable entropy source would.
class FailingRandomSource final : public IRandomSource {
public:
    NameStatus Uniform(std::uint32_t, std::uint32_t, std::uint32_t&) override {
        return NameStatus::MissingRngBytes;
    }

    std::string_view Name() const override {
        return "failing";
    }
};

}  // namespace namecraft::test
