#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "namecraft/name_status.hpp"

namespace namecraft {

class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    // Draws a value uniformly from the inclusive range [min, max].
    virtual NameStatus Uniform(std::uint32_t min, std::uint32_t max, std::uint32_t& out_value) = 0;

    virtual std::string_view Name() const = 0;
};

struct RandomSourceOptions {
    // Unset selects the OS-seeded pool. A seed selects a reproducible stream.
    std::optional<std::uint64_t> seed;
};

class RandomSourceFactory {
public:
    static std::unique_ptr<IRandomSource> Create(
        const RandomSourceOptions& options,
        NameStatus& out_status);
};

}  // namespace namecraft
