#include "namecraft/random_source.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "aes.h"
#include "cryptlib.h"
#include "modes.h"
#include "osrng.h"
#include "sha.h"

namespace namecraft {

namespace {

NameStatus DrawWord32(
    CryptoPP::RandomNumberGenerator& rng,
    const std::uint32_t min,
    const std::uint32_t max,
    std::uint32_t& out_value) {
    if (min > max) {
        return NameStatus::InvalidRange;
    }
    try {
        out_value = static_cast<std::uint32_t>(rng.GenerateWord32(min, max));
    } catch (const CryptoPP::Exception&) {
        return NameStatus::MissingRngBytes;
    }
    return NameStatus::Ok;
}

class OsRandomSource final : public IRandomSource {
public:
    NameStatus Uniform(const std::uint32_t min, const std::uint32_t max, std::uint32_t& out_value) override {
        return DrawWord32(pool_, min, max, out_value);
    }

    std::string_view Name() const override {
        return "os";
    }

private:
    CryptoPP::AutoSeededRandomPool pool_;
};

class SeededRandomSource final : public IRandomSource {
public:
    explicit SeededRandomSource(const std::uint64_t seed) {
        std::array<CryptoPP::byte, 8> seed_bytes{};
        for (std::size_t i = 0; i < seed_bytes.size(); ++i) {
            seed_bytes[i] = static_cast<CryptoPP::byte>((seed >> (i * 8U)) & 0xFFU);
        }

        std::array<CryptoPP::byte, CryptoPP::SHA256::DIGESTSIZE> key{};
        CryptoPP::SHA256().CalculateDigest(key.data(), seed_bytes.data(), seed_bytes.size());

        const std::array<CryptoPP::byte, CryptoPP::AES::BLOCKSIZE> iv{};
        stream_.SetKeyWithIV(key.data(), key.size(), iv.data(), iv.size());
    }

    NameStatus Uniform(const std::uint32_t min, const std::uint32_t max, std::uint32_t& out_value) override {
        return DrawWord32(stream_, min, max, out_value);
    }

    std::string_view Name() const override {
        return "seeded";
    }

private:
    CryptoPP::OFB_Mode<CryptoPP::AES>::Encryption stream_;
};

}  // namespace

std::unique_ptr<IRandomSource> RandomSourceFactory::Create(
    const RandomSourceOptions& options,
    NameStatus& out_status) {
    try {
        std::unique_ptr<IRandomSource> source;
        if (options.seed.has_value()) {
            source = std::make_unique<SeededRandomSource>(*options.seed);
        } else {
            source = std::make_unique<OsRandomSource>();
        }
        out_status = NameStatus::Ok;
        return source;
    } catch (const CryptoPP::Exception&) {
        out_status = NameStatus::MissingRngBytes;
        return nullptr;
    }
}

}  // namespace namecraft
