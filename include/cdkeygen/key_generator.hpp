#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cryptlib.h"

#include "cdkeygen/gen_status.hpp"

namespace cdkeygen {

constexpr std::size_t kDefaultKeyCount = 10;
constexpr std::size_t kDefaultKeyLength = 25;
constexpr char kPatternPlaceholder = 'X';
constexpr std::uint64_t kCapacityCeiling = 1000000000000000000ULL;

constexpr std::size_t kCollisionAttemptFactor = 50;
constexpr std::size_t kCollisionAlphabetLimit = 10;
constexpr std::size_t kProgressMinCount = 5000;
constexpr std::size_t kProgressInterval = 1000;
constexpr std::size_t kReserveLimit = 64 * kProgressInterval;

using LogSink = std::function<void(const std::string&)>;

struct GenerationConfig {
    std::size_t count = kDefaultKeyCount;
    std::size_t length = kDefaultKeyLength;
    std::optional<std::string> pattern;
    std::optional<std::string> alphabet;
    bool avoid_ambiguous = true;
    bool unique = true;
    std::size_t group_size = 0;
    std::string separator = "-";
    bool uppercase = true;
};

// alphabet_size ^ keyspace_length, saturated at kCapacityCeiling.
std::uint64_t EstimateCapacity(std::size_t alphabet_size, std::size_t keyspace_length);

// Number of sampled positions: pattern placeholders, or `length` without a pattern.
std::size_t KeyspaceLength(const GenerationConfig& config);

// Alphabet::Build, then folded to upper case when `config.uppercase` is set so
// the sampling set matches what ends up in the keys.
GenStatus ResolveAlphabet(const GenerationConfig& config, std::string& out_alphabet);

std::string ApplyGrouping(std::string_view raw, std::size_t group_size, std::string_view separator);

class KeyGenerator {
public:
    static GenStatus Validate(const GenerationConfig& config);

    static GenStatus Generate(
        const GenerationConfig& config,
        std::vector<std::string>& out_keys,
        const LogSink& log = {});

    static GenStatus Generate(
        const GenerationConfig& config,
        CryptoPP::RandomNumberGenerator& rng,
        std::vector<std::string>& out_keys,
        const LogSink& log = {});

    // `alphabet` must already be normalized by Alphabet::Build.
    static GenStatus GenerateOne(
        const GenerationConfig& config,
        std::string_view alphabet,
        CryptoPP::RandomNumberGenerator& rng,
        std::string& out_key);
};

}  // namespace cdkeygen
