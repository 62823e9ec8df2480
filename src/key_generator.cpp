#include "cdkeygen/key_generator.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <new>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "osrng.h"

#include "cdkeygen/alphabet.hpp"

namespace cdkeygen {

namespace {

char SampleChar(const std::string_view alphabet, CryptoPP::RandomNumberGenerator& rng) {
    const auto max_index = static_cast<CryptoPP::word32>(alphabet.size() - 1);
    return alphabet[rng.GenerateWord32(0, max_index)];
}

void ToUpperAscii(std::string& value) {
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
}

void Emit(const LogSink& log, const std::string& message) {
    if (log) {
        log(message);
    }
}

std::string FormatProgress(
    const std::size_t accepted,
    const std::size_t requested,
    const std::chrono::steady_clock::time_point start) {
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    std::ostringstream out;
    out << "[" << accepted << "/" << requested << "] generated... ("
        << std::fixed << std::setprecision(1) << elapsed.count() << "s)";
    return out.str();
}

}  // namespace

std::uint64_t EstimateCapacity(const std::size_t alphabet_size, const std::size_t keyspace_length) {
    if (keyspace_length == 0) {
        return 1;
    }
    if (alphabet_size <= 1) {
        return alphabet_size;
    }

    const auto base = static_cast<std::uint64_t>(alphabet_size);
    if (base >= kCapacityCeiling) {
        return kCapacityCeiling;
    }
    std::uint64_t value = 1;
    for (std::size_t i = 0; i < keyspace_length; ++i) {
        if (value > kCapacityCeiling / base) {
            return kCapacityCeiling;
        }
        value *= base;
        if (value >= kCapacityCeiling) {
            return kCapacityCeiling;
        }
    }
    return value;
}

std::size_t KeyspaceLength(const GenerationConfig& config) {
    if (config.pattern.has_value()) {
        return static_cast<std::size_t>(
            std::count(config.pattern->begin(), config.pattern->end(), kPatternPlaceholder));
    }
    return config.length;
}

std::string ApplyGrouping(const std::string_view raw, const std::size_t group_size, const std::string_view separator) {
    if (group_size == 0) {
        return std::string(raw);
    }

    std::string out;
    const std::size_t groups = (raw.size() + group_size - 1) / group_size;
    out.reserve(raw.size() + (groups > 0 ? (groups - 1) * separator.size() : 0));
    for (std::size_t pos = 0; pos < raw.size(); pos += group_size) {
        if (pos > 0) {
            out.append(separator);
        }
        out.append(raw.substr(pos, group_size));
    }
    return out;
}

GenStatus KeyGenerator::Validate(const GenerationConfig& config) {
    if (config.count == 0 || config.count > std::vector<std::string>().max_size()) {
        return GenStatus::InvalidConfig;
    }
    if (config.pattern.has_value()) {
        if (config.pattern->find(kPatternPlaceholder) == std::string::npos) {
            return GenStatus::InvalidConfig;
        }
    } else if (config.length == 0) {
        return GenStatus::InvalidConfig;
    }
    return GenStatus::Ok;
}

GenStatus KeyGenerator::GenerateOne(
    const GenerationConfig& config,
    const std::string_view alphabet,
    CryptoPP::RandomNumberGenerator& rng,
    std::string& out_key) {
    if (alphabet.size() < kMinAlphabetSize) {
        return GenStatus::InvalidAlphabet;
    }

    std::string key;
    if (config.pattern.has_value()) {
        key.reserve(config.pattern->size());
        for (const char ch : *config.pattern) {
            key.push_back(ch == kPatternPlaceholder ? SampleChar(alphabet, rng) : ch);
        }
    } else {
        std::string raw;
        raw.reserve(config.length);
        for (std::size_t i = 0; i < config.length; ++i) {
            raw.push_back(SampleChar(alphabet, rng));
        }
        key = ApplyGrouping(raw, config.group_size, config.separator);
    }

    if (config.uppercase) {
        ToUpperAscii(key);
    }
    out_key = std::move(key);
    return GenStatus::Ok;
}

GenStatus ResolveAlphabet(const GenerationConfig& config, std::string& out_alphabet) {
    std::string alphabet;
    const GenStatus status = Alphabet::Build(config.alphabet, config.avoid_ambiguous, alphabet);
    if (status != GenStatus::Ok || !config.uppercase) {
        out_alphabet = std::move(alphabet);
        return status;
    }
    // Keys are upper-cased after sampling, so sample from the folded set.
    ToUpperAscii(alphabet);
    return Alphabet::Build(alphabet, config.avoid_ambiguous, out_alphabet);
}

GenStatus KeyGenerator::Generate(
    const GenerationConfig& config,
    std::vector<std::string>& out_keys,
    const LogSink& log) {
    out_keys.clear();
    try {
        CryptoPP::AutoSeededRandomPool rng;
        return Generate(config, rng, out_keys, log);
    } catch (const CryptoPP::Exception&) {
        return GenStatus::MissingRngBytes;
    }
}

GenStatus KeyGenerator::Generate(
    const GenerationConfig& config,
    CryptoPP::RandomNumberGenerator& rng,
    std::vector<std::string>& out_keys,
    const LogSink& log) {
    out_keys.clear();

    const GenStatus config_status = Validate(config);
    if (config_status != GenStatus::Ok) {
        return config_status;
    }

    std::string alphabet;
    const GenStatus alphabet_status = ResolveAlphabet(config, alphabet);
    if (alphabet_status != GenStatus::Ok) {
        return alphabet_status;
    }

    const std::uint64_t capacity = EstimateCapacity(alphabet.size(), KeyspaceLength(config));
    if (config.unique && capacity < kCapacityCeiling && static_cast<std::uint64_t>(config.count) > capacity) {
        return GenStatus::CapacityExceeded;
    }

    const auto start = std::chrono::steady_clock::now();
    const bool report_progress = config.count >= kProgressMinCount;
    std::size_t attempts = 0;
    bool warned = false;

    try {
        std::vector<std::string> keys;
        keys.reserve(std::min(config.count, kReserveLimit));
        std::unordered_set<std::string> seen;
        if (config.unique) {
            seen.reserve(std::min(config.count, kReserveLimit));
        }

        while (keys.size() < config.count) {
            std::string key;
            const GenStatus key_status = GenerateOne(config, alphabet, rng, key);
            if (key_status != GenStatus::Ok) {
                return key_status;
            }
            ++attempts;

            if (config.unique && !warned &&
                attempts > config.count * kCollisionAttemptFactor &&
                alphabet.size() < kCollisionAlphabetLimit) {
                Emit(log, "Warning: many collisions occurring. Consider increasing length/alphabet.");
                warned = true;
            }

            if (config.unique && !seen.insert(key).second) {
                continue;
            }
            keys.push_back(std::move(key));

            if (report_progress && keys.size() % kProgressInterval == 0) {
                Emit(log, FormatProgress(keys.size(), config.count, start));
            }
        }
        out_keys = std::move(keys);
    } catch (const CryptoPP::Exception&) {
        return GenStatus::MissingRngBytes;
    } catch (const std::bad_alloc&) {
        return GenStatus::ResourceExhausted;
    } catch (const std::length_error&) {
        return GenStatus::ResourceExhausted;
    }
    return GenStatus::Ok;
}

}  // namespace cdkeygen
