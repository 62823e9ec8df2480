#include "cdkeygen/alphabet.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace cdkeygen {

namespace {

constexpr std::string_view kAmbiguous = "0O1IL";

bool IsAmbiguous(const char ch) {
    return kAmbiguous.find(ch) != std::string_view::npos;
}

}  // namespace

GenStatus Alphabet::Build(
    const std::optional<std::string>& custom,
    const bool avoid_ambiguous,
    std::string& out_alphabet) {
    const std::string& base = (custom.has_value() && !custom->empty())
        ? *custom
        : (avoid_ambiguous ? DefaultNoAmbiguous() : DefaultFull());

    std::array<bool, 256> seen{};
    std::string normalized;
    normalized.reserve(base.size());
    for (const char ch : base) {
        const auto byte = static_cast<unsigned char>(ch);
        if (seen[byte]) {
            continue;
        }
        seen[byte] = true;
        if (avoid_ambiguous && IsAmbiguous(ch)) {
            continue;
        }
        if (std::isspace(byte) != 0) {
            continue;
        }
        normalized.push_back(ch);
    }

    if (normalized.size() < kMinAlphabetSize) {
        out_alphabet.clear();
        return GenStatus::InvalidAlphabet;
    }
    out_alphabet = std::move(normalized);
    return GenStatus::Ok;
}

const std::string& Alphabet::DefaultNoAmbiguous() {
    static const std::string alphabet = "ABCDEFGHJKMNPQRSTUVWXYZ23456789";
    return alphabet;
}

const std::string& Alphabet::DefaultFull() {
    static const std::string alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    return alphabet;
}

std::string_view Alphabet::AmbiguousCharacters() {
    return kAmbiguous;
}

}  // namespace cdkeygen
