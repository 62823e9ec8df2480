#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "cdkeygen/gen_status.hpp"

namespace cdkeygen {

constexpr std::size_t kMinAlphabetSize = 2;

class Alphabet {
public:
    // Normalizes `custom` (or a built-in default when absent) into a
    // deduplicated, whitespace-free sampling set. Order of first occurrence
    // is preserved.
    static GenStatus Build(
        const std::optional<std::string>& custom,
        bool avoid_ambiguous,
        std::string& out_alphabet);

    static const std::string& DefaultNoAmbiguous();
    static const std::string& DefaultFull();
    static std::string_view AmbiguousCharacters();
};

}  // namespace cdkeygen
