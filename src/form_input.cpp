#include "cdkeygen/form_input.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>

namespace cdkeygen {

namespace {

std::string Trim(const std::string& value) {
    const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };
    const auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    const auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool ParseNumber(const std::string& text, std::size_t& out) {
    const std::string value = Trim(text);
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](const unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        return false;
    }
    try {
        const unsigned long long parsed = std::stoull(value);
        if (parsed > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max())) {
            return false;
        }
        out = static_cast<std::size_t>(parsed);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

}  // namespace

GenStatus ConfigFromForm(const FormInput& input, GenerationConfig& out_config, std::string& out_error) {
    std::size_t count = 0;
    std::size_t length = 0;
    std::size_t group_size = 0;
    if (!ParseNumber(input.count, count) ||
        !ParseNumber(input.length, length) ||
        !ParseNumber(input.group_size, group_size)) {
        out_error = "Count/Length/Group size must be numbers.";
        return GenStatus::InvalidConfig;
    }
    if (count == 0) {
        out_error = "Count must be > 0.";
        return GenStatus::InvalidConfig;
    }
    if (length == 0) {
        out_error = "Length must be > 0.";
        return GenStatus::InvalidConfig;
    }

    GenerationConfig config;
    config.count = count;
    config.length = length;

    const std::string pattern = Trim(input.pattern);
    if (!pattern.empty()) {
        if (pattern.find(kPatternPlaceholder) == std::string::npos) {
            out_error = "Pattern must contain at least one 'X'.";
            return GenStatus::InvalidConfig;
        }
        config.pattern = pattern;
    }
    config.group_size = config.pattern.has_value() ? 0 : group_size;

    const std::string separator = Trim(input.separator);
    config.separator = separator.empty() ? "-" : separator;

    const std::string alphabet = Trim(input.alphabet);
    if (!alphabet.empty()) {
        config.alphabet = alphabet;
    }
    config.avoid_ambiguous = !input.allow_ambiguous;
    config.unique = input.unique;

    out_error.clear();
    out_config = std::move(config);
    return GenStatus::Ok;
}

}  // namespace cdkeygen
