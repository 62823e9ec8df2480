#pragma once

#include <string>

#include "cdkeygen/gen_status.hpp"
#include "cdkeygen/key_generator.hpp"

namespace cdkeygen {

// Raw text of the key form, as typed by the user.
struct FormInput {
    std::string count = "100";
    std::string length = "25";
    std::string pattern;
    std::string group_size = "5";
    std::string separator = "-";
    std::string alphabet;
    bool allow_ambiguous = false;
    bool unique = true;
};

// Validates the form and fills `out_config`. On failure `out_error` holds a
// message for the user and the status is InvalidConfig.
GenStatus ConfigFromForm(const FormInput& input, GenerationConfig& out_config, std::string& out_error);

}  // namespace cdkeygen
