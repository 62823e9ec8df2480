#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "cdkeygen/gen_status.hpp"

namespace cdkeygen {

enum class OutputFormat {
    Text,
    Csv,
    Json
};

std::string_view ToString(OutputFormat format);

class KeyWriter {
public:
    // Accepts "txt"/"text", "csv" and "json", case-insensitive, surrounding
    // whitespace ignored.
    static GenStatus ParseFormat(std::string_view token, OutputFormat& out_format);

    static OutputFormat FormatFromExtension(const std::string& path);

    static void Render(const std::vector<std::string>& keys, OutputFormat format, std::string& out_text);

    static GenStatus Save(const std::vector<std::string>& keys, const std::string& path, OutputFormat format);
    static GenStatus Save(const std::vector<std::string>& keys, const std::string& path, std::string_view format);
};

}  // namespace cdkeygen
