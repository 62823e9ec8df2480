#include "cdkeygen/key_writer.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace cdkeygen {

namespace {

std::filesystem::path PathFromUtf8(const std::string& value) {
#ifdef _WIN32
    const auto* begin = reinterpret_cast<const char8_t*>(value.data());
    const auto* end = begin + value.size();
    return std::filesystem::path(std::u8string(begin, end));
#else
    return std::filesystem::path(value);
#endif
}

std::string NormalizeToken(std::string_view token) {
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())) != 0) {
        token.remove_prefix(1);
    }
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())) != 0) {
        token.remove_suffix(1);
    }
    std::string normalized(token);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return normalized;
}

std::string EscapeJson(const std::string_view input) {
    std::string output;
    output.reserve(input.size() + 8);
    for (const char ch : input) {
        switch (ch) {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default: {
                const auto byte = static_cast<unsigned char>(ch);
                if (byte < 0x20U) {
                    static constexpr char kHex[] = "0123456789ABCDEF";
                    output += "\\u00";
                    output.push_back(kHex[(byte >> 4U) & 0x0FU]);
                    output.push_back(kHex[byte & 0x0FU]);
                } else {
                    output.push_back(ch);
                }
                break;
            }
        }
    }
    return output;
}

// Minimal quoting: only fields holding a delimiter, quote or line break are quoted.
std::string EscapeCsvField(const std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string output;
    output.reserve(field.size() + 2);
    output.push_back('"');
    for (const char ch : field) {
        if (ch == '"') {
            output.push_back('"');
        }
        output.push_back(ch);
    }
    output.push_back('"');
    return output;
}

void RenderText(const std::vector<std::string>& keys, std::string& out) {
    for (const auto& key : keys) {
        out += key;
        out.push_back('\n');
    }
}

void RenderCsv(const std::vector<std::string>& keys, std::string& out) {
    out += "cd_key\r\n";
    for (const auto& key : keys) {
        out += EscapeCsvField(key);
        out += "\r\n";
    }
}

void RenderJson(const std::vector<std::string>& keys, std::string& out) {
    if (keys.empty()) {
        out += "{\n  \"cd_keys\": []\n}\n";
        return;
    }
    out += "{\n  \"cd_keys\": [\n";
    for (std::size_t i = 0; i < keys.size(); ++i) {
        out += "    \"";
        out += EscapeJson(keys[i]);
        out += "\"";
        if (i + 1 < keys.size()) {
            out.push_back(',');
        }
        out.push_back('\n');
    }
    out += "  ]\n}\n";
}

bool WriteFileText(const std::string& path, const std::string& text) {
    std::error_code ec;
    const std::filesystem::path p = PathFromUtf8(path);
    const auto parent = p.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    if (!text.empty()) {
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
    }
    out.close();
    return !out.fail();
}

}  // namespace

std::string_view ToString(const OutputFormat format) {
    switch (format) {
        case OutputFormat::Text:
            return "txt";
        case OutputFormat::Csv:
            return "csv";
        case OutputFormat::Json:
            return "json";
    }
    return "txt";
}

GenStatus KeyWriter::ParseFormat(const std::string_view token, OutputFormat& out_format) {
    const std::string normalized = NormalizeToken(token);
    if (normalized == "txt" || normalized == "text") {
        out_format = OutputFormat::Text;
    } else if (normalized == "csv") {
        out_format = OutputFormat::Csv;
    } else if (normalized == "json") {
        out_format = OutputFormat::Json;
    } else {
        return GenStatus::UnsupportedFormat;
    }
    return GenStatus::Ok;
}

OutputFormat KeyWriter::FormatFromExtension(const std::string& path) {
    const std::string extension = NormalizeToken(PathFromUtf8(path).extension().string());
    if (extension == ".csv") {
        return OutputFormat::Csv;
    }
    if (extension == ".json") {
        return OutputFormat::Json;
    }
    return OutputFormat::Text;
}

void KeyWriter::Render(const std::vector<std::string>& keys, const OutputFormat format, std::string& out_text) {
    out_text.clear();
    switch (format) {
        case OutputFormat::Text:
            RenderText(keys, out_text);
            break;
        case OutputFormat::Csv:
            RenderCsv(keys, out_text);
            break;
        case OutputFormat::Json:
            RenderJson(keys, out_text);
            break;
    }
}

GenStatus KeyWriter::Save(const std::vector<std::string>& keys, const std::string& path, const OutputFormat format) {
    if (path.empty()) {
        return GenStatus::IOFailure;
    }
    std::string text;
    Render(keys, format, text);
    if (!WriteFileText(path, text)) {
        return GenStatus::IOFailure;
    }
    return GenStatus::Ok;
}

GenStatus KeyWriter::Save(const std::vector<std::string>& keys, const std::string& path, const std::string_view format) {
    OutputFormat parsed = OutputFormat::Text;
    const GenStatus format_status = ParseFormat(format, parsed);
    if (format_status != GenStatus::Ok) {
        return format_status;
    }
    return Save(keys, path, parsed);
}

}  // namespace cdkeygen
