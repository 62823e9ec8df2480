#pragma once

#include <string_view>

namespace cdkeygen {

enum class GenStatus {
    Ok = 0,
    InvalidAlphabet,
    InvalidConfig,
    CapacityExceeded,
    UnsupportedFormat,
    IOFailure,
    MissingRngBytes,
    ResourceExhausted
};

inline std::string_view ToString(const GenStatus status) {
    switch (status) {
        case GenStatus::Ok:
            return "Ok";
        case GenStatus::InvalidAlphabet:
            return "InvalidAlphabet";
        case GenStatus::InvalidConfig:
            return "InvalidConfig";
        case GenStatus::CapacityExceeded:
            return "CapacityExceeded";
        case GenStatus::UnsupportedFormat:
            return "UnsupportedFormat";
        case GenStatus::IOFailure:
            return "IOFailure";
        case GenStatus::MissingRngBytes:
            return "MissingRngBytes";
        case GenStatus::ResourceExhausted:
            return "ResourceExhausted";
    }
    return "UnknownStatus";
}

}  // namespace cdkeygen
