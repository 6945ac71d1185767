#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the budget tracking library.

#include <cstdint>
#include <string_view>

namespace pbt::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone. Ranges that are not listed
/// are reserved.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0802,

    // Budget (0x0900 - 0x09FF)
    InvalidBudgetConfig = 0x0900,
    BudgetConfigNotFound = 0x0901,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Budget";
        default: return "Unknown";
    }
}

} // namespace pbt::foundation
