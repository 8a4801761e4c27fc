/// @file error.cpp
/// @brief Error handling implementation for brine_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <brine/core/error.hpp>
#include <sstream>
#include <vector>

namespace brine_core {

// =============================================================================
// Error Message Formatting (Out-of-line for complex cases)
// =============================================================================

namespace detail {

const char* pickler_error_kind_name(PicklerError::Kind kind) {
    switch (kind) {
        case PicklerError::Kind::GenerationFailed: return "PicklerGenerationError";
        case PicklerError::Kind::DelegateBinding: return "DelegateBindingError";
        case PicklerError::Kind::AbstractTypeMisuse: return "AbstractTypeMisuseError";
        case PicklerError::Kind::InvalidValue: return "InvalidValueError";
        default: return "PicklerError";
    }
}

/// Format pickler error with full context
std::string format_pickler_error(const PicklerError& err) {
    std::ostringstream oss;
    oss << "[" << pickler_error_kind_name(err.kind) << "] " << err.message;

    if (!err.type_name.empty()) {
        oss << " (type: " << err.type_name << ")";
    }

    return oss.str();
}

/// Format wire format error with full context
std::string format_format_error(const FormatError& err) {
    std::ostringstream oss;
    oss << "[FormatError] " << err.message;

    if (!err.tag.empty()) {
        oss << " (field: " << err.tag << ")";
    }

    return oss.str();
}

/// Format type registry error with full context
std::string format_type_registry_error(const TypeRegistryError& err) {
    std::ostringstream oss;
    oss << "[TypeRegistryError] " << err.message;

    if (!err.type_name.empty()) {
        oss << " (type: " << err.type_name << ")";
    }
    if (!err.expected.empty() && !err.found.empty()) {
        oss << " (expected: " << err.expected << ", found: " << err.found << ")";
    }

    return oss.str();
}

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, PicklerError>) {
            oss << detail::format_pickler_error(err);
        } else if constexpr (std::is_same_v<T, FormatError>) {
            oss << detail::format_format_error(err);
        } else if constexpr (std::is_same_v<T, TypeRegistryError>) {
            oss << detail::format_type_registry_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

} // namespace brine_core
