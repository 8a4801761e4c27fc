#pragma once

/// @file error.hpp
/// @brief Error handling types for brine_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace brine_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    GenerationFailed,
    BindingFailed,
    TypeMismatch,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::GenerationFailed: return "GenerationFailed";
        case ErrorCode::BindingFailed: return "BindingFailed";
        case ErrorCode::TypeMismatch: return "TypeMismatch";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Pickler construction and usage errors
struct PicklerError {
    enum class Kind : std::uint8_t {
        GenerationFailed,    // No pickler can be built for the type
        DelegateBinding,     // Method + target rebinding failed
        AbstractTypeMisuse,  // Concrete value reached an abstract placeholder
        InvalidValue,        // Value cannot be encoded by this pickler
    };

    Kind kind;
    std::string message;
    std::string type_name;
    std::string reason;

    [[nodiscard]] static PicklerError generation_failed(const std::string& type, const std::string& why) {
        return PicklerError{Kind::GenerationFailed,
            "Cannot generate pickler for '" + type + "': " + why, type, why};
    }

    [[nodiscard]] static PicklerError delegate_binding(const std::string& type, const std::string& why) {
        return PicklerError{Kind::DelegateBinding,
            "Cannot bind delegate '" + type + "': " + why, type, why};
    }

    [[nodiscard]] static PicklerError abstract_type_misuse(const std::string& type) {
        return PicklerError{Kind::AbstractTypeMisuse,
            "internal error: attempting to consume abstract pickler '" + type + "'", type, {}};
    }

    [[nodiscard]] static PicklerError invalid_value(const std::string& type, const std::string& why) {
        return PicklerError{Kind::InvalidValue,
            "Invalid value for '" + type + "': " + why, type, why};
    }
};

/// Wire format errors
struct FormatError {
    enum class Kind : std::uint8_t {
        UnexpectedEnd,     // Input ended before the field was complete
        TagMismatch,       // Self-describing input carries another tag
        InvalidData,       // Malformed or mistyped field
        TypeMismatch,      // Root type differs from the requested one
        InvalidReference,  // Unknown or in-progress back reference
    };

    Kind kind;
    std::string message;
    std::string tag;

    [[nodiscard]] static FormatError unexpected_end(const std::string& field) {
        return FormatError{Kind::UnexpectedEnd, "Unexpected end of input reading '" + field + "'", field};
    }

    [[nodiscard]] static FormatError tag_mismatch(const std::string& expected, const std::string& found) {
        return FormatError{Kind::TagMismatch,
            "Expected field '" + expected + "', found '" + found + "'", expected};
    }

    [[nodiscard]] static FormatError invalid_data(const std::string& field, const std::string& why) {
        return FormatError{Kind::InvalidData, "Invalid data in '" + field + "': " + why, field};
    }

    [[nodiscard]] static FormatError type_mismatch(const std::string& expected, const std::string& found) {
        return FormatError{Kind::TypeMismatch,
            "Expected serialized type '" + expected + "', found '" + found + "'", {}};
    }

    [[nodiscard]] static FormatError invalid_reference(std::uint32_t id, const std::string& why) {
        return FormatError{Kind::InvalidReference,
            "Invalid object reference #" + std::to_string(id) + ": " + why, {}};
    }
};

/// Type registry errors
struct TypeRegistryError {
    enum class Kind : std::uint8_t {
        NotRegistered,      // Type not registered
        AlreadyRegistered,  // Name already taken by another type
        TypeMismatch,       // Cast type mismatch
    };

    Kind kind;
    std::string message;
    std::string type_name;
    std::string expected;  // For TypeMismatch
    std::string found;     // For TypeMismatch

    [[nodiscard]] static TypeRegistryError not_registered(const std::string& name) {
        return TypeRegistryError{Kind::NotRegistered, "Type not registered: " + name, name, {}, {}};
    }

    [[nodiscard]] static TypeRegistryError already_registered(const std::string& name) {
        return TypeRegistryError{Kind::AlreadyRegistered, "Type name already registered: " + name, name, {}, {}};
    }

    [[nodiscard]] static TypeRegistryError type_mismatch(const std::string& expected_t, const std::string& found_t) {
        return TypeRegistryError{Kind::TypeMismatch,
            "Type mismatch: expected " + expected_t + ", found " + found_t,
            {}, expected_t, found_t};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,
        ParseFailed,
        InvalidValue,
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, {}};
    }

    [[nodiscard]] static ConfigError parse_failed(const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Config parse failed: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid config value '" + key + "': " + reason, key};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        PicklerError,
        FormatError,
        TypeRegistryError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(PicklerError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(FormatError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(TypeRegistryError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(PicklerError::Kind kind) {
        switch (kind) {
            case PicklerError::Kind::GenerationFailed: return ErrorCode::GenerationFailed;
            case PicklerError::Kind::DelegateBinding: return ErrorCode::BindingFailed;
            case PicklerError::Kind::AbstractTypeMisuse: return ErrorCode::InvalidState;
            case PicklerError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(FormatError::Kind kind) {
        switch (kind) {
            case FormatError::Kind::UnexpectedEnd: return ErrorCode::IOError;
            case FormatError::Kind::TagMismatch: return ErrorCode::ParseError;
            case FormatError::Kind::InvalidData: return ErrorCode::ParseError;
            case FormatError::Kind::TypeMismatch: return ErrorCode::TypeMismatch;
            case FormatError::Kind::InvalidReference: return ErrorCode::ParseError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(TypeRegistryError::Kind kind) {
        switch (kind) {
            case TypeRegistryError::Kind::NotRegistered: return ErrorCode::NotFound;
            case TypeRegistryError::Kind::AlreadyRegistered: return ErrorCode::AlreadyExists;
            case TypeRegistryError::Kind::TypeMismatch: return ErrorCode::TypeMismatch;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

} // namespace brine_core
