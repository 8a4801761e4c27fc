#pragma once

/// @file exception.hpp
/// @brief Exception carrying brine_core::Error out of pickler operations

#include "fwd.hpp"
#include <brine/core/error.hpp>
#include <exception>
#include <string>

namespace brine_pickle {

/// Thrown by pickler operations and by resolution. All pickler errors are
/// unrecoverable at this layer and propagate to the top-level caller.
class PicklerException : public std::exception {
public:
    explicit PicklerException(brine_core::Error error);

    [[nodiscard]] const char* what() const noexcept override { return m_what.c_str(); }
    [[nodiscard]] const brine_core::Error& error() const noexcept { return m_error; }
    [[nodiscard]] brine_core::ErrorCode code() const noexcept { return m_error.code(); }
    [[nodiscard]] std::string message() const { return m_error.message(); }

    /// True when this carries a PicklerError of the given kind
    [[nodiscard]] bool is(brine_core::PicklerError::Kind kind) const;

    /// True when this carries a FormatError of the given kind
    [[nodiscard]] bool is(brine_core::FormatError::Kind kind) const;

    /// Record the type being resolved while this error propagated
    void add_resolution_frame(const std::string& type_name);

private:
    brine_core::Error m_error;
    std::string m_what;
};

} // namespace brine_pickle
