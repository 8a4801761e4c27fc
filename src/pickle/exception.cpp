/// @file exception.cpp
/// @brief PicklerException implementation

#include <brine/pickle/exception.hpp>

namespace brine_pickle {

PicklerException::PicklerException(brine_core::Error error)
    : m_error(std::move(error))
    , m_what(brine_core::build_error_chain(m_error)) {}

bool PicklerException::is(brine_core::PicklerError::Kind kind) const {
    const auto* err = m_error.as<brine_core::PicklerError>();
    return err && err->kind == kind;
}

bool PicklerException::is(brine_core::FormatError::Kind kind) const {
    const auto* err = m_error.as<brine_core::FormatError>();
    return err && err->kind == kind;
}

void PicklerException::add_resolution_frame(const std::string& type_name) {
    // Innermost type first: "Leaf <- Parent <- Root"
    if (const std::string* path = m_error.get_context("resolving")) {
        m_error.with_context("resolving", *path + " <- " + type_name);
    } else {
        m_error.with_context("resolving", type_name);
    }
    m_what = brine_core::build_error_chain(m_error);
}

} // namespace brine_pickle
