/// @file state.cpp
/// @brief Session state implementation

#include <brine/pickle/state.hpp>

namespace brine_pickle {

using brine_core::FormatError;
using brine_core::PicklerError;

// =============================================================================
// WriteState
// =============================================================================

std::optional<std::uint32_t> WriteState::find_reference(const ReferenceKey& key) const {
    if (!m_track_references) {
        return std::nullopt;
    }
    auto it = m_references.find(key);
    if (it == m_references.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::uint32_t WriteState::add_reference(const ReferenceKey& key) {
    std::uint32_t id = m_next_id++;
    if (m_track_references) {
        m_references.emplace(key, id);
    }
    return id;
}

// =============================================================================
// ReadState
// =============================================================================

std::uint32_t ReadState::reserve_reference() {
    m_references.emplace_back();
    return static_cast<std::uint32_t>(m_references.size() - 1);
}

void ReadState::fill_reference(std::uint32_t id, ObjectRef value) {
    if (id >= m_references.size()) {
        throw PicklerException(FormatError::invalid_reference(id, "id was never reserved"));
    }
    m_references[id] = std::move(value);
}

ObjectRef ReadState::reference(std::uint32_t id) const {
    if (id >= m_references.size()) {
        throw PicklerException(FormatError::invalid_reference(id, "unknown id"));
    }
    if (m_references[id].is_null()) {
        throw PicklerException(FormatError::invalid_reference(id, "cyclic reference to a value still being read"));
    }
    return m_references[id];
}

// =============================================================================
// CloneState
// =============================================================================

const ObjectRef* CloneState::find(const ReferenceKey& key) const {
    auto it = m_clones.find(key);
    if (it == m_clones.end()) {
        return nullptr;
    }
    if (it->second.is_null()) {
        throw PicklerException(PicklerError::invalid_value(
            brine_core::demangle(key.type.name()), "cyclic object graph cannot be cloned"));
    }
    return &it->second;
}

} // namespace brine_pickle
