#pragma once

/// @file state.hpp
/// @brief Per-session state for write, read, clone and visit

#include "fwd.hpp"
#include "formatter.hpp"
#include "object.hpp"
#include "exception.hpp"
#include <brine/core/type_registry.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace brine_pickle {

// =============================================================================
// ReferenceKey
// =============================================================================

/// Identity of a shared value: its address plus the type it is stored as.
/// The type keeps a record and its first member apart.
struct ReferenceKey {
    const void* address = nullptr;
    std::type_index type = std::type_index(typeid(void));

    bool operator==(const ReferenceKey& other) const noexcept {
        return address == other.address && type == other.type;
    }
};

struct ReferenceKeyHash {
    std::size_t operator()(const ReferenceKey& key) const noexcept {
        std::size_t h = std::hash<const void*>{}(key.address);
        return h ^ (std::hash<std::type_index>{}(key.type) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

// =============================================================================
// WriteState
// =============================================================================

/// Write session: formatter plus the table of already written shared values
class WriteState {
public:
    explicit WriteState(FormatWriter& writer, bool track_references = true)
        : m_writer(writer), m_track_references(track_references) {}

    WriteState(const WriteState&) = delete;
    WriteState& operator=(const WriteState&) = delete;

    [[nodiscard]] FormatWriter& formatter() noexcept { return m_writer; }

    [[nodiscard]] bool tracks_references() const noexcept { return m_track_references; }

    /// Id of a value already written in this session
    [[nodiscard]] std::optional<std::uint32_t> find_reference(const ReferenceKey& key) const;

    /// Assign the next id to a value about to be written in full
    std::uint32_t add_reference(const ReferenceKey& key);

    [[nodiscard]] std::uint32_t reference_count() const noexcept { return m_next_id; }

private:
    FormatWriter& m_writer;
    bool m_track_references;
    std::unordered_map<ReferenceKey, std::uint32_t, ReferenceKeyHash> m_references;
    std::uint32_t m_next_id = 0;
};

// =============================================================================
// ReadState
// =============================================================================

/// Read session: formatter plus the table of shared values read so far.
/// Ids are assigned in the same pre-order the writer used.
class ReadState {
public:
    explicit ReadState(FormatReader& reader) : m_reader(reader) {}

    ReadState(const ReadState&) = delete;
    ReadState& operator=(const ReadState&) = delete;

    [[nodiscard]] FormatReader& formatter() noexcept { return m_reader; }

    /// Reserve the id of a value whose payload is about to be read
    [[nodiscard]] std::uint32_t reserve_reference();

    /// Publish the finished value for a reserved id
    void fill_reference(std::uint32_t id, ObjectRef value);

    /// Resolve a back reference. Unknown ids and values still being read
    /// (cycles) throw PicklerException with FormatError::InvalidReference.
    [[nodiscard]] ObjectRef reference(std::uint32_t id) const;

    [[nodiscard]] std::size_t reference_count() const noexcept { return m_references.size(); }

private:
    FormatReader& m_reader;
    std::vector<ObjectRef> m_references;
};

// =============================================================================
// CloneState
// =============================================================================

/// Clone session: source identity -> clone, so a value reached twice is
/// cloned once
class CloneState {
public:
    CloneState() = default;

    CloneState(const CloneState&) = delete;
    CloneState& operator=(const CloneState&) = delete;

    /// Clone already produced for key, nullptr otherwise.
    /// Throws PicklerException when key is still being cloned (a cycle).
    [[nodiscard]] const ObjectRef* find(const ReferenceKey& key) const;

    /// Return the session's clone of key, producing it with make() once
    template<typename F>
    ObjectRef clone_once(const ReferenceKey& key, F&& make) {
        if (const ObjectRef* prior = find(key)) {
            return *prior;
        }

        m_clones.emplace(key, ObjectRef{});
        ObjectRef copy = make();
        m_clones[key] = copy;
        return copy;
    }

    [[nodiscard]] std::size_t tracked_count() const noexcept { return m_clones.size(); }

private:
    // A null entry marks a clone in progress
    std::unordered_map<ReferenceKey, ObjectRef, ReferenceKeyHash> m_clones;
};

// =============================================================================
// VisitState
// =============================================================================

/// Caller supplied visitor.
///
/// visit() receives the pickler of the value and a pointer to the value
/// (of type pickler.type()). Returning false skips the constituents of
/// that value.
class ObjectVisitor {
public:
    virtual ~ObjectVisitor() = default;

    virtual bool visit(const PicklerBase& pickler, const void* value) = 0;
};

/// Visit session: the visitor plus the set of shared values already entered
class VisitState {
public:
    explicit VisitState(ObjectVisitor& visitor) : m_visitor(visitor) {}

    VisitState(const VisitState&) = delete;
    VisitState& operator=(const VisitState&) = delete;

    [[nodiscard]] ObjectVisitor& visitor() noexcept { return m_visitor; }

    /// Notify the visitor; true when the value's constituents should be visited
    bool visit(const PicklerBase& pickler, const void* value) {
        return m_visitor.visit(pickler, value);
    }

    /// Record entry into a shared value; false when it was entered before
    bool mark_visited(const ReferenceKey& key) {
        return m_visited.insert(key).second;
    }

    [[nodiscard]] std::size_t visited_count() const noexcept { return m_visited.size(); }

private:
    ObjectVisitor& m_visitor;
    std::unordered_set<ReferenceKey, ReferenceKeyHash> m_visited;
};

} // namespace brine_pickle
