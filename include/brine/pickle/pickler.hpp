#pragma once

/// @file pickler.hpp
/// @brief Pickler contract: write, read, clone and accept over one type
///
/// A pickler bundles four operations that must stay structurally in sync:
/// what write emits is exactly what read consumes, and clone and accept
/// traverse the same constituents. Picklers are created once per type by
/// PicklerResolver and are immutable afterwards.

#include "fwd.hpp"
#include "exception.hpp"
#include "object.hpp"
#include "state.hpp"
#include <brine/core/type_registry.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>

namespace brine_pickle {

// =============================================================================
// PicklerInfo
// =============================================================================

/// Classification of the construct a pickler serializes
enum class PicklerInfo : std::uint8_t {
    Primitive,
    FieldSerialization,
    Enum,
    Nullable,
    Delegate,
    Reference,
    Object,
    Method,
    Sequence,
    Abstract,
    Custom,
};

[[nodiscard]] inline const char* pickler_info_name(PicklerInfo info) {
    switch (info) {
        case PicklerInfo::Primitive: return "Primitive";
        case PicklerInfo::FieldSerialization: return "FieldSerialization";
        case PicklerInfo::Enum: return "Enum";
        case PicklerInfo::Nullable: return "Nullable";
        case PicklerInfo::Delegate: return "Delegate";
        case PicklerInfo::Reference: return "Reference";
        case PicklerInfo::Object: return "Object";
        case PicklerInfo::Method: return "Method";
        case PicklerInfo::Sequence: return "Sequence";
        case PicklerInfo::Abstract: return "Abstract";
        case PicklerInfo::Custom: return "Custom";
        default: return "Unknown";
    }
}

// =============================================================================
// PicklerBase
// =============================================================================

/// Type-erased pickler: metadata plus boxed operations on ObjectRef
class PicklerBase {
public:
    virtual ~PicklerBase() = default;

    PicklerBase(const PicklerBase&) = delete;
    PicklerBase& operator=(const PicklerBase&) = delete;

    [[nodiscard]] std::type_index type() const noexcept { return m_type; }
    [[nodiscard]] const std::string& type_name() const noexcept { return m_type_name; }
    [[nodiscard]] PicklerInfo info() const noexcept { return m_info; }

    /// Values must be tracked by identity when cloned, visited or written
    [[nodiscard]] bool cache_by_ref() const noexcept { return m_cache_by_ref; }

    /// This pickler may be reused for runtime subtypes of its type
    [[nodiscard]] bool use_with_subtypes() const noexcept { return m_use_with_subtypes; }

    virtual void write_boxed(WriteState& state, std::string_view tag, const ObjectRef& value) const = 0;
    [[nodiscard]] virtual ObjectRef read_boxed(ReadState& state, std::string_view tag) const = 0;
    [[nodiscard]] virtual ObjectRef clone_boxed(CloneState& state, const ObjectRef& value) const = 0;
    virtual void accept_boxed(VisitState& state, const ObjectRef& value) const = 0;

protected:
    PicklerBase(std::type_index type, std::string type_name, PicklerInfo info,
                bool cache_by_ref, bool use_with_subtypes)
        : m_type(type)
        , m_type_name(std::move(type_name))
        , m_info(info)
        , m_cache_by_ref(cache_by_ref)
        , m_use_with_subtypes(use_with_subtypes) {}

    /// Take over classification metadata (used by forwarding placeholders)
    void adopt_metadata(const PicklerBase& other) {
        m_info = other.m_info;
        m_cache_by_ref = other.m_cache_by_ref;
        m_use_with_subtypes = other.m_use_with_subtypes;
    }

private:
    std::type_index m_type;
    std::string m_type_name;
    PicklerInfo m_info;
    bool m_cache_by_ref;
    bool m_use_with_subtypes;
};

// =============================================================================
// Pickler<T>
// =============================================================================

/// Typed pickler for T
template<typename T>
class Pickler : public PicklerBase {
public:
    using value_type = T;

    virtual void write(WriteState& state, std::string_view tag, const T& value) const = 0;
    [[nodiscard]] virtual T read(ReadState& state, std::string_view tag) const = 0;
    [[nodiscard]] virtual T clone(CloneState& state, const T& value) const = 0;
    virtual void accept(VisitState& state, const T& value) const = 0;

    void write_boxed(WriteState& state, std::string_view tag, const ObjectRef& value) const final {
        write(state, tag, unbox(value));
    }

    [[nodiscard]] ObjectRef read_boxed(ReadState& state, std::string_view tag) const final {
        return ObjectRef::make<T>(read(state, tag));
    }

    [[nodiscard]] ObjectRef clone_boxed(CloneState& state, const ObjectRef& value) const final {
        return ObjectRef::make<T>(clone(state, unbox(value)));
    }

    void accept_boxed(VisitState& state, const ObjectRef& value) const final {
        accept(state, unbox(value));
    }

protected:
    Pickler(PicklerInfo info, bool cache_by_ref, bool use_with_subtypes)
        : PicklerBase(std::type_index(typeid(T)), brine_core::type_name_of<T>(),
                      info, cache_by_ref, use_with_subtypes) {}

private:
    const T& unbox(const ObjectRef& value) const {
        const T* typed = value.get<T>();
        if (!typed) {
            throw PicklerException(brine_core::TypeRegistryError::type_mismatch(
                type_name(), brine_core::demangle(value.type().name())));
        }
        return *typed;
    }
};

// =============================================================================
// CompositePickler<T>
// =============================================================================

/// Pickler assembled from four closures; the form every combinator produces
template<typename T>
class CompositePickler final : public Pickler<T> {
public:
    using Reader = std::function<T(ReadState&, std::string_view)>;
    using Writer = std::function<void(WriteState&, std::string_view, const T&)>;
    using Cloner = std::function<T(CloneState&, const T&)>;
    using Accepter = std::function<void(VisitState&, const T&)>;

    CompositePickler(Reader reader, Writer writer, Cloner cloner, Accepter accepter,
                     PicklerInfo info, bool cache_by_ref, bool use_with_subtypes)
        : Pickler<T>(info, cache_by_ref, use_with_subtypes)
        , m_reader(std::move(reader))
        , m_writer(std::move(writer))
        , m_cloner(std::move(cloner))
        , m_accepter(std::move(accepter)) {}

    [[nodiscard]] static std::shared_ptr<Pickler<T>> create(
        Reader reader, Writer writer, Cloner cloner, Accepter accepter,
        PicklerInfo info, bool cache_by_ref, bool use_with_subtypes)
    {
        return std::make_shared<CompositePickler>(
            std::move(reader), std::move(writer), std::move(cloner), std::move(accepter),
            info, cache_by_ref, use_with_subtypes);
    }

    void write(WriteState& state, std::string_view tag, const T& value) const override {
        m_writer(state, tag, value);
    }

    [[nodiscard]] T read(ReadState& state, std::string_view tag) const override {
        return m_reader(state, tag);
    }

    [[nodiscard]] T clone(CloneState& state, const T& value) const override {
        return m_cloner(state, value);
    }

    /// The visitor sees the value first and decides whether to descend
    void accept(VisitState& state, const T& value) const override {
        if (state.visit(*this, &value)) {
            m_accepter(state, value);
        }
    }

private:
    Reader m_reader;
    Writer m_writer;
    Cloner m_cloner;
    Accepter m_accepter;
};

// =============================================================================
// ForwardingPickler<T>
// =============================================================================

/// Indirection installed by the resolver while T's pickler is being built.
/// Recursive requests capture it; it becomes functional once bound.
template<typename T>
class ForwardingPickler final : public Pickler<T> {
public:
    ForwardingPickler() : Pickler<T>(PicklerInfo::Custom, false, false) {}

    void bind(std::shared_ptr<Pickler<T>> target) {
        this->adopt_metadata(*target);
        m_target = std::move(target);
    }

    /// Drop the target; breaks ownership cycles of recursive picklers.
    /// reason completes "Pickler for 'T' ..." in later use errors.
    void unbind(const char* reason) noexcept {
        m_target.reset();
        m_unbound_reason = reason;
    }

    [[nodiscard]] bool is_bound() const noexcept { return m_target != nullptr; }
    [[nodiscard]] const std::shared_ptr<Pickler<T>>& target() const noexcept { return m_target; }

    void write(WriteState& state, std::string_view tag, const T& value) const override {
        bound().write(state, tag, value);
    }

    [[nodiscard]] T read(ReadState& state, std::string_view tag) const override {
        return bound().read(state, tag);
    }

    [[nodiscard]] T clone(CloneState& state, const T& value) const override {
        return bound().clone(state, value);
    }

    void accept(VisitState& state, const T& value) const override {
        bound().accept(state, value);
    }

private:
    const Pickler<T>& bound() const {
        if (!m_target) {
            const std::string state = m_unbound_reason ? m_unbound_reason
                                                       : "used before its construction completed";
            throw PicklerException(brine_core::Error(brine_core::ErrorCode::InvalidState,
                "Pickler for '" + this->type_name() + "' " + state));
        }
        return *m_target;
    }

    std::shared_ptr<Pickler<T>> m_target;
    const char* m_unbound_reason = nullptr;
};

} // namespace brine_pickle
