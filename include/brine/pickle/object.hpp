#pragma once

/// @file object.hpp
/// @brief Opaque shared object reference

#include "fwd.hpp"
#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace brine_pickle {

/// Type-erased shared reference to a heap object.
///
/// Records the static type the reference was created from. Equality is
/// reference identity, not value equality. Subtype dispatch is not
/// supported: get<T>() succeeds only for the recorded type.
class ObjectRef {
public:
    ObjectRef() : m_type(typeid(void)) {}

    /// Wrap an existing shared pointer (a null pointer keeps its type)
    template<typename T>
    [[nodiscard]] static ObjectRef from(std::shared_ptr<T> ptr) {
        using V = std::remove_const_t<T>;
        ObjectRef ref;
        ref.m_ptr = std::const_pointer_cast<V>(std::move(ptr));
        ref.m_type = std::type_index(typeid(V));
        return ref;
    }

    /// Allocate a new T
    template<typename T, typename... Args>
    [[nodiscard]] static ObjectRef make(Args&&... args) {
        return from(std::make_shared<T>(std::forward<Args>(args)...));
    }

    [[nodiscard]] bool is_null() const noexcept { return m_ptr == nullptr; }
    explicit operator bool() const noexcept { return m_ptr != nullptr; }

    /// Recorded type (void for a default constructed reference)
    [[nodiscard]] std::type_index type() const noexcept { return m_type; }

    [[nodiscard]] const void* address() const noexcept { return m_ptr.get(); }

    /// Typed access; nullptr when null or when T is not the recorded type
    template<typename T>
    [[nodiscard]] T* get() const noexcept {
        if (!m_ptr || m_type != std::type_index(typeid(std::remove_const_t<T>))) {
            return nullptr;
        }
        return static_cast<T*>(m_ptr.get());
    }

    /// Typed shared access sharing ownership with this reference
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> get_shared() const noexcept {
        if (!get<T>()) {
            return nullptr;
        }
        return std::static_pointer_cast<T>(m_ptr);
    }

    [[nodiscard]] const std::shared_ptr<void>& shared() const noexcept { return m_ptr; }

    [[nodiscard]] long use_count() const noexcept { return m_ptr.use_count(); }

    friend bool operator==(const ObjectRef& a, const ObjectRef& b) noexcept {
        return a.m_ptr == b.m_ptr;
    }

    friend bool operator!=(const ObjectRef& a, const ObjectRef& b) noexcept {
        return !(a == b);
    }

private:
    std::shared_ptr<void> m_ptr;
    std::type_index m_type;
};

} // namespace brine_pickle
