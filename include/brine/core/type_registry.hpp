#pragma once

/// @file type_registry.hpp
/// @brief Runtime type information and name registry for brine_core

#include "fwd.hpp"
#include "error.hpp"
#include <cstdint>
#include <string>
#include <typeinfo>
#include <typeindex>
#include <map>
#include <functional>

namespace brine_core {

/// Demangle a compiler type name (returns the input when demangling fails)
[[nodiscard]] std::string demangle(const char* mangled);

/// Readable name of T
template<typename T>
[[nodiscard]] std::string type_name_of() {
    return demangle(typeid(T).name());
}

// =============================================================================
// TypeInfo
// =============================================================================

/// Runtime type information
struct TypeInfo {
    std::type_index type_id;
    std::string name;
    std::size_t size = 0;
    std::size_t align = 0;

    TypeInfo() : type_id(typeid(void)) {}

    TypeInfo(std::type_index tid, std::string n, std::size_t sz, std::size_t al)
        : type_id(tid), name(std::move(n)), size(sz), align(al) {}

    /// Create TypeInfo for type T
    template<typename T>
    [[nodiscard]] static TypeInfo of() {
        TypeInfo info;
        info.type_id = std::type_index(typeid(T));
        info.name = type_name_of<T>();
        info.size = sizeof(T);
        info.align = alignof(T);
        return info;
    }

    /// Replace the demangled name with a stable one
    TypeInfo& with_name(const std::string& readable_name) {
        name = readable_name;
        return *this;
    }
};

// =============================================================================
// TypeRegistry
// =============================================================================

/// Stable-name registry used to identify types across process boundaries
class TypeRegistry {
public:
    TypeRegistry() = default;

    /// Register type under its demangled name
    template<typename T>
    Result<void> register_type() {
        return register_info(TypeInfo::of<T>());
    }

    /// Register type under a stable name
    template<typename T>
    Result<void> register_with_name(const std::string& name) {
        return register_info(TypeInfo::of<T>().with_name(name));
    }

    /// Register prepared info. Re-registering a type under a new name
    /// replaces the old name; a name owned by another type is rejected.
    Result<void> register_info(TypeInfo info);

    /// Get type info by type
    template<typename T>
    [[nodiscard]] const TypeInfo* get() const {
        return get(std::type_index(typeid(T)));
    }

    /// Get type info by type_index
    [[nodiscard]] const TypeInfo* get(std::type_index type_id) const {
        auto it = m_by_id.find(type_id);
        return it != m_by_id.end() ? &it->second : nullptr;
    }

    /// Get type info by name
    [[nodiscard]] const TypeInfo* get_by_name(const std::string& name) const {
        auto it = m_by_name.find(name);
        if (it == m_by_name.end()) {
            return nullptr;
        }
        return get(it->second);
    }

    template<typename T>
    [[nodiscard]] bool contains() const {
        return contains(std::type_index(typeid(T)));
    }

    [[nodiscard]] bool contains(std::type_index type_id) const {
        return m_by_id.find(type_id) != m_by_id.end();
    }

    [[nodiscard]] bool contains_name(const std::string& name) const {
        return m_by_name.find(name) != m_by_name.end();
    }

    /// Registered name, or the demangled compiler name for unknown types
    [[nodiscard]] std::string name_of(std::type_index type_id) const;

    [[nodiscard]] std::size_t len() const noexcept {
        return m_by_id.size();
    }

    [[nodiscard]] bool is_empty() const noexcept {
        return m_by_id.empty();
    }

    void clear() {
        m_by_id.clear();
        m_by_name.clear();
    }

    template<typename F>
    void for_each(F&& func) const {
        for (const auto& [id, info] : m_by_id) {
            func(info);
        }
    }

    [[nodiscard]] Result<std::reference_wrapper<const TypeInfo>> get_result(std::type_index type_id) const {
        const TypeInfo* info = get(type_id);
        if (!info) {
            return Err<std::reference_wrapper<const TypeInfo>>(
                TypeRegistryError::not_registered(demangle(type_id.name())));
        }
        return Ok(std::cref(*info));
    }

    [[nodiscard]] Result<std::reference_wrapper<const TypeInfo>> get_result_by_name(const std::string& name) const {
        const TypeInfo* info = get_by_name(name);
        if (!info) {
            return Err<std::reference_wrapper<const TypeInfo>>(
                TypeRegistryError::not_registered(name));
        }
        return Ok(std::cref(*info));
    }

private:
    std::map<std::type_index, TypeInfo> m_by_id;
    std::map<std::string, std::type_index> m_by_name;
};

/// Register the primitive types under short stable names ("i32", "string", ...)
void register_builtin_types(TypeRegistry& registry);

} // namespace brine_core
