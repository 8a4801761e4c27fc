#pragma once

/// @file method.hpp
/// @brief Method descriptors and their registry
///
/// A MethodInfo is an immutable, shareable description of a callable: a
/// stable name, whether it is static, the declaring type of instance
/// methods, the call signature and a type-erased invoker. Descriptors are
/// identified on the wire by name, so every method a delegate may bind
/// must be registered in the resolver's MethodRegistry.

#include "fwd.hpp"
#include "exception.hpp"
#include "object.hpp"
#include <brine/core/error.hpp>
#include <brine/core/type_registry.hpp>
#include <any>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace brine_pickle {

// =============================================================================
// MethodInfo
// =============================================================================

class MethodInfo {
public:
    MethodInfo(std::string name, bool is_static,
               std::type_index declaring_type, std::string declaring_type_name,
               std::type_index signature, std::string signature_name,
               std::any invoker)
        : m_name(std::move(name))
        , m_is_static(is_static)
        , m_declaring_type(declaring_type)
        , m_declaring_type_name(std::move(declaring_type_name))
        , m_signature(signature)
        , m_signature_name(std::move(signature_name))
        , m_invoker(std::move(invoker)) {}

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] bool is_static() const noexcept { return m_is_static; }

    /// Type the target of an instance method must have (void for static methods)
    [[nodiscard]] std::type_index declaring_type() const noexcept { return m_declaring_type; }
    [[nodiscard]] const std::string& declaring_type_name() const noexcept { return m_declaring_type_name; }

    /// Function type R(Args...) the method is called with, excluding the target
    [[nodiscard]] std::type_index signature() const noexcept { return m_signature; }
    [[nodiscard]] const std::string& signature_name() const noexcept { return m_signature_name; }

    template<typename R, typename... Args>
    [[nodiscard]] const std::function<R(Args...)>* static_invoker() const noexcept {
        return std::any_cast<std::function<R(Args...)>>(&m_invoker);
    }

    template<typename R, typename... Args>
    [[nodiscard]] const std::function<R(const ObjectRef&, Args...)>* instance_invoker() const noexcept {
        return std::any_cast<std::function<R(const ObjectRef&, Args...)>>(&m_invoker);
    }

private:
    std::string m_name;
    bool m_is_static;
    std::type_index m_declaring_type;
    std::string m_declaring_type_name;
    std::type_index m_signature;
    std::string m_signature_name;
    std::any m_invoker;
};

// =============================================================================
// MethodRegistry
// =============================================================================

/// Name -> descriptor table
class MethodRegistry {
public:
    MethodRegistry() = default;

    MethodRegistry(const MethodRegistry&) = delete;
    MethodRegistry& operator=(const MethodRegistry&) = delete;

    /// Register a free or static member function
    template<typename R, typename... Args>
    brine_core::Result<MethodHandle> register_static(const std::string& name, R (*fn)(Args...)) {
        std::function<R(Args...)> invoker = fn;
        return add(std::make_shared<const MethodInfo>(
            name, true,
            std::type_index(typeid(void)), std::string(),
            std::type_index(typeid(R(Args...))), brine_core::type_name_of<R(Args...)>(),
            std::any(std::move(invoker))));
    }

    /// Register a non-const member function
    template<typename T, typename R, typename... Args>
    brine_core::Result<MethodHandle> register_instance(const std::string& name, R (T::*fn)(Args...)) {
        return add_instance<T, R, Args...>(name, [fn](T& self, Args... args) -> R {
            return (self.*fn)(std::forward<Args>(args)...);
        });
    }

    /// Register a const member function
    template<typename T, typename R, typename... Args>
    brine_core::Result<MethodHandle> register_instance(const std::string& name, R (T::*fn)(Args...) const) {
        return add_instance<T, R, Args...>(name, [fn](T& self, Args... args) -> R {
            return (self.*fn)(std::forward<Args>(args)...);
        });
    }

    /// Descriptor by name, nullptr if unknown
    [[nodiscard]] MethodHandle find(const std::string& name) const;

    /// Descriptor by name, NotFound error if unknown
    [[nodiscard]] brine_core::Result<MethodHandle> get(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const {
        return m_methods.find(name) != m_methods.end();
    }

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_methods.size(); }

    void clear() { m_methods.clear(); }

private:
    brine_core::Result<MethodHandle> add(MethodHandle method);

    template<typename T, typename R, typename... Args, typename Call>
    brine_core::Result<MethodHandle> add_instance(const std::string& name, Call call) {
        std::string declaring = brine_core::type_name_of<T>();
        std::function<R(const ObjectRef&, Args...)> invoker =
            [call, name, declaring](const ObjectRef& target, Args... args) -> R {
                T* self = target.get<T>();
                if (!self) {
                    throw PicklerException(brine_core::PicklerError::delegate_binding(
                        name, "target is not a " + declaring));
                }
                return call(*self, std::forward<Args>(args)...);
            };

        return add(std::make_shared<const MethodInfo>(
            name, false,
            std::type_index(typeid(T)), declaring,
            std::type_index(typeid(R(Args...))), brine_core::type_name_of<R(Args...)>(),
            std::any(std::move(invoker))));
    }

    std::map<std::string, MethodHandle> m_methods;
};

} // namespace brine_pickle
