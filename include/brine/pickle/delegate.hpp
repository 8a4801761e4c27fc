#pragma once

/// @file delegate.hpp
/// @brief Multicast function reference
///
/// A Delegate holds an ordered invocation list. Each binding pairs a
/// registered method descriptor with a target object (instance methods)
/// or with nothing (static methods). Invoking the delegate calls every
/// binding in order and returns the result of the last one.

#include "fwd.hpp"
#include "exception.hpp"
#include "method.hpp"
#include "object.hpp"
#include <brine/core/type_registry.hpp>
#include <functional>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace brine_pickle {

template<typename R, typename... Args>
class Delegate<R(Args...)> {
public:
    using result_type = R;
    using Signature = R(Args...);
    using Function = std::function<R(Args...)>;

    /// One element of the invocation list
    struct Binding {
        MethodHandle method;
        ObjectRef target;
        Function call;
    };

    Delegate() = default;

    /// Bind an instance method to a target. Throws PicklerException
    /// (DelegateBinding) when the pair is incompatible with Signature.
    [[nodiscard]] static Delegate bind(ObjectRef target, MethodHandle method) {
        check_signature(method);
        if (method->is_static()) {
            fail("static method '" + method->name() + "' cannot be bound to a target");
        }
        if (target.is_null()) {
            fail("instance method '" + method->name() + "' requires a target");
        }
        if (target.type() != method->declaring_type()) {
            fail("target of type '" + brine_core::demangle(target.type().name()) +
                 "' does not declare '" + method->name() + "'");
        }

        const auto* invoker = method->template instance_invoker<R, Args...>();
        if (!invoker) {
            fail("method '" + method->name() + "' has no instance invoker");
        }

        Binding binding;
        binding.call = [fn = *invoker, target](Args... args) -> R {
            return fn(target, std::forward<Args>(args)...);
        };
        binding.method = std::move(method);
        binding.target = std::move(target);
        return from_binding(std::move(binding));
    }

    /// Bind a static method
    [[nodiscard]] static Delegate bind_static(MethodHandle method) {
        check_signature(method);
        if (!method->is_static()) {
            fail("instance method '" + method->name() + "' requires a target");
        }

        const auto* invoker = method->template static_invoker<R, Args...>();
        if (!invoker) {
            fail("method '" + method->name() + "' has no static invoker");
        }

        Binding binding;
        binding.call = *invoker;
        binding.method = std::move(method);
        return from_binding(std::move(binding));
    }

    /// Delegate with a single existing binding
    [[nodiscard]] static Delegate from_binding(Binding binding) {
        Delegate d;
        d.m_bindings.push_back(std::move(binding));
        return d;
    }

    /// Concatenate invocation lists in order
    [[nodiscard]] static Delegate combine(const std::vector<Delegate>& parts) {
        Delegate d;
        for (const auto& part : parts) {
            d.m_bindings.insert(d.m_bindings.end(), part.m_bindings.begin(), part.m_bindings.end());
        }
        return d;
    }

    [[nodiscard]] Delegate operator+(const Delegate& other) const {
        return combine({*this, other});
    }

    [[nodiscard]] const std::vector<Binding>& invocation_list() const noexcept { return m_bindings; }

    [[nodiscard]] std::size_t size() const noexcept { return m_bindings.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_bindings.empty(); }

    /// Method of the last binding
    [[nodiscard]] MethodHandle method() const {
        return m_bindings.empty() ? nullptr : m_bindings.back().method;
    }

    /// Target of the last binding (null for static bindings)
    [[nodiscard]] ObjectRef target() const {
        return m_bindings.empty() ? ObjectRef{} : m_bindings.back().target;
    }

    [[nodiscard]] bool is_static() const {
        return !m_bindings.empty() && m_bindings.back().method->is_static();
    }

    /// Invoke every binding in order; an empty delegate throws std::bad_function_call
    R operator()(Args... args) const {
        if (m_bindings.empty()) {
            throw std::bad_function_call();
        }
        for (std::size_t i = 0; i + 1 < m_bindings.size(); ++i) {
            m_bindings[i].call(args...);
        }
        return m_bindings.back().call(args...);
    }

    /// Same methods bound to the same targets, in the same order
    friend bool operator==(const Delegate& a, const Delegate& b) {
        if (a.m_bindings.size() != b.m_bindings.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.m_bindings.size(); ++i) {
            if (a.m_bindings[i].method != b.m_bindings[i].method ||
                a.m_bindings[i].target != b.m_bindings[i].target) {
                return false;
            }
        }
        return true;
    }

    friend bool operator!=(const Delegate& a, const Delegate& b) {
        return !(a == b);
    }

private:
    [[noreturn]] static void fail(const std::string& why) {
        throw PicklerException(brine_core::PicklerError::delegate_binding(
            brine_core::type_name_of<Delegate>(), why));
    }

    static void check_signature(const MethodHandle& method) {
        if (!method) {
            fail("no method descriptor");
        }
        if (method->signature() != std::type_index(typeid(Signature))) {
            fail("method '" + method->name() + "' has signature " + method->signature_name() +
                 ", expected " + brine_core::type_name_of<Signature>());
        }
    }

    std::vector<Binding> m_bindings;
};

} // namespace brine_pickle
