#pragma once

/// @file resolver.hpp
/// @brief Type -> pickler resolution with recursion-safe caching
///
/// Resolution protocol for a cache miss on T:
/// 1. install a ForwardingPickler<T> under T's key and mark T in flight,
/// 2. build the real pickler (custom factory, else the generator),
/// 3. bind the placeholder to it.
/// A nested resolve<T>() during step 2 returns the placeholder. If that
/// happened, the placeholder stays in the cache so every caller observes
/// one instance; otherwise the real pickler replaces it.
///
/// A failed pass removes every entry it installed, so the cache never
/// holds half-built picklers.

#include "fwd.hpp"
#include "exception.hpp"
#include "method.hpp"
#include "pickler.hpp"
#include <brine/core/error.hpp>
#include <brine/core/log.hpp>
#include <brine/core/type_registry.hpp>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace brine_pickle {

/// Logger of the resolution channel
inline std::shared_ptr<spdlog::logger> resolver_log() {
    return brine_core::channel_logger(brine_core::LogChannel::Resolver);
}

/// Builds the pickler for T from its shape (defined in generator.hpp)
template<typename T>
std::shared_ptr<Pickler<T>> generate_pickler(PicklerResolver& resolver);

// =============================================================================
// PicklerResolver
// =============================================================================

class PicklerResolver {
public:
    template<typename T>
    using Factory = std::function<std::shared_ptr<Pickler<T>>(PicklerResolver&)>;

    PicklerResolver();
    ~PicklerResolver();

    PicklerResolver(const PicklerResolver&) = delete;
    PicklerResolver& operator=(const PicklerResolver&) = delete;

    /// Process-wide resolver
    [[nodiscard]] static PicklerResolver& global();

    // -------------------------------------------------------------------------
    // Resolution
    // -------------------------------------------------------------------------

    /// Pickler for T; the same instance on every call.
    /// Throws PicklerException (GenerationFailed) when T cannot be handled.
    template<typename T>
    [[nodiscard]] std::shared_ptr<Pickler<T>> resolve() {
        static_assert(!std::is_reference_v<T>, "resolve a value type, not a reference");
        static_assert(!std::is_function_v<T>, "functions are pickled through Delegate");
        static_assert(!std::is_array_v<T>, "arrays are not supported, use std::vector");
        static_assert(!std::is_const_v<T> && !std::is_volatile_v<T>, "resolve the unqualified type");
        static_assert(!std::is_abstract_v<T>,
            "abstract types are resolved through std::shared_ptr<T>");

        const std::type_index key(typeid(T));
        if (auto it = m_cache.find(key); it != m_cache.end()) {
            if (m_in_flight.count(key) != 0 && m_captured.insert(key).second) {
                resolver_log()->trace("Placeholder for '{}' captured", it->second->type_name());
            }
            return std::static_pointer_cast<Pickler<T>>(it->second);
        }

        PassGuard guard(*this, key);
        auto placeholder = std::make_shared<ForwardingPickler<T>>();
        m_cache.emplace(key, placeholder);
        m_journal.push_back(key);
        m_in_flight.insert(key);

        std::shared_ptr<Pickler<T>> pickler;
        try {
            pickler = build<T>();
        } catch (PicklerException& e) {
            e.add_resolution_frame(placeholder->type_name());
            if (m_depth == 1) {
                resolver_log()->warn("{}", e.what());
            }
            throw;
        }

        placeholder->bind(pickler);
        m_in_flight.erase(key);

        if (m_captured.count(key) != 0) {
            m_unbinders[key] = [placeholder](const char* reason) { placeholder->unbind(reason); };
        } else {
            m_cache[key] = pickler;
        }

        guard.commit();
        return std::static_pointer_cast<Pickler<T>>(m_cache[key]);
    }

    /// Non-throwing variant of resolve<T>()
    template<typename T>
    [[nodiscard]] brine_core::Result<std::shared_ptr<Pickler<T>>> try_resolve() {
        try {
            return brine_core::Ok(resolve<T>());
        } catch (const PicklerException& e) {
            return brine_core::Err<std::shared_ptr<Pickler<T>>>(e.error());
        }
    }

    /// Pickler for a runtime type registered with register_type<T>()
    [[nodiscard]] std::shared_ptr<PicklerBase> resolve(std::type_index type);

    // -------------------------------------------------------------------------
    // Registration
    // -------------------------------------------------------------------------

    /// Custom pickler factory for T, consulted before any built-in shape
    template<typename T>
    void register_factory(Factory<T> factory) {
        const std::type_index key(typeid(T));
        if (m_cache.count(key) != 0) {
            resolver_log()->warn(
                "Factory for '{}' registered after resolution; the cached pickler stays until reset()",
                brine_core::type_name_of<T>());
        }
        m_factories[key] = [factory = std::move(factory)](PicklerResolver& resolver)
            -> std::shared_ptr<PicklerBase> {
            return factory(resolver);
        };
    }

    [[nodiscard]] bool has_factory(std::type_index type) const {
        return m_factories.find(type) != m_factories.end();
    }

    /// Register T under a stable name for dynamic dispatch through ObjectRef
    template<typename T>
    brine_core::Result<void> register_type(const std::string& name) {
        auto result = m_types.register_with_name<T>(name);
        if (result.is_err()) {
            return result;
        }
        m_dynamic[std::type_index(typeid(T))] = [](PicklerResolver& resolver)
            -> std::shared_ptr<PicklerBase> {
            return resolver.resolve<T>();
        };
        return brine_core::Ok();
    }

    [[nodiscard]] MethodRegistry& methods() noexcept { return *m_methods; }
    [[nodiscard]] const std::shared_ptr<MethodRegistry>& method_registry() const noexcept { return m_methods; }

    [[nodiscard]] brine_core::TypeRegistry& types() noexcept { return m_types; }
    [[nodiscard]] const brine_core::TypeRegistry& types() const noexcept { return m_types; }

    /// Non-owning handle for picklers that dispatch back into this resolver.
    /// Expires when the resolver is destroyed.
    [[nodiscard]] std::weak_ptr<PicklerResolver> handle() const noexcept { return m_handle; }

    // -------------------------------------------------------------------------
    // Cache
    // -------------------------------------------------------------------------

    [[nodiscard]] std::size_t cached_count() const noexcept { return m_cache.size(); }

    template<typename T>
    [[nodiscard]] bool is_resolved() const {
        return m_cache.count(std::type_index(typeid(T))) != 0;
    }

    /// Drop every cached pickler. Factories, types and methods survive.
    void reset();

private:
    /// Scope of one resolution pass; rolls back its entries unless committed
    class PassGuard {
    public:
        PassGuard(PicklerResolver& resolver, std::type_index key)
            : m_resolver(resolver), m_key(key), m_mark(resolver.m_journal.size()) {
            ++m_resolver.m_depth;
        }

        ~PassGuard() {
            m_resolver.m_in_flight.erase(m_key);
            if (!m_committed) {
                m_resolver.rollback(m_mark);
            }
            if (--m_resolver.m_depth == 0) {
                m_resolver.m_journal.clear();
            }
        }

        PassGuard(const PassGuard&) = delete;
        PassGuard& operator=(const PassGuard&) = delete;

        void commit() noexcept { m_committed = true; }

    private:
        PicklerResolver& m_resolver;
        std::type_index m_key;
        std::size_t m_mark;
        bool m_committed = false;
    };

    template<typename T>
    std::shared_ptr<Pickler<T>> build() {
        const std::type_index key(typeid(T));
        if (auto it = m_factories.find(key); it != m_factories.end()) {
            auto typed = std::dynamic_pointer_cast<Pickler<T>>(it->second(*this));
            if (!typed) {
                throw PicklerException(brine_core::PicklerError::generation_failed(
                    brine_core::type_name_of<T>(), "factory returned no pickler for this type"));
            }
            resolver_log()->debug("Built '{}' from custom factory ({})",
                typed->type_name(), pickler_info_name(typed->info()));
            return typed;
        }
        return generate_pickler<T>(*this);
    }

    /// Remove entries installed since mark
    void rollback(std::size_t mark) noexcept;

    /// Unbind kept placeholders and empty the cache
    void release() noexcept;

    using ErasedFactory = std::function<std::shared_ptr<PicklerBase>(PicklerResolver&)>;

    std::unordered_map<std::type_index, std::shared_ptr<PicklerBase>> m_cache;
    std::unordered_set<std::type_index> m_in_flight;
    std::unordered_set<std::type_index> m_captured;
    std::unordered_map<std::type_index, std::function<void(const char*)>> m_unbinders;
    std::vector<std::type_index> m_journal;
    std::size_t m_depth = 0;

    std::unordered_map<std::type_index, ErasedFactory> m_factories;
    std::unordered_map<std::type_index, ErasedFactory> m_dynamic;
    brine_core::TypeRegistry m_types;
    std::shared_ptr<MethodRegistry> m_methods;
    std::shared_ptr<PicklerResolver> m_handle;
};

} // namespace brine_pickle
