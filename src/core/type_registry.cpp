/// @file type_registry.cpp
/// @brief Type registry implementation for brine_core
///
/// Provides:
/// - Compiler name demangling
/// - Name conflict handling on registration
/// - Built-in type registrations

#include <brine/core/type_registry.hpp>
#include <brine/core/log.hpp>
#include <cxxabi.h>
#include <cstdlib>
#include <memory>

namespace brine_core {

// =============================================================================
// Demangling
// =============================================================================

std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);

    if (status != 0 || !demangled) {
        return mangled;
    }
    return demangled.get();
}

// =============================================================================
// TypeRegistry
// =============================================================================

Result<void> TypeRegistry::register_info(TypeInfo info) {
    auto owner = m_by_name.find(info.name);
    if (owner != m_by_name.end() && owner->second != info.type_id) {
        return Err(TypeRegistryError::already_registered(info.name));
    }

    auto existing = m_by_id.find(info.type_id);
    if (existing != m_by_id.end() && existing->second.name != info.name) {
        m_by_name.erase(existing->second.name);
    }

    m_by_name.insert_or_assign(info.name, info.type_id);
    m_by_id.insert_or_assign(info.type_id, std::move(info));
    return Ok();
}

std::string TypeRegistry::name_of(std::type_index type_id) const {
    if (const TypeInfo* info = get(type_id)) {
        return info->name;
    }
    return demangle(type_id.name());
}

// =============================================================================
// Built-in Type Registration
// =============================================================================

void register_builtin_types(TypeRegistry& registry) {
    auto check = [](Result<void> result) {
        if (result.is_err()) {
            channel_logger(LogChannel::Types)->warn("Built-in type registration skipped: {}", result.error().message());
        }
    };

    check(registry.register_with_name<bool>("bool"));
    check(registry.register_with_name<char>("char"));
    check(registry.register_with_name<std::int8_t>("i8"));
    check(registry.register_with_name<std::int16_t>("i16"));
    check(registry.register_with_name<std::int32_t>("i32"));
    check(registry.register_with_name<std::int64_t>("i64"));
    check(registry.register_with_name<std::uint8_t>("u8"));
    check(registry.register_with_name<std::uint16_t>("u16"));
    check(registry.register_with_name<std::uint32_t>("u32"));
    check(registry.register_with_name<std::uint64_t>("u64"));
    check(registry.register_with_name<float>("f32"));
    check(registry.register_with_name<double>("f64"));
    check(registry.register_with_name<std::string>("string"));
}

} // namespace brine_core
