/// @file method.cpp
/// @brief MethodRegistry implementation

#include <brine/pickle/method.hpp>
#include <brine/core/log.hpp>

namespace brine_pickle {

brine_core::Result<MethodHandle> MethodRegistry::add(MethodHandle method) {
    const std::string& name = method->name();
    if (m_methods.find(name) != m_methods.end()) {
        return brine_core::Err<MethodHandle>(brine_core::Error(
            brine_core::ErrorCode::AlreadyExists, "Method already registered: " + name));
    }

    brine_core::channel_logger(brine_core::LogChannel::Methods)->debug("Registered {} method '{}' ({})",
        method->is_static() ? "static" : "instance", name, method->signature_name());

    m_methods.emplace(name, method);
    return brine_core::Ok(std::move(method));
}

MethodHandle MethodRegistry::find(const std::string& name) const {
    auto it = m_methods.find(name);
    return it != m_methods.end() ? it->second : nullptr;
}

brine_core::Result<MethodHandle> MethodRegistry::get(const std::string& name) const {
    if (auto method = find(name)) {
        return brine_core::Ok(std::move(method));
    }
    return brine_core::Err<MethodHandle>(brine_core::Error(
        brine_core::ErrorCode::NotFound, "Method not registered: " + name));
}

std::vector<std::string> MethodRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(m_methods.size());
    for (const auto& [name, method] : m_methods) {
        result.push_back(name);
    }
    return result;
}

} // namespace brine_pickle
