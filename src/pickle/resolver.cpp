/// @file resolver.cpp
/// @brief PicklerResolver implementation

#include <brine/pickle/resolver.hpp>

namespace brine_pickle {

PicklerResolver::PicklerResolver()
    : m_methods(std::make_shared<MethodRegistry>())
    , m_handle(this, [](PicklerResolver*) {}) {
    brine_core::register_builtin_types(m_types);
}

PicklerResolver::~PicklerResolver() {
    m_handle.reset();
    release();
}

PicklerResolver& PicklerResolver::global() {
    static PicklerResolver instance;
    return instance;
}

std::shared_ptr<PicklerBase> PicklerResolver::resolve(std::type_index type) {
    if (auto it = m_cache.find(type); it != m_cache.end()) {
        if (m_in_flight.count(type) != 0) {
            m_captured.insert(type);
        }
        return it->second;
    }

    auto it = m_dynamic.find(type);
    if (it == m_dynamic.end()) {
        throw PicklerException(brine_core::PicklerError::generation_failed(
            m_types.name_of(type), "type is not registered for dynamic dispatch"));
    }
    return it->second(*this);
}

void PicklerResolver::reset() {
    resolver_log()->debug("Resolver reset: dropped {} picklers ({} recursive)",
        m_cache.size(), m_unbinders.size());
    release();
}

void PicklerResolver::release() noexcept {
    for (auto& [key, unbind] : m_unbinders) {
        unbind("released by resolver reset");
    }
    m_unbinders.clear();
    m_cache.clear();
    m_captured.clear();
}

void PicklerResolver::rollback(std::size_t mark) noexcept {
    if (mark >= m_journal.size()) {
        return;
    }

    for (std::size_t i = mark; i < m_journal.size(); ++i) {
        const std::type_index key = m_journal[i];
        if (auto it = m_unbinders.find(key); it != m_unbinders.end()) {
            it->second("discarded by a failed resolution pass");
            m_unbinders.erase(it);
        }
        m_cache.erase(key);
        m_captured.erase(key);
    }

    resolver_log()->debug("Rolled back {} partially resolved picklers",
        m_journal.size() - mark);
    m_journal.erase(m_journal.begin() + static_cast<std::ptrdiff_t>(mark), m_journal.end());
}

} // namespace brine_pickle
