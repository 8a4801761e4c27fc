#pragma once

/// @file enum_pickler.hpp
/// @brief Enumerations through their underlying integral pickler

#include "pickler.hpp"
#include "resolver.hpp"
#include <type_traits>

namespace brine_pickle {

/// Enums travel as their underlying value under the "value" tag. Values
/// outside the named members are kept as they are.
struct EnumPickler {
    template<typename E>
    [[nodiscard]] static std::shared_ptr<Pickler<E>> create(PicklerResolver& resolver) {
        static_assert(std::is_enum_v<E>, "EnumPickler requires an enumeration");
        using Underlying = std::underlying_type_t<E>;

        auto underlying = resolver.resolve<Underlying>();

        return CompositePickler<E>::create(
            [underlying](ReadState& state, std::string_view) -> E {
                return static_cast<E>(underlying->read(state, "value"));
            },
            [underlying](WriteState& state, std::string_view, const E& value) {
                underlying->write(state, "value", static_cast<Underlying>(value));
            },
            [](CloneState&, const E& value) -> E { return value; },
            [](VisitState&, const E&) {},
            PicklerInfo::Enum, false, false);
    }
};

} // namespace brine_pickle
