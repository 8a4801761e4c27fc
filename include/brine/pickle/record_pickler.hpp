#pragma once

/// @file record_pickler.hpp
/// @brief Field-based pickler for plain records, built from member pointers
///
/// @code
/// resolver.register_factory<Point>([](PicklerResolver& r) {
///     return RecordPickler::create<Point>(r, field("x", &Point::x), field("y", &Point::y));
/// });
/// @endcode
///
/// Fields are written, read, cloned and visited in declaration order.
/// Members not listed keep their default value on read and clone.

#include "pickler.hpp"
#include "resolver.hpp"
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace brine_pickle {

template<typename T, typename M>
struct Field {
    std::string_view name;
    M T::*member;
};

/// Field descriptor; name must outlive the pickler (use a literal)
template<typename T, typename M>
[[nodiscard]] constexpr Field<T, M> field(std::string_view name, M T::*member) {
    return Field<T, M>{name, member};
}

struct RecordPickler {
    template<typename T, typename... Ms>
    [[nodiscard]] static std::shared_ptr<Pickler<T>> create(PicklerResolver& resolver, Field<T, Ms>... fields) {
        static_assert(std::is_default_constructible_v<T>, "records are rebuilt from a default constructed value");

        auto bound = std::make_tuple(std::make_pair(fields, resolver.resolve<std::remove_cv_t<Ms>>())...);

        return CompositePickler<T>::create(
            [bound](ReadState& state, std::string_view) -> T {
                T result{};
                std::apply([&](const auto&... f) {
                    ((result.*(f.first.member) = f.second->read(state, f.first.name)), ...);
                }, bound);
                return result;
            },
            [bound](WriteState& state, std::string_view, const T& value) {
                std::apply([&](const auto&... f) {
                    (f.second->write(state, f.first.name, value.*(f.first.member)), ...);
                }, bound);
            },
            [bound](CloneState& state, const T& value) -> T {
                T result{};
                std::apply([&](const auto&... f) {
                    ((result.*(f.first.member) = f.second->clone(state, value.*(f.first.member))), ...);
                }, bound);
                return result;
            },
            [bound](VisitState& state, const T& value) {
                std::apply([&](const auto&... f) {
                    (f.second->accept(state, value.*(f.first.member)), ...);
                }, bound);
            },
            PicklerInfo::FieldSerialization, false, false);
    }
};

} // namespace brine_pickle
