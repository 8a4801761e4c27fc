#pragma once

/// @file reference_pickler.hpp
/// @brief std::shared_ptr<T> with aliasing preserved within a session
///
/// Wire layout under the caller's tag, one marker byte:
/// - 0: null
/// - 1: back reference, followed by uint32 "id"
/// - 2: new value, followed by the payload under "value"

#include "pickler.hpp"
#include "resolver.hpp"
#include <memory>
#include <type_traits>
#include <typeinfo>

namespace brine_pickle {

/// Marker byte shared by the reference and object picklers
enum class ReferenceMarker : std::uint8_t {
    Null = 0,
    BackReference = 1,
    NewValue = 2,
};

struct ReferencePickler {
    template<typename T>
    [[nodiscard]] static std::shared_ptr<Pickler<std::shared_ptr<T>>> create(PicklerResolver& resolver) {
        using V = std::remove_const_t<T>;
        using Pointer = std::shared_ptr<T>;
        static_assert(!std::is_abstract_v<V>, "abstract slots use AbstractPickler");

        auto inner = resolver.resolve<V>();
        const std::type_index type(typeid(V));

        return CompositePickler<Pointer>::create(
            [inner](ReadState& state, std::string_view tag) -> Pointer {
                auto& in = state.formatter();
                const auto marker = in.read_uint8(tag);
                switch (static_cast<ReferenceMarker>(marker)) {
                    case ReferenceMarker::Null:
                        return nullptr;
                    case ReferenceMarker::BackReference: {
                        const std::uint32_t id = in.read_uint32("id");
                        auto shared = state.reference(id).get_shared<V>();
                        if (!shared) {
                            throw PicklerException(brine_core::FormatError::invalid_reference(
                                id, "refers to a value of another type than " + inner->type_name()));
                        }
                        return shared;
                    }
                    case ReferenceMarker::NewValue: {
                        const std::uint32_t id = state.reserve_reference();
                        auto shared = std::make_shared<V>(inner->read(state, "value"));
                        state.fill_reference(id, ObjectRef::from(shared));
                        return shared;
                    }
                    default:
                        throw PicklerException(brine_core::FormatError::invalid_data(
                            std::string(tag), "unknown reference marker " + std::to_string(marker)));
                }
            },
            [inner, type](WriteState& state, std::string_view tag, const Pointer& value) {
                auto& out = state.formatter();
                if (!value) {
                    out.write_uint8(tag, static_cast<std::uint8_t>(ReferenceMarker::Null));
                    return;
                }

                if constexpr (std::is_polymorphic_v<V>) {
                    if (std::type_index(typeid(*value)) != type) {
                        throw PicklerException(brine_core::PicklerError::invalid_value(
                            inner->type_name(), "value of derived type '" +
                            brine_core::demangle(typeid(*value).name()) + "' would be sliced"));
                    }
                }

                const ReferenceKey key{value.get(), type};
                if (auto id = state.find_reference(key)) {
                    out.write_uint8(tag, static_cast<std::uint8_t>(ReferenceMarker::BackReference));
                    out.write_uint32("id", *id);
                    return;
                }

                state.add_reference(key);
                out.write_uint8(tag, static_cast<std::uint8_t>(ReferenceMarker::NewValue));
                inner->write(state, "value", *value);
            },
            [inner, type](CloneState& state, const Pointer& value) -> Pointer {
                if (!value) {
                    return nullptr;
                }
                ObjectRef copy = state.clone_once(ReferenceKey{value.get(), type}, [&]() {
                    return ObjectRef::from(std::make_shared<V>(inner->clone(state, *value)));
                });
                return copy.get_shared<V>();
            },
            [inner, type](VisitState& state, const Pointer& value) {
                if (!value || !state.mark_visited(ReferenceKey{value.get(), type})) {
                    return;
                }
                inner->accept(state, *value);
            },
            PicklerInfo::Reference, true, false);
    }
};

} // namespace brine_pickle
