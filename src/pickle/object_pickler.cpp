/// @file object_pickler.cpp
/// @brief ObjectRef and MethodHandle picklers

#include <brine/pickle/object_pickler.hpp>
#include <brine/pickle/reference_pickler.hpp>

namespace brine_pickle {

using brine_core::FormatError;
using brine_core::PicklerError;
using brine_core::TypeRegistryError;

namespace {

/// Resolver behind a pickler; it must outlive every use of the pickler
std::shared_ptr<PicklerResolver> lock_resolver(const std::weak_ptr<PicklerResolver>& handle) {
    auto resolver = handle.lock();
    if (!resolver) {
        throw PicklerException(brine_core::Error(brine_core::ErrorCode::InvalidState,
            "ObjectRef pickler used after its resolver was destroyed"));
    }
    return resolver;
}

/// Registered name of a runtime type
const std::string& registered_name(const PicklerResolver& resolver, std::type_index type) {
    const brine_core::TypeInfo* info = resolver.types().get(type);
    if (!info) {
        throw PicklerException(TypeRegistryError::not_registered(brine_core::demangle(type.name())));
    }
    return info->name;
}

/// Pickler for the runtime type of a non-null reference
std::shared_ptr<PicklerBase> dispatch(PicklerResolver& resolver, const ObjectRef& value) {
    registered_name(resolver, value.type());
    return resolver.resolve(value.type());
}

} // namespace

// =============================================================================
// ObjectPickler
// =============================================================================

std::shared_ptr<Pickler<ObjectRef>> ObjectPickler::create(PicklerResolver& resolver) {
    std::weak_ptr<PicklerResolver> handle = resolver.handle();

    return CompositePickler<ObjectRef>::create(
        [handle](ReadState& state, std::string_view tag) -> ObjectRef {
            auto& in = state.formatter();
            const auto marker = in.read_uint8(tag);
            switch (static_cast<ReferenceMarker>(marker)) {
                case ReferenceMarker::Null:
                    return ObjectRef{};
                case ReferenceMarker::BackReference:
                    return state.reference(in.read_uint32("id"));
                case ReferenceMarker::NewValue: {
                    auto r = lock_resolver(handle);
                    const std::uint32_t id = state.reserve_reference();
                    const std::string name = in.read_string("type");
                    const brine_core::TypeInfo* info = r->types().get_by_name(name);
                    if (!info) {
                        throw PicklerException(TypeRegistryError::not_registered(name));
                    }
                    ObjectRef value = r->resolve(info->type_id)->read_boxed(state, "value");
                    state.fill_reference(id, value);
                    return value;
                }
                default:
                    throw PicklerException(FormatError::invalid_data(
                        std::string(tag), "unknown reference marker " + std::to_string(marker)));
            }
        },
        [handle](WriteState& state, std::string_view tag, const ObjectRef& value) {
            auto& out = state.formatter();
            if (value.is_null()) {
                out.write_uint8(tag, static_cast<std::uint8_t>(ReferenceMarker::Null));
                return;
            }

            auto r = lock_resolver(handle);
            const std::string& name = registered_name(*r, value.type());
            const ReferenceKey key{value.address(), value.type()};
            if (auto id = state.find_reference(key)) {
                out.write_uint8(tag, static_cast<std::uint8_t>(ReferenceMarker::BackReference));
                out.write_uint32("id", *id);
                return;
            }

            auto pickler = r->resolve(value.type());
            state.add_reference(key);
            out.write_uint8(tag, static_cast<std::uint8_t>(ReferenceMarker::NewValue));
            out.write_string("type", name);
            pickler->write_boxed(state, "value", value);
        },
        [handle](CloneState& state, const ObjectRef& value) -> ObjectRef {
            if (value.is_null()) {
                return ObjectRef{};
            }
            auto pickler = dispatch(*lock_resolver(handle), value);
            return state.clone_once(ReferenceKey{value.address(), value.type()}, [&]() {
                return pickler->clone_boxed(state, value);
            });
        },
        [handle](VisitState& state, const ObjectRef& value) {
            if (value.is_null() || !state.mark_visited(ReferenceKey{value.address(), value.type()})) {
                return;
            }
            dispatch(*lock_resolver(handle), value)->accept_boxed(state, value);
        },
        PicklerInfo::Object, true, false);
}

// =============================================================================
// MethodPickler
// =============================================================================

std::shared_ptr<Pickler<MethodHandle>> MethodPickler::create(PicklerResolver& resolver) {
    std::shared_ptr<MethodRegistry> registry = resolver.method_registry();

    return CompositePickler<MethodHandle>::create(
        [registry](ReadState& state, std::string_view tag) -> MethodHandle {
            const std::string name = state.formatter().read_string(tag);
            MethodHandle method = registry->find(name);
            if (!method) {
                throw PicklerException(PicklerError::delegate_binding(name, "inaccessible member"));
            }
            return method;
        },
        [](WriteState& state, std::string_view tag, const MethodHandle& value) {
            if (!value) {
                throw PicklerException(PicklerError::invalid_value("MethodHandle", "null method descriptor"));
            }
            state.formatter().write_string(tag, value->name());
        },
        [](CloneState&, const MethodHandle& value) -> MethodHandle { return value; },
        [](VisitState&, const MethodHandle&) {},
        PicklerInfo::Method, false, false);
}

} // namespace brine_pickle
