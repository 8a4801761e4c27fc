#pragma once

/// @file object_pickler.hpp
/// @brief Picklers for opaque object references and method descriptors
///
/// ObjectRef dispatches on its runtime type, which must have been registered
/// with PicklerResolver::register_type<T>(name). Wire layout under the
/// caller's tag: ReferenceMarker, then uint32 "id" for back references or
/// the "type" name and the payload under "value" for new values.
///
/// MethodHandle travels as its registered name and is looked up in the
/// resolver's MethodRegistry on read.

#include "pickler.hpp"
#include "resolver.hpp"
#include <memory>

namespace brine_pickle {

struct ObjectPickler {
    [[nodiscard]] static std::shared_ptr<Pickler<ObjectRef>> create(PicklerResolver& resolver);
};

struct MethodPickler {
    [[nodiscard]] static std::shared_ptr<Pickler<MethodHandle>> create(PicklerResolver& resolver);
};

} // namespace brine_pickle
