#pragma once

/// @file pickle.hpp
/// @brief Main include file for brine_pickle module
///
/// Include this header (not resolver.hpp alone) wherever picklers are
/// resolved: it provides the generator that resolve<T>() instantiates.

#include "fwd.hpp"
#include "exception.hpp"
#include "formatter.hpp"
#include "binary_formatter.hpp"
#include "json_formatter.hpp"
#include "object.hpp"
#include "state.hpp"
#include "pickler.hpp"
#include "method.hpp"
#include "delegate.hpp"
#include "resolver.hpp"
#include "primitive_pickler.hpp"
#include "enum_pickler.hpp"
#include "nullable_pickler.hpp"
#include "delegate_pickler.hpp"
#include "abstract_pickler.hpp"
#include "reference_pickler.hpp"
#include "object_pickler.hpp"
#include "sequence_pickler.hpp"
#include "record_pickler.hpp"
#include "generator.hpp"
#include "config.hpp"
#include "serializer.hpp"

/// @namespace brine_pickle
/// @brief Type-directed pickler composition engine
///
/// - **Picklers**: write, read, clone and accept bundled per type
/// - **Resolver**: recursion-safe type -> pickler cache
/// - **Combinators**: enum, optional, delegate, abstract placeholder,
///   shared reference, sequence, record
/// - **Serializer**: framed entry points over binary or JSON formatters
///
/// Example usage:
/// @code
/// #include <brine/pickle/pickle.hpp>
///
/// using namespace brine_pickle;
///
/// enum class Color : std::int32_t { Red, Green, Blue };
///
/// PicklerResolver resolver;
/// Serializer serializer(resolver);
/// auto bytes = serializer.pickle(Color::Green);
/// Color c = serializer.unpickle<Color>(bytes);
/// @endcode
