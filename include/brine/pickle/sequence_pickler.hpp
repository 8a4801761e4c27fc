#pragma once

/// @file sequence_pickler.hpp
/// @brief std::vector<T> as an int32 length followed by the elements

#include "pickler.hpp"
#include "resolver.hpp"
#include <limits>
#include <vector>

namespace brine_pickle {

struct SequencePickler {
    template<typename T>
    [[nodiscard]] static std::shared_ptr<Pickler<std::vector<T>>> create(PicklerResolver& resolver) {
        using Sequence = std::vector<T>;
        auto element = resolver.resolve<T>();

        return CompositePickler<Sequence>::create(
            [element](ReadState& state, std::string_view tag) -> Sequence {
                const std::int32_t length = state.formatter().read_int32(tag);
                if (length < 0) {
                    throw PicklerException(brine_core::FormatError::invalid_data(
                        std::string(tag), "negative sequence length"));
                }
                Sequence result;
                for (std::int32_t i = 0; i < length; ++i) {
                    result.push_back(element->read(state, "item"));
                }
                return result;
            },
            [element](WriteState& state, std::string_view tag, const Sequence& value) {
                if (value.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
                    throw PicklerException(brine_core::PicklerError::invalid_value(
                        brine_core::type_name_of<Sequence>(), "too many elements"));
                }
                state.formatter().write_int32(tag, static_cast<std::int32_t>(value.size()));
                for (const auto& item : value) {
                    element->write(state, "item", item);
                }
            },
            [element](CloneState& state, const Sequence& value) -> Sequence {
                Sequence result;
                result.reserve(value.size());
                for (const auto& item : value) {
                    result.push_back(element->clone(state, item));
                }
                return result;
            },
            [element](VisitState& state, const Sequence& value) {
                for (const auto& item : value) {
                    element->accept(state, item);
                }
            },
            PicklerInfo::Sequence, false, false);
    }
};

} // namespace brine_pickle
