#pragma once

/// @file abstract_pickler.hpp
/// @brief Placeholder for slots typed as an abstract class
///
/// No value of an abstract type exists, so a concrete value reaching this
/// pickler means subtype dispatch was bypassed upstream. Only an empty slot
/// is legitimate, and only accept can observe one.

#include "pickler.hpp"
#include <memory>
#include <type_traits>

namespace brine_pickle {

template<typename Base>
class AbstractPickler final : public Pickler<std::shared_ptr<Base>> {
    static_assert(std::is_abstract_v<Base>, "AbstractPickler requires an abstract type");

public:
    using Slot = std::shared_ptr<Base>;

    AbstractPickler() : Pickler<Slot>(PicklerInfo::Abstract, true, false) {}

    [[nodiscard]] static std::shared_ptr<Pickler<Slot>> create() {
        return std::make_shared<AbstractPickler>();
    }

    void write(WriteState&, std::string_view, const Slot&) const override {
        throw misuse();
    }

    [[nodiscard]] Slot read(ReadState&, std::string_view) const override {
        throw misuse();
    }

    [[nodiscard]] Slot clone(CloneState&, const Slot&) const override {
        throw misuse();
    }

    /// Occupied slots fail before the visitor is consulted
    void accept(VisitState& state, const Slot& value) const override {
        if (value) {
            throw misuse();
        }
        (void)state.visit(*this, &value);
    }

private:
    [[nodiscard]] PicklerException misuse() const {
        return PicklerException(brine_core::PicklerError::abstract_type_misuse(
            brine_core::type_name_of<Base>()));
    }
};

} // namespace brine_pickle
