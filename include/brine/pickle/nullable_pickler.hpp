#pragma once

/// @file nullable_pickler.hpp
/// @brief Optional values: payload codec and absence marker layer
///
/// NullablePickler encodes only the present payload of a std::optional<V>;
/// its writer requires a value. NullMarkerPickler is the outer layer that
/// writes an "isNull" flag and skips the payload for absent values. The
/// resolver composes the two for std::optional<V>.

#include "pickler.hpp"
#include "resolver.hpp"
#include <functional>
#include <optional>
#include <type_traits>

namespace brine_pickle {

// =============================================================================
// NullablePickler
// =============================================================================

struct NullablePickler {
    template<typename V>
    [[nodiscard]] static std::shared_ptr<Pickler<std::optional<V>>> create(std::shared_ptr<Pickler<V>> inner) {
        static_assert(std::is_default_constructible_v<V>, "optional payload must be default constructible");
        static_assert(std::is_copy_constructible_v<V>, "optional payload must be copy constructible");
        static_assert(!std::is_pointer_v<V>, "optional payload must be a value type");

        using Optional = std::optional<V>;

        return CompositePickler<Optional>::create(
            [inner](ReadState& state, std::string_view tag) -> Optional {
                return Optional(inner->read(state, tag));
            },
            [inner](WriteState& state, std::string_view tag, const Optional& value) {
                if (!value) {
                    throw PicklerException(brine_core::PicklerError::invalid_value(
                        brine_core::type_name_of<Optional>(),
                        "absent value reached the payload writer"));
                }
                inner->write(state, tag, *value);
            },
            [inner](CloneState& state, const Optional& value) -> Optional {
                if (!value) {
                    return std::nullopt;
                }
                return Optional(inner->clone(state, *value));
            },
            [inner](VisitState& state, const Optional& value) {
                if (value) {
                    inner->accept(state, *value);
                }
            },
            PicklerInfo::Nullable, false, false);
    }

    template<typename V>
    [[nodiscard]] static std::shared_ptr<Pickler<std::optional<V>>> create(PicklerResolver& resolver) {
        return create<V>(resolver.resolve<V>());
    }
};

// =============================================================================
// NullMarkerPickler
// =============================================================================

/// Writes a boolean "isNull" marker ahead of the inner pickler's fields
template<typename T>
class NullMarkedPickler final : public Pickler<T> {
public:
    using AbsencePredicate = std::function<bool(const T&)>;

    NullMarkedPickler(std::shared_ptr<Pickler<T>> inner, AbsencePredicate is_absent, T absent)
        : Pickler<T>(inner->info(), inner->cache_by_ref(), inner->use_with_subtypes())
        , m_inner(std::move(inner))
        , m_is_absent(std::move(is_absent))
        , m_absent(std::move(absent)) {}

    void write(WriteState& state, std::string_view tag, const T& value) const override {
        const bool absent = m_is_absent(value);
        state.formatter().write_boolean("isNull", absent);
        if (!absent) {
            m_inner->write(state, tag, value);
        }
    }

    [[nodiscard]] T read(ReadState& state, std::string_view tag) const override {
        if (state.formatter().read_boolean("isNull")) {
            return m_absent;
        }
        return m_inner->read(state, tag);
    }

    [[nodiscard]] T clone(CloneState& state, const T& value) const override {
        if (m_is_absent(value)) {
            return m_absent;
        }
        return m_inner->clone(state, value);
    }

    void accept(VisitState& state, const T& value) const override {
        if (m_is_absent(value)) {
            state.visit(*this, &value);
            return;
        }
        m_inner->accept(state, value);
    }

private:
    std::shared_ptr<Pickler<T>> m_inner;
    AbsencePredicate m_is_absent;
    T m_absent;
};

struct NullMarkerPickler {
    template<typename T>
    [[nodiscard]] static std::shared_ptr<Pickler<T>> create(
        std::shared_ptr<Pickler<T>> inner,
        typename NullMarkedPickler<T>::AbsencePredicate is_absent,
        T absent)
    {
        return std::make_shared<NullMarkedPickler<T>>(std::move(inner), std::move(is_absent), std::move(absent));
    }

    /// Marker layer around NullablePickler, as resolved for std::optional<V>
    template<typename V>
    [[nodiscard]] static std::shared_ptr<Pickler<std::optional<V>>> create_optional(PicklerResolver& resolver) {
        return create<std::optional<V>>(
            NullablePickler::create<V>(resolver),
            [](const std::optional<V>& value) { return !value.has_value(); },
            std::nullopt);
    }
};

} // namespace brine_pickle
