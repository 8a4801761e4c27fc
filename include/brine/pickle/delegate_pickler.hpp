#pragma once

/// @file delegate_pickler.hpp
/// @brief Multicast function references
///
/// Wire layout:
/// - single binding: "isLinked" = false, "method", and "target" for
///   instance methods
/// - multicast: "isLinked" = true, int32 "length", then every element as a
///   single binding under "linked"
///
/// Elements go through the delegate's own pickler, which during
/// construction is the resolver's forwarding placeholder.

#include "delegate.hpp"
#include "pickler.hpp"
#include "resolver.hpp"
#include <vector>

namespace brine_pickle {

struct DelegatePickler {
    template<typename D>
    [[nodiscard]] static std::shared_ptr<Pickler<D>> create(PicklerResolver& resolver) {
        auto objects = resolver.resolve<ObjectRef>();
        auto methods = resolver.resolve<MethodHandle>();
        auto self = resolver.resolve<D>();
        const std::string name = brine_core::type_name_of<D>();

        auto bindings_of = [name](const D& value) -> const std::vector<typename D::Binding>& {
            if (value.empty()) {
                throw PicklerException(brine_core::PicklerError::invalid_value(name, "empty invocation list"));
            }
            return value.invocation_list();
        };

        auto reader = [objects, methods, self, name](ReadState& state, std::string_view) -> D {
            auto& in = state.formatter();
            if (!in.read_boolean("isLinked")) {
                MethodHandle method = methods->read(state, "method");
                if (method->is_static()) {
                    return D::bind_static(std::move(method));
                }
                ObjectRef target = objects->read(state, "target");
                return D::bind(std::move(target), std::move(method));
            }

            const std::int32_t length = in.read_int32("length");
            if (length < 1) {
                throw PicklerException(brine_core::FormatError::invalid_data(
                    "length", "invocation list of " + name + " must not be empty"));
            }
            std::vector<D> elements;
            elements.reserve(static_cast<std::size_t>(length));
            for (std::int32_t i = 0; i < length; ++i) {
                elements.push_back(self->read(state, "linked"));
            }
            return D::combine(elements);
        };

        auto writer = [objects, methods, self, bindings_of](WriteState& state, std::string_view, const D& value) {
            const auto& list = bindings_of(value);
            auto& out = state.formatter();
            if (list.size() == 1) {
                const auto& binding = list.front();
                out.write_boolean("isLinked", false);
                methods->write(state, "method", binding.method);
                if (!binding.method->is_static()) {
                    objects->write(state, "target", binding.target);
                }
                return;
            }

            out.write_boolean("isLinked", true);
            out.write_int32("length", static_cast<std::int32_t>(list.size()));
            for (const auto& binding : list) {
                self->write(state, "linked", D::from_binding(binding));
            }
        };

        auto cloner = [objects, self, bindings_of](CloneState& state, const D& value) -> D {
            const auto& list = bindings_of(value);
            if (list.size() == 1) {
                const auto& binding = list.front();
                if (binding.method->is_static()) {
                    return D::bind_static(binding.method);
                }
                return D::bind(objects->clone(state, binding.target), binding.method);
            }

            std::vector<D> cloned;
            cloned.reserve(list.size());
            for (const auto& binding : list) {
                cloned.push_back(self->clone(state, D::from_binding(binding)));
            }
            return D::combine(cloned);
        };

        auto accepter = [objects, methods, self, bindings_of](VisitState& state, const D& value) {
            const auto& list = bindings_of(value);
            if (list.size() == 1) {
                const auto& binding = list.front();
                methods->accept(state, binding.method);
                if (!binding.method->is_static()) {
                    objects->accept(state, binding.target);
                }
                return;
            }

            for (const auto& binding : list) {
                self->accept(state, D::from_binding(binding));
            }
        };

        return CompositePickler<D>::create(
            std::move(reader), std::move(writer), std::move(cloner), std::move(accepter),
            PicklerInfo::Delegate, false, false);
    }
};

} // namespace brine_pickle
