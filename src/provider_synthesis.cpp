#include "provider_synthesis.hpp"

#include "librtprov/annotations.hpp"
#include "librtprov/exceptions.hpp"
#include "librtprov/logging.hpp"
#include "librtprov/provides_descriptor.hpp"
#include "librtprov/service_locator.hpp"
#include "librtprov/type_utils.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace librtprov::internal {

namespace {

using destroyer = provides_annotation::destroyer;

void add_unique(std::vector<type_expr>& types, const type_expr& t) {
    if (std::find(types.begin(), types.end(), t) == types.end()) types.push_back(t);
}

std::vector<type_expr> unique(const std::vector<type_expr>& types) {
    std::vector<type_expr> out;
    for (const auto& t : types) add_unique(out, t);
    return out;
}

bool is_static(const member_ref& member) noexcept {
    auto kind = kind_of(member);
    return kind == provider_kind::static_method || kind == provider_kind::static_field;
}

/// Run a member's code, wrapping whatever it throws in multi_error.
template <typename Fn>
instance_ptr call_member(Fn&& fn) {
    try {
        return fn();
    } catch (...) {
        throw multi_error({std::current_exception()});
    }
}

/// Closes a handle on scope exit when asked to.
class handle_closer {
public:
    handle_closer(service_handle& handle, bool enabled) noexcept
        : handle_(handle), enabled_(enabled) {}
    ~handle_closer() {
        if (enabled_) handle_.close();
    }

    handle_closer(const handle_closer&) = delete;
    handle_closer& operator=(const handle_closer&) = delete;

private:
    service_handle& handle_;
    bool enabled_;
};

// ---------------------------------------------------------------
// Scope
// ---------------------------------------------------------------

annotation_ptr scope_for(const member_ref& member,
                         const std::vector<type_expr>& contracts,
                         const descriptor_ptr& provider) {
    const annotation_list& type_annotations =
        std::holds_alternative<const method_info*>(member)
            ? std::get<const method_info*>(member)->return_annotations
            : std::get<const field_info*>(member)->type_annotations;

    if (has_annotation(type_annotations, annotations::nullable_type())) {
        return annotations::per_lookup();
    }

    if (auto scope = find_scope(annotations_of(member))) return scope;

    for (const auto& contract : contracts) {
        if (const auto* cls = raw_class(contract)) {
            if (auto scope = find_scope(cls->annotations())) return scope;
        }
    }

    if (!is_static(member) && provider && provider->scope_annotation()) {
        return provider->scope_annotation();
    }

    return annotations::per_lookup();
}

bool is_per_lookup(const active_descriptor& d) noexcept {
    const auto& scope = d.scope_annotation();
    return !scope || &scope->annotation_type() == &annotations::per_lookup_type();
}

// ---------------------------------------------------------------
// Creation
// ---------------------------------------------------------------

std::vector<instance_ptr> resolve_arguments(service_locator& locator,
                                            const std::vector<parameter_info>& parameters,
                                            const std::vector<type_expr>& types,
                                            service_handle& root) {
    std::vector<instance_ptr> args;
    args.reserve(types.size());
    for (std::size_t i = 0; i < types.size(); ++i) {
        args.push_back(locator.get_injectee(types[i], qualifiers_of(parameters[i].annotations), &root));
    }
    return args;
}

create_fn create_from_method(service_locator& locator,
                             const method_info* method,
                             std::vector<type_expr> parameter_types,
                             const class_info* provider_class,
                             descriptor_ptr provider,
                             const class_info* produced_class) {
    return [&locator, method, parameter_types = std::move(parameter_types),
            provider_class, provider = std::move(provider), produced_class](service_handle& root) {
        auto args = resolve_arguments(locator, method->parameters, parameter_types, root);

        instance_ptr receiver;
        if (!method->is_static) {
            instance_ptr owner = locator.get_service(provider, &root);
            receiver = provider_class->upcast(owner, *method->declaring_class);
        }

        instance_ptr provided = call_member([&] { return method->invoke(receiver.get(), args); });
        if (provided && produced_class) locator.post_construct(provided, *produced_class);
        return provided;
    };
}

create_fn create_from_field(service_locator& locator,
                            const field_info* field,
                            const class_info* provider_class,
                            descriptor_ptr provider,
                            const class_info* produced_class) {
    return [&locator, field, provider_class, provider = std::move(provider),
            produced_class](service_handle& root) {
        instance_ptr receiver;
        if (!field->is_static) {
            instance_ptr owner = locator.get_service(provider, &root);
            receiver = provider_class->upcast(owner, *field->declaring_class);
        }

        instance_ptr provided = call_member([&] { return field->read(receiver.get()); });
        if (provided && produced_class) locator.post_construct(provided, *produced_class);
        return provided;
    };
}

// ---------------------------------------------------------------
// Disposal
// ---------------------------------------------------------------

dispose_fn missing_destroy_method(const provides_annotation& provides, const member_ref& member) {
    std::string method = provides.destroy_method();
    std::string element = member_name(member);
    LIBRTPROV_LOG_WARN << "Destroy method \"" << method << "\" for " << element
                       << " not found; disposal will fail";
    return [method, element](const instance_ptr&) {
        throw multi_error({std::make_exception_ptr(destroy_method_not_found(method, element))});
    };
}

dispose_fn dispose_by_provided_instance(const provides_annotation& provides,
                                        const member_ref& member,
                                        const class_info* produced_class) {
    const method_info* destroy = nullptr;
    if (produced_class) {
        for (const auto* m : produced_class->methods()) {
            if (m->name == provides.destroy_method() && !m->is_static && m->parameters.empty()) {
                destroy = m;
                break;
            }
        }
    }
    if (!destroy) return missing_destroy_method(provides, member);

    return [produced_class, destroy](const instance_ptr& instance) {
        instance_ptr receiver = produced_class->upcast(instance, *destroy->declaring_class);
        call_member([&] { return destroy->invoke(receiver.get(), {}); });
    };
}

dispose_fn dispose_by_provider(service_locator& locator,
                               const provides_annotation& provides,
                               const member_ref& member,
                               const type_expr& produced_type,
                               const class_info& provider_class,
                               const type_expr& provider_type,
                               const descriptor_ptr& provider) {
    const bool static_member = is_static(member);

    const method_info* destroy = nullptr;
    for (const auto* m : provider_class.methods()) {
        if (m->name != provides.destroy_method()) continue;
        if (m->is_static != static_member) continue;
        if (m->parameters.size() != 1) continue;
        type_expr parameter_type = resolve_type(provider_type, m->parameters.front().type);
        if (is_assignable(parameter_type, produced_type)) {
            destroy = m;
            break;
        }
    }
    if (!destroy) return missing_destroy_method(provides, member);

    const class_info* produced_class = raw_class(produced_type);
    const class_info* parameter_class = raw_class(destroy->parameters.front().type);

    auto as_argument = [produced_class, parameter_class](const instance_ptr& instance) {
        if (produced_class && parameter_class) return produced_class->upcast(instance, *parameter_class);
        return instance;
    };

    if (static_member) {
        return [destroy, as_argument](const instance_ptr& instance) {
            std::array<instance_ptr, 1> args{as_argument(instance)};
            call_member([&] { return destroy->invoke(nullptr, args); });
        };
    }

    const class_info* owner_class = &provider_class;
    return [&locator, destroy, as_argument, owner_class, provider](const instance_ptr& instance) {
        auto handle = locator.get_service_handle(provider);
        handle_closer closer(*handle, is_per_lookup(*provider));

        instance_ptr owner = handle->get_service();
        instance_ptr receiver = owner_class->upcast(owner, *destroy->declaring_class);
        std::array<instance_ptr, 1> args{as_argument(instance)};
        call_member([&] { return destroy->invoke(receiver.get(), args); });
    };
}

dispose_fn dispose_for(service_locator& locator,
                       const provides_annotation& provides,
                       const member_ref& member,
                       const type_expr& produced_type,
                       const class_info& provider_class,
                       const type_expr& provider_type,
                       const descriptor_ptr& provider) {
    const class_info* produced_class = raw_class(produced_type);

    if (provides.destroy_method().empty()) {
        return [&locator, produced_class](const instance_ptr& instance) {
            if (produced_class) locator.pre_destroy(instance, *produced_class);
        };
    }

    switch (provides.destroyed_by()) {
        case destroyer::provided_instance:
            return dispose_by_provided_instance(provides, member, produced_class);
        case destroyer::provider:
            return dispose_by_provider(locator, provides, member, produced_type,
                                       provider_class, provider_type, provider);
    }

    throw di_error("Unknown destroyer value "
                   + std::to_string(static_cast<int>(provides.destroyed_by()))
                   + " on " + member_name(member));
}

} // namespace

// ---------------------------------------------------------------
// Contracts
// ---------------------------------------------------------------

bool is_contract(const type_expr& type) {
    const class_info* cls = raw_class(type);
    if (!cls) return false;

    for (const auto& a : cls->annotations()) {
        if (&a->annotation_type() == &annotations::contract_type()) return true;
        if (has_annotation(a->annotation_type().annotations(), annotations::contract_indicator_type())) {
            return true;
        }
    }
    return false;
}

std::vector<type_expr> advertised_contracts(const type_expr& type) {
    const class_info* cls = raw_class(type);
    if (!cls) return {type};

    if (auto explicit_contracts = find_annotation<contracts_provided_annotation>(cls->annotations())) {
        return unique(explicit_contracts->contracts());
    }

    std::vector<type_expr> contracts{type};
    for (const auto& st : supertypes_of(type)) {
        if (is_contract(st)) add_unique(contracts, st);
    }
    return contracts;
}

const annotation_list& annotations_of(const member_ref& member) noexcept {
    if (const auto* m = std::get_if<const method_info*>(&member)) return (*m)->annotations;
    return std::get<const field_info*>(member)->annotations;
}

bool is_static_member(const member_ref& member) noexcept {
    return is_static(member);
}

bool is_placeholder(const active_descriptor& descriptor) noexcept {
    const auto* provided = dynamic_cast<const provides_descriptor*>(&descriptor);
    return provided && std::holds_alternative<const class_info*>(provided->source());
}

std::string member_name(const member_ref& member) {
    if (const auto* m = std::get_if<const method_info*>(&member)) {
        return (*m)->declaring_class->name() + "." + (*m)->name + "()";
    }
    const auto* f = std::get<const field_info*>(member);
    return f->declaring_class->name() + "." + f->name;
}

// ---------------------------------------------------------------
// Synthesis
// ---------------------------------------------------------------

descriptor_ptr descriptor_from_member(service_locator& locator,
                                      const member_ref& member,
                                      const class_info& provider_class,
                                      const type_expr& provider_type,
                                      const descriptor_ptr& provider,
                                      const synthesis_options& options) {
    auto provides = find_annotation<provides_annotation>(annotations_of(member));
    if (!provides) return nullptr;

    if (!is_static(member) && !provider) {
        throw di_error("A component descriptor is required for instance member "
                       + member_name(member));
    }

    const auto* method = std::get_if<const method_info*>(&member);
    const auto* field = std::get_if<const field_info*>(&member);

    const type_expr& declared = method ? (*method)->return_type : (*field)->type;
    type_expr produced = resolve_type(provider_type, declared);
    if (contains_type_variable(produced)) {
        LIBRTPROV_LOG_DEBUG << "Skipping " << member_name(member) << ": produced type "
                            << produced.to_string() << " is not resolvable from "
                            << provider_type.to_string();
        return nullptr;
    }

    std::vector<type_expr> parameter_types;
    if (method) {
        for (const auto& p : (*method)->parameters) {
            type_expr resolved = resolve_type(provider_type, p.type);
            if (contains_type_variable(resolved)) {
                LIBRTPROV_LOG_DEBUG << "Skipping " << member_name(member) << ": parameter type "
                                    << resolved.to_string() << " is not resolvable from "
                                    << provider_type.to_string();
                return nullptr;
            }
            parameter_types.push_back(std::move(resolved));
        }
    }

    std::vector<type_expr> contracts = provides->contracts().empty()
        ? advertised_contracts(produced)
        : unique(provides->contracts());

    annotation_ptr scope = scope_for(member, contracts, provider);
    const class_info* produced_class = raw_class(produced);

    create_fn create = method
        ? create_from_method(locator, *method, std::move(parameter_types),
                             &provider_class, provider, produced_class)
        : create_from_field(locator, *field, &provider_class, provider, produced_class);

    dispose_fn dispose = (field && !options.dispose_field_values)
        ? dispose_fn([](const instance_ptr&) {})
        : dispose_for(locator, *provides, member, produced, provider_class, provider_type, provider);

    provider_source source = method ? provider_source(*method) : provider_source(*field);

    auto descriptor = std::make_shared<provides_descriptor>(
        source, produced, std::move(contracts), std::move(scope),
        std::move(create), std::move(dispose));

    LIBRTPROV_LOG_DEBUG << "Synthesized " << descriptor->to_string() << " producing "
                        << produced.to_string();
    return descriptor;
}

} // namespace librtprov::internal
