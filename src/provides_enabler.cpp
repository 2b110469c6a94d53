#include "librtprov/provides_enabler.hpp"
#include "librtprov/annotations.hpp"
#include "librtprov/exceptions.hpp"
#include "librtprov/logging.hpp"
#include "librtprov/provides_descriptor.hpp"
#include "librtprov/type_utils.hpp"
#include "class_descriptor.hpp"
#include "provider_synthesis.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace librtprov {

namespace {

/// A private, parameterless, sole constructor on a class whose declared
/// members are all static.
bool is_utility_class_constructor(const class_info& cls, const constructor_info* ctor) noexcept {
    if (!ctor || !ctor->is_private || !ctor->parameters.empty()) return false;
    if (cls.constructors().size() != 1) return false;

    const auto& fields = cls.declared_fields();
    const auto& methods = cls.declared_methods();
    return std::all_of(fields.begin(), fields.end(), [](const field_info& f) { return f.is_static; })
        && std::all_of(methods.begin(), methods.end(), [](const method_info& m) { return m.is_static; });
}

/// Whether the default configuration would accept the class.
bool default_can_instantiate(const class_info& cls) noexcept {
    return internal::is_instantiable(cls)
        && !is_utility_class_constructor(cls, internal::usable_constructor(cls));
}

} // namespace

// ---------------------------------------------------------------
// forwarding_configuration
// ---------------------------------------------------------------

class provides_enabler::forwarding_configuration final : public dynamic_configuration {
public:
    explicit forwarding_configuration(provides_enabler& owner)
        : owner_(owner)
        , delegate_(owner.default_service_.create_dynamic_configuration())
    {}

    descriptor_ptr add_active_descriptor(descriptor_ptr descriptor) override {
        return delegate_->add_active_descriptor(std::move(descriptor));
    }

    descriptor_ptr add_active_descriptor(const type_expr& type) override {
        return owner_.add_class(type, *this, *delegate_);
    }

    void commit() override {
        delegate_->commit();
    }

private:
    provides_enabler& owner_;
    std::unique_ptr<dynamic_configuration> delegate_;
};

// ---------------------------------------------------------------
// provides_enabler
// ---------------------------------------------------------------

std::shared_ptr<provides_enabler> provides_enabler::install(service_locator& locator,
                                                            enabler_options options) {
    auto enabler = std::make_shared<provides_enabler>(locator, options);
    locator.set_configuration_service(enabler);
    locator.add_configuration_listener(enabler);
    return enabler;
}

provides_enabler::provides_enabler(service_locator& locator, enabler_options options)
    : locator_(locator)
    , options_(options)
    , default_service_(locator.default_configuration_service())
{}

std::unique_ptr<dynamic_configuration> provides_enabler::create_dynamic_configuration() {
    return std::make_unique<forwarding_configuration>(*this);
}

void provides_enabler::configuration_changed() {
    try {
        find_all_providers();
    } catch (const std::exception& e) {
        LIBRTPROV_LOG_ERROR << "provides_enabler: configuration pass failed: " << e.what();
        throw;
    }
}

void provides_enabler::find_all_providers() {
    // Whoever currently serves configurations, possibly not us.
    auto configuration = locator_.configuration_service().create_dynamic_configuration();

    std::size_t added = 0;
    for (const auto& candidate : locator_.descriptors()) {
        descriptor_ptr component = locator_.reify_descriptor(candidate);
        if (!component) continue;

        const class_info* cls = component->implementation_class();
        if (!cls || !classes_fully_analyzed_.add(*cls)) continue;

        descriptor_ptr owner = internal::is_placeholder(*component) ? nullptr : component;
        added += add_provides_descriptors(*cls, component->implementation_type(), owner, *configuration);
        added += add_registers_descriptors(*cls, *configuration);
    }

    if (added > 0) {
        LIBRTPROV_LOG_DEBUG << "provides_enabler: committing " << added << " descriptor(s)";
        configuration->commit();
    }
}

std::size_t provides_enabler::add_provides_descriptors(const class_info& cls,
                                                       const type_expr& type,
                                                       const descriptor_ptr& component,
                                                       dynamic_configuration& configuration) {
    std::array<bool, category_count> known{};
    {
        std::lock_guard lock(mutex_);
        for (std::size_t c = 0; c < category_count; ++c) {
            known[c] = by_class_[c].contains(&cls);
        }
    }

    std::array<std::optional<descriptor_list>, category_count> found;
    std::size_t added = 0;
    for (std::size_t c = 0; c < category_count; ++c) {
        const bool instance_category = c == instance_methods || c == instance_fields;
        if (known[c] || (instance_category && !component)) continue;

        found[c] = scan(cls, type, component, static_cast<category>(c), configuration);
        added += found[c]->size();
    }

    std::lock_guard lock(mutex_);
    for (std::size_t c = 0; c < category_count; ++c) {
        if (found[c]) by_class_[c].emplace(&cls, std::move(*found[c]));
    }
    return added;
}

std::size_t provides_enabler::add_registers_descriptors(const class_info& cls,
                                                        dynamic_configuration& configuration) {
    auto registers = find_annotation<registers_annotation>(cls.annotations());
    if (!registers) return 0;

    std::size_t added = 0;
    for (const auto* registered : registers->classes()) {
        configuration.add_active_descriptor(registered->as_type());
        ++added;
    }
    return added;
}

provides_enabler::descriptor_list provides_enabler::scan(const class_info& cls,
                                                         const type_expr& type,
                                                         const descriptor_ptr& component,
                                                         category which,
                                                         dynamic_configuration& configuration) {
    const bool want_static = which == static_methods || which == static_fields;
    const bool want_methods = which == static_methods || which == instance_methods;

    std::vector<member_ref> members;
    if (want_methods) {
        for (const auto* m : cls.methods()) {
            if (m->is_static == want_static) members.emplace_back(m);
        }
    } else {
        for (const auto* f : cls.fields()) {
            if (f->is_static == want_static) members.emplace_back(f);
        }
    }

    const internal::synthesis_options synthesis{.dispose_field_values = options_.dispose_field_values};

    descriptor_list descriptors;
    for (const auto& member : members) {
        auto descriptor = internal::descriptor_from_member(locator_, member, cls, type,
                                                           component, synthesis);
        if (descriptor) descriptors.push_back(configuration.add_active_descriptor(std::move(descriptor)));
    }
    return descriptors;
}

descriptor_ptr provides_enabler::add_class(const type_expr& type,
                                           dynamic_configuration& configuration,
                                           dynamic_configuration& fallback) {
    const class_info* cls = raw_class(type);
    if (!cls) return fallback.add_active_descriptor(type);

    add_provides_descriptors(*cls, type, nullptr, configuration);

    descriptor_list statics;
    {
        std::lock_guard lock(mutex_);
        for (auto c : {static_methods, static_fields}) {
            auto it = by_class_[c].find(cls);
            if (it != by_class_[c].end()) {
                statics.insert(statics.end(), it->second.begin(), it->second.end());
            }
        }
    }

    if (statics.empty() && !has_annotation(cls->annotations(), annotations::registers_type())) {
        return fallback.add_active_descriptor(type);
    }

    // Registering the class already served a purpose, so never let the
    // default configuration reject it.
    if (default_can_instantiate(*cls)) {
        return fallback.add_active_descriptor(type);
    }

    for (const auto& d : statics) {
        if (d->advertises(cls->as_type()) || d->advertises(type)) return d;
    }

    LIBRTPROV_LOG_DEBUG << "provides_enabler: " << type.to_string()
                        << " cannot be instantiated, registering a placeholder";

    auto placeholder = std::make_shared<provides_descriptor>(
        cls, type, std::vector<type_expr>{}, annotations::singleton(),
        [cls](service_handle&) -> instance_ptr {
            throw unsupported_operation("Cannot create an instance of " + cls->name());
        },
        [cls](const instance_ptr&) {
            throw unsupported_operation("Cannot dispose an instance of " + cls->name());
        });
    return configuration.add_active_descriptor(std::move(placeholder));
}

} // namespace librtprov
