#include "librtprov/provides_listener.hpp"
#include "librtprov/annotations.hpp"
#include "librtprov/logging.hpp"
#include "provider_synthesis.hpp"

#include <memory>
#include <utility>

namespace librtprov {

provides_listener::provides_listener(service_locator& locator, discovery_options options)
    : locator_(locator)
    , options_(std::move(options))
{}

void provides_listener::configuration_changed() {
    // Look the service up on every pass, it may have been replaced.
    auto configuration = locator_.configuration_service().create_dynamic_configuration();

    std::size_t added = 0;
    for (const auto& candidate : locator_.descriptors(options_.filter)) {
        descriptor_ptr component = locator_.reify_descriptor(candidate);
        if (!component || !seen_.add(*component)) continue;

        const class_info* cls = component->implementation_class();
        if (!cls) continue;

        added += scan_component(*configuration, component, *cls);
    }

    if (added > 0) {
        LIBRTPROV_LOG_DEBUG << "provides_listener: committing " << added << " provider(s)";
        configuration->commit();
    }
}

std::size_t provides_listener::scan_component(dynamic_configuration& configuration,
                                              const descriptor_ptr& component,
                                              const class_info& cls) {
    const bool instance_members = !internal::is_placeholder(*component);
    const internal::synthesis_options synthesis{.dispose_field_values = options_.dispose_field_values};

    std::size_t added = 0;
    auto visit = [&](const member_ref& member) {
        if (!has_annotation(internal::annotations_of(member), annotations::provides_type())) return;

        const bool is_static = internal::is_static_member(member);
        if (!is_static && !instance_members) return;

        const bool fresh = is_static ? seen_.add_static(member)
                                     : seen_.add_instance(*component, member);
        if (!fresh) return;

        auto descriptor = internal::descriptor_from_member(
            locator_, member, cls, component->implementation_type(), component, synthesis);
        if (!descriptor) return;

        configuration.add_active_descriptor(std::move(descriptor));
        ++added;
    };

    for (const auto* m : cls.methods()) visit(m);
    for (const auto* f : cls.fields()) visit(f);
    return added;
}

} // namespace librtprov
