#pragma once

/// @file provides_listener.hpp
/// Discovery engine that scans every registered component for provider
/// members after each configuration change.

#include "export.hpp"
#include "configuration.hpp"
#include "descriptor.hpp"
#include "providers_seen.hpp"
#include "service_locator.hpp"

#include <cstddef>

namespace librtprov {

struct discovery_options {
    /// Components to scan.  Empty scans every descriptor.
    descriptor_filter filter;

    /// Apply the destroy rules to values read from provider fields.  Off by
    /// default: a field usually hands out an object it keeps owning.
    bool dispose_field_values = false;
};

/// Scans per descriptor: a class exposed by two components is analysed
/// twice for its instance members and once for its static members.
///
/// Register with service_locator::add_configuration_listener().
class LIBRTPROV_EXPORT provides_listener final : public configuration_listener {
public:
    explicit provides_listener(service_locator& locator, discovery_options options = {});

    void configuration_changed() override;

    const providers_seen& seen() const noexcept { return seen_; }

private:
    std::size_t scan_component(dynamic_configuration& configuration,
                               const descriptor_ptr& component,
                               const class_info& cls);

    service_locator& locator_;
    discovery_options options_;
    providers_seen seen_;
};

} // namespace librtprov
