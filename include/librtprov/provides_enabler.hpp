#pragma once

/// @file provides_enabler.hpp
/// Discovery engine that analyses each class once and caches its provider
/// descriptors, plus the configuration service that lets classes with only
/// static providers be registered.

#include "export.hpp"
#include "configuration.hpp"
#include "descriptor.hpp"
#include "providers_seen.hpp"
#include "service_locator.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace librtprov {

struct enabler_options {
    /// Apply the destroy rules to values read from provider fields.
    bool dispose_field_values = true;
};

/// Preferred way to turn on provider discovery:
///
///     auto loc = locator::create();
///     provides_enabler::install(*loc);
///     auto config = loc->configuration_service().create_dynamic_configuration();
///     config->add_active_descriptor(clock_factory_class());  // static providers only
///     config->commit();
///
/// Once installed, every configuration created through the locator is a
/// forwarding configuration whose add_active_descriptor(type) scans the class
/// for static providers first.  A class that could not be built through a
/// constructor is then accepted instead of rejected.
class LIBRTPROV_EXPORT provides_enabler final
    : public configuration_listener
    , public dynamic_configuration_service {
public:
    /// Make a new enabler the locator's configuration service and register
    /// it as a listener, which runs the first discovery pass.
    static std::shared_ptr<provides_enabler> install(service_locator& locator,
                                                     enabler_options options = {});

    /// Captures the locator's default configuration service for delegation.
    explicit provides_enabler(service_locator& locator, enabler_options options = {});

    /// Errors are logged and rethrown.
    void configuration_changed() override;

    std::unique_ptr<dynamic_configuration> create_dynamic_configuration() override;

private:
    class forwarding_configuration;

    enum category : std::size_t {
        static_methods,
        static_fields,
        instance_methods,
        instance_fields,
        category_count
    };

    using descriptor_list = std::vector<descriptor_ptr>;

    void find_all_providers();

    /// Fill every category of `cls` not cached yet.  Instance categories need
    /// `component`.  Returns the number of descriptors added.
    std::size_t add_provides_descriptors(const class_info& cls,
                                         const type_expr& type,
                                         const descriptor_ptr& component,
                                         dynamic_configuration& configuration);

    std::size_t add_registers_descriptors(const class_info& cls,
                                          dynamic_configuration& configuration);

    descriptor_list scan(const class_info& cls,
                         const type_expr& type,
                         const descriptor_ptr& component,
                         category which,
                         dynamic_configuration& configuration);

    /// The class registration path of forwarding_configuration.
    descriptor_ptr add_class(const type_expr& type,
                             dynamic_configuration& configuration,
                             dynamic_configuration& fallback);

    service_locator& locator_;
    enabler_options options_;
    dynamic_configuration_service& default_service_;

    providers_seen classes_fully_analyzed_;

    // Held while checking or storing finished lists, never while scanning.
    std::mutex mutex_;
    std::array<std::unordered_map<const class_info*, descriptor_list>, category_count> by_class_;
};

} // namespace librtprov
