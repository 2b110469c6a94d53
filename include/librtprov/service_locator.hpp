#pragma once

/// @file service_locator.hpp
/// The container surface the discovery engines consume.

#include "export.hpp"
#include "class_info.hpp"
#include "configuration.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "service_handle.hpp"
#include "type.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace librtprov {

using descriptor_filter = std::function<bool(const active_descriptor&)>;

class LIBRTPROV_EXPORT service_locator {
public:
    virtual ~service_locator() = default;

    // ---------------------------------------------------------------
    // Descriptor table
    // ---------------------------------------------------------------

    /// Committed descriptors in registration order.  An empty filter
    /// accepts everything.
    virtual std::vector<descriptor_ptr> descriptors(const descriptor_filter& filter = {}) const = 0;

    /// Make sure a descriptor is fully analysed before use.
    virtual descriptor_ptr reify_descriptor(const descriptor_ptr& descriptor) = 0;

    /// Highest-ranked descriptor advertising `type` with every qualifier in
    /// `qualifiers`, or null.
    virtual descriptor_ptr best_descriptor(const type_expr& type,
                                           const annotation_list& qualifiers = {}) const = 0;

    // ---------------------------------------------------------------
    // Lookup
    // ---------------------------------------------------------------

    /// Resolve an injection point.  Per-lookup instances are adopted by
    /// `parent` when one is given.  Throws not_found.
    virtual instance_ptr get_injectee(const type_expr& type,
                                      const annotation_list& qualifiers,
                                      service_handle* parent) = 0;

    /// Null when nothing matches.  The result points at the raw class of
    /// `type`.
    virtual instance_ptr get_service(const type_expr& type,
                                     const annotation_list& qualifiers = {}) = 0;

    /// The service of one descriptor, pointing at its implementation class.
    virtual instance_ptr get_service(const descriptor_ptr& descriptor, service_handle* root) = 0;

    virtual std::shared_ptr<service_handle> get_service_handle(const descriptor_ptr& descriptor) = 0;

    // ---------------------------------------------------------------
    // Lifecycle hooks
    // ---------------------------------------------------------------

    /// Run the `post_construct` methods of `cls` on `instance`.
    virtual void post_construct(const instance_ptr& instance, const class_info& cls) = 0;

    /// Run the `pre_destroy` methods of `cls` on `instance`.
    virtual void pre_destroy(const instance_ptr& instance, const class_info& cls) = 0;

    // ---------------------------------------------------------------
    // Configuration
    // ---------------------------------------------------------------

    /// The service that currently creates configurations.
    virtual dynamic_configuration_service& configuration_service() = 0;

    /// The built-in service, unaffected by set_configuration_service().
    virtual dynamic_configuration_service& default_configuration_service() = 0;

    virtual void set_configuration_service(std::shared_ptr<dynamic_configuration_service> service) = 0;

    /// The listener is notified once immediately and after every commit.
    virtual void add_configuration_listener(std::shared_ptr<configuration_listener> listener) = 0;

    // ---------------------------------------------------------------
    // Typed helpers
    // ---------------------------------------------------------------

    /// `T` must be the C++ type behind the raw class of `type`.
    template <typename T>
    std::shared_ptr<T> get(const type_expr& type, const annotation_list& qualifiers = {}) {
        return std::static_pointer_cast<T>(get_service(type, qualifiers));
    }

    template <typename T>
    std::shared_ptr<T> get_injectee(const type_expr& type, const annotation_list& qualifiers = {},
                                    service_handle* parent = nullptr) {
        return std::static_pointer_cast<T>(get_injectee(type, qualifiers, parent));
    }
};

} // namespace librtprov
