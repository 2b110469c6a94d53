#pragma once

/// @file locator.hpp
/// In-memory container implementing the service_locator interface.

#include "export.hpp"
#include "service_locator.hpp"

#include <memory>
#include <string>
#include <vector>

namespace librtprov {

struct locator_options {
    /// Detect dependency cycles at creation time and throw
    /// cyclic_dependency instead of recursing.
    bool detect_cycles = true;

    /// Appears in log lines.
    std::string name = "default";
};

class LIBRTPROV_EXPORT locator final : public service_locator {
public:
    static std::shared_ptr<locator> create(locator_options options = {});

    /// Disposes remaining singletons.
    ~locator() override;

    locator(const locator&) = delete;
    locator& operator=(const locator&) = delete;

    using service_locator::get_injectee;
    using service_locator::get_service;

    const locator_options& options() const noexcept;

    std::vector<descriptor_ptr> descriptors(const descriptor_filter& filter = {}) const override;
    descriptor_ptr reify_descriptor(const descriptor_ptr& descriptor) override;
    descriptor_ptr best_descriptor(const type_expr& type,
                                   const annotation_list& qualifiers = {}) const override;

    instance_ptr get_injectee(const type_expr& type,
                              const annotation_list& qualifiers,
                              service_handle* parent) override;
    instance_ptr get_service(const type_expr& type,
                             const annotation_list& qualifiers = {}) override;
    instance_ptr get_service(const descriptor_ptr& descriptor, service_handle* root) override;
    std::shared_ptr<service_handle> get_service_handle(const descriptor_ptr& descriptor) override;

    void post_construct(const instance_ptr& instance, const class_info& cls) override;
    void pre_destroy(const instance_ptr& instance, const class_info& cls) override;

    dynamic_configuration_service& configuration_service() override;
    dynamic_configuration_service& default_configuration_service() override;
    void set_configuration_service(std::shared_ptr<dynamic_configuration_service> service) override;
    void add_configuration_listener(std::shared_ptr<configuration_listener> listener) override;

    /// Dispose singletons in reverse creation order and clear their caches.
    /// Disposal failures are logged.  Safe to call more than once.
    void shutdown() noexcept;

private:
    friend class locator_configuration;

    struct impl;

    explicit locator(locator_options options);

    void commit(std::vector<descriptor_ptr> descriptors);
    instance_ptr create_instance(const descriptor_ptr& descriptor, service_handle& root);

    std::unique_ptr<impl> impl_;
};

} // namespace librtprov
