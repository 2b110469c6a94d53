#pragma once

#include "export.hpp"
#include "descriptor.hpp"

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace librtprov {

class service_locator;

/// A lazily resolved reference to the service of one descriptor.
///
/// Per-lookup instances created while resolving through this handle (the
/// service itself and its per-lookup dependencies) are owned by the handle
/// and disposed, most recent first, when it is closed.
class LIBRTPROV_EXPORT service_handle {
public:
    service_handle(service_locator& locator, descriptor_ptr descriptor);
    ~service_handle();

    service_handle(const service_handle&) = delete;
    service_handle& operator=(const service_handle&) = delete;

    const descriptor_ptr& active_descriptor() const noexcept { return descriptor_; }
    service_locator& locator() const noexcept { return *locator_; }

    /// Resolve (once) and return the service.  Throws illegal_state after
    /// close().
    instance_ptr get_service();

    bool is_active() const;

    /// Dispose every owned instance.  Disposal failures are logged, never
    /// thrown.  Idempotent.
    void close() noexcept;

    /// Take ownership of a per-lookup instance created on this handle's
    /// behalf.
    void adopt(descriptor_ptr descriptor, instance_ptr instance);

private:
    service_locator* locator_;
    descriptor_ptr descriptor_;

    mutable std::recursive_mutex mutex_;
    instance_ptr service_;
    bool resolved_ = false;
    bool closed_ = false;
    std::vector<std::pair<descriptor_ptr, instance_ptr>> owned_;
};

} // namespace librtprov
