#include "librtprov/service_handle.hpp"
#include "librtprov/exceptions.hpp"
#include "librtprov/logging.hpp"
#include "librtprov/service_locator.hpp"

#include <utility>

namespace librtprov {

service_handle::service_handle(service_locator& locator, descriptor_ptr descriptor)
    : locator_(&locator)
    , descriptor_(std::move(descriptor))
{}

service_handle::~service_handle() {
    close();
}

instance_ptr service_handle::get_service() {
    std::lock_guard lock(mutex_);
    if (closed_) {
        throw illegal_state("Service handle for " + descriptor_->to_string() + " is closed");
    }
    if (!resolved_) {
        service_ = locator_->get_service(descriptor_, this);
        resolved_ = true;
    }
    return service_;
}

bool service_handle::is_active() const {
    std::lock_guard lock(mutex_);
    return !closed_;
}

void service_handle::adopt(descriptor_ptr descriptor, instance_ptr instance) {
    std::lock_guard lock(mutex_);
    owned_.emplace_back(std::move(descriptor), std::move(instance));
}

void service_handle::close() noexcept {
    std::vector<std::pair<descriptor_ptr, instance_ptr>> owned;
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        closed_ = true;
        owned.swap(owned_);
        service_.reset();
    }

    for (auto it = owned.rbegin(); it != owned.rend(); ++it) {
        try {
            it->first->dispose(it->second);
        } catch (const std::exception& e) {
            LIBRTPROV_LOG_ERROR << "Failed to dispose " << it->first->to_string()
                                << ": " << e.what();
        }
    }
}

} // namespace librtprov
