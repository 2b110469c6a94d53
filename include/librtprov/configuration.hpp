#pragma once

/// @file configuration.hpp
/// Transactional descriptor registration and change notification.

#include "export.hpp"
#include "descriptor.hpp"
#include "type.hpp"

#include <memory>

namespace librtprov {

/// A batch of registrations that become visible together on commit().
class LIBRTPROV_EXPORT dynamic_configuration {
public:
    virtual ~dynamic_configuration() = default;

    /// Returns the descriptor that will represent the registration.
    virtual descriptor_ptr add_active_descriptor(descriptor_ptr descriptor) = 0;

    /// Register a class (or a parameterization of one) to be built through
    /// its constructor.
    virtual descriptor_ptr add_active_descriptor(const type_expr& type) = 0;

    virtual void commit() = 0;
};

class LIBRTPROV_EXPORT dynamic_configuration_service {
public:
    virtual ~dynamic_configuration_service() = default;

    virtual std::unique_ptr<dynamic_configuration> create_dynamic_configuration() = 0;
};

class LIBRTPROV_EXPORT configuration_listener {
public:
    virtual ~configuration_listener() = default;

    /// Called after every commit.
    virtual void configuration_changed() = 0;
};

} // namespace librtprov
