#pragma once

/// @file descriptor.hpp
/// The container's view of one registered service.

#include "export.hpp"
#include "class_info.hpp"
#include "type.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace librtprov {

class service_handle;

class LIBRTPROV_EXPORT active_descriptor {
public:
    virtual ~active_descriptor();

    active_descriptor(const active_descriptor&) = delete;
    active_descriptor& operator=(const active_descriptor&) = delete;

    /// Class of the produced instances; nullptr when the produced type is
    /// opaque (a variable or an array).
    virtual const class_info* implementation_class() const noexcept = 0;
    virtual const type_expr& implementation_type() const noexcept = 0;

    /// The types this descriptor is found under.  May be empty.
    virtual const std::vector<type_expr>& contract_types() const noexcept = 0;

    virtual const annotation_ptr& scope_annotation() const noexcept = 0;
    virtual const annotation_list& qualifier_annotations() const noexcept = 0;
    virtual std::optional<std::string> name() const = 0;

    /// Absent means "unknown".
    virtual std::optional<bool> is_proxiable() const { return std::nullopt; }
    virtual std::optional<bool> is_proxy_for_same_scope() const { return std::nullopt; }

    virtual instance_ptr create(service_handle& root) = 0;

    /// Release `instance`.  A null instance is ignored.
    virtual void dispose(const instance_ptr& instance) = 0;

    virtual std::string to_string() const = 0;

    bool advertises(const type_expr& contract) const noexcept;

    // ---------------------------------------------------------------
    // Ranking
    // ---------------------------------------------------------------

    /// Derived from initial_ranking() on first read, writable afterwards.
    int ranking() const;

    /// Returns the previous ranking.
    int set_ranking(int ranking);

    // ---------------------------------------------------------------
    // Instance cache (one slot per scope lifetime)
    // ---------------------------------------------------------------

    /// Throws illegal_state if the cache is not set.
    instance_ptr cache() const;
    bool is_cache_set() const;
    void set_cache(instance_ptr instance);
    void release_cache();

protected:
    active_descriptor() = default;

    virtual int initial_ranking() const { return 0; }

private:
    mutable std::mutex ranking_mutex_;
    mutable std::optional<int> ranking_;

    mutable std::mutex cache_mutex_;
    instance_ptr cache_;
    bool cache_set_ = false;
};

using descriptor_ptr = std::shared_ptr<active_descriptor>;

} // namespace librtprov
