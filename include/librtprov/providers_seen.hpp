#pragma once

/// @file providers_seen.hpp
/// Dedup keys recorded by a discovery engine.

#include "export.hpp"
#include "class_info.hpp"
#include "descriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>
#include <tuple>

namespace librtprov {

/// Append-only set of "already analysed" keys.  One instance per engine.
class LIBRTPROV_EXPORT providers_seen {
public:
    /// Each add() returns true when the key was not present before.

    /// The whole component behind one descriptor.
    bool add(const active_descriptor& component);

    /// The whole class, whichever component exposes it.
    bool add(const class_info& cls);

    /// A static member, shared by every component exposing its class.
    bool add_static(const member_ref& member);

    /// An instance member as seen through one component.
    bool add_instance(const active_descriptor& component, const member_ref& member);

    std::size_t size() const;

private:
    enum class key_kind : std::uint8_t { component, klass, static_member, instance_member };

    // (kind, component or class, member)
    using key = std::tuple<key_kind, const void*, const void*>;

    bool insert(key k);

    mutable std::mutex mutex_;
    std::set<key> keys_;
};

} // namespace librtprov
