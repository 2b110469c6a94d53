#include "librtprov/providers_seen.hpp"

#include <variant>

namespace librtprov {

namespace {

const void* identity(const member_ref& member) noexcept {
    return std::visit([](const auto* m) -> const void* { return m; }, member);
}

} // namespace

bool providers_seen::insert(key k) {
    std::lock_guard lock(mutex_);
    return keys_.insert(k).second;
}

bool providers_seen::add(const active_descriptor& component) {
    return insert({key_kind::component, &component, nullptr});
}

bool providers_seen::add(const class_info& cls) {
    return insert({key_kind::klass, &cls, nullptr});
}

bool providers_seen::add_static(const member_ref& member) {
    return insert({key_kind::static_member, nullptr, identity(member)});
}

bool providers_seen::add_instance(const active_descriptor& component, const member_ref& member) {
    return insert({key_kind::instance_member, &component, identity(member)});
}

std::size_t providers_seen::size() const {
    std::lock_guard lock(mutex_);
    return keys_.size();
}

} // namespace librtprov
