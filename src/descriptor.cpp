#include "librtprov/descriptor.hpp"
#include "librtprov/exceptions.hpp"

#include <algorithm>
#include <utility>

namespace librtprov {

active_descriptor::~active_descriptor() = default;

bool active_descriptor::advertises(const type_expr& contract) const noexcept {
    const auto& contracts = contract_types();
    return std::find(contracts.begin(), contracts.end(), contract) != contracts.end();
}

int active_descriptor::ranking() const {
    std::lock_guard lock(ranking_mutex_);
    if (!ranking_) ranking_ = initial_ranking();
    return *ranking_;
}

int active_descriptor::set_ranking(int ranking) {
    std::lock_guard lock(ranking_mutex_);
    int previous = ranking_ ? *ranking_ : initial_ranking();
    ranking_ = ranking;
    return previous;
}

instance_ptr active_descriptor::cache() const {
    std::lock_guard lock(cache_mutex_);
    if (!cache_set_) {
        throw illegal_state("Cache is not set for " + to_string());
    }
    return cache_;
}

bool active_descriptor::is_cache_set() const {
    std::lock_guard lock(cache_mutex_);
    return cache_set_;
}

void active_descriptor::set_cache(instance_ptr instance) {
    std::lock_guard lock(cache_mutex_);
    cache_ = std::move(instance);
    cache_set_ = true;
}

void active_descriptor::release_cache() {
    std::lock_guard lock(cache_mutex_);
    cache_.reset();
    cache_set_ = false;
}

} // namespace librtprov
