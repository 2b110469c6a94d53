#include "librtprov/locator.hpp"
#include "librtprov/annotations.hpp"
#include "librtprov/exceptions.hpp"
#include "librtprov/logging.hpp"
#include "librtprov/type_utils.hpp"
#include "class_descriptor.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <any>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace librtprov {

namespace {

// Descriptors currently being created on this thread, outermost first.
thread_local std::vector<const active_descriptor*> creation_stack;

struct creation_frame {
    explicit creation_frame(const active_descriptor* d) { creation_stack.push_back(d); }
    ~creation_frame() { creation_stack.pop_back(); }

    creation_frame(const creation_frame&) = delete;
    creation_frame& operator=(const creation_frame&) = delete;
};

bool advertises_type(const active_descriptor& d, const type_expr& type) {
    for (const auto& contract : d.contract_types()) {
        if (contract == type) return true;
        if (type.kind() == type_kind::raw && raw_class(contract) == type.as_raw()) return true;
    }
    return false;
}

bool qualifiers_match(const active_descriptor& d, const annotation_list& required) {
    const auto& present = d.qualifier_annotations();
    return std::all_of(required.begin(), required.end(), [&](const annotation_ptr& q) {
        return std::any_of(present.begin(), present.end(),
                           [&](const annotation_ptr& a) { return a->equals(*q); });
    });
}

const class_info& scope_type_of(const active_descriptor& d) noexcept {
    const auto& scope = d.scope_annotation();
    return scope ? scope->annotation_type() : annotations::per_lookup_type();
}

void invoke_marked(const instance_ptr& instance, const class_info& cls, const class_info& marker) {
    if (!instance) return;
    for (const auto* m : cls.methods()) {
        if (m->is_static || !m->parameters.empty()) continue;
        if (!has_annotation(m->annotations, marker)) continue;
        instance_ptr receiver = cls.upcast(instance, *m->declaring_class);
        m->invoke(receiver.get(), {});
    }
}

} // namespace

// ---------------------------------------------------------------
// Default configuration
// ---------------------------------------------------------------

class locator_configuration final : public dynamic_configuration {
public:
    explicit locator_configuration(locator& owner) : owner_(owner) {}

    descriptor_ptr add_active_descriptor(descriptor_ptr descriptor) override {
        ensure_open();
        pending_.push_back(descriptor);
        return descriptor;
    }

    descriptor_ptr add_active_descriptor(const type_expr& type) override {
        ensure_open();
        descriptor_ptr descriptor = std::make_shared<internal::class_descriptor>(owner_, type);
        pending_.push_back(descriptor);
        return descriptor;
    }

    void commit() override {
        ensure_open();
        committed_ = true;
        owner_.commit(std::move(pending_));
    }

private:
    void ensure_open() const {
        if (committed_) throw illegal_state("Configuration has already been committed");
    }

    locator& owner_;
    std::vector<descriptor_ptr> pending_;
    bool committed_ = false;
};

namespace {

class default_service_impl final : public dynamic_configuration_service {
public:
    explicit default_service_impl(locator& owner) : owner_(owner) {}

    std::unique_ptr<dynamic_configuration> create_dynamic_configuration() override {
        return std::make_unique<locator_configuration>(owner_);
    }

private:
    locator& owner_;
};

} // namespace

// ---------------------------------------------------------------
// Impl: shared locator state
// ---------------------------------------------------------------

struct locator::impl {
    struct entry {
        descriptor_ptr descriptor;
        std::uint64_t service_id;
        std::any commit_stacktrace;
    };

    struct singleton_record {
        descriptor_ptr descriptor;
        std::shared_ptr<service_handle> root;  // owns per-lookup dependencies
    };

    locator_options options;

    mutable std::mutex table_mutex;
    std::vector<entry> entries;
    std::uint64_t next_service_id = 0;
    std::shared_ptr<dynamic_configuration_service> default_service;
    std::shared_ptr<dynamic_configuration_service> current_service;
    std::vector<std::shared_ptr<dynamic_configuration_service>> retired_services;

    std::recursive_mutex singleton_mutex;
    std::vector<singleton_record> singletons;  // creation order

    std::mutex listener_mutex;
    std::vector<std::shared_ptr<configuration_listener>> listeners;

    std::string commit_trace_for(const active_descriptor* d) const {
        std::lock_guard lock(table_mutex);
        for (const auto& e : entries) {
            if (e.descriptor.get() == d) {
                return internal::format_commit_trace(d->to_string(), e.commit_stacktrace);
            }
        }
        return {};
    }
};

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

locator::locator(locator_options options)
    : impl_(std::make_unique<impl>())
{
    impl_->options = std::move(options);
    impl_->default_service = std::make_shared<default_service_impl>(*this);
    impl_->current_service = impl_->default_service;
    LIBRTPROV_LOG_DEBUG << "[" << impl_->options.name << "] locator created";
}

locator::~locator() {
    shutdown();
}

std::shared_ptr<locator> locator::create(locator_options options) {
    log::apply_default_level();
    return std::shared_ptr<locator>(new locator(std::move(options)));
}

const locator_options& locator::options() const noexcept {
    return impl_->options;
}

// ---------------------------------------------------------------
// Descriptor table
// ---------------------------------------------------------------

void locator::commit(std::vector<descriptor_ptr> descriptors) {
    {
        std::lock_guard lock(impl_->table_mutex);
        for (auto& d : descriptors) {
            impl_->entries.push_back({std::move(d), impl_->next_service_id++,
                                      internal::capture_stacktrace()});
        }
    }
    LIBRTPROV_LOG_DEBUG << "[" << impl_->options.name << "] committed "
                        << descriptors.size() << " descriptor(s)";

    std::vector<std::shared_ptr<configuration_listener>> listeners;
    {
        std::lock_guard lock(impl_->listener_mutex);
        listeners = impl_->listeners;
    }
    for (const auto& l : listeners) {
        l->configuration_changed();
    }
}

std::vector<descriptor_ptr> locator::descriptors(const descriptor_filter& filter) const {
    std::vector<descriptor_ptr> all;
    {
        std::lock_guard lock(impl_->table_mutex);
        all.reserve(impl_->entries.size());
        for (const auto& e : impl_->entries) all.push_back(e.descriptor);
    }
    if (filter) {
        std::erase_if(all, [&](const descriptor_ptr& d) { return !filter(*d); });
    }
    return all;
}

descriptor_ptr locator::reify_descriptor(const descriptor_ptr& descriptor) {
    return descriptor;
}

descriptor_ptr locator::best_descriptor(const type_expr& type,
                                        const annotation_list& qualifiers) const {
    std::vector<std::pair<descriptor_ptr, std::uint64_t>> candidates;
    {
        std::lock_guard lock(impl_->table_mutex);
        for (const auto& e : impl_->entries) {
            candidates.emplace_back(e.descriptor, e.service_id);
        }
    }

    descriptor_ptr best;
    int best_rank = 0;
    for (const auto& [d, id] : candidates) {
        if (!advertises_type(*d, type) || !qualifiers_match(*d, qualifiers)) continue;
        int rank = d->ranking();
        // Candidates are in service id order, so ties keep the earlier one.
        if (!best || rank > best_rank) {
            best = d;
            best_rank = rank;
        }
    }
    return best;
}

// ---------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------

instance_ptr locator::get_injectee(const type_expr& type,
                                   const annotation_list& qualifiers,
                                   service_handle* parent) {
    descriptor_ptr d = best_descriptor(type, qualifiers);
    if (!d) {
        std::string hint;
        if (!qualifiers.empty() && best_descriptor(type)) {
            hint = "a service of this type exists but not with the requested qualifiers";
        }
        throw not_found(type, hint);
    }

    instance_ptr instance = get_service(d, parent);
    const class_info* from = d->implementation_class();
    const class_info* to = raw_class(type);
    if (from && to) return from->upcast(instance, *to);
    return instance;
}

instance_ptr locator::get_service(const type_expr& type, const annotation_list& qualifiers) {
    if (!best_descriptor(type, qualifiers)) return nullptr;
    return get_injectee(type, qualifiers, nullptr);
}

instance_ptr locator::get_service(const descriptor_ptr& descriptor, service_handle* root) {
    const class_info& scope = scope_type_of(*descriptor);

    if (&scope == &annotations::singleton_type()) {
        std::lock_guard lock(impl_->singleton_mutex);
        if (descriptor->is_cache_set()) return descriptor->cache();

        auto owner = std::make_shared<service_handle>(*this, descriptor);
        instance_ptr instance = create_instance(descriptor, *owner);
        descriptor->set_cache(instance);
        impl_->singletons.push_back({descriptor, std::move(owner)});
        return instance;
    }

    if (&scope == &annotations::per_lookup_type()) {
        if (!root) {
            // Nobody to adopt the instance: it owns its own handle and is
            // disposed when the last reference goes away.
            auto handle = get_service_handle(descriptor);
            instance_ptr instance = handle->get_service();
            if (!instance) return nullptr;
            return instance_ptr(instance.get(), [handle](void*) { handle->close(); });
        }

        instance_ptr instance = create_instance(descriptor, *root);
        if (instance) root->adopt(descriptor, instance);
        return instance;
    }

    throw di_error("Unsupported scope " + descriptor->scope_annotation()->to_string()
                   + " on " + descriptor->to_string());
}

std::shared_ptr<service_handle> locator::get_service_handle(const descriptor_ptr& descriptor) {
    return std::make_shared<service_handle>(*this, descriptor);
}

instance_ptr locator::create_instance(const descriptor_ptr& descriptor, service_handle& root) {
    if (impl_->options.detect_cycles) {
        auto it = std::find(creation_stack.begin(), creation_stack.end(), descriptor.get());
        if (it != creation_stack.end()) {
            std::vector<std::string> cycle;
            for (; it != creation_stack.end(); ++it) cycle.push_back((*it)->to_string());
            cycle.push_back(descriptor->to_string());
            throw cyclic_dependency(std::move(cycle));
        }
    }

    creation_frame frame(descriptor.get());
    try {
        return descriptor->create(root);
    } catch (di_error& e) {
        // Caught by non-const reference so the chain "... (while resolving
        // B -> A)" can be built up before rethrowing.
        e.append_resolution_context(descriptor->to_string());
        if (e.diagnostic_detail().empty()) {
            auto trace = impl_->commit_trace_for(descriptor.get());
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    } catch (const std::exception& e) {
        auto ex = resolution_error(descriptor->to_string(), e);
        ex.set_diagnostic_detail(impl_->commit_trace_for(descriptor.get()));
        throw ex;
    }
}

// ---------------------------------------------------------------
// Lifecycle hooks
// ---------------------------------------------------------------

void locator::post_construct(const instance_ptr& instance, const class_info& cls) {
    invoke_marked(instance, cls, annotations::post_construct_type());
}

void locator::pre_destroy(const instance_ptr& instance, const class_info& cls) {
    invoke_marked(instance, cls, annotations::pre_destroy_type());
}

void locator::shutdown() noexcept {
    std::vector<impl::singleton_record> records;
    {
        std::lock_guard lock(impl_->singleton_mutex);
        records.swap(impl_->singletons);
    }

    for (auto it = records.rbegin(); it != records.rend(); ++it) {
        const auto& d = it->descriptor;
        try {
            if (d->is_cache_set()) d->dispose(d->cache());
        } catch (const std::exception& e) {
            LIBRTPROV_LOG_ERROR << "[" << impl_->options.name << "] failed to dispose "
                                << d->to_string() << ": " << e.what();
        }
        d->release_cache();
        it->root->close();
    }
}

// ---------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------

dynamic_configuration_service& locator::configuration_service() {
    std::lock_guard lock(impl_->table_mutex);
    return *impl_->current_service;
}

dynamic_configuration_service& locator::default_configuration_service() {
    return *impl_->default_service;
}

void locator::set_configuration_service(std::shared_ptr<dynamic_configuration_service> service) {
    if (!service) throw di_error("Configuration service must not be null");
    std::lock_guard lock(impl_->table_mutex);
    // The replaced service may still be referenced by a caller of
    // configuration_service().
    impl_->retired_services.push_back(std::move(impl_->current_service));
    impl_->current_service = std::move(service);
}

void locator::add_configuration_listener(std::shared_ptr<configuration_listener> listener) {
    if (!listener) throw di_error("Configuration listener must not be null");
    {
        std::lock_guard lock(impl_->listener_mutex);
        impl_->listeners.push_back(listener);
    }
    listener->configuration_changed();
}

} // namespace librtprov
