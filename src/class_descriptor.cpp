#include "class_descriptor.hpp"
#include "provider_synthesis.hpp"

#include "librtprov/annotations.hpp"
#include "librtprov/exceptions.hpp"
#include "librtprov/service_locator.hpp"
#include "librtprov/type_utils.hpp"

#include <utility>

namespace librtprov::internal {

namespace {

const class_info& require_class(const type_expr& type) {
    const class_info* cls = raw_class(type);
    if (!cls) {
        throw di_error("Cannot register " + type.to_string() + ": not a class type");
    }
    if (!is_instantiable(*cls)) {
        throw di_error("Cannot register " + type.to_string()
                       + ": no usable constructor (one marked inject, or one with no parameters)");
    }
    return *cls;
}

} // namespace

const constructor_info* usable_constructor(const class_info& cls) noexcept {
    const constructor_info* zero_arg = nullptr;
    for (const auto& ctor : cls.constructors()) {
        if (has_annotation(ctor.annotations, annotations::inject_type())) return &ctor;
        if (ctor.parameters.empty() && !zero_arg) zero_arg = &ctor;
    }
    return zero_arg;
}

bool is_instantiable(const class_info& cls) noexcept {
    if (cls.kind() != class_kind::concrete) return false;
    const auto* ctor = usable_constructor(cls);
    return ctor && ctor->construct;
}

class_descriptor::class_descriptor(service_locator& locator, type_expr type)
    : locator_(&locator)
    , type_(std::move(type))
    , cls_(&require_class(type_))
    , constructor_(usable_constructor(*cls_))
    , contracts_(advertised_contracts(type_))
    , scope_(find_scope(cls_->annotations()))
    , qualifiers_(qualifiers_of(cls_->annotations()))
{
    if (!scope_) scope_ = annotations::per_lookup();
}

std::optional<std::string> class_descriptor::name() const {
    if (auto named = find_annotation<named_annotation>(cls_->annotations())) return named->value();
    return std::nullopt;
}

std::optional<bool> class_descriptor::is_proxiable() const {
    if (auto a = find_annotation<use_proxy_annotation>(cls_->annotations())) return a->value();
    return std::nullopt;
}

std::optional<bool> class_descriptor::is_proxy_for_same_scope() const {
    if (auto a = find_annotation<proxy_for_same_scope_annotation>(cls_->annotations())) return a->value();
    return std::nullopt;
}

int class_descriptor::initial_ranking() const {
    if (auto rank = find_annotation<rank_annotation>(cls_->annotations())) return rank->value();
    return 0;
}

instance_ptr class_descriptor::create(service_handle& root) {
    std::vector<instance_ptr> args;
    args.reserve(constructor_->parameters.size());
    for (const auto& p : constructor_->parameters) {
        args.push_back(locator_->get_injectee(resolve_type(type_, p.type),
                                              qualifiers_of(p.annotations), &root));
    }

    instance_ptr instance = constructor_->construct(args);
    if (instance) locator_->post_construct(instance, *cls_);
    return instance;
}

void class_descriptor::dispose(const instance_ptr& instance) {
    if (!instance) return;
    locator_->pre_destroy(instance, *cls_);
}

std::string class_descriptor::to_string() const {
    return "class_descriptor[" + type_.to_string() + "]";
}

} // namespace librtprov::internal
