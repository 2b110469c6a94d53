#include "librtprov/provides_descriptor.hpp"
#include "librtprov/annotations.hpp"
#include "librtprov/type_utils.hpp"

#include <utility>

namespace librtprov {

provides_descriptor::provides_descriptor(provider_source source,
                                         type_expr implementation_type,
                                         std::vector<type_expr> contracts,
                                         annotation_ptr scope,
                                         create_fn create,
                                         dispose_fn dispose)
    : source_(source)
    , implementation_type_(std::move(implementation_type))
    , implementation_class_(raw_class(implementation_type_))
    , contracts_(std::move(contracts))
    , scope_(std::move(scope))
    , qualifiers_(qualifiers_of(source_annotations()))
    , create_(std::move(create))
    , dispose_(std::move(dispose))
{}

const annotation_list& provides_descriptor::source_annotations() const noexcept {
    if (const auto* m = std::get_if<const method_info*>(&source_)) return (*m)->annotations;
    if (const auto* f = std::get_if<const field_info*>(&source_)) return (*f)->annotations;
    return std::get<const class_info*>(source_)->annotations();
}

std::optional<std::string> provides_descriptor::name() const {
    if (auto named = find_annotation<named_annotation>(source_annotations())) {
        return named->value();
    }
    return std::nullopt;
}

std::optional<bool> provides_descriptor::is_proxiable() const {
    if (auto a = find_annotation<use_proxy_annotation>(source_annotations())) {
        return a->value();
    }
    return std::nullopt;
}

std::optional<bool> provides_descriptor::is_proxy_for_same_scope() const {
    if (auto a = find_annotation<proxy_for_same_scope_annotation>(source_annotations())) {
        return a->value();
    }
    return std::nullopt;
}

int provides_descriptor::initial_ranking() const {
    if (auto rank = find_annotation<rank_annotation>(source_annotations())) {
        return rank->value();
    }
    return 0;
}

instance_ptr provides_descriptor::create(service_handle& root) {
    return create_(root);
}

void provides_descriptor::dispose(const instance_ptr& instance) {
    if (!instance) return;
    dispose_(instance);
}

std::string provides_descriptor::to_string() const {
    std::string element;
    if (const auto* m = std::get_if<const method_info*>(&source_)) {
        element = (*m)->declaring_class->name() + "." + (*m)->name + "()";
    } else if (const auto* f = std::get_if<const field_info*>(&source_)) {
        element = (*f)->declaring_class->name() + "." + (*f)->name;
    } else {
        element = "class " + std::get<const class_info*>(source_)->name();
    }
    return "provides_descriptor[" + element + "]";
}

} // namespace librtprov
