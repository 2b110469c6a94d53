#include "librtprov/annotations.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace librtprov {

namespace {

std::string join_types(const std::vector<type_expr>& types) {
    std::string out;
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (i > 0) out += ", ";
        out += types[i].to_string();
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------
// annotation
// ---------------------------------------------------------------

bool annotation::equals(const annotation& other) const noexcept {
    return &annotation_type() == &other.annotation_type();
}

std::string annotation::to_string() const {
    return "@" + annotation_type().name();
}

const class_info& rank_annotation::annotation_type() const noexcept {
    return annotations::rank_type();
}

bool rank_annotation::equals(const annotation& other) const noexcept {
    const auto* o = dynamic_cast<const rank_annotation*>(&other);
    return o && o->value_ == value_;
}

std::string rank_annotation::to_string() const {
    return "@Rank(" + std::to_string(value_) + ")";
}

const class_info& named_annotation::annotation_type() const noexcept {
    return annotations::named_type();
}

bool named_annotation::equals(const annotation& other) const noexcept {
    const auto* o = dynamic_cast<const named_annotation*>(&other);
    return o && o->value_ == value_;
}

std::string named_annotation::to_string() const {
    return "@Named(\"" + value_ + "\")";
}

const class_info& provides_annotation::annotation_type() const noexcept {
    return annotations::provides_type();
}

bool provides_annotation::equals(const annotation& other) const noexcept {
    const auto* o = dynamic_cast<const provides_annotation*>(&other);
    return o && o->contracts_ == contracts_
        && o->destroy_method_ == destroy_method_
        && o->destroyed_by_ == destroyed_by_;
}

std::string provides_annotation::to_string() const {
    std::string out = "@Provides(contracts={" + join_types(contracts_) + "}";
    if (!destroy_method_.empty()) {
        out += ", destroyMethod=\"" + destroy_method_ + "\", destroyedBy=";
        out += destroyed_by_ == destroyer::provider ? "PROVIDER" : "PROVIDED_INSTANCE";
    }
    return out + ")";
}

const class_info& contracts_provided_annotation::annotation_type() const noexcept {
    return annotations::contracts_provided_type();
}

bool contracts_provided_annotation::equals(const annotation& other) const noexcept {
    const auto* o = dynamic_cast<const contracts_provided_annotation*>(&other);
    return o && o->contracts_ == contracts_;
}

const class_info& registers_annotation::annotation_type() const noexcept {
    return annotations::registers_type();
}

bool registers_annotation::equals(const annotation& other) const noexcept {
    const auto* o = dynamic_cast<const registers_annotation*>(&other);
    return o && o->classes_ == classes_;
}

const class_info& use_proxy_annotation::annotation_type() const noexcept {
    return annotations::use_proxy_type();
}

bool use_proxy_annotation::equals(const annotation& other) const noexcept {
    const auto* o = dynamic_cast<const use_proxy_annotation*>(&other);
    return o && o->value_ == value_;
}

const class_info& proxy_for_same_scope_annotation::annotation_type() const noexcept {
    return annotations::proxy_for_same_scope_type();
}

bool proxy_for_same_scope_annotation::equals(const annotation& other) const noexcept {
    const auto* o = dynamic_cast<const proxy_for_same_scope_annotation*>(&other);
    return o && o->value_ == value_;
}

// ---------------------------------------------------------------
// Built-in annotation classes
// ---------------------------------------------------------------

namespace annotations {

const class_info& scope_type() {
    static const class_info cls("Scope", class_kind::annotation);
    return cls;
}

const class_info& qualifier_type() {
    static const class_info cls("Qualifier", class_kind::annotation);
    return cls;
}

const class_info& contract_indicator_type() {
    static const class_info cls("ContractIndicator", class_kind::annotation);
    return cls;
}

const class_info& contract_type() {
    static const class_info cls("Contract", class_kind::annotation);
    return cls;
}

const class_info& contracts_provided_type() {
    static const class_info cls("ContractsProvided", class_kind::annotation);
    return cls;
}

const class_info& rank_type() {
    static const class_info cls("Rank", class_kind::annotation);
    return cls;
}

const class_info& named_type() {
    static const class_info cls("Named", class_kind::annotation, [](class_info& c) {
        c.annotate(qualifier());
    });
    return cls;
}

const class_info& provides_type() {
    static const class_info cls("Provides", class_kind::annotation);
    return cls;
}

const class_info& registers_type() {
    static const class_info cls("Registers", class_kind::annotation);
    return cls;
}

const class_info& singleton_type() {
    static const class_info cls("Singleton", class_kind::annotation, [](class_info& c) {
        c.annotate(scope());
    });
    return cls;
}

const class_info& per_lookup_type() {
    static const class_info cls("PerLookup", class_kind::annotation, [](class_info& c) {
        c.annotate(scope());
    });
    return cls;
}

const class_info& inject_type() {
    static const class_info cls("Inject", class_kind::annotation);
    return cls;
}

const class_info& post_construct_type() {
    static const class_info cls("PostConstruct", class_kind::annotation);
    return cls;
}

const class_info& pre_destroy_type() {
    static const class_info cls("PreDestroy", class_kind::annotation);
    return cls;
}

const class_info& nullable_type() {
    static const class_info cls("Nullable", class_kind::annotation);
    return cls;
}

const class_info& use_proxy_type() {
    static const class_info cls("UseProxy", class_kind::annotation);
    return cls;
}

const class_info& proxy_for_same_scope_type() {
    static const class_info cls("ProxyForSameScope", class_kind::annotation);
    return cls;
}

// ---------------------------------------------------------------
// Factories
// ---------------------------------------------------------------

annotation_ptr marker(const class_info& type) {
    return std::make_shared<const marker_annotation>(type);
}

annotation_ptr scope()              { return marker(scope_type()); }
annotation_ptr qualifier()          { return marker(qualifier_type()); }
annotation_ptr contract_indicator() { return marker(contract_indicator_type()); }
annotation_ptr contract()           { return marker(contract_type()); }
annotation_ptr singleton()          { return marker(singleton_type()); }
annotation_ptr per_lookup()         { return marker(per_lookup_type()); }
annotation_ptr inject()             { return marker(inject_type()); }
annotation_ptr post_construct()     { return marker(post_construct_type()); }
annotation_ptr pre_destroy()        { return marker(pre_destroy_type()); }
annotation_ptr nullable()           { return marker(nullable_type()); }

annotation_ptr contracts_provided(std::vector<type_expr> contracts) {
    return std::make_shared<const contracts_provided_annotation>(std::move(contracts));
}

annotation_ptr rank(int value) {
    return std::make_shared<const rank_annotation>(value);
}

annotation_ptr named(std::string value) {
    return std::make_shared<const named_annotation>(std::move(value));
}

annotation_ptr provides(std::vector<type_expr> contracts,
                        std::string destroy_method,
                        provides_annotation::destroyer destroyed_by) {
    return std::make_shared<const provides_annotation>(
        std::move(contracts), std::move(destroy_method), destroyed_by);
}

annotation_ptr registers(std::vector<const class_info*> classes) {
    return std::make_shared<const registers_annotation>(std::move(classes));
}

annotation_ptr use_proxy(bool value) {
    return std::make_shared<const use_proxy_annotation>(value);
}

annotation_ptr proxy_for_same_scope(bool value) {
    return std::make_shared<const proxy_for_same_scope_annotation>(value);
}

} // namespace annotations

// ---------------------------------------------------------------
// Lookup helpers
// ---------------------------------------------------------------

annotation_ptr find_annotation(const annotation_list& list, const class_info& type) noexcept {
    for (const auto& a : list) {
        if (&a->annotation_type() == &type) return a;
    }
    return nullptr;
}

bool is_scope(const annotation& a) noexcept {
    return has_annotation(a.annotation_type().annotations(), annotations::scope_type());
}

bool is_qualifier(const annotation& a) noexcept {
    return has_annotation(a.annotation_type().annotations(), annotations::qualifier_type());
}

annotation_ptr find_scope(const annotation_list& list) noexcept {
    for (const auto& a : list) {
        if (is_scope(*a)) return a;
    }
    return nullptr;
}

annotation_list qualifiers_of(const annotation_list& list) {
    annotation_list result;
    std::copy_if(list.begin(), list.end(), std::back_inserter(result),
                 [](const annotation_ptr& a) { return is_qualifier(*a); });
    return result;
}

} // namespace librtprov
