#include "librtprov/type.hpp"
#include "librtprov/class_info.hpp"

#include <functional>
#include <string>
#include <utility>

namespace librtprov {

namespace {

void hash_combine(std::size_t& seed, std::size_t value) noexcept {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

std::size_t hash_all(std::size_t seed, const std::vector<type_expr>& types) noexcept {
    for (const auto& t : types) hash_combine(seed, t.hash());
    return seed;
}

std::string join(const std::vector<type_expr>& types, const char* separator) {
    std::string out;
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (i > 0) out += separator;
        out += types[i].to_string();
    }
    return out;
}

std::size_t hash_of(const type_node& node) noexcept {
    return std::visit([](const auto& v) -> std::size_t {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, raw_type>) {
            return std::hash<const void*>{}(v.cls);
        } else if constexpr (std::is_same_v<V, parameterized_type>) {
            std::size_t seed = std::hash<const void*>{}(v.raw);
            if (v.owner) hash_combine(seed, v.owner->hash());
            return hash_all(seed, v.arguments);
        } else if constexpr (std::is_same_v<V, wildcard_type>) {
            std::size_t seed = 0x5bd1e995;
            seed = hash_all(seed, v.lower_bounds);
            hash_combine(seed, 0x27d4eb2f);
            return hash_all(seed, v.upper_bounds);
        } else if constexpr (std::is_same_v<V, type_variable>) {
            if (v.capture) return std::hash<const void*>{}(v.capture.get());
            return std::hash<const void*>{}(v.declared);
        } else {
            std::size_t seed = 0x1b873593;
            hash_combine(seed, v.component.hash());
            return seed;
        }
    }, node.value);
}

std::shared_ptr<const type_node> make_node(
        std::variant<raw_type, parameterized_type, wildcard_type, type_variable, array_type> value) {
    auto node = std::make_shared<type_node>();
    node->value = std::move(value);
    node->hash = hash_of(*node);
    return node;
}

} // namespace

// ---------------------------------------------------------------
// Construction
// ---------------------------------------------------------------

type_expr::type_expr(std::shared_ptr<const type_node> node) noexcept
    : node_(std::move(node))
{}

type_expr::type_expr(const class_info& cls)
    : node_(make_node(raw_type{&cls}))
{}

type_expr type_expr::parameterized(const class_info& raw, std::vector<type_expr> arguments) {
    return type_expr(make_node(parameterized_type{std::nullopt, &raw, std::move(arguments)}));
}

type_expr type_expr::parameterized(type_expr owner, const class_info& raw,
                                   std::vector<type_expr> arguments) {
    return type_expr(make_node(parameterized_type{std::move(owner), &raw, std::move(arguments)}));
}

type_expr type_expr::wildcard() {
    return type_expr(make_node(wildcard_type{{}, {type_expr(object_class())}}));
}

type_expr type_expr::wildcard_extends(std::vector<type_expr> upper_bounds) {
    if (upper_bounds.empty()) upper_bounds.emplace_back(object_class());
    return type_expr(make_node(wildcard_type{{}, std::move(upper_bounds)}));
}

type_expr type_expr::wildcard_super(std::vector<type_expr> lower_bounds) {
    return type_expr(make_node(wildcard_type{std::move(lower_bounds), {type_expr(object_class())}}));
}

type_expr type_expr::variable(const type_parameter& parameter) {
    return type_expr(make_node(type_variable{&parameter, nullptr}));
}

type_expr type_expr::capture(std::shared_ptr<const capture_site> site) {
    return type_expr(make_node(type_variable{nullptr, std::move(site)}));
}

type_expr type_expr::array_of(type_expr component) {
    return type_expr(make_node(array_type{std::move(component)}));
}

// ---------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------

type_kind type_expr::kind() const noexcept {
    return static_cast<type_kind>(node_->value.index());
}

const class_info* type_expr::as_raw() const noexcept {
    const auto* raw = std::get_if<raw_type>(&node_->value);
    return raw ? raw->cls : nullptr;
}

const parameterized_type* type_expr::as_parameterized() const noexcept {
    return std::get_if<parameterized_type>(&node_->value);
}

const wildcard_type* type_expr::as_wildcard() const noexcept {
    return std::get_if<wildcard_type>(&node_->value);
}

const type_variable* type_expr::as_variable() const noexcept {
    return std::get_if<type_variable>(&node_->value);
}

const array_type* type_expr::as_array() const noexcept {
    return std::get_if<array_type>(&node_->value);
}

std::size_t type_expr::hash() const noexcept {
    return node_->hash;
}

const std::string& type_variable::name() const noexcept {
    return capture ? capture->name : declared->name();
}

const std::vector<type_expr>& type_variable::bounds() const noexcept {
    return capture ? capture->bounds : declared->bounds();
}

// ---------------------------------------------------------------
// Equality
// ---------------------------------------------------------------

bool operator==(const type_expr& a, const type_expr& b) noexcept {
    if (a.node_ == b.node_) return true;
    if (a.node_->hash != b.node_->hash) return false;
    if (a.node_->value.index() != b.node_->value.index()) return false;

    switch (a.kind()) {
        case type_kind::raw:
            return a.as_raw() == b.as_raw();

        case type_kind::parameterized: {
            const auto* pa = a.as_parameterized();
            const auto* pb = b.as_parameterized();
            return pa->raw == pb->raw
                && pa->owner == pb->owner
                && pa->arguments == pb->arguments;
        }

        case type_kind::wildcard: {
            const auto* wa = a.as_wildcard();
            const auto* wb = b.as_wildcard();
            return wa->lower_bounds == wb->lower_bounds
                && wa->upper_bounds == wb->upper_bounds;
        }

        case type_kind::variable: {
            const auto* va = a.as_variable();
            const auto* vb = b.as_variable();
            if (va->is_capture() != vb->is_capture()) return false;
            return va->is_capture() ? va->capture == vb->capture
                                    : va->declared == vb->declared;
        }

        case type_kind::array:
            return a.as_array()->component == b.as_array()->component;
    }
    return false;
}

// ---------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------

std::string type_expr::to_string() const {
    switch (kind()) {
        case type_kind::raw:
            return as_raw()->name();

        case type_kind::parameterized: {
            const auto* p = as_parameterized();
            std::string out;
            if (p->owner) out = p->owner->to_string() + ".";
            out += p->raw->name();
            if (!p->arguments.empty()) out += "<" + join(p->arguments, ", ") + ">";
            return out;
        }

        case type_kind::wildcard: {
            const auto* w = as_wildcard();
            if (!w->lower_bounds.empty()) return "? super " + join(w->lower_bounds, " & ");
            if (w->upper_bounds.empty() || w->upper_bounds.front() == type_expr(object_class()))
                return "?";
            return "? extends " + join(w->upper_bounds, " & ");
        }

        case type_kind::variable:
            return as_variable()->name();

        case type_kind::array:
            return as_array()->component.to_string() + "[]";
    }
    return {};
}

} // namespace librtprov
