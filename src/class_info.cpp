#include "librtprov/class_info.hpp"
#include "librtprov/exceptions.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <tuple>
#include <utility>

namespace librtprov {

namespace {

const class_info* raw_of(const type_expr& t) noexcept {
    if (const auto* raw = t.as_raw()) return raw;
    if (const auto* p = t.as_parameterized()) return p->raw;
    return nullptr;
}

template <typename Fn>
void for_each_supertype(const class_info& cls, Fn&& fn) {
    if (cls.superclass()) {
        if (const auto* raw = raw_of(cls.superclass()->type)) fn(*raw, *cls.superclass());
    }
    for (const auto& iface : cls.interfaces()) {
        if (const auto* raw = raw_of(iface.type)) fn(*raw, iface);
    }
}

} // namespace

const class_info& object_class() {
    static const class_info cls("Object", class_kind::concrete);
    return cls;
}

provider_kind kind_of(const member_ref& member) noexcept {
    if (const auto* m = std::get_if<const method_info*>(&member)) {
        return (*m)->is_static ? provider_kind::static_method : provider_kind::instance_method;
    }
    return std::get<const field_info*>(member)->is_static
        ? provider_kind::static_field : provider_kind::instance_field;
}

// ---------------------------------------------------------------
// type_parameter
// ---------------------------------------------------------------

type_parameter::type_parameter(const class_info& declaring, std::string name)
    : declaring_(&declaring)
    , name_(std::move(name))
    , bounds_{type_expr(object_class())}
{}

void type_parameter::set_bounds(std::vector<type_expr> bounds) {
    if (bounds.empty()) bounds.emplace_back(object_class());
    bounds_ = std::move(bounds);
}

type_expr type_parameter::as_type() const {
    return type_expr::variable(*this);
}

// ---------------------------------------------------------------
// class_info
// ---------------------------------------------------------------

class_info::class_info(std::string name, class_kind kind, const describe_fn& describe)
    : name_(std::move(name))
    , kind_(kind)
{
    if (describe) describe(*this);
}

class_info::~class_info() = default;

type_parameter& class_info::add_type_parameter(std::string name) {
    return type_parameters_.emplace_back(*this, std::move(name));
}

void class_info::set_superclass(type_expr type, upcast_fn upcast) {
    superclass_ = supertype_info{std::move(type), upcast};
}

void class_info::add_interface(type_expr type, upcast_fn upcast) {
    interfaces_.push_back(supertype_info{std::move(type), upcast});
}

void class_info::annotate(annotation_ptr a) {
    annotations_.push_back(std::move(a));
}

constructor_info& class_info::add_constructor(constructor_info ctor) {
    return constructors_.emplace_back(std::move(ctor));
}

method_info& class_info::add_method(method_info method) {
    method.declaring_class = this;
    return methods_.emplace_back(std::move(method));
}

field_info& class_info::add_field(field_info field) {
    field.declaring_class = this;
    return fields_.emplace_back(std::move(field));
}

type_expr class_info::of(std::vector<type_expr> arguments) const {
    return type_expr::parameterized(*this, std::move(arguments));
}

std::vector<const method_info*> class_info::methods() const {
    std::vector<const method_info*> result;
    std::set<std::tuple<std::string, bool, std::size_t>> signatures;

    auto collect = [&](const class_info& cls) {
        for (const auto& m : cls.methods_) {
            if (signatures.emplace(m.name, m.is_static, m.parameters.size()).second) {
                result.push_back(&m);
            }
        }
    };

    // Breadth-first so that a subclass always hides its bases.
    std::vector<const class_info*> queue{this};
    std::set<const class_info*> visited{this};
    for (std::size_t i = 0; i < queue.size(); ++i) {
        collect(*queue[i]);
        for_each_supertype(*queue[i], [&](const class_info& raw, const supertype_info&) {
            if (visited.insert(&raw).second) queue.push_back(&raw);
        });
    }
    return result;
}

std::vector<const field_info*> class_info::fields() const {
    std::vector<const field_info*> result;
    std::set<std::string> names;

    std::vector<const class_info*> queue{this};
    std::set<const class_info*> visited{this};
    for (std::size_t i = 0; i < queue.size(); ++i) {
        for (const auto& f : queue[i]->fields_) {
            if (names.insert(f.name).second) result.push_back(&f);
        }
        for_each_supertype(*queue[i], [&](const class_info& raw, const supertype_info&) {
            if (visited.insert(&raw).second) queue.push_back(&raw);
        });
    }
    return result;
}

bool class_info::is_subclass_of(const class_info& base) const noexcept {
    if (&base == this || &base == &object_class()) return true;
    bool found = false;
    for_each_supertype(*this, [&](const class_info& raw, const supertype_info&) {
        if (!found && raw.is_subclass_of(base)) found = true;
    });
    return found;
}

void* class_info::upcast_raw(void* instance, const class_info& target) const noexcept {
    if (&target == this || &target == &object_class()) return instance;
    void* found = nullptr;
    for_each_supertype(*this, [&](const class_info& raw, const supertype_info& s) {
        if (found || !raw.is_subclass_of(target)) return;
        void* base = s.upcast ? s.upcast(instance) : instance;
        found = raw.upcast_raw(base, target);
    });
    return found;
}

instance_ptr class_info::upcast(const instance_ptr& instance, const class_info& target) const {
    if (!instance) return nullptr;
    void* p = upcast_raw(instance.get(), target);
    if (!p) {
        throw di_error("Cannot upcast " + name_ + " to " + target.name()
                       + ": not a supertype");
    }
    return instance_ptr(instance, p);
}

} // namespace librtprov
