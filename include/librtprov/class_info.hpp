#pragma once

/// @file class_info.hpp
/// Runtime class metadata.
///
/// Components describe themselves once, in a function-local static:
///
///     const class_info& repo_class() {
///         static const class_info cls("Repo", class_kind::concrete, [](class_info& c) {
///             auto& t = c.add_type_parameter("T");
///             c.add_method({
///                 .name        = "list",
///                 .return_type = list_class().of({t.as_type()}),
///                 .annotations = {annotations::provides()},
///                 .invoke      = [](void* self, std::span<const instance_ptr>) -> instance_ptr {
///                     return self_as<Repo>(self).list();
///                 },
///             });
///         });
///         return cls;
///     }
///
/// The describe callback receives the class under construction.  A class
/// whose bounds or members mention itself must use that reference rather
/// than its own accessor, which is still being initialized.

#include "export.hpp"
#include "type.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace librtprov {

class annotation;
class class_info;

using instance_ptr    = std::shared_ptr<void>;
using annotation_ptr  = std::shared_ptr<const annotation>;
using annotation_list = std::vector<annotation_ptr>;

/// Re-points a pointer to a derived object at one of its base subobjects.
using upcast_fn = void* (*)(void*);

/// Receiver is null for static members.  Arguments arrive in declaration order.
using invoke_fn    = std::function<instance_ptr(void* receiver, std::span<const instance_ptr> arguments)>;
using read_fn      = std::function<instance_ptr(void* receiver)>;
using construct_fn = std::function<instance_ptr(std::span<const instance_ptr> arguments)>;

enum class class_kind {
    concrete,
    abstract_class,
    interface,
    enumeration,
    annotation
};

/// The root of every class hierarchy.
LIBRTPROV_EXPORT const class_info& object_class();

// ---------------------------------------------------------------
// type_parameter: one declared generic parameter
// ---------------------------------------------------------------

class LIBRTPROV_EXPORT type_parameter {
public:
    type_parameter(const class_info& declaring, std::string name);

    type_parameter(const type_parameter&) = delete;
    type_parameter& operator=(const type_parameter&) = delete;

    const class_info& declaring_class() const noexcept { return *declaring_; }
    const std::string& name() const noexcept { return name_; }

    /// Upper bounds; `{object}` unless set.
    const std::vector<type_expr>& bounds() const noexcept { return bounds_; }
    void set_bounds(std::vector<type_expr> bounds);

    type_expr as_type() const;

private:
    const class_info* declaring_;
    std::string name_;
    std::vector<type_expr> bounds_;
};

// ---------------------------------------------------------------
// Members
// ---------------------------------------------------------------

struct parameter_info {
    type_expr type;
    annotation_list annotations;
};

struct method_info {
    std::string name;
    bool is_static = false;
    type_expr return_type = object_class();
    std::vector<parameter_info> parameters;
    annotation_list annotations;
    annotation_list return_annotations;
    invoke_fn invoke;
    const class_info* declaring_class = nullptr;  // set by add_method
};

struct field_info {
    std::string name;
    bool is_static = false;
    type_expr type = object_class();
    annotation_list annotations;
    annotation_list type_annotations;
    read_fn read;
    const class_info* declaring_class = nullptr;  // set by add_field
};

struct constructor_info {
    std::vector<parameter_info> parameters;
    annotation_list annotations;
    bool is_private = false;
    construct_fn construct;
};

struct supertype_info {
    type_expr type;
    upcast_fn upcast = nullptr;
};

/// The four shapes a provider member can take.
enum class provider_kind {
    static_method,
    instance_method,
    static_field,
    instance_field
};

using member_ref = std::variant<const method_info*, const field_info*>;

LIBRTPROV_EXPORT provider_kind kind_of(const member_ref& member) noexcept;

// ---------------------------------------------------------------
// class_info
// ---------------------------------------------------------------

class LIBRTPROV_EXPORT class_info {
public:
    using describe_fn = std::function<void(class_info&)>;

    class_info(std::string name, class_kind kind, const describe_fn& describe = {});
    ~class_info();

    class_info(const class_info&) = delete;
    class_info& operator=(const class_info&) = delete;

    const std::string& name() const noexcept { return name_; }
    class_kind kind() const noexcept { return kind_; }
    bool is_abstract() const noexcept {
        return kind_ == class_kind::abstract_class || kind_ == class_kind::interface;
    }

    const std::deque<type_parameter>& type_parameters() const noexcept { return type_parameters_; }
    const std::optional<supertype_info>& superclass() const noexcept { return superclass_; }
    const std::vector<supertype_info>& interfaces() const noexcept { return interfaces_; }
    const annotation_list& annotations() const noexcept { return annotations_; }
    const std::deque<constructor_info>& constructors() const noexcept { return constructors_; }
    const std::deque<method_info>& declared_methods() const noexcept { return methods_; }
    const std::deque<field_info>& declared_fields() const noexcept { return fields_; }

    /// Declared methods followed by the ones inherited from superclasses and
    /// interfaces.  An inherited method with the same name, staticness and
    /// arity as one already listed is hidden by it.
    std::vector<const method_info*> methods() const;

    /// Declared fields followed by inherited ones, hidden by name.
    std::vector<const field_info*> fields() const;

    // ---------------------------------------------------------------
    // Description (only meaningful inside the describe callback)
    // ---------------------------------------------------------------

    type_parameter& add_type_parameter(std::string name);
    void set_superclass(type_expr type, upcast_fn upcast);
    void add_interface(type_expr type, upcast_fn upcast);
    void annotate(annotation_ptr a);
    constructor_info& add_constructor(constructor_info ctor);
    method_info& add_method(method_info method);
    field_info& add_field(field_info field);

    // ---------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------

    /// True for the class itself, every transitive supertype and object.
    bool is_subclass_of(const class_info& base) const noexcept;

    /// Re-point `instance` (an object of this class) at its `target`
    /// subobject.  The result shares ownership with `instance`.
    /// Throws di_error when `target` is not a supertype.
    instance_ptr upcast(const instance_ptr& instance, const class_info& target) const;

    type_expr as_type() const { return type_expr(*this); }
    type_expr of(std::vector<type_expr> arguments) const;

private:
    void* upcast_raw(void* instance, const class_info& target) const noexcept;

    std::string name_;
    class_kind kind_;
    std::deque<type_parameter> type_parameters_;
    std::optional<supertype_info> superclass_;
    std::vector<supertype_info> interfaces_;
    annotation_list annotations_;
    std::deque<constructor_info> constructors_;
    std::deque<method_info> methods_;
    std::deque<field_info> fields_;
};

// ---------------------------------------------------------------
// Glue helpers for describe callbacks
// ---------------------------------------------------------------

template <typename Derived, typename Base>
void* upcast_to(void* p) noexcept {
    return static_cast<Base*>(static_cast<Derived*>(p));
}

template <typename T>
T& self_as(void* receiver) noexcept {
    return *static_cast<T*>(receiver);
}

template <typename T>
std::shared_ptr<T> arg_as(const instance_ptr& p) noexcept {
    return std::static_pointer_cast<T>(p);
}

} // namespace librtprov
