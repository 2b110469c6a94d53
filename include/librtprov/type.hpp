#pragma once

/// @file type.hpp
/// Runtime generic type expressions.
///
/// A `type_expr` is an immutable value handle over one of five node kinds:
///   raw            `String`, `List` (a class, no arguments)
///   parameterized  `List<String>`, `Outer<A>.Inner<B>`
///   wildcard       `?`, `? extends Number`, `? super Integer`
///   variable       `T`, or a capture variable `capture#1 of ? extends ...`
///   array          `T[]`, `List<String>[]`
///
/// Copies share the underlying node.  Equality and hashing are structural,
/// except for type variables, which compare by declaration identity.

#include "export.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace librtprov {

class class_info;
class type_parameter;
struct type_node;
struct capture_site;
struct parameterized_type;
struct wildcard_type;
struct type_variable;
struct array_type;

enum class type_kind {
    raw,
    parameterized,
    wildcard,
    variable,
    array
};

class LIBRTPROV_EXPORT type_expr {
public:
    /// Raw reference to a class.  Implicit so that a `class_info` can be
    /// passed wherever a type is expected.
    type_expr(const class_info& cls);

    static type_expr parameterized(const class_info& raw, std::vector<type_expr> arguments);
    static type_expr parameterized(type_expr owner, const class_info& raw,
                                   std::vector<type_expr> arguments);

    /// `?`
    static type_expr wildcard();
    /// `? extends A & B`
    static type_expr wildcard_extends(std::vector<type_expr> upper_bounds);
    /// `? super A`
    static type_expr wildcard_super(std::vector<type_expr> lower_bounds);

    static type_expr variable(const type_parameter& parameter);
    static type_expr capture(std::shared_ptr<const capture_site> site);
    static type_expr array_of(type_expr component);

    type_kind kind() const noexcept;

    /// The class of a raw type; nullptr for every other kind.
    const class_info* as_raw() const noexcept;
    const parameterized_type* as_parameterized() const noexcept;
    const wildcard_type* as_wildcard() const noexcept;
    const type_variable* as_variable() const noexcept;
    const array_type* as_array() const noexcept;

    std::string to_string() const;
    std::size_t hash() const noexcept;

    friend LIBRTPROV_EXPORT bool operator==(const type_expr& a, const type_expr& b) noexcept;

private:
    explicit type_expr(std::shared_ptr<const type_node> node) noexcept;

    std::shared_ptr<const type_node> node_;
};

struct raw_type {
    const class_info* cls = nullptr;
};

struct parameterized_type {
    std::optional<type_expr> owner;
    const class_info* raw = nullptr;
    std::vector<type_expr> arguments;
};

struct wildcard_type {
    std::vector<type_expr> lower_bounds;
    std::vector<type_expr> upper_bounds;
};

/// A synthetic type variable standing in for one captured wildcard.  Its
/// identity is the address of the site, never its name or bounds.
struct capture_site {
    std::string name;
    std::vector<type_expr> bounds;
};

struct type_variable {
    const type_parameter* declared = nullptr;     // null for captures
    std::shared_ptr<const capture_site> capture;  // null for declared parameters

    bool is_capture() const noexcept { return capture != nullptr; }
    LIBRTPROV_EXPORT const std::string& name() const noexcept;
    LIBRTPROV_EXPORT const std::vector<type_expr>& bounds() const noexcept;
};

struct array_type {
    type_expr component;
};

struct type_node {
    std::variant<raw_type, parameterized_type, wildcard_type, type_variable, array_type> value;
    std::size_t hash = 0;
};

} // namespace librtprov

template <>
struct std::hash<librtprov::type_expr> {
    std::size_t operator()(const librtprov::type_expr& t) const noexcept { return t.hash(); }
};
