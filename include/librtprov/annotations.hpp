#pragma once

/// @file annotations.hpp
/// Marker model.
///
/// An annotation is an instance of an annotation class (a `class_info` of
/// kind `annotation`).  Meta-markers are ordinary annotations placed on those
/// classes: `singleton` is a scope because `singleton_type()` carries
/// `scope()`, and a user qualifier is any annotation class carrying
/// `qualifier()`.

#include "export.hpp"
#include "class_info.hpp"
#include "type.hpp"

#include <memory>
#include <string>
#include <vector>

namespace librtprov {

class LIBRTPROV_EXPORT annotation {
public:
    virtual ~annotation() = default;

    virtual const class_info& annotation_type() const noexcept = 0;

    /// Same annotation class and same values.
    virtual bool equals(const annotation& other) const noexcept;

    virtual std::string to_string() const;
};

/// An annotation with no values.
class LIBRTPROV_EXPORT marker_annotation : public annotation {
public:
    explicit marker_annotation(const class_info& type) noexcept : type_(&type) {}

    const class_info& annotation_type() const noexcept override { return *type_; }

private:
    const class_info* type_;
};

class LIBRTPROV_EXPORT rank_annotation : public annotation {
public:
    explicit rank_annotation(int value) noexcept : value_(value) {}

    const class_info& annotation_type() const noexcept override;
    bool equals(const annotation& other) const noexcept override;
    std::string to_string() const override;

    int value() const noexcept { return value_; }

private:
    int value_;
};

class LIBRTPROV_EXPORT named_annotation : public annotation {
public:
    explicit named_annotation(std::string value) : value_(std::move(value)) {}

    const class_info& annotation_type() const noexcept override;
    bool equals(const annotation& other) const noexcept override;
    std::string to_string() const override;

    const std::string& value() const noexcept { return value_; }

private:
    std::string value_;
};

class LIBRTPROV_EXPORT provides_annotation : public annotation {
public:
    /// Who receives the destroy call for a provided instance.
    enum class destroyer {
        /// A zero-argument instance method on the provided object.
        provided_instance,
        /// A one-argument method on the class declaring the provider.
        provider
    };

    provides_annotation(std::vector<type_expr> contracts,
                        std::string destroy_method,
                        destroyer destroyed_by)
        : contracts_(std::move(contracts))
        , destroy_method_(std::move(destroy_method))
        , destroyed_by_(destroyed_by)
    {}

    const class_info& annotation_type() const noexcept override;
    bool equals(const annotation& other) const noexcept override;
    std::string to_string() const override;

    /// Explicit contracts; empty means "infer".
    const std::vector<type_expr>& contracts() const noexcept { return contracts_; }
    /// Empty means "use the container's pre-destroy hook".
    const std::string& destroy_method() const noexcept { return destroy_method_; }
    destroyer destroyed_by() const noexcept { return destroyed_by_; }

private:
    std::vector<type_expr> contracts_;
    std::string destroy_method_;
    destroyer destroyed_by_;
};

class LIBRTPROV_EXPORT contracts_provided_annotation : public annotation {
public:
    explicit contracts_provided_annotation(std::vector<type_expr> contracts)
        : contracts_(std::move(contracts)) {}

    const class_info& annotation_type() const noexcept override;
    bool equals(const annotation& other) const noexcept override;

    const std::vector<type_expr>& contracts() const noexcept { return contracts_; }

private:
    std::vector<type_expr> contracts_;
};

class LIBRTPROV_EXPORT registers_annotation : public annotation {
public:
    explicit registers_annotation(std::vector<const class_info*> classes)
        : classes_(std::move(classes)) {}

    const class_info& annotation_type() const noexcept override;
    bool equals(const annotation& other) const noexcept override;

    const std::vector<const class_info*>& classes() const noexcept { return classes_; }

private:
    std::vector<const class_info*> classes_;
};

class LIBRTPROV_EXPORT use_proxy_annotation : public annotation {
public:
    explicit use_proxy_annotation(bool value) noexcept : value_(value) {}

    const class_info& annotation_type() const noexcept override;
    bool equals(const annotation& other) const noexcept override;

    bool value() const noexcept { return value_; }

private:
    bool value_;
};

class LIBRTPROV_EXPORT proxy_for_same_scope_annotation : public annotation {
public:
    explicit proxy_for_same_scope_annotation(bool value) noexcept : value_(value) {}

    const class_info& annotation_type() const noexcept override;
    bool equals(const annotation& other) const noexcept override;

    bool value() const noexcept { return value_; }

private:
    bool value_;
};

// ---------------------------------------------------------------
// Built-in annotation classes and factories
// ---------------------------------------------------------------

namespace annotations {

// Meta-markers
LIBRTPROV_EXPORT const class_info& scope_type();
LIBRTPROV_EXPORT const class_info& qualifier_type();
LIBRTPROV_EXPORT const class_info& contract_indicator_type();

LIBRTPROV_EXPORT const class_info& contract_type();
LIBRTPROV_EXPORT const class_info& contracts_provided_type();
LIBRTPROV_EXPORT const class_info& rank_type();
LIBRTPROV_EXPORT const class_info& named_type();
LIBRTPROV_EXPORT const class_info& provides_type();
LIBRTPROV_EXPORT const class_info& registers_type();
LIBRTPROV_EXPORT const class_info& singleton_type();
LIBRTPROV_EXPORT const class_info& per_lookup_type();
LIBRTPROV_EXPORT const class_info& inject_type();
LIBRTPROV_EXPORT const class_info& post_construct_type();
LIBRTPROV_EXPORT const class_info& pre_destroy_type();
LIBRTPROV_EXPORT const class_info& nullable_type();
LIBRTPROV_EXPORT const class_info& use_proxy_type();
LIBRTPROV_EXPORT const class_info& proxy_for_same_scope_type();

LIBRTPROV_EXPORT annotation_ptr scope();
LIBRTPROV_EXPORT annotation_ptr qualifier();
LIBRTPROV_EXPORT annotation_ptr contract_indicator();
LIBRTPROV_EXPORT annotation_ptr contract();
LIBRTPROV_EXPORT annotation_ptr contracts_provided(std::vector<type_expr> contracts);
LIBRTPROV_EXPORT annotation_ptr rank(int value);
LIBRTPROV_EXPORT annotation_ptr named(std::string value);
LIBRTPROV_EXPORT annotation_ptr provides(
    std::vector<type_expr> contracts = {},
    std::string destroy_method = {},
    provides_annotation::destroyer destroyed_by = provides_annotation::destroyer::provided_instance);
LIBRTPROV_EXPORT annotation_ptr registers(std::vector<const class_info*> classes);
LIBRTPROV_EXPORT annotation_ptr singleton();
LIBRTPROV_EXPORT annotation_ptr per_lookup();
LIBRTPROV_EXPORT annotation_ptr inject();
LIBRTPROV_EXPORT annotation_ptr post_construct();
LIBRTPROV_EXPORT annotation_ptr pre_destroy();
LIBRTPROV_EXPORT annotation_ptr nullable();
LIBRTPROV_EXPORT annotation_ptr use_proxy(bool value = true);
LIBRTPROV_EXPORT annotation_ptr proxy_for_same_scope(bool value = true);

/// Instance of a user-defined marker class.
LIBRTPROV_EXPORT annotation_ptr marker(const class_info& type);

} // namespace annotations

// ---------------------------------------------------------------
// Lookup helpers
// ---------------------------------------------------------------

LIBRTPROV_EXPORT annotation_ptr find_annotation(const annotation_list& list,
                                                const class_info& type) noexcept;

inline bool has_annotation(const annotation_list& list, const class_info& type) noexcept {
    return find_annotation(list, type) != nullptr;
}

template <typename A>
std::shared_ptr<const A> find_annotation(const annotation_list& list) noexcept {
    for (const auto& a : list) {
        if (auto typed = std::dynamic_pointer_cast<const A>(a)) return typed;
    }
    return nullptr;
}

/// The annotation's class carries the `scope` meta-marker.
LIBRTPROV_EXPORT bool is_scope(const annotation& a) noexcept;

/// The annotation's class carries the `qualifier` meta-marker.
LIBRTPROV_EXPORT bool is_qualifier(const annotation& a) noexcept;

/// First scope annotation in `list`, or null.
LIBRTPROV_EXPORT annotation_ptr find_scope(const annotation_list& list) noexcept;

LIBRTPROV_EXPORT annotation_list qualifiers_of(const annotation_list& list);

} // namespace librtprov
