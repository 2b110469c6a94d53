#pragma once

// Class models shared by the test suites.

#include <librtprov.hpp>

#include <memory>
#include <span>
#include <string>
#include <vector>

namespace librtprov::testing {

// ---------------------------------------------------------------
// C++ objects behind the models
// ---------------------------------------------------------------

struct number {
    virtual ~number() = default;
    virtual int value() const = 0;
};

struct integer : number {
    explicit integer(int v) : v(v) {}
    int value() const override { return v; }
    int v;
};

struct list_value {
    std::vector<instance_ptr> items;
};

struct repo {
    std::shared_ptr<list_value> list() const {
        auto l = std::make_shared<list_value>();
        l->items.push_back(std::make_shared<std::string>("first"));
        return l;
    }
};

// ---------------------------------------------------------------
// Models
// ---------------------------------------------------------------

inline const class_info& comparable_class() {
    static const class_info cls("Comparable", class_kind::interface, [](class_info& c) {
        c.add_type_parameter("T");
    });
    return cls;
}

inline const class_info& string_class() {
    static const class_info cls("String", class_kind::concrete, [](class_info& c) {
        c.add_interface(comparable_class().of({c}), nullptr);
    });
    return cls;
}

inline const class_info& number_class() {
    static const class_info cls("Number", class_kind::abstract_class);
    return cls;
}

inline const class_info& integer_class() {
    static const class_info cls("Integer", class_kind::concrete, [](class_info& c) {
        c.set_superclass(number_class(), upcast_to<integer, number>);
        c.add_interface(comparable_class().of({c}), nullptr);
    });
    return cls;
}

/// List<E>, a contract.
inline const class_info& list_class() {
    static const class_info cls("List", class_kind::interface, [](class_info& c) {
        c.add_type_parameter("E");
        c.annotate(annotations::contract());
    });
    return cls;
}

/// ArrayList<E> implements List<E>
inline const class_info& array_list_class() {
    static const class_info cls("ArrayList", class_kind::concrete, [](class_info& c) {
        auto& e = c.add_type_parameter("E");
        c.add_interface(list_class().of({e.as_type()}), nullptr);
        c.add_constructor({
            .construct = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<list_value>();
            },
        });
    });
    return cls;
}

/// Pair<A, B>
inline const class_info& pair_class() {
    static const class_info cls("Pair", class_kind::concrete, [](class_info& c) {
        c.add_type_parameter("A");
        c.add_type_parameter("B");
    });
    return cls;
}

/// Box<T extends Number>
inline const class_info& box_class() {
    static const class_info cls("Box", class_kind::concrete, [](class_info& c) {
        auto& t = c.add_type_parameter("T");
        t.set_bounds({number_class()});
    });
    return cls;
}

/// Repo<T> with `@Provides List<T> list()`.
inline const class_info& repo_class() {
    static const class_info cls("Repo", class_kind::concrete, [](class_info& c) {
        auto& t = c.add_type_parameter("T");
        c.add_constructor({
            .construct = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<repo>();
            },
        });
        c.add_method({
            .name        = "list",
            .return_type = list_class().of({t.as_type()}),
            .annotations = {annotations::provides()},
            .invoke      = [](void* self, std::span<const instance_ptr>) -> instance_ptr {
                return self_as<repo>(self).list();
            },
        });
    });
    return cls;
}

/// StringRepo extends Repo<String>
inline const class_info& string_repo_class() {
    static const class_info cls("StringRepo", class_kind::concrete, [](class_info& c) {
        c.set_superclass(repo_class().of({string_class()}), nullptr);
        c.add_constructor({
            .construct = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<repo>();
            },
        });
    });
    return cls;
}

// ---------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------

inline type_expr list_of(type_expr element) {
    return list_class().of({std::move(element)});
}

/// Register `types` through the locator's current configuration service.
inline std::vector<descriptor_ptr> register_classes(service_locator& loc,
                                                    std::vector<type_expr> types) {
    auto config = loc.configuration_service().create_dynamic_configuration();
    std::vector<descriptor_ptr> added;
    for (const auto& t : types) added.push_back(config->add_active_descriptor(t));
    config->commit();
    return added;
}

inline std::size_t count_contract(service_locator& loc, const type_expr& contract) {
    return loc.descriptors([&](const active_descriptor& d) { return d.advertises(contract); }).size();
}

} // namespace librtprov::testing
