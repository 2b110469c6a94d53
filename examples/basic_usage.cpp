/// basic_usage.cpp: librtprov introductory example.
///
/// Demonstrates provider discovery on top of the in-memory locator:
///   1. Describe classes once with class_info, marking provider members.
///   2. Install the provides enabler so utility classes can be registered.
///   3. Register a generic component; its providers are resolved against
///      the concrete parameterization and registered automatically.
///   4. Look services up by contract; per-lookup results are disposed
///      when the last reference goes away.

#include <librtprov.hpp>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace librtprov;

// -----------------------------------------------------------------------
// Domain types
// -----------------------------------------------------------------------

struct clock_source {
    long now() const { return 1700000000; }
};

struct names {
    std::vector<std::string> items;
};

struct string_repository {
    names all() const { return {{"alice", "bob"}}; }
};

// -----------------------------------------------------------------------
// Class descriptions
// -----------------------------------------------------------------------

const class_info& string_class() {
    static const class_info cls("String", class_kind::concrete);
    return cls;
}

/// @Contract List<E>
const class_info& list_class() {
    static const class_info cls("List", class_kind::interface, [](class_info& c) {
        c.add_type_parameter("E");
        c.annotate(annotations::contract());
    });
    return cls;
}

/// @Singleton Clock
const class_info& clock_class() {
    static const class_info cls("Clock", class_kind::concrete, [](class_info& c) {
        c.annotate(annotations::singleton());
    });
    return cls;
}

/// Clocks: a utility class whose only job is `@Provides static Clock system()`.
const class_info& clocks_class() {
    static const class_info cls("Clocks", class_kind::concrete, [](class_info& c) {
        c.add_constructor({.is_private = true});
        c.add_method({
            .name        = "system",
            .is_static   = true,
            .return_type = clock_class(),
            .annotations = {annotations::provides()},
            .invoke      = [](void*, std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<clock_source>();
            },
        });
    });
    return cls;
}

/// Repository<T> { @Provides List<T> all(); }
const class_info& repository_class() {
    static const class_info cls("Repository", class_kind::concrete, [](class_info& c) {
        auto& t = c.add_type_parameter("T");
        c.add_constructor({
            .construct = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<string_repository>();
            },
        });
        c.add_method({
            .name        = "all",
            .return_type = list_class().of({t.as_type()}),
            .annotations = {annotations::provides()},
            .invoke      = [](void* self, std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<names>(self_as<string_repository>(self).all());
            },
        });
    });
    return cls;
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    librtprov::log::init({.min_level = librtprov::log::level::info});

    // ── Setup ─────────────────────────────────────────────────────────
    auto loc = locator::create({.name = "example"});
    provides_enabler::install(*loc);

    // ── Registration ──────────────────────────────────────────────────
    auto config = loc->configuration_service().create_dynamic_configuration();

    // Clocks cannot be built, but its static provider makes it useful.
    config->add_active_descriptor(clocks_class().as_type());
    // Repository<String> provides List<String>.
    config->add_active_descriptor(repository_class().of({string_class().as_type()}));
    config->commit();

    // ── Lookup ────────────────────────────────────────────────────────
    const auto c1 = loc->get<clock_source>(clock_class());
    const auto c2 = loc->get<clock_source>(clock_class());
    assert(c1.get() == c2.get() && "Clock is a singleton");
    std::cout << "Clock reads " << c1->now() << '\n';

    const auto all = loc->get<names>(list_class().of({string_class().as_type()}));
    assert(all && "List<String> comes from Repository<String>.all()");
    for (const auto& n : all->items) {
        std::cout << "Name: " << n << '\n';
    }

    for (const auto& d : loc->descriptors()) {
        std::cout << "Registered: " << d->to_string() << '\n';
    }

    loc->shutdown();
    std::cout << "Done.\n";
    return 0;
}
