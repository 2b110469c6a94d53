#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "test_support.hpp"

#include <stdexcept>
#include <string>

using namespace librtprov;
using namespace librtprov::testing;

namespace {

struct engine {
    virtual ~engine() = default;
    virtual std::string name() const = 0;
};

struct v8 : engine {
    std::string name() const override { return "v8"; }
    bool started = false;
};

struct electric : engine {
    std::string name() const override { return "electric"; }
};

struct car {
    explicit car(std::shared_ptr<engine> e) : e(std::move(e)) {}
    std::shared_ptr<engine> e;
};

struct wheel {};
struct garage {
    explicit garage(std::shared_ptr<wheel> w) : w(std::move(w)) {}
    std::shared_ptr<wheel> w;
};

struct chicken {};
struct egg {};

int v8_stopped = 0;
int wheels_removed = 0;

const class_info& engine_class() {
    static const class_info cls("Engine", class_kind::interface, [](class_info& c) {
        c.annotate(annotations::contract());
    });
    return cls;
}

/// @Singleton V8 implements Engine, with start() / stop() hooks.
const class_info& v8_class() {
    static const class_info cls("V8", class_kind::concrete, [](class_info& c) {
        c.add_interface(engine_class(), upcast_to<v8, engine>);
        c.annotate(annotations::singleton());
        c.add_constructor({
            .construct = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<v8>();
            },
        });
        c.add_method({
            .name        = "start",
            .annotations = {annotations::post_construct()},
            .invoke      = [](void* self, std::span<const instance_ptr>) -> instance_ptr {
                self_as<v8>(self).started = true;
                return nullptr;
            },
        });
        c.add_method({
            .name        = "stop",
            .annotations = {annotations::pre_destroy()},
            .invoke      = [](void*, std::span<const instance_ptr>) -> instance_ptr {
                ++v8_stopped;
                return nullptr;
            },
        });
    });
    return cls;
}

/// @Singleton @Named("electric") Electric implements Engine
const class_info& electric_class() {
    static const class_info cls("Electric", class_kind::concrete, [](class_info& c) {
        c.add_interface(engine_class(), upcast_to<electric, engine>);
        c.annotate(annotations::singleton());
        c.annotate(annotations::named("electric"));
        c.add_constructor({
            .construct = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<electric>();
            },
        });
    });
    return cls;
}

/// Car(@Inject Engine)
const class_info& car_class() {
    static const class_info cls("Car", class_kind::concrete, [](class_info& c) {
        c.add_constructor({
            .parameters  = {{.type = engine_class()}},
            .annotations = {annotations::inject()},
            .construct   = [](std::span<const instance_ptr> args) -> instance_ptr {
                return std::make_shared<car>(arg_as<engine>(args[0]));
            },
        });
    });
    return cls;
}

const class_info& wheel_class() {
    static const class_info cls("Wheel", class_kind::concrete, [](class_info& c) {
        c.add_constructor({
            .construct = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<wheel>();
            },
        });
        c.add_method({
            .name        = "remove",
            .annotations = {annotations::pre_destroy()},
            .invoke      = [](void*, std::span<const instance_ptr>) -> instance_ptr {
                ++wheels_removed;
                return nullptr;
            },
        });
    });
    return cls;
}

const class_info& garage_class() {
    static const class_info cls("Garage", class_kind::concrete, [](class_info& c) {
        c.add_constructor({
            .parameters  = {{.type = wheel_class()}},
            .annotations = {annotations::inject()},
            .construct   = [](std::span<const instance_ptr> args) -> instance_ptr {
                return std::make_shared<garage>(arg_as<wheel>(args[0]));
            },
        });
    });
    return cls;
}

/// Bird, a contract.
const class_info& bird_class() {
    static const class_info cls("Bird", class_kind::interface, [](class_info& c) {
        c.annotate(annotations::contract());
    });
    return cls;
}

/// Egg(@Inject Bird)
const class_info& egg_class() {
    static const class_info cls("Egg", class_kind::concrete, [](class_info& c) {
        c.add_constructor({
            .parameters  = {{.type = bird_class()}},
            .annotations = {annotations::inject()},
            .construct   = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<egg>();
            },
        });
    });
    return cls;
}

/// Chicken(@Inject Egg) implements Bird
const class_info& chicken_class() {
    static const class_info cls("Chicken", class_kind::concrete, [](class_info& c) {
        c.add_interface(bird_class(), nullptr);
        c.add_constructor({
            .parameters  = {{.type = egg_class()}},
            .annotations = {annotations::inject()},
            .construct   = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<chicken>();
            },
        });
    });
    return cls;
}

struct holder {
    explicit holder(instance_ptr value) : value(std::move(value)) {}
    instance_ptr value;
};

/// Holder<T>(@Inject T)
const class_info& holder_class() {
    static const class_info cls("Holder", class_kind::concrete, [](class_info& c) {
        auto& t = c.add_type_parameter("T");
        c.add_constructor({
            .parameters  = {{.type = t.as_type()}},
            .annotations = {annotations::inject()},
            .construct   = [](std::span<const instance_ptr> args) -> instance_ptr {
                return std::make_shared<holder>(args[0]);
            },
        });
    });
    return cls;
}

const class_info& request_scoped_class() {
    static const class_info cls("RequestScoped", class_kind::annotation, [](class_info& c) {
        c.annotate(annotations::scope());
    });
    return cls;
}

const class_info& per_request_class() {
    static const class_info cls("PerRequest", class_kind::concrete, [](class_info& c) {
        c.annotate(annotations::marker(request_scoped_class()));
        c.add_constructor({
            .construct = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<wheel>();
            },
        });
    });
    return cls;
}

const class_info& faulty_class() {
    static const class_info cls("Faulty", class_kind::concrete, [](class_info& c) {
        c.add_constructor({
            .construct = [](std::span<const instance_ptr>) -> instance_ptr {
                throw std::runtime_error("engine on fire");
            },
        });
    });
    return cls;
}

struct counting_listener : configuration_listener {
    void configuration_changed() override { ++calls; }
    int calls = 0;
};

} // namespace

// ---------------------------------------------------------------
// Registration and lookup
// ---------------------------------------------------------------

TEST_CASE("locator: constructor injection with a singleton dependency", "[locator]") {
    auto loc = locator::create();
    register_classes(*loc, {v8_class(), car_class()});

    auto c = loc->get<car>(car_class());
    REQUIRE(c);
    REQUIRE(c->e->name() == "v8");

    auto e = loc->get<engine>(engine_class());
    REQUIRE(e.get() == c->e.get());
    REQUIRE(loc->get<car>(car_class()).get() != c.get());
}

TEST_CASE("locator: class descriptors advertise contract supertypes", "[locator]") {
    auto loc = locator::create();
    auto added = register_classes(*loc, {v8_class()});

    REQUIRE(added.size() == 1);
    REQUIRE(added[0]->contract_types().size() == 2);
    REQUIRE(added[0]->advertises(v8_class()));
    REQUIRE(added[0]->advertises(engine_class()));
    REQUIRE(added[0]->to_string() == "class_descriptor[V8]");
    REQUIRE(loc->descriptors().size() == 1);
}

TEST_CASE("locator: post_construct runs on creation, pre_destroy on shutdown", "[locator][lifecycle]") {
    v8_stopped = 0;
    auto loc = locator::create();
    register_classes(*loc, {v8_class()});

    auto instance = std::static_pointer_cast<v8>(loc->get_service(v8_class()));
    REQUIRE(instance->started);
    REQUIRE(v8_stopped == 0);

    loc->shutdown();
    REQUIRE(v8_stopped == 1);

    loc->shutdown();
    REQUIRE(v8_stopped == 1);
}

TEST_CASE("locator: per-lookup instances are disposed with their handle", "[locator][lifecycle]") {
    wheels_removed = 0;
    auto loc = locator::create();
    register_classes(*loc, {wheel_class(), garage_class()});

    auto a = loc->get_service(wheel_class());
    auto b = loc->get_service(wheel_class());
    REQUIRE(a.get() != b.get());

    a.reset();
    REQUIRE(wheels_removed == 1);

    auto g = loc->get<garage>(garage_class());
    REQUIRE(g->w);
    auto w = g->w;
    g.reset();
    REQUIRE(wheels_removed == 2);

    b.reset();
    REQUIRE(wheels_removed == 3);
}

TEST_CASE("locator: service handles own what they resolve", "[locator][lifecycle]") {
    wheels_removed = 0;
    auto loc = locator::create();
    auto added = register_classes(*loc, {wheel_class()});

    auto handle = loc->get_service_handle(added[0]);
    REQUIRE(handle->is_active());
    auto first = handle->get_service();
    REQUIRE(first == handle->get_service());

    handle->close();
    REQUIRE_FALSE(handle->is_active());
    REQUIRE(wheels_removed == 1);
    REQUIRE_THROWS_AS(handle->get_service(), illegal_state);

    handle->close();
    REQUIRE(wheels_removed == 1);
}

TEST_CASE("locator: qualifiers and ranking select the descriptor", "[locator]") {
    auto loc = locator::create();
    auto added = register_classes(*loc, {v8_class(), electric_class()});

    REQUIRE(loc->get<engine>(engine_class())->name() == "v8");
    REQUIRE(loc->get<engine>(engine_class(), {annotations::named("electric")})->name() == "electric");
    REQUIRE(loc->get_service(engine_class(), {annotations::named("diesel")}) == nullptr);

    added[1]->set_ranking(10);
    REQUIRE(loc->best_descriptor(engine_class()) == added[1]);
}

TEST_CASE("locator: generic classes are registered per parameterization", "[locator]") {
    auto loc = locator::create();
    register_classes(*loc, {v8_class(), holder_class().of({engine_class()})});

    auto h = loc->get<holder>(holder_class().of({engine_class()}));
    REQUIRE(h);
    REQUIRE(static_cast<engine*>(h->value.get())->name() == "v8");

    // A raw request matches any parameterization.
    REQUIRE(loc->get_service(holder_class()) != nullptr);
    REQUIRE(loc->get_service(holder_class().of({string_class()})) == nullptr);
}

// ---------------------------------------------------------------
// Failures
// ---------------------------------------------------------------

TEST_CASE("locator: missing services", "[locator][errors]") {
    auto loc = locator::create();
    REQUIRE(loc->get_service(string_class()) == nullptr);
    REQUIRE_THROWS_AS(loc->get_injectee(string_class(), {}, nullptr), not_found);

    register_classes(*loc, {v8_class()});
    try {
        loc->get_injectee(engine_class(), {annotations::named("diesel")}, nullptr);
        FAIL("Expected not_found");
    } catch (const not_found& e) {
        REQUIRE(e.requested() == "Engine");
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("qualifiers"));
    }
}

TEST_CASE("locator: non-instantiable classes are rejected", "[locator][errors]") {
    auto loc = locator::create();
    REQUIRE_THROWS_AS(register_classes(*loc, {number_class()}), di_error);
    REQUIRE_THROWS_AS(register_classes(*loc, {engine_class()}), di_error);
    REQUIRE(loc->descriptors().empty());
}

TEST_CASE("locator: configurations commit once", "[locator][errors]") {
    auto loc = locator::create();
    auto config = loc->configuration_service().create_dynamic_configuration();
    config->add_active_descriptor(wheel_class());
    config->commit();
    REQUIRE_THROWS_AS(config->commit(), illegal_state);
    REQUIRE_THROWS_AS(config->add_active_descriptor(wheel_class()), illegal_state);
    REQUIRE(loc->descriptors().size() == 1);
}

TEST_CASE("locator: cycles are detected", "[locator][errors]") {
    auto loc = locator::create();
    register_classes(*loc, {chicken_class(), egg_class()});

    try {
        loc->get_service(chicken_class());
        FAIL("Expected cyclic_dependency");
    } catch (const cyclic_dependency& e) {
        REQUIRE(e.cycle().size() == 3);
        REQUIRE(e.cycle().front() == "class_descriptor[Chicken]");
        REQUIRE(e.cycle().back() == "class_descriptor[Chicken]");
    }
}

TEST_CASE("locator: constructor failures become resolution_error", "[locator][errors]") {
    auto loc = locator::create();
    register_classes(*loc, {faulty_class()});

    try {
        loc->get_service(faulty_class());
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("engine on fire"));
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("class_descriptor[Faulty]"));
    }
}

TEST_CASE("locator: unsupported scopes fail on lookup", "[locator][errors]") {
    auto loc = locator::create();
    register_classes(*loc, {per_request_class()});
    REQUIRE_THROWS_AS(loc->get_service(per_request_class()), di_error);
}

// ---------------------------------------------------------------
// Configuration plumbing
// ---------------------------------------------------------------

TEST_CASE("locator: listeners run when added and after each commit", "[locator][config]") {
    auto loc = locator::create({.name = "listeners"});
    auto listener = std::make_shared<counting_listener>();

    loc->add_configuration_listener(listener);
    REQUIRE(listener->calls == 1);

    register_classes(*loc, {wheel_class()});
    REQUIRE(listener->calls == 2);
    REQUIRE(loc->options().name == "listeners");
}

TEST_CASE("locator: configuration service can be replaced", "[locator][config]") {
    struct recording_service : dynamic_configuration_service {
        explicit recording_service(dynamic_configuration_service& inner) : inner(inner) {}
        std::unique_ptr<dynamic_configuration> create_dynamic_configuration() override {
            ++created;
            return inner.create_dynamic_configuration();
        }
        dynamic_configuration_service& inner;
        int created = 0;
    };

    auto loc = locator::create();
    auto service = std::make_shared<recording_service>(loc->default_configuration_service());
    loc->set_configuration_service(service);

    REQUIRE(&loc->configuration_service() == service.get());
    register_classes(*loc, {wheel_class()});
    REQUIRE(service->created == 1);
    REQUIRE(loc->descriptors().size() == 1);
    REQUIRE_THROWS_AS(loc->set_configuration_service(nullptr), di_error);
}
