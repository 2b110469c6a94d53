#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "test_support.hpp"

#include <boost/log/keywords/severity.hpp>
#include <boost/log/trivial.hpp>

#include <exception>
#include <stdexcept>
#include <string>

using namespace librtprov;
using namespace librtprov::testing;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

struct needy {
    explicit needy(std::shared_ptr<integer> n) : n(std::move(n)) {}
    std::shared_ptr<integer> n;
};

/// Needy(@Inject Integer)
const class_info& needy_class() {
    static const class_info cls("Needy", class_kind::concrete, [](class_info& c) {
        c.add_constructor({
            .parameters  = {{.type = integer_class()}},
            .annotations = {annotations::inject()},
            .construct   = [](std::span<const instance_ptr> args) -> instance_ptr {
                return std::make_shared<needy>(arg_as<integer>(args[0]));
            },
        });
    });
    return cls;
}

/// Fragile { @Provides static Integer boom(); @Provides @Named("odd") static Integer odd(); }
const class_info& fragile_class() {
    static const class_info cls("Fragile", class_kind::concrete, [](class_info& c) {
        c.add_constructor({
            .construct = [](std::span<const instance_ptr>) -> instance_ptr {
                return std::make_shared<int>(0);
            },
        });
        c.add_method({
            .name        = "boom",
            .is_static   = true,
            .return_type = integer_class(),
            .annotations = {annotations::provides()},
            .invoke      = [](void*, std::span<const instance_ptr>) -> instance_ptr {
                throw std::runtime_error("boom went the provider");
            },
        });
        c.add_method({
            .name        = "odd",
            .is_static   = true,
            .return_type = integer_class(),
            .annotations = {annotations::provides(), annotations::named("odd")},
            .invoke      = [](void*, std::span<const instance_ptr>) -> instance_ptr {
                throw 42;
            },
        });
    });
    return cls;
}

std::shared_ptr<locator> make_locator() {
    auto loc = locator::create({.name = "diagnostics"});
    loc->add_configuration_listener(std::make_shared<provides_listener>(*loc));
    return loc;
}

} // namespace

TEST_CASE("not_found includes the requested type", "[diagnostics]") {
    auto loc = make_locator();

    try {
        loc->get_injectee(list_of(string_class()), {}, nullptr);
        FAIL("Expected not_found");
    } catch (const not_found& e) {
        REQUIRE(e.requested() == "List<String>");
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("List<String>"));
    }
}

TEST_CASE("not_found hints at qualifier mismatches", "[diagnostics]") {
    auto loc = make_locator();
    register_classes(*loc, {array_list_class().of({string_class()})});

    try {
        loc->get_injectee(list_of(string_class()), {annotations::named("other")}, nullptr);
        FAIL("Expected not_found");
    } catch (const not_found& e) {
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("not with the requested qualifiers"));
    }
}

TEST_CASE("di_error carries source_location", "[diagnostics]") {
    try {
        throw di_error("test error");
    } catch (const di_error& e) {
        std::string file = e.location().file_name();
        REQUIRE_THAT(file, ContainsSubstring("test_diagnostics"));
        REQUIRE(e.location().line() > 0);
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("[at "));
    }
}

TEST_CASE("resolution context names every enclosing component", "[diagnostics]") {
    auto loc = make_locator();
    register_classes(*loc, {needy_class()});

    try {
        loc->get_service(needy_class());
        FAIL("Expected not_found");
    } catch (const not_found& e) {
        std::string msg = e.what();
        REQUIRE_THAT(msg, ContainsSubstring("Service not found: Integer"));
        REQUIRE_THAT(msg, ContainsSubstring("(while resolving class_descriptor[Needy])"));
    }
}

TEST_CASE("cyclic_dependency message format is correct", "[diagnostics]") {
    cyclic_dependency e({"class_descriptor[A]", "class_descriptor[B]", "class_descriptor[A]"});
    REQUIRE(e.cycle().size() == 3);
    REQUIRE_THAT(std::string(e.what()),
                 StartsWith("Cyclic dependency detected: class_descriptor[A] -> "
                            "class_descriptor[B] -> class_descriptor[A]"));
}

TEST_CASE("provider failures arrive as multi_error", "[diagnostics]") {
    auto loc = make_locator();
    register_classes(*loc, {fragile_class()});

    try {
        loc->get_service(integer_class());
        FAIL("Expected multi_error");
    } catch (const multi_error& e) {
        REQUIRE(e.errors().size() == 1);
        std::string msg = e.what();
        REQUIRE_THAT(msg, ContainsSubstring("A provider failed with 1 error"));
        REQUIRE_THAT(msg, ContainsSubstring("boom went the provider"));
        REQUIRE_THAT(msg, ContainsSubstring("(while resolving provides_descriptor[Fragile.boom()])"));
    }
}

TEST_CASE("non-std-exception from a provider is wrapped in multi_error", "[diagnostics]") {
    auto loc = make_locator();
    register_classes(*loc, {fragile_class()});

    try {
        loc->get_service(integer_class(), {annotations::named("odd")});
        FAIL("Expected multi_error");
    } catch (const multi_error& e) {
        REQUIRE(e.errors().size() == 1);
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("non-standard exception"));
        REQUIRE_THROWS_AS(std::rethrow_exception(e.errors()[0]), int);
    }
}

TEST_CASE("destroy_method_not_found names method and provider", "[diagnostics]") {
    destroy_method_not_found e("shutdown", "Pool.open()");
    REQUIRE_THAT(std::string(e.what()),
                 StartsWith("Destroy method \"shutdown\" for Pool.open() not found"));
}

TEST_CASE("full_diagnostic appends detail", "[diagnostics]") {
    di_error e("plain");
    REQUIRE(e.full_diagnostic() == std::string(e.what()));

    e.set_diagnostic_detail("committed at:\n  frame");
    REQUIRE_THAT(e.full_diagnostic(), ContainsSubstring("\ncommitted at:\n  frame"));
}

TEST_CASE("log level names", "[diagnostics][log]") {
    REQUIRE(librtprov::log::level_from_string("TRACE") == librtprov::log::level::trace);
    REQUIRE(librtprov::log::level_from_string("warn") == librtprov::log::level::warning);
    REQUIRE(librtprov::log::level_from_string("Warning") == librtprov::log::level::warning);
    REQUIRE(librtprov::log::level_from_string("fatal") == librtprov::log::level::fatal);
    REQUIRE(librtprov::log::level_from_string("chatty") == librtprov::log::level::info);
}

TEST_CASE("debug lines are filtered by default once a locator exists", "[diagnostics][log]") {
    auto loc = locator::create();

    auto record = boost::log::trivial::logger::get().open_record(
        boost::log::keywords::severity = boost::log::trivial::debug);
    REQUIRE_FALSE(record);
}
