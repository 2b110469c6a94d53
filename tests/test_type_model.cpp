#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"

#include <unordered_set>

using namespace librtprov;
using namespace librtprov::testing;

TEST_CASE("parameterized types compare structurally", "[type]") {
    auto a = list_of(string_class());
    auto b = list_of(string_class());
    auto c = list_of(integer_class());

    REQUIRE(a == b);
    REQUIRE(a.hash() == b.hash());
    REQUIRE_FALSE(a == c);
    REQUIRE_FALSE(a == type_expr(list_class()));
}

TEST_CASE("types work as hash keys", "[type]") {
    std::unordered_set<type_expr> set;
    set.insert(list_of(string_class()));
    set.insert(list_of(string_class()));
    set.insert(type_expr::array_of(string_class()));
    set.insert(type_expr::array_of(string_class()));
    REQUIRE(set.size() == 2);
}

TEST_CASE("type variables compare by declaration", "[type]") {
    // Both are named "E" but belong to different classes.
    auto list_e = list_class().type_parameters()[0].as_type();
    auto array_list_e = array_list_class().type_parameters()[0].as_type();

    REQUIRE(list_e.to_string() == "E");
    REQUIRE(array_list_e.to_string() == "E");
    REQUIRE_FALSE(list_e == array_list_e);
    REQUIRE(list_e == list_class().type_parameters()[0].as_type());
}

TEST_CASE("to_string renders every kind", "[type]") {
    REQUIRE(type_expr(string_class()).to_string() == "String");
    REQUIRE(pair_class().of({string_class(), integer_class()}).to_string() == "Pair<String, Integer>");
    REQUIRE(type_expr::wildcard().to_string() == "?");
    REQUIRE(type_expr::wildcard_extends({number_class()}).to_string() == "? extends Number");
    REQUIRE(type_expr::wildcard_super({integer_class()}).to_string() == "? super Integer");
    REQUIRE(type_expr::array_of(list_of(string_class())).to_string() == "List<String>[]");
    REQUIRE(type_expr::parameterized(repo_class().of({string_class()}), list_class(),
                                     {string_class()}).to_string()
            == "Repo<String>.List<String>");
}

TEST_CASE("unbounded wildcard is bounded by object", "[type]") {
    auto w = type_expr::wildcard();
    REQUIRE(w.kind() == type_kind::wildcard);
    REQUIRE(w.as_wildcard()->upper_bounds.size() == 1);
    REQUIRE(w.as_wildcard()->upper_bounds[0] == type_expr(object_class()));
    REQUIRE(w.as_wildcard()->lower_bounds.empty());
    REQUIRE(w == type_expr::wildcard_extends({}));
}

TEST_CASE("accessors match the kind", "[type]") {
    type_expr raw = string_class();
    REQUIRE(raw.kind() == type_kind::raw);
    REQUIRE(raw.as_raw() == &string_class());
    REQUIRE(raw.as_parameterized() == nullptr);

    auto p = list_of(string_class());
    REQUIRE(p.kind() == type_kind::parameterized);
    REQUIRE(p.as_raw() == nullptr);
    REQUIRE(p.as_parameterized()->raw == &list_class());

    auto v = box_class().type_parameters()[0].as_type();
    REQUIRE(v.kind() == type_kind::variable);
    REQUIRE_FALSE(v.as_variable()->is_capture());
    REQUIRE(v.as_variable()->bounds().size() == 1);
    REQUIRE(v.as_variable()->bounds()[0] == type_expr(number_class()));
}

TEST_CASE("contains_type_variable finds nested variables", "[type]") {
    auto e = list_class().type_parameters()[0].as_type();

    REQUIRE_FALSE(contains_type_variable(string_class()));
    REQUIRE_FALSE(contains_type_variable(list_of(string_class())));
    REQUIRE_FALSE(contains_type_variable(list_of(type_expr::wildcard())));
    REQUIRE(contains_type_variable(e));
    REQUIRE(contains_type_variable(list_of(e)));
    REQUIRE(contains_type_variable(list_of(type_expr::wildcard_extends({e}))));
    REQUIRE(contains_type_variable(type_expr::array_of(e)));
    REQUIRE(contains_type_variable(
        type_expr::parameterized(list_of(e), pair_class(), {string_class(), string_class()})));
}

TEST_CASE("raw_class of opaque types is null", "[type]") {
    REQUIRE(raw_class(string_class()) == &string_class());
    REQUIRE(raw_class(list_of(string_class())) == &list_class());
    REQUIRE(raw_class(type_expr::array_of(string_class())) == nullptr);
    REQUIRE(raw_class(type_expr::wildcard()) == nullptr);
    REQUIRE(raw_class(list_class().type_parameters()[0].as_type()) == nullptr);
}

TEST_CASE("upcast re-points at the base subobject", "[type]") {
    auto value = std::make_shared<integer>(7);
    instance_ptr instance = value;

    auto base = integer_class().upcast(instance, number_class());
    REQUIRE(static_cast<number*>(base.get())->value() == 7);
    REQUIRE(base.use_count() == value.use_count());

    REQUIRE(integer_class().is_subclass_of(number_class()));
    REQUIRE(integer_class().is_subclass_of(object_class()));
    REQUIRE_FALSE(number_class().is_subclass_of(integer_class()));
    REQUIRE_THROWS_AS(number_class().upcast(instance, integer_class()), di_error);
}

TEST_CASE("methods lists inherited members after declared ones", "[type]") {
    auto methods = string_repo_class().methods();
    REQUIRE(methods.size() == 1);
    REQUIRE(methods[0]->name == "list");
    REQUIRE(methods[0]->declaring_class == &repo_class());
    REQUIRE(kind_of(methods[0]) == provider_kind::instance_method);
}
