#include <doctest/doctest.h>
#include <brushkit/parameter_value.hpp>

#include <string>

TEST_CASE("Parameter map: ordered unique keys") {
    brushkit::parameter_map map;
    map.insert_or_assign("diameter", 25.0);
    map.insert_or_assign("name", "Soft Round");
    map.insert_or_assign("spacing", std::int64_t{25});
    map.insert_or_assign("diameter", 30.0);

    REQUIRE(map.size() == 3);
    auto it = map.begin();
    CHECK(it->key == "diameter");
    CHECK(*it->value.get_if<double>() == doctest::Approx(30.0));
    ++it;
    CHECK(it->key == "name");
    ++it;
    CHECK(it->key == "spacing");

    CHECK(map.contains("name"));
    CHECK_FALSE(map.contains("opacity"));
    CHECK(map.find("opacity") == nullptr);
    REQUIRE(map.find("name")->as_string() != nullptr);
    CHECK(*map.find("name")->as_string() == "Soft Round");
}

TEST_CASE("Parameter value: kinds") {
    CHECK(brushkit::parameter_value(std::int64_t{1}).kind() == brushkit::value_kind::integer);
    CHECK(brushkit::parameter_value(1).kind() == brushkit::value_kind::integer);
    CHECK(brushkit::parameter_value(1.0).kind() == brushkit::value_kind::real);
    CHECK(brushkit::parameter_value(true).kind() == brushkit::value_kind::boolean);
    CHECK(brushkit::parameter_value("x").kind() == brushkit::value_kind::string);
    CHECK(brushkit::parameter_value(brushkit::unit_float{}).kind() == brushkit::value_kind::unit);
    CHECK(brushkit::parameter_value(brushkit::parameter_list{}).kind() == brushkit::value_kind::list);
    CHECK(brushkit::parameter_value(brushkit::parameter_map{}).kind() == brushkit::value_kind::map);
}

TEST_CASE("Parameter value: nesting and text rendering") {
    brushkit::parameter_map inner;
    inner.insert_or_assign("angle", brushkit::unit_float{45.0, brushkit::unit_kind::angle, 0});
    inner.insert_or_assign("flip", false);

    brushkit::parameter_list list;
    list.emplace_back(std::int64_t{1});
    list.emplace_back(inner);

    brushkit::parameter_map root;
    root.insert_or_assign("items", list);
    root.insert_or_assign("label", "a\"b");

    const brushkit::parameter_value value(root);
    CHECK(brushkit::to_string(value) ==
          "{\"items\": [1, {\"angle\": 45 angle, \"flip\": false}], \"label\": \"a\\\"b\"}");

    const brushkit::parameter_value copy = value;
    CHECK(copy == value);
}

TEST_CASE("Parameter value: unrecognized units keep their tag") {
    const brushkit::unit_float u{2.5, brushkit::unit_kind::unrecognized, 0x23426C6E};   // "#Bln"
    CHECK(brushkit::to_string(brushkit::parameter_value(u)) == "2.5 #Bln");
    CHECK(std::string(brushkit::to_string(brushkit::unit_kind::pixels)) == "pixels");
}
