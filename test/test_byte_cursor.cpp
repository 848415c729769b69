#include <doctest/doctest.h>
#include <brushkit/byte_cursor.hpp>

#include <vector>

TEST_CASE("Byte cursor: fixed-width reads") {
    const std::vector<std::uint8_t> data = {0x12, 0x34, 0x56, 0x78, 0xFF, 0xFE};

    SUBCASE("Big-endian unsigned") {
        brushkit::byte_cursor cursor(data);
        std::uint16_t a = 0;
        std::uint32_t b = 0;
        REQUIRE(cursor.read_u16(a));
        CHECK(a == 0x1234);
        cursor = brushkit::byte_cursor(data);
        REQUIRE(cursor.read_u32(b));
        CHECK(b == 0x12345678);
        CHECK(cursor.offset() == 4);
    }

    SUBCASE("Little-endian") {
        brushkit::byte_cursor cursor(data);
        std::int64_t v = 0;
        REQUIRE(cursor.read_fixed(2, false, v, false));
        CHECK(v == 0x3412);
    }

    SUBCASE("Signed values are sign-extended") {
        brushkit::byte_cursor cursor(data, 4);
        std::int64_t v = 0;
        REQUIRE(cursor.read_fixed(2, true, v));
        CHECK(v == -2);
    }

    SUBCASE("Unsupported width") {
        brushkit::byte_cursor cursor(data);
        std::int64_t v = 0;
        CHECK_FALSE(cursor.read_fixed(3, false, v));
        CHECK(cursor.offset() == 0);
    }
}

TEST_CASE("Byte cursor: reads past the end fail without moving") {
    const std::vector<std::uint8_t> data = {1, 2, 3};
    brushkit::byte_cursor cursor(data);

    std::uint32_t v = 0;
    CHECK_FALSE(cursor.read_u32(v));
    CHECK(cursor.offset() == 0);

    std::span<const std::uint8_t> bytes;
    CHECK_FALSE(cursor.read_bytes(4, bytes));
    CHECK_FALSE(cursor.skip(4));
    CHECK(cursor.offset() == 0);

    REQUIRE(cursor.skip(3));
    CHECK(cursor.at_end());
    CHECK_FALSE(cursor.seek(4));
    CHECK(cursor.seek(3));

    const auto result = cursor.out_of_bounds("test field");
    CHECK_FALSE(result.ok);
    CHECK(result.error == brushkit::decode_error::out_of_bounds);
    CHECK(result.offset == 3);
    CHECK(result.message.find("test field") != std::string::npos);
}

TEST_CASE("Byte cursor: peek does not advance") {
    const std::vector<std::uint8_t> data = {'8', 'B', 'I', 'M', 's', 'a', 'm', 'p'};
    brushkit::byte_cursor cursor(data);

    std::span<const std::uint8_t> bytes;
    REQUIRE(cursor.peek_bytes(4, bytes));
    CHECK(bytes.size() == 4);
    CHECK(cursor.offset() == 0);
    CHECK(cursor.peek_equals("8BIMsamp"));
    CHECK_FALSE(cursor.peek_equals("8BIMdesc"));
    CHECK_FALSE(cursor.peek_equals("8BIMsamp!"));
    CHECK(cursor.offset() == 0);
}

TEST_CASE("Byte cursor: doubles and tags") {
    // 1.5 as IEEE 754 big-endian
    const std::vector<std::uint8_t> data = {0x3F, 0xF8, 0, 0, 0, 0, 0, 0};
    brushkit::byte_cursor cursor(data);
    double d = 0.0;
    REQUIRE(cursor.read_f64(d));
    CHECK(d == doctest::Approx(1.5));

    CHECK(brushkit::make_tag("8BIM") == 0x3842494D);
    CHECK(brushkit::tag_to_string(brushkit::make_tag("desc")) == "desc");
    CHECK(brushkit::tag_to_string(0x01020304) == "????");
}

TEST_CASE("Decode result: offsets and tags in failures") {
    const auto result = brushkit::decode_result::failure_at(
        brushkit::decode_error::unrecognized_value_type, 42, "Bad value", brushkit::make_tag("Wrng"));
    CHECK_FALSE(result);
    CHECK(result.offset == 42);
    CHECK(result.tag == brushkit::make_tag("Wrng"));
    CHECK(result.message == "Bad value (offset 42, tag 'Wrng')");
    CHECK(std::string(brushkit::to_string(result.error)) == "unrecognized_value_type");
}
