#include <doctest/doctest.h>
#include "utf8.hh"
#include "test_utils.hh"

using namespace pngme;

static std::optional<std::size_t> check(std::initializer_list<unsigned> values) {
    auto data = to_bytes(values);
    return find_invalid_utf8(data.data(), data.size());
}

TEST_CASE("utf8 validation") {
    SUBCASE("well formed") {
        CHECK_FALSE(find_invalid_utf8(nullptr, 0).has_value());
        CHECK_FALSE(check({'a', 'b', 'c'}).has_value());
        CHECK_FALSE(check({0xC3, 0xBC}).has_value());               // U+00FC
        CHECK_FALSE(check({0xE2, 0x82, 0xAC}).has_value());         // U+20AC
        CHECK_FALSE(check({0xF0, 0x9F, 0x98, 0x80}).has_value());   // U+1F600
        CHECK_FALSE(check({0xF4, 0x8F, 0xBF, 0xBF}).has_value());   // U+10FFFF
        CHECK_FALSE(check({0x00, 0x7F}).has_value());
    }

    SUBCASE("stray and invalid lead bytes") {
        CHECK(check({0x80}) == 0u);
        CHECK(check({'a', 0xBF}) == 1u);
        CHECK(check({0xC0, 0x80}) == 0u);
        CHECK(check({0xC1, 0xBF}) == 0u);
        CHECK(check({0xF5, 0x80, 0x80, 0x80}) == 0u);
        CHECK(check({0xFF}) == 0u);
    }

    SUBCASE("overlong forms") {
        CHECK(check({0xE0, 0x80, 0x80}) == 0u);
        CHECK(check({0xF0, 0x80, 0x80, 0x80}) == 0u);
    }

    SUBCASE("surrogates and out of range") {
        CHECK(check({0xED, 0xA0, 0x80}) == 0u);        // U+D800
        CHECK(check({0xF4, 0x90, 0x80, 0x80}) == 0u);  // U+110000
    }

    SUBCASE("truncated sequences") {
        CHECK(check({'x', 0xE2, 0x82}) == 1u);
        CHECK(check({0xF0, 0x9F, 0x98}) == 0u);
        CHECK(check({0xC3, 'a'}) == 0u);
    }
}
