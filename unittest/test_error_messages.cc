//
// Test to verify error messages and error codes
//

#include <doctest/doctest.h>
#include <string>
#include <vector>

#include <pngme/png.hh>
#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>
#include "test_utils.hh"

using namespace pngme;

TEST_CASE("Improved error messages") {
    SUBCASE("checksum mismatch - shows chunk, offset and both values") {
        auto bytes = png_signature();
        auto rust = raw_chunk(42, "RuSt", secret_message, 2882656333u);
        bytes.insert(bytes.end(), rust.begin(), rust.end());

        try {
            (void)png::parse(bytes);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("RuSt") != std::string::npos);
            CHECK(msg.find("offset 8") != std::string::npos);
            CHECK(msg.find("abd1d84d") != std::string::npos);  // stored
            CHECK(msg.find("abd1d84e") != std::string::npos);  // computed
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("chunk size limit exceeded - shows chunk details") {
        auto bytes = png_signature();
        auto big = raw_chunk(2000, "DaTa", std::string(2000, 'x'), 0);
        bytes.insert(bytes.end(), big.begin(), big.end());

        parse_options opts;
        opts.max_chunk_size = 1024;

        try {
            (void)png::parse(bytes, opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::chunk_too_large);
            CHECK(e.offset() == 8);
            std::string msg = e.what();
            CHECK(msg.find("DaTa") != std::string::npos);
            CHECK(msg.find("offset 8") != std::string::npos);
            CHECK(msg.find("2000") != std::string::npos);
            CHECK(msg.find("1024") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("truncated chunk with a huge declared length runs out of data") {
        auto bytes = png_signature();
        append_u32be(bytes, 0x80000000u);
        append_text(bytes, "RuSt");

        try {
            (void)png::parse(bytes);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::unexpected_eof);
            CHECK(e.offset() == 16);
            CHECK(std::string(e.what()).find("chunk data") != std::string::npos);
        }
    }

    SUBCASE("limit applies once the payload is present") {
        auto bytes = raw_chunk(42, "RuSt", secret_message, secret_crc);
        parse_options opts;
        opts.max_chunk_size = 41;

        try {
            (void)chunk::parse(bytes.data(), bytes.size(), 0, opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::chunk_too_large);
            CHECK(e.offset() == 0);
        }

        opts.max_chunk_size = 42;
        CHECK(chunk::parse(bytes.data(), bytes.size(), 0, opts).length() == 42);
    }

    SUBCASE("tag errors name the offending character") {
        try {
            (void)chunk_tag::from_string("Ru$t");
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("'$'") != std::string::npos);
            CHECK(msg.find("Ru$t") != std::string::npos);
        }
    }
}

TEST_CASE("error code names") {
    CHECK(std::string(to_string(error_code::io)) == "io");
    CHECK(std::string(to_string(error_code::invalid_tag_length)) == "invalid_tag_length");
    CHECK(std::string(to_string(error_code::invalid_tag_bytes)) == "invalid_tag_bytes");
    CHECK(std::string(to_string(error_code::unexpected_eof)) == "unexpected_eof");
    CHECK(std::string(to_string(error_code::checksum_mismatch)) == "checksum_mismatch");
    CHECK(std::string(to_string(error_code::bad_signature)) == "bad_signature");
    CHECK(std::string(to_string(error_code::trailing_bytes)) == "trailing_bytes");
    CHECK(std::string(to_string(error_code::chunk_too_large)) == "chunk_too_large");
    CHECK(std::string(to_string(error_code::chunk_not_found)) == "chunk_not_found");
    CHECK(std::string(to_string(error_code::invalid_utf8)) == "invalid_utf8");
}

TEST_CASE("exception hierarchy") {
    CHECK_THROWS_AS((void)chunk_tag::from_string("x"), png_error);
    CHECK_THROWS_AS((void)chunk_tag::from_string("x"), std::runtime_error);
    CHECK_THROWS_AS((void)png::parse(std::vector<std::byte>{}), png_error);
}
