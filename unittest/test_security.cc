//
// Hardening tests: truncated, corrupted and hostile input
//

#include <doctest/doctest.h>
#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>
#include <pngme/png.hh>

#include <random>

#include "test_utils.hh"

using namespace pngme;

TEST_CASE("Security - truncated records") {
    SUBCASE("every prefix of a record fails to decode") {
        auto record = secret_record();
        for (std::size_t n = 0; n < record.size(); n++) {
            CAPTURE(n);
            std::vector<std::byte> prefix(record.begin(), record.begin() + static_cast<std::ptrdiff_t>(n));
            CHECK_THROWS_AS(chunk::from_bytes(prefix), parse_error);
        }
        CHECK_NOTHROW(chunk::from_bytes(record));
    }

    SUBCASE("every truncation of a container fails to parse") {
        auto bytes = testing_png_bytes();
        std::size_t first_record_end = 8 + 12 + 20;
        for (std::size_t n = 9; n < first_record_end; n++) {
            CAPTURE(n);
            std::vector<std::byte> prefix(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(n));
            CHECK_THROWS_AS(png::parse(prefix), parse_error);
        }
        std::vector<std::byte> prefix(bytes.begin(), bytes.end() - 1);
        CHECK_THROWS_AS(png::parse(prefix), parse_error);
    }

    SUBCASE("length field far beyond the input") {
        auto record = make_record(0xFFFFFFFFu, "RuSt", "tiny", 0);
        CHECK_THROWS_AS(chunk::from_bytes(record), parse_error);
        CHECK_THROWS_AS(png::parse(with_signature(record)), parse_error);
    }

    SUBCASE("length field one past the data") {
        auto record = make_record(43, "RuSt", secret_message, secret_crc);
        CHECK_THROWS_AS(chunk::from_bytes(record), parse_error);
    }
}

TEST_CASE("Security - corrupted records") {
    SUBCASE("any flipped data bit is a checksum mismatch") {
        auto record = secret_record();
        for (std::size_t i = 8; i < 8 + 42; i++) {
            for (int bit = 0; bit < 8; bit++) {
                auto corrupted = record;
                corrupted[i] ^= std::byte(1 << bit);
                CAPTURE(i);
                CAPTURE(bit);
                CHECK_THROWS_AS(chunk::from_bytes(corrupted), crc_error);
            }
        }
    }

    SUBCASE("any flipped crc bit is a checksum mismatch") {
        auto record = secret_record();
        for (std::size_t i = 50; i < 54; i++) {
            for (int bit = 0; bit < 8; bit++) {
                auto corrupted = record;
                corrupted[i] ^= std::byte(1 << bit);
                CAPTURE(i);
                CAPTURE(bit);
                CHECK_THROWS_AS(chunk::from_bytes(corrupted), crc_error);
            }
        }
    }

    SUBCASE("flipped case bit of a type letter") {
        auto record = secret_record();
        // Bytes 0, 1 and 3 of the type only change properties
        for (std::size_t i : {4u, 5u, 7u}) {
            auto corrupted = record;
            corrupted[i] ^= std::byte(0x20);
            CAPTURE(i);
            CHECK_THROWS_AS(chunk::from_bytes(corrupted), crc_error);
        }

        // Byte 2 turns RuSt into Rust, which strict mode rejects first
        auto corrupted = record;
        corrupted[6] ^= std::byte(0x20);
        CHECK_THROWS_AS(chunk::from_bytes(corrupted), chunk_type_error);

        parse_options lenient;
        lenient.strict = false;
        CHECK_THROWS_AS(chunk::from_bytes(corrupted, lenient), crc_error);
    }

    SUBCASE("any other flipped type bit fails") {
        auto record = secret_record();
        for (std::size_t i = 4; i < 8; i++) {
            for (int bit = 0; bit < 8; bit++) {
                auto corrupted = record;
                corrupted[i] ^= std::byte(1 << bit);
                CAPTURE(i);
                CAPTURE(bit);
                CHECK_THROWS_AS(chunk::from_bytes(corrupted), pngme_error);
            }
        }
    }

    SUBCASE("flipped signature bits") {
        auto bytes = testing_png_bytes();
        for (std::size_t i = 0; i < 8; i++) {
            for (int bit = 0; bit < 8; bit++) {
                auto corrupted = bytes;
                corrupted[i] ^= std::byte(1 << bit);
                CAPTURE(i);
                CAPTURE(bit);
                CHECK_THROWS_AS(png::parse(corrupted), parse_error);
            }
        }
    }
}

TEST_CASE("Security - garbage input") {
    std::mt19937 rng(0x504E47u);
    std::uniform_int_distribution<int> byte_dist(0, 255);
    std::uniform_int_distribution<int> size_dist(0, 64);

    for (int round = 0; round < 200; round++) {
        std::vector<std::byte> garbage(static_cast<std::size_t>(size_dist(rng)) + 1);
        for (auto& b : garbage) {
            b = static_cast<std::byte>(byte_dist(rng));
        }
        CAPTURE(round);
        CHECK_THROWS_AS(chunk::from_bytes(garbage), pngme_error);
        CHECK_THROWS_AS(png::parse(with_signature(garbage)), pngme_error);
    }
}

TEST_CASE("Security - max chunk size") {
    parse_options opts;
    opts.max_chunk_size = 16;

    SUBCASE("record over the limit is rejected before reading data") {
        CHECK_THROWS_AS(chunk::from_bytes(secret_record(), opts), parse_error);
        CHECK_THROWS_AS(png::parse(with_signature(secret_record()), opts), parse_error);
    }

    SUBCASE("record at the limit is accepted") {
        chunk small("smAl"_ct, std::string_view("sixteen bytes!!!"));
        REQUIRE(small.length() == 16);
        CHECK_NOTHROW(chunk::from_bytes(small.to_bytes(), opts));
    }
}
