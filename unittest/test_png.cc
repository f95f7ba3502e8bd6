//
// Container parsing, mutation and serialization
//

#include <doctest/doctest.h>
#include <pngme/png.hh>
#include <pngme/crc.hh>
#include <pngme/exceptions.hh>

#include <sstream>
#include <string>

#include "test_utils.hh"

using namespace pngme;

namespace {
    png testing_png() {
        return png::parse(testing_png_bytes());
    }

    const std::vector<std::string> testing_types = {"FrSt", "miDl", "LASt"};

    std::vector<std::string> type_list(const png& p) {
        std::vector<std::string> out;
        for (const auto& c : p.chunks()) {
            out.push_back(c.type().to_string());
        }
        return out;
    }
}

TEST_CASE("png parsing") {
    SUBCASE("chunks in file order") {
        auto p = testing_png();
        CHECK(type_list(p) == testing_types);
        CHECK(p.header() == png::signature);
    }

    SUBCASE("signature only") {
        auto p = png::parse(signature_bytes());
        CHECK(p.chunks().empty());
        CHECK(p.to_bytes() == signature_bytes());
    }

    SUBCASE("invalid signature") {
        auto bytes = testing_png_bytes();
        bytes[0] = std::byte(13);
        CHECK_THROWS_AS(png::parse(bytes), parse_error);
    }

    SUBCASE("input shorter than the signature") {
        auto bytes = signature_bytes();
        bytes.pop_back();
        CHECK_THROWS_AS(png::parse(bytes), parse_error);
        CHECK_THROWS_AS(png::parse(std::vector<std::byte>{}), parse_error);
    }

    SUBCASE("invalid chunk aborts the whole parse") {
        auto bytes = testing_png_bytes();
        auto bad = make_record(42, "RuSt", secret_message, secret_crc + 1);
        bytes.insert(bytes.end(), bad.begin(), bad.end());
        CHECK_THROWS_AS(png::parse(bytes), crc_error);
    }

    SUBCASE("bytes round trip exactly") {
        auto bytes = testing_png_bytes();
        CHECK(png::parse(bytes).to_bytes() == bytes);
    }

    SUBCASE("from stream") {
        auto bytes = testing_png_bytes();
        std::istringstream is(std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
        auto p = png::parse(is);
        CHECK(type_list(p) == testing_types);
    }

    SUBCASE("from raw pointer") {
        auto bytes = testing_png_bytes();
        auto p = png::parse(bytes.data(), bytes.size());
        CHECK(p.chunks().size() == 3);
    }
}

TEST_CASE("png lookup") {
    SUBCASE("chunk by type") {
        auto p = testing_png();
        const chunk* c = p.chunk_by_type("FrSt");
        REQUIRE(c != nullptr);
        CHECK(c->type().to_string() == "FrSt");
        CHECK(c->data_as_string() == "I am the first chunk");
    }

    SUBCASE("absent type") {
        auto p = testing_png();
        CHECK(p.chunk_by_type("NoNe") == nullptr);
        CHECK(p.chunk_by_type("FrS") == nullptr);
        CHECK(p.chunk_by_type("") == nullptr);
    }

    SUBCASE("lookup is case sensitive") {
        auto p = testing_png();
        CHECK(p.chunk_by_type("frst") == nullptr);
    }

    SUBCASE("first match wins") {
        auto p = testing_png();
        p.append_chunk(chunk("FrSt"_ct, std::string_view("I am a later duplicate")));
        CHECK(p.chunk_by_type("FrSt")->data_as_string() == "I am the first chunk");
    }
}

TEST_CASE("png mutation") {
    SUBCASE("append chunk") {
        auto p = testing_png();
        p.append_chunk(chunk("TeSt"_ct, std::string_view("Message")));
        CHECK(p.chunks().size() == 4);
        CHECK(p.chunks().back().type().to_string() == "TeSt");
        CHECK(p.chunk_by_type("TeSt")->data_as_string() == "Message");
    }

    SUBCASE("appended secret survives serialization") {
        auto p = testing_png();
        p.append_chunk(chunk(chunk_type::from_string("ruSt"), secret_message));

        auto reparsed = png::parse(p.to_bytes());
        const chunk* c = reparsed.chunk_by_type("ruSt");
        REQUIRE(c != nullptr);
        CHECK(c->data_as_string() == std::string(secret_message));
        CHECK(c->length() == 42);
        CHECK(c->crc() == chunk_crc("ruSt"_ct, c->data().data(), c->data().size()));
        CHECK(*c == p.chunks().back());
    }

    SUBCASE("remove present type") {
        auto p = testing_png();
        auto removed = p.remove_chunk("miDl");
        CHECK(removed.type().to_string() == "miDl");
        CHECK(removed.data_as_string() == "I am another chunk");
        std::vector<std::string> expected = {"FrSt", "LASt"};
        CHECK(type_list(p) == expected);
        CHECK(p.chunk_by_type("miDl") == nullptr);
    }

    SUBCASE("remove absent type leaves the container untouched") {
        auto p = testing_png();
        auto before = p.to_bytes();
        CHECK_THROWS_AS(p.remove_chunk("NoNe"), not_found_error);
        CHECK(p.chunks().size() == 3);
        CHECK(p.to_bytes() == before);
    }

    SUBCASE("remove only the first duplicate") {
        auto p = png::parse(signature_bytes());
        p.append_chunk(chunk("TeSt"_ct, std::string_view("one")));
        p.append_chunk(chunk("abCd"_ct, std::string_view("between")));
        p.append_chunk(chunk("TeSt"_ct, std::string_view("two")));

        auto removed = p.remove_chunk("TeSt");
        CHECK(removed.data_as_string() == "one");
        REQUIRE(p.chunks().size() == 2);
        CHECK(p.chunks()[0].data_as_string() == "between");
        CHECK(p.chunks()[1].data_as_string() == "two");

        p.remove_chunk("TeSt");
        CHECK_THROWS_AS(p.remove_chunk("TeSt"), not_found_error);
        CHECK(p.chunks().size() == 1);
    }
}

TEST_CASE("png end to end") {
    auto p = png::parse(signature_bytes());
    chunk original(chunk_type::from_string("RuSt"), std::string_view("hello"));
    p.append_chunk(original);

    auto bytes = p.to_bytes();
    CHECK(bytes.size() == 8 + 12 + 5);

    auto reparsed = png::parse(bytes);
    REQUIRE(reparsed.chunks().size() == 1);
    CHECK(reparsed.chunks()[0] == original);
    CHECK(reparsed.chunks()[0].crc() == 748752844u);
}

TEST_CASE("png display") {
    auto p = testing_png();
    std::ostringstream os;
    os << p;
    auto s = os.str();
    CHECK(s.find("PNG with 3 chunks") != std::string::npos);
    CHECK(s.find("[0] chunk 'FrSt'") != std::string::npos);
    CHECK(s.find("[1] chunk 'miDl'") != std::string::npos);
    CHECK(s.find("[2] chunk 'LASt'") != std::string::npos);
    CHECK(s.find("\"I am the last chunk\"") != std::string::npos);

    std::ostringstream empty;
    empty << png::parse(signature_bytes());
    CHECK(empty.str() == "PNG with 0 chunks\n");
}
