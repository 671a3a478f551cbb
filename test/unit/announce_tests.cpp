// Unit tests for the discovery datagram
#include <catch2/catch_test_macros.hpp>
#include "protocol/announce.hpp"
#include "protocol/packet.hpp"

using namespace protocol;

TEST_CASE("Announce - encode and decode", "[announce]") {
    Announce announce{"kitchen-laptop", 60001, 1700000000123};
    std::string datagram = encode_announce(announce);

    CHECK(datagram.rfind(ANNOUNCE_PREFIX, 0) == 0);

    Announce decoded = decode_announce(datagram);
    CHECK(decoded.name == "kitchen-laptop");
    CHECK(decoded.port == 60001);
    CHECK(decoded.timestamp == 1700000000123);
}

TEST_CASE("Announce - malformed datagrams", "[announce]") {
    SECTION("Foreign traffic") {
        CHECK_FALSE(try_decode_announce("OTHERAPP|482913|5000").has_value());
        CHECK_FALSE(try_decode_announce("").has_value());
        CHECK_FALSE(try_decode_announce(R"({"name":"a","port":1,"timestamp":1})").has_value());
    }

    SECTION("Bad bodies") {
        std::string prefix = ANNOUNCE_PREFIX;
        CHECK_FALSE(try_decode_announce(prefix + "not json").has_value());
        CHECK_FALSE(try_decode_announce(prefix + R"({"name":"a","port":1})").has_value());
        CHECK_FALSE(try_decode_announce(prefix + R"({"name":"a","port":1,"timestamp":1,"extra":true})").has_value());
        CHECK_FALSE(try_decode_announce(prefix + R"({"name":"","port":1,"timestamp":1})").has_value());
        CHECK_FALSE(try_decode_announce(prefix + R"({"name":"a","port":0,"timestamp":1})").has_value());
        CHECK_FALSE(try_decode_announce(prefix + R"({"name":"a","port":70000,"timestamp":1})").has_value());
        CHECK_FALSE(try_decode_announce(prefix + R"({"name":"a","port":"80","timestamp":1})").has_value());
        CHECK_THROWS_AS(decode_announce(prefix + "[]"), DecodeError);
    }

    SECTION("Oversized datagram") {
        std::string big = std::string(ANNOUNCE_PREFIX) + std::string(MAX_ANNOUNCE_SIZE, 'x');
        CHECK_THROWS_AS(decode_announce(big), DecodeError);
    }
}

TEST_CASE("Announce - timestamps come from the wall clock", "[announce]") {
    int64_t before = now_millis();
    Announce decoded = decode_announce(encode_announce({"n", 1, now_millis()}));
    CHECK(decoded.timestamp >= before);
}
