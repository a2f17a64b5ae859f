#include <doctest/doctest.h>
#include "radarlink/pretty.hpp"
#include "radarlink/codec.hpp"

#include <string>
#include <vector>

using namespace radarlink;

static MessageHeader hdr(uint32_t seq) {
    MessageHeader h;
    h.source_id = 1;
    h.time_tag = 1000;
    h.sequence_number = seq;
    return h;
}

static bool contains(const std::string& s, const std::string& part) {
    return s.find(part) != std::string::npos;
}

TEST_CASE("decode_pretty renders a keep-alive header line") {
    DecodedMessage dm = decode_message(encode_message(hdr(3), KeepAlive{}));
    CHECK(decode_pretty(dm) == "status=ok msg=Keep_Alive id=0xcef00400 src=1 seq=3 len=20 time=1000");
}

TEST_CASE("decode_pretty shows only the status fields that arrived") {
    SystemStatus s;
    s.radar_state = 4;
    s.operating_mode = 1;
    s.temperature_dc = 235;
    std::string line = decode_pretty(decode_message(encode_message(hdr(1), s)));
    CHECK(contains(line, "msg=System_Status"));
    CHECK(contains(line, "radar_state=4 mode=1 error=0"));
    CHECK(contains(line, "temp_c=23.5"));
    CHECK_FALSE(contains(line, "power="));
    CHECK_FALSE(contains(line, "antenna_deg="));
}

TEST_CASE("decode_pretty flags truncation and header inconsistencies") {
    Target t;
    t.id = 4;
    t.range_mm = 1500250;
    t.azimuth_mdeg = 45000;
    TargetReport r;
    r.declared_count = 1;
    r.targets.push_back(t);

    std::vector<uint8_t> f = encode_message(hdr(2), r);
    std::string line = decode_pretty(decode_message(f));
    CHECK(contains(line, "count=1 decoded=1 truncated=0 target=4:1500.250m/45.000deg"));

    f.resize(f.size() - 1);                 // lose the last byte of the record
    line = decode_pretty(decode_message(f));
    CHECK(contains(line, "warn=length_exceeds_data"));
    CHECK(contains(line, "decoded=0 truncated=1"));

    std::vector<uint8_t> tiny(5, 0);
    CHECK(decode_pretty(decode_message(tiny)) == "status=error reason=too_short");
}

TEST_CASE("describe marks unavailable extended fields") {
    SingleTargetExtended e;
    e.track.availability = avail::POLAR_LOCATION;
    std::string block = describe(decode_message(encode_message(hdr(1), e)));
    CHECK(contains(block, "Single Target Extended"));
    CHECK(contains(block, "(n/a)"));
}

TEST_CASE("to_json carries header, kind and body") {
    Acknowledge a{42};
    nlohmann::json j = to_json(decode_message(encode_message(hdr(9), a)));
    CHECK(j["status"] == "ok");
    CHECK(j["kind"] == "acknowledge");
    CHECK(j["name"] == "Acknowledge");
    CHECK(j["header"]["sequence_number"] == 9);
    CHECK(j["header_check"] == "consistent");
    CHECK(j["body"]["acked_sequence"] == 42);
}

TEST_CASE("Hex helpers accept common separators") {
    std::vector<uint8_t> b;
    REQUIRE(parse_hex("0xDE:ad be-EF", b));
    CHECK(to_hex(b) == "deadbeef");
    CHECK_FALSE(parse_hex("abc", b));
    CHECK_FALSE(parse_hex("zz", b));
}
