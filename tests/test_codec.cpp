#include <doctest/doctest.h>
#include "radarlink/codec.hpp"
#include "radarlink/byte_order.hpp"

#include <cstring>
#include <vector>

using namespace radarlink;

static MessageHeader fields(uint32_t seq) {
    MessageHeader h;
    h.source_id       = 9;
    h.time_tag        = 1000;
    h.sequence_number = seq;
    return h;
}

// Hand-built frame: header in ICD order + raw payload.
static std::vector<uint8_t> raw_frame(uint32_t id, const std::vector<uint8_t>& payload,
                                      uint32_t seq = 1) {
    std::vector<uint8_t> f;
    wire::put_u32(f, 9);
    wire::put_u32(f, id);
    wire::put_u32(f, static_cast<uint32_t>(HEADER_SIZE + payload.size()));
    wire::put_u32(f, 1000);
    wire::put_u32(f, seq);
    f.insert(f.end(), payload.begin(), payload.end());
    return f;
}

TEST_CASE("KeepAlive is a bare 20-byte header") {
    std::vector<uint8_t> f = encode_message(fields(5), KeepAlive{});
    REQUIRE(f.size() == HEADER_SIZE);
    CHECK(wire::get_u32(f.data(), 4) == msg_id::KEEP_ALIVE);
    CHECK(wire::get_u32(f.data(), 8) == 20);

    DecodedMessage dm = decode_message(f);
    CHECK(dm.ok());
    CHECK(dm.kind == MessageKind::KeepAlive);
    CHECK(dm.header_check == HeaderCheck::Consistent);
    CHECK(dm.header.sequence_number == 5);
    CHECK(std::strcmp(dm.name(), "Keep Alive") == 0);
}

TEST_CASE("Every body kind survives encode then decode") {
    SystemControl c;
    c.radar_state = radar_state::OPERATE;
    c.mission_category = 2;
    c.sensor_controls = {{0, 1, 0, 1, 0, 0, 0, 1}};
    c.freq_index = 3;

    SystemStatus s;
    s.radar_state = 2; s.operating_mode = 1; s.error_code = 0;
    s.temperature_dc = -55; s.power_status = power::MAIN; s.antenna_position_cdeg = 18000;

    TargetReport r;
    Target t; t.id = 1; t.range_mm = 5000;
    r.targets = {t, t};
    r.declared_count = 2;

    SingleTargetExtended e;
    e.track.id = 11;
    e.plot.id = 12;

    SystemMotion m;
    m.motion.navigation_mode = 2;

    SensorPosition p;
    p.latitude_e7 = 515074000; p.longitude_e7 = -1278000; p.roll_mdeg = -500;

    Generic g;
    g.message_id = msg_id::BIT_STATUS_DATA;
    g.payload = {1, 2, 3};

    const std::vector<Body> bodies = {
        KeepAlive{}, c, s, Acknowledge{77}, r, SingleTargetReport{t}, e, m, p, g,
    };

    uint32_t seq = 1;
    for (const Body& body : bodies) {
        CAPTURE(body.index());
        std::vector<uint8_t> f = encode_message(fields(seq), body);
        DecodedMessage dm = decode_message(f);
        CHECK(dm.ok());
        CHECK(dm.header.sequence_number == seq);
        CHECK(dm.header.message_length == f.size());
        CHECK(dm.kind == kind_of(body));
        CHECK(dm.body == body);
        ++seq;
    }
}

TEST_CASE("SystemControl payload size follows the control revision") {
    SystemControl c;
    c.radar_state = 2;
    c.freq_index = 5;

    std::vector<uint8_t> f40 = encode_message(fields(1), c);
    CHECK(f40.size() == HEADER_SIZE + 40);
    CHECK(wire::get_u32(f40.data(), HEADER_SIZE + 16) == 5);

    CodecOptions ext;
    ext.control = ControlLayout::extended44();
    std::vector<uint8_t> f44 = encode_message(fields(1), c, ext);
    CHECK(f44.size() == HEADER_SIZE + 44);
    CHECK(wire::get_u32(f44.data(), HEADER_SIZE + 20) == 5);

    DecodedMessage dm = decode_message(f44, ext);
    REQUIRE(dm.ok());
    CHECK(std::get<SystemControl>(dm.body) == c);
}

TEST_CASE("SystemStatus decodes progressively from 12 to 24 bytes") {
    std::vector<uint8_t> payload;
    wire::put_u32(payload, 4);      // radar_state
    wire::put_u32(payload, 1);      // mode
    wire::put_u32(payload, 0);      // error
    wire::put_i32(payload, 251);    // 25.1 C
    wire::put_u32(payload, 0x3F);
    wire::put_u32(payload, 9000);   // 90.00 deg

    SUBCASE("8 bytes is insufficient, raw bytes kept") {
        std::vector<uint8_t> p8(payload.begin(), payload.begin() + 8);
        DecodedMessage dm = decode_message(raw_frame(msg_id::SYSTEM_STATUS, p8));
        CHECK(dm.status == DecodeStatus::InsufficientPayload);
        CHECK(dm.kind == MessageKind::SystemStatus);
        REQUIRE(std::holds_alternative<Generic>(dm.body));
        CHECK(std::get<Generic>(dm.body).payload == p8);
    }
    SUBCASE("12 bytes: required fields only") {
        std::vector<uint8_t> p(payload.begin(), payload.begin() + 12);
        DecodedMessage dm = decode_message(raw_frame(msg_id::SYSTEM_STATUS, p));
        REQUIRE(dm.ok());
        const SystemStatus& s = std::get<SystemStatus>(dm.body);
        CHECK(s.radar_state == 4);
        CHECK_FALSE(s.temperature_dc.has_value());
        CHECK_FALSE(s.power_status.has_value());
    }
    SUBCASE("16 bytes adds temperature") {
        std::vector<uint8_t> p(payload.begin(), payload.begin() + 16);
        const SystemStatus s = std::get<SystemStatus>(decode_message(raw_frame(msg_id::SYSTEM_STATUS, p)).body);
        REQUIRE(s.temperature_c().has_value());
        CHECK(*s.temperature_c() == doctest::Approx(25.1));
        CHECK_FALSE(s.power_status.has_value());
    }
    SUBCASE("20 bytes adds power status") {
        std::vector<uint8_t> p(payload.begin(), payload.begin() + 20);
        const SystemStatus s = std::get<SystemStatus>(decode_message(raw_frame(msg_id::SYSTEM_STATUS, p)).body);
        CHECK(s.power_status == 0x3Fu);
        CHECK_FALSE(s.antenna_position_cdeg.has_value());
    }
    SUBCASE("24 bytes is the full record; extra bytes are ignored") {
        REQUIRE(payload.size() == STATUS_MAX_PAYLOAD);
        std::vector<uint8_t> p = payload;
        p.push_back(0xAA);
        p.push_back(0xBB);
        const SystemStatus s = std::get<SystemStatus>(decode_message(raw_frame(msg_id::SYSTEM_STATUS, p)).body);
        REQUIRE(s.antenna_position_deg().has_value());
        CHECK(*s.antenna_position_deg() == doctest::Approx(90.0));
    }
}

TEST_CASE("TargetReport with fewer records than declared is truncated, not failed") {
    Target a; a.id = 1;
    Target b; b.id = 2;
    std::vector<uint8_t> payload;
    wire::put_u32(payload, 3);
    encode_target(a, payload);
    encode_target(b, payload);
    payload.insert(payload.end(), 10, 0xEE);    // partial third record

    DecodedMessage dm = decode_message(raw_frame(msg_id::TARGET_REPORT, payload));
    REQUIRE(dm.ok());
    const TargetReport& r = std::get<TargetReport>(dm.body);
    CHECK(r.declared_count == 3);
    REQUIRE(r.targets.size() == 2);
    CHECK(r.targets[1].id == 2);
    CHECK(r.truncated);
}

TEST_CASE("Extended target without the geo flag exposes no geo location") {
    SingleTargetExtended e;
    e.track.id = 5;
    e.track.availability = avail::POLAR_LOCATION;
    e.track.geo_location_raw = Triple{1.0, 1.0, 1.0};
    e.plot.snr = 12.0;

    std::vector<uint8_t> f = encode_message(fields(1), e);
    CHECK(f.size() == HEADER_SIZE + EXTENDED_PAYLOAD);

    DecodedMessage dm = decode_message(f);
    REQUIRE(dm.ok());
    const SingleTargetExtended& back = std::get<SingleTargetExtended>(dm.body);
    CHECK_FALSE(back.track.geo_location().has_value());
    CHECK(back.track.polar_location().has_value());
    CHECK(back.plot.snr == doctest::Approx(12.0));

    std::vector<uint8_t> shortp(100, 0);
    DecodedMessage bad = decode_message(raw_frame(msg_id::SINGLE_TARGET_EXTENDED, shortp));
    CHECK(bad.status == DecodeStatus::InsufficientPayload);
}

TEST_CASE("Unknown message id decodes as Generic named Unknown") {
    DecodedMessage dm = decode_message(raw_frame(0x12345678, {0xDE, 0xAD}));
    CHECK(dm.ok());
    CHECK(dm.kind == MessageKind::Generic);
    CHECK(std::strcmp(dm.name(), "Unknown") == 0);
    const Generic& g = std::get<Generic>(dm.body);
    CHECK(g.message_id == 0x12345678);
    CHECK((g.payload == std::vector<uint8_t>{0xDE, 0xAD}));
}

TEST_CASE("Short input and inconsistent lengths") {
    std::vector<uint8_t> tiny(10, 0);
    CHECK(decode_message(tiny).status == DecodeStatus::TooShort);

    std::vector<uint8_t> f = raw_frame(msg_id::ACKNOWLEDGE, {1, 0, 0, 0});
    wire::set_u32(f.data(), 8, 64);             // claims more than we hold
    DecodedMessage dm = decode_message(f);
    CHECK(dm.ok());
    CHECK(dm.header_check == HeaderCheck::LengthExceedsData);
    CHECK(std::get<Acknowledge>(dm.body).acked_sequence == 1);
}

TEST_CASE("Catalog lookups") {
    CHECK(kind_for_id(msg_id::SENSOR_POSITION) == MessageKind::SensorPosition);
    CHECK(kind_for_id(msg_id::MAINTENANCE_DATA) == MessageKind::Generic);
    CHECK(id_for_kind(MessageKind::Acknowledge) == msg_id::ACKNOWLEDGE);
    CHECK(std::strcmp(message_name(msg_id::RADAR_DATA_STREAM), "Radar Data Stream") == 0);
    CHECK(message_id_for(Generic{msg_id::BIT_REQUEST, {}}) == msg_id::BIT_REQUEST);
    CHECK(std::strcmp(to_string(MessageKind::SingleTargetExtended), "single_target_extended") == 0);
}
