#include <doctest/doctest.h>
#include "radarlink/records.hpp"
#include "radarlink/byte_order.hpp"

#include <cstring>
#include <vector>

using namespace radarlink;

TEST_CASE("Target record is 32 bytes with scaled accessors") {
    Target t;
    t.id             = 42;
    t.range_mm       = 1234567;
    t.azimuth_mdeg   = 90500;
    t.elevation_mdeg = 1250;
    t.velocity_cms   = -1500;
    t.rcs_cdbsm      = 275;
    t.classification = static_cast<int32_t>(TargetClass::Helicopter);
    t.confidence     = 80;

    std::vector<uint8_t> b;
    encode_target(t, b);
    REQUIRE(b.size() == TARGET_SIZE);
    CHECK(wire::get_u32(b.data(), 4) == 1234567);

    Target back;
    decode_target(b.data(), back);
    CHECK(back == t);
    CHECK(back.range_m() == doctest::Approx(1234.567));
    CHECK(back.azimuth_deg() == doctest::Approx(90.5));
    CHECK(back.velocity_ms() == doctest::Approx(-15.0));
    CHECK(back.rcs_dbsm() == doctest::Approx(2.75));
    CHECK(std::strcmp(target_class_name(back.classification), "Helicopter") == 0);
    CHECK(std::strcmp(target_class_name(99), "Unknown") == 0);
}

TEST_CASE("TargetData availability bits gate the optional triples") {
    TargetData d;
    d.id                     = 7;
    d.status                 = static_cast<uint32_t>(TrackStatus::Update);
    d.polar_position         = Triple{0.01, 1.5, 2500.0};
    d.geo_location_raw       = Triple{0.9, 0.1, 120.0};
    d.cartesian_location_raw = Triple{10.0, 20.0, 30.0};
    d.ground_speed_raw       = 55.0;
    d.ground_heading_raw     = 1.2;
    d.availability           = avail::CARTESIAN_LOCATION | avail::POLAR_LOCATION |
                               avail::ABSOLUTE_VELOCITY;

    std::vector<uint8_t> b;
    encode_target_data(d, b);
    REQUIRE(b.size() == TARGET_DATA_SIZE);
    CHECK(b[124] == d.availability);

    TargetData back;
    decode_target_data(b.data(), back);
    CHECK(back == d);

    CHECK_FALSE(back.geo_location().has_value());
    CHECK(back.geo_location_raw.c == doctest::Approx(120.0));   // still carried
    REQUIRE(back.cartesian_location().has_value());
    CHECK(back.cartesian_location()->b == doctest::Approx(20.0));
    REQUIRE(back.polar_location().has_value());
    CHECK(back.polar_location()->c == doctest::Approx(2500.0));
    CHECK_FALSE(back.cartesian_velocity().has_value());
    CHECK_FALSE(back.polar_velocity().has_value());
    CHECK_FALSE(back.cartesian_sigma().has_value());
    REQUIRE(back.absolute_velocity().has_value());
    CHECK(back.absolute_velocity()->a == doctest::Approx(55.0));
    CHECK(back.absolute_velocity()->b == doctest::Approx(1.2));
    CHECK(std::strcmp(track_status_name(back.status), "update") == 0);
    CHECK(std::strcmp(track_status_name(17), "unknown") == 0);
}

TEST_CASE("PlotData and MotionRecord fill their fixed sizes") {
    PlotData p;
    p.time = 123456789;
    p.id   = 3;
    p.snr  = 17.5;
    std::vector<uint8_t> pb;
    encode_plot_data(p, pb);
    REQUIRE(pb.size() == PLOT_DATA_SIZE);
    PlotData pback;
    decode_plot_data(pb.data(), pback);
    CHECK(pback == p);

    MotionRecord m;
    m.position = Triple{0.5, -0.25, 80.0};
    m.attitude = Triple{0.0, 0.0, 3.14159265358979};
    m.validity = 0xFF;
    std::vector<uint8_t> mb;
    encode_motion(m, mb);
    REQUIRE(mb.size() == MOTION_SIZE);
    MotionRecord mback;
    decode_motion(mb.data(), mback);
    CHECK(mback == m);
    CHECK(mback.latitude_deg() == doctest::Approx(28.6478897565));
    CHECK(mback.attitude_deg().c == doctest::Approx(180.0));
}

TEST_CASE("Record fields sit at their fixed byte offsets") {
    TargetData d;
    d.geo_location_raw   = Triple{0.75, -1.25, 310.0};
    d.ground_speed_raw   = 42.0;
    d.ground_heading_raw = 2.5;
    std::vector<uint8_t> tb;
    encode_target_data(d, tb);
    REQUIRE(tb.size() == TARGET_DATA_SIZE);
    CHECK(wire::get_f64(tb.data(), 128) == doctest::Approx(0.75));
    CHECK(wire::get_f64(tb.data(), 136) == doctest::Approx(-1.25));
    CHECK(wire::get_f64(tb.data(), 296) == doctest::Approx(42.0));
    CHECK(wire::get_f64(tb.data(), 304) == doctest::Approx(2.5));

    PlotData p;
    p.id  = 0x01020304;
    p.snr = -3.5;
    std::vector<uint8_t> pb;
    encode_plot_data(p, pb);
    REQUIRE(pb.size() == PLOT_DATA_SIZE);
    CHECK(wire::get_u32(pb.data(), 8) == 0x01020304u);
    CHECK(wire::get_f64(pb.data(), 48) == doctest::Approx(-3.5));

    MotionRecord m;
    m.position = Triple{0.1, 0.2, 55.0};
    m.validity = 0x3C;
    std::vector<uint8_t> mb;
    encode_motion(m, mb);
    REQUIRE(mb.size() == MOTION_SIZE);
    CHECK(wire::get_f64(mb.data(), 8) == doctest::Approx(0.1));
    CHECK(wire::get_f64(mb.data(), 24) == doctest::Approx(55.0));
    CHECK(wire::get_u32(mb.data(), 156) == 0x3Cu);
}
