#include <doctest/doctest.h>
#include "radarlink/framer.hpp"
#include "radarlink/codec.hpp"

#include <vector>

using namespace radarlink;

static std::vector<uint8_t> keepalive(uint32_t seq) {
    MessageHeader h;
    h.source_id = 9;
    h.sequence_number = seq;
    return encode_message(h, KeepAlive{});
}

static std::vector<uint8_t> ack(uint32_t seq, uint32_t acked) {
    MessageHeader h;
    h.source_id = 9;
    h.sequence_number = seq;
    return encode_message(h, Acknowledge{acked});
}

TEST_CASE("A frame split across feeds is released only when complete") {
    StreamFramer fr;
    std::vector<uint8_t> f = ack(1, 5);
    std::vector<uint8_t> out;

    fr.feed(f.data(), 7);
    CHECK_FALSE(fr.next(out));
    fr.feed(f.data() + 7, 10);
    CHECK_FALSE(fr.next(out));
    fr.feed(f.data() + 17, f.size() - 17);
    REQUIRE(fr.next(out));
    CHECK(out == f);
    CHECK(fr.buffered() == 0);
    CHECK(fr.desync_count() == 0);
}

TEST_CASE("Several frames in one feed come out in order") {
    StreamFramer fr;
    std::vector<uint8_t> a = keepalive(1);
    std::vector<uint8_t> b = ack(2, 1);
    std::vector<uint8_t> c = keepalive(3);
    std::vector<uint8_t> all = a;
    all.insert(all.end(), b.begin(), b.end());
    all.insert(all.end(), c.begin(), c.end());
    all.push_back(0x00);                         // start of a fourth

    fr.feed(all.data(), all.size());
    std::vector<uint8_t> out;
    REQUIRE(fr.next(out)); CHECK(out == a);
    REQUIRE(fr.next(out)); CHECK(out == b);
    REQUIRE(fr.next(out)); CHECK(out == c);
    CHECK_FALSE(fr.next(out));
    CHECK(fr.buffered() == 1);
}

TEST_CASE("Leading garbage is skipped one byte at a time") {
    StreamFramer fr(HeaderLayout::icd(), 1024);
    std::vector<uint8_t> f = keepalive(4);
    std::vector<uint8_t> in = {0xFF, 0xFF, 0xFF};
    in.insert(in.end(), f.begin(), f.end());

    fr.feed(in.data(), in.size());
    std::vector<uint8_t> out;
    REQUIRE(fr.next(out));
    CHECK(out == f);
    CHECK(fr.desync_count() == 3);
    CHECK(fr.last_status() == FramerStatus::Desync);

    std::vector<uint8_t> g = keepalive(5);
    fr.feed(g.data(), g.size());
    REQUIRE(fr.next(out));
    CHECK(fr.last_status() == FramerStatus::Ok);
}

TEST_CASE("reset() drops a partial frame") {
    StreamFramer fr;
    std::vector<uint8_t> f = ack(1, 1);
    fr.feed(f.data(), 12);
    CHECK(fr.buffered() == 12);
    fr.reset();
    CHECK(fr.buffered() == 0);

    fr.feed(f.data(), f.size());
    std::vector<uint8_t> out;
    REQUIRE(fr.next(out));
    CHECK(out == f);
}

TEST_CASE("max_message never goes below one header") {
    StreamFramer fr(HeaderLayout::icd(), 4);
    CHECK(fr.max_message() == HEADER_SIZE);
}

TEST_CASE("A quarter megabyte of garbage is skipped and the next frame recovered") {
    // 1024 keeps the windows straddling garbage and header (0x09FF, 0x14CE) out of range.
    StreamFramer fr(HeaderLayout::icd(), 1024);
    const size_t garbage = 4 * StreamFramer::DEFAULT_MAX_MESSAGE - HEADER_SIZE;
    std::vector<uint8_t> in(garbage, 0xFF);
    std::vector<uint8_t> f = keepalive(6);
    in.insert(in.end(), f.begin(), f.end());
    fr.feed(in.data(), in.size());

    std::vector<uint8_t> out;
    bool got = false;
    for (int i = 0; i < 4 && !got; ++i) got = fr.next(out);
    REQUIRE(got);
    CHECK(out == f);
    CHECK(fr.desync_count() == garbage);
    CHECK(fr.buffered() == 0);

    std::vector<uint8_t> g = ack(7, 6);
    fr.feed(g.data(), g.size());
    REQUIRE(fr.next(out));
    CHECK(out == g);
}

TEST_CASE("Consumed bytes are released while frames stay intact") {
    StreamFramer fr;
    std::vector<uint8_t> all;
    for (uint32_t i = 1; i <= 50; ++i) {
        std::vector<uint8_t> f = ack(i, i);
        all.insert(all.end(), f.begin(), f.end());
    }
    fr.feed(all.data(), all.size());

    std::vector<uint8_t> out;
    for (uint32_t i = 1; i <= 50; ++i) {
        REQUIRE(fr.next(out));
        CHECK(decode_message(out).header.sequence_number == i);
        CHECK(fr.buffered() == all.size() - i * out.size());
    }
    CHECK_FALSE(fr.next(out));
    CHECK(fr.buffered() == 0);
}
