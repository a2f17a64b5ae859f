#include <doctest/doctest.h>
#include "radarlink/channel.hpp"
#include "radarlink/byte_order.hpp"

#include <string>
#include <vector>

using namespace radarlink;

static uint32_t fixed_time_tag() { return 43200000; }   // 12:00:00.000

static ChannelConfig test_config() {
    ChannelConfig cfg;
    cfg.source_id = 0xC2;
    return cfg;
}

static std::vector<uint8_t> rc_status(uint32_t seq, uint32_t reported) {
    MessageHeader h;
    h.source_id = 0x0C;
    h.sequence_number = seq;
    SystemStatus s;
    s.radar_state = reported;
    return encode_message(h, s);
}

static std::vector<DecodedMessage> drain_sent(Channel& ch) {
    std::vector<DecodedMessage> out;
    std::vector<uint8_t> frame;
    while (ch.get_message(frame)) out.push_back(decode_message(frame, ch.config().codec));
    return out;
}

TEST_CASE("connect() queues a stamped keep-alive with sequence 1") {
    Channel ch(test_config());
    ch.set_time_tag_source(&fixed_time_tag);
    ch.connect(0);

    CHECK(ch.state() == LinkState::Connected);
    std::vector<DecodedMessage> sent = drain_sent(ch);
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].kind == MessageKind::KeepAlive);
    CHECK(sent[0].header.source_id == 0xC2);
    CHECK(sent[0].header.sequence_number == 1);
    CHECK(sent[0].header.time_tag == 43200000);
    CHECK(ch.next_sequence() == 2);

    NoteStr note;
    REQUIRE(ch.get_note(note));
    CHECK(std::string(note.c_str()) == "event=transition from=disconnected to=connected");
}

TEST_CASE("Keep-alives follow the 1 s cadence through tick()") {
    Channel ch(test_config());
    ch.connect(0);
    drain_sent(ch);

    CHECK_FALSE(ch.tick(500));
    CHECK(drain_sent(ch).empty());
    CHECK_FALSE(ch.tick(1000));
    std::vector<DecodedMessage> sent = drain_sent(ch);
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].kind == MessageKind::KeepAlive);
    CHECK(sent[0].header.sequence_number == 2);
    CHECK_FALSE(ch.tick(1999));
    CHECK(drain_sent(ch).empty());
    CHECK_FALSE(ch.tick(2000));
    CHECK(drain_sent(ch).size() == 1);
}

TEST_CASE("Inbound frames are decoded one per tick and forwarded") {
    Channel ch(test_config());
    ch.connect(0);
    drain_sent(ch);

    std::vector<uint8_t> in = rc_status(10, 0);
    std::vector<uint8_t> second = rc_status(11, 0);
    in.insert(in.end(), second.begin(), second.end());
    REQUIRE(ch.add_bytes(in.data(), in.size()));

    CHECK(ch.tick(10));
    CHECK(ch.session().status_count == 1);
    CHECK(ch.tick(20));
    CHECK(ch.session().status_count == 2);
    CHECK_FALSE(ch.tick(30));
    CHECK(ch.frames_received() == 2);
    CHECK(ch.state() == LinkState::StandbyRequested);

    DecodedMessage dm;
    REQUIRE(ch.get_decoded(dm));
    CHECK(dm.header.sequence_number == 10);
    REQUIRE(ch.get_decoded(dm));
    CHECK(dm.header.sequence_number == 11);
    CHECK_FALSE(ch.get_decoded(dm));

    std::vector<DecodedMessage> sent = drain_sent(ch);
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].kind == MessageKind::SystemControl);
    CHECK(std::get<SystemControl>(sent[0].body).radar_state == radar_state::STANDBY);
    CHECK(sent[0].header.message_length == HEADER_SIZE + 40);
}

TEST_CASE("add_bytes refuses a chunk that would overflow the receive buffer") {
    ChannelConfig cfg = test_config();
    cfg.max_message = 64;
    Channel ch(cfg);
    ch.connect(0);

    std::vector<uint8_t> big(Channel::RX_BUFFER_FRAMES * 64 + 1, 0);
    CHECK_FALSE(ch.add_bytes(big.data(), big.size()));

    std::vector<uint8_t> f = rc_status(1, 0);
    CHECK(ch.add_bytes(f.data(), f.size()));
    CHECK(ch.tick(1));
}

TEST_CASE("Sequence numbers wrap to 1, never 0") {
    Channel ch(test_config());
    ch.set_next_sequence(0xFFFFFFFFu);
    ch.connect(0);
    REQUIRE(ch.send(Acknowledge{5}));

    std::vector<DecodedMessage> sent = drain_sent(ch);
    REQUIRE(sent.size() == 2);
    CHECK(sent[0].header.sequence_number == 0xFFFFFFFFu);
    CHECK(sent[1].header.sequence_number == 1);

    ch.set_next_sequence(0);
    CHECK(ch.next_sequence() == 1);
}

TEST_CASE("A full outbox drops the newest frame and counts it") {
    Channel ch(test_config());
    ch.connect(0);                                 // 1 queued
    for (size_t i = 1; i < Channel::OUTBOX_CAP; ++i) REQUIRE(ch.send(KeepAlive{}));
    CHECK_FALSE(ch.send(KeepAlive{}));
    CHECK(ch.dropped_outbound() == 1);
    CHECK(ch.frames_sent() == Channel::OUTBOX_CAP);
}

TEST_CASE("disconnect() clears pending state and reports the loss") {
    Channel ch(test_config());
    ch.connect(0);
    std::vector<uint8_t> f = rc_status(1, 0);
    REQUIRE(ch.add_bytes(f.data(), 10));            // partial frame

    ch.disconnect();
    CHECK(ch.state() == LinkState::Disconnected);
    CHECK(drain_sent(ch).empty());
    CHECK_FALSE(ch.tick(5000));
    CHECK(drain_sent(ch).empty());

    NoteStr note, last;
    while (ch.get_note(note)) last = note;
    CHECK(std::string(last.c_str()) == "event=transition from=connected to=disconnected");

    ch.connect(6000);
    REQUIRE(ch.add_bytes(f.data(), f.size()));
    CHECK(ch.tick(6001));
    CHECK(ch.session().status_count == 1);
}

TEST_CASE("Message-first header revision is used on both directions") {
    ChannelConfig cfg = test_config();
    cfg.codec.header = HeaderLayout::message_first();
    Channel ch(cfg);
    ch.connect(0);

    std::vector<uint8_t> frame;
    REQUIRE(ch.get_message(frame));
    CHECK(wire::get_u32(frame.data(), 0) == msg_id::KEEP_ALIVE);
    CHECK(wire::get_u32(frame.data(), 16) == 0xC2);

    MessageHeader h;
    h.source_id = 0x0C;
    h.sequence_number = 1;
    SystemStatus s;
    std::vector<uint8_t> in = encode_message(h, s, cfg.codec);
    REQUIRE(ch.add_bytes(in.data(), in.size()));
    CHECK(ch.tick(1));
    CHECK(ch.session().status_count == 1);
}
