#include <doctest/doctest.h>
#include "radarlink/header.hpp"
#include "radarlink/byte_order.hpp"

#include <cstring>
#include <vector>

using namespace radarlink;

static MessageHeader sample_header() {
    MessageHeader h;
    h.source_id       = 0x11111111;
    h.message_id      = 0xCEF00403;
    h.message_length  = 44;
    h.time_tag        = 3600000;
    h.sequence_number = 7;
    return h;
}

TEST_CASE("ICD header layout puts source_id first, little-endian") {
    uint8_t buf[HEADER_SIZE];
    encode_header(sample_header(), HeaderLayout::icd(), buf);

    CHECK(buf[0] == 0x11);
    CHECK(buf[4] == 0x03);      // low byte of 0xCEF00403
    CHECK(buf[7] == 0xCE);
    CHECK(wire::get_u32(buf, 8) == 44);
    CHECK(wire::get_u32(buf, 12) == 3600000);
    CHECK(wire::get_u32(buf, 16) == 7);

    MessageHeader back;
    REQUIRE(decode_header(buf, sizeof(buf), HeaderLayout::icd(), back) == DecodeStatus::Ok);
    CHECK(back == sample_header());
    CHECK(back.declared_payload_size() == 24);
}

TEST_CASE("Message-first layout moves source_id to the tail") {
    uint8_t buf[HEADER_SIZE];
    encode_header(sample_header(), HeaderLayout::message_first(), buf);

    CHECK(wire::get_u32(buf, 0) == 0xCEF00403);
    CHECK(wire::get_u32(buf, 4) == 44);
    CHECK(wire::get_u32(buf, 16) == 0x11111111);
    CHECK(peek_message_length(buf, HeaderLayout::message_first()) == 44);

    MessageHeader wrong;
    REQUIRE(decode_header(buf, sizeof(buf), HeaderLayout::icd(), wrong) == DecodeStatus::Ok);
    CHECK(wrong.message_id != 0xCEF00403);
}

TEST_CASE("Fewer than 20 bytes is TooShort") {
    uint8_t buf[HEADER_SIZE] = {0};
    MessageHeader h;
    CHECK(decode_header(buf, 19, HeaderLayout::icd(), h) == DecodeStatus::TooShort);
    CHECK(decode_header(nullptr, 40, HeaderLayout::icd(), h) == DecodeStatus::TooShort);
    CHECK(decode_header(buf, 0, HeaderLayout::icd(), h) == DecodeStatus::TooShort);
}

TEST_CASE("check_length compares declared length with the bytes at hand") {
    MessageHeader h;
    h.message_length = 12;
    CHECK(check_length(h, 20) == HeaderCheck::LengthBelowHeader);
    h.message_length = 40;
    CHECK(check_length(h, 40) == HeaderCheck::Consistent);
    CHECK(check_length(h, 32) == HeaderCheck::LengthExceedsData);
    CHECK(check_length(h, 48) == HeaderCheck::LengthBelowData);
    CHECK(std::strcmp(to_string(HeaderCheck::LengthExceedsData), "length_exceeds_data") == 0);
}

TEST_CASE("Header revisions resolve by name") {
    HeaderLayout l = HeaderLayout::icd();
    REQUIRE(header_layout_by_name("message-first", l));
    CHECK(l.message_off == 0);
    REQUIRE(header_layout_by_name("icd-2135m-004", l));
    CHECK(l.source_off == 0);
    CHECK_FALSE(header_layout_by_name("icd-9", l));
    CHECK_FALSE(header_layout_by_name(nullptr, l));
}
