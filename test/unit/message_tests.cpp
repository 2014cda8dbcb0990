// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/error.hpp"
#include "network/message.hpp"
#include <cstring>
#include <random>
#include <vector>

using namespace bacnet;
using namespace bacnet::message;
using bacnet::network::Error;
using bacnet::network::ErrorKind;

namespace {

// Prepend a BVLC header with the correct length
std::vector<uint8_t> Frame(std::vector<uint8_t> body, uint8_t function = 0x0A) {
    std::vector<uint8_t> frame = {0x81, function, 0x00, 0x00};
    frame.insert(frame.end(), body.begin(), body.end());
    frame[2] = static_cast<uint8_t>(frame.size() >> 8);
    frame[3] = static_cast<uint8_t>(frame.size() & 0xFF);
    return frame;
}

DataLink DecodeBytes(const std::vector<uint8_t>& bytes) {
    return Decode(bytes.data(), bytes.size());
}

ErrorKind DecodeErrorKind(const std::vector<uint8_t>& bytes) {
    try {
        DecodeBytes(bytes);
    } catch (const Error& e) {
        return e.kind();
    }
    FAIL("decode unexpectedly succeeded");
    return ErrorKind::Io;
}

const Apdu& RequireApdu(const DataLink& frame) {
    const Apdu* apdu = GetApdu(frame);
    REQUIRE(apdu != nullptr);
    return *apdu;
}

} // namespace

// ============================================================================
// Object identifiers and values
// ============================================================================

TEST_CASE("ObjectId packs type and instance", "[codec][objectid]") {
    ObjectId ai(protocol::ObjectType::AnalogInput, 1);
    CHECK(ai.raw() == 0x00000001);

    ObjectId device(protocol::ObjectType::Device, 1234);
    CHECK(device.raw() == 0x020004D2);
    CHECK(ObjectId::from_raw(0x020004D2) == device);

    ObjectId max(protocol::MAX_OBJECT_TYPE, protocol::MAX_OBJECT_INSTANCE);
    CHECK(max.raw() == 0xFFFFFFFF);

    CHECK(device.to_string() == "device:1234");
    CHECK(ObjectId(200, 5).to_string() == "proprietary-200:5");
}

TEST_CASE("FormatValue renders every value kind", "[codec][format]") {
    CHECK(FormatValue(Null{}) == "null");
    CHECK(FormatValue(true) == "true");
    CHECK(FormatValue(uint32_t{42}) == "42");
    CHECK(FormatValue(int32_t{-7}) == "-7");
    CHECK(FormatValue(21.5f) == "21.5");
    CHECK(FormatValue(OctetString{0x01, 0xAB}) == "0x01ab");
    CHECK(FormatValue(std::string("lobby")) == "\"lobby\"");
    CHECK(FormatValue(Enumerated{3}) == "enumerated(3)");
    CHECK(FormatValue(ObjectId(protocol::ObjectType::AnalogValue, 3)) == "analog-value:3");

    SECTION("Bit strings list every used bit") {
        BitString flags;
        flags.unused_bits = 4;
        flags.bytes = {0x40}; // in-alarm=false, fault=true, overridden=false, out-of-service=false
        CHECK(flags.size() == 4);
        CHECK(FormatValue(flags) == "{false,true,false,false}");
    }

    SECTION("Dates and times with unspecified fields") {
        Date date{124, 5, 1, 3};
        CHECK(FormatValue(date) == "2024-05-01");
        CHECK(FormatValue(Date{}) == "*-*-*");

        Time time{13, 5, 9, 50};
        CHECK(FormatValue(time) == "13:05:09.50");
    }
}

// ============================================================================
// Request encoding
// ============================================================================

TEST_CASE("Encode ReadProperty request", "[codec][encode]") {
    ReadProperty rp;
    rp.object_id = ObjectId(protocol::ObjectType::AnalogInput, 1);
    rp.property_id = static_cast<uint32_t>(protocol::PropertyId::PresentValue);

    auto bytes = Encode(MakeConfirmedRequest(1, rp));
    std::vector<uint8_t> expected = {
        0x81, 0x0A, 0x00, 0x11,       // BVLC original-unicast, 17 bytes
        0x01, 0x04,                   // NPDU, expecting reply
        0x00, 0x05, 0x01, 0x0C,       // confirmed request, 1476 bytes, invoke 1, read-property
        0x0C, 0x00, 0x00, 0x00, 0x01, // [0] analog-input:1
        0x19, 0x55,                   // [1] present-value
    };
    CHECK(bytes == expected);

    SECTION("Array index is a third context tag") {
        rp.property_id = static_cast<uint32_t>(protocol::PropertyId::PriorityArray);
        rp.array_index = 0;
        auto indexed = Encode(MakeConfirmedRequest(1, rp));
        REQUIRE(indexed.size() == 19);
        CHECK(indexed[15] == 0x19);
        CHECK(indexed[16] == 0x57);
        CHECK(indexed[17] == 0x29);
        CHECK(indexed[18] == 0x00);
    }
}

TEST_CASE("Encode WriteProperty request", "[codec][encode]") {
    WriteProperty wp;
    wp.object_id = ObjectId(protocol::ObjectType::AnalogValue, 3);
    wp.values.push_back(21.5f);
    wp.priority = 8;

    auto bytes = Encode(MakeConfirmedRequest(2, wp));
    std::vector<uint8_t> expected = Frame({
        0x01, 0x04,
        0x00, 0x05, 0x02, 0x0F,
        0x0C, 0x00, 0x80, 0x00, 0x03,
        0x19, 0x55,
        0x3E, 0x44, 0x41, 0xAC, 0x00, 0x00, 0x3F, // {21.5}
        0x49, 0x08,                               // [4] priority 8
    });
    CHECK(bytes == expected);

    SECTION("Null relinquishes a priority slot") {
        wp.values = {Null{}};
        auto relinquish = Encode(MakeConfirmedRequest(2, wp));
        CHECK(relinquish[relinquish.size() - 5] == 0x3E);
        CHECK(relinquish[relinquish.size() - 4] == 0x00);
        CHECK(relinquish[relinquish.size() - 3] == 0x3F);
    }

    SECTION("Priority outside 1..16 is rejected") {
        wp.priority = 17;
        CHECK_THROWS_AS(Encode(MakeConfirmedRequest(2, wp)), Error);
        wp.priority = 0;
        CHECK_THROWS_AS(Encode(MakeConfirmedRequest(2, wp)), Error);
    }

    SECTION("A write needs a value") {
        wp.values.clear();
        CHECK_THROWS_AS(Encode(MakeConfirmedRequest(2, wp)), Error);
    }
}

TEST_CASE("Encode Who-Is", "[codec][encode]") {
    SECTION("Global broadcast") {
        auto bytes = Encode(MakeUnconfirmedRequest(WhoIs{}, true));
        std::vector<uint8_t> expected = {
            0x81, 0x0B, 0x00, 0x0C,             // original-broadcast
            0x01, 0x20, 0xFF, 0xFF, 0x00, 0xFF, // DNET 0xFFFF, DLEN 0, hop count 255
            0x10, 0x08,                         // unconfirmed who-is
        };
        CHECK(bytes == expected);
    }

    SECTION("Unicast") {
        auto bytes = Encode(MakeUnconfirmedRequest(WhoIs{}, false));
        std::vector<uint8_t> expected = {0x81, 0x0A, 0x00, 0x08, 0x01, 0x00, 0x10, 0x08};
        CHECK(bytes == expected);
    }

    SECTION("Instance range") {
        WhoIs ranged;
        ranged.low_limit = 10;
        ranged.high_limit = 300;
        auto bytes = Encode(MakeUnconfirmedRequest(ranged, false));
        std::vector<uint8_t> expected = Frame({0x01, 0x00, 0x10, 0x08, 0x09, 0x0A, 0x1A, 0x01, 0x2C});
        CHECK(bytes == expected);
    }

    SECTION("Half a range is rejected") {
        WhoIs half;
        half.low_limit = 10;
        CHECK_THROWS_AS(Encode(MakeUnconfirmedRequest(half, false)), Error);
    }
}

TEST_CASE("Application tag lengths", "[codec][encode]") {
    auto encode_value = [](ApplicationDataValue value) {
        WriteProperty wp;
        wp.object_id = ObjectId(protocol::ObjectType::AnalogValue, 0);
        wp.values.push_back(std::move(value));
        auto bytes = Encode(MakeConfirmedRequest(0, wp));
        // Strip header up to and including the opening tag 3, and the closing tag
        return std::vector<uint8_t>(bytes.begin() + 18, bytes.end() - 1);
    };

    CHECK(encode_value(uint32_t{0}) == std::vector<uint8_t>{0x21, 0x00});
    CHECK(encode_value(uint32_t{256}) == std::vector<uint8_t>{0x22, 0x01, 0x00});
    CHECK(encode_value(uint32_t{0x10000}) == std::vector<uint8_t>{0x23, 0x01, 0x00, 0x00});
    CHECK(encode_value(int32_t{-1}) == std::vector<uint8_t>{0x31, 0xFF});
    CHECK(encode_value(int32_t{-129}) == std::vector<uint8_t>{0x32, 0xFF, 0x7F});
    CHECK(encode_value(false) == std::vector<uint8_t>{0x10});
    CHECK(encode_value(true) == std::vector<uint8_t>{0x11});
    CHECK(encode_value(std::string("hello")) ==
          std::vector<uint8_t>{0x75, 0x06, 0x00, 'h', 'e', 'l', 'l', 'o'});

    SECTION("Lengths above 253 use the 16-bit escape") {
        auto bytes = encode_value(OctetString(300, 0xAA));
        REQUIRE(bytes.size() == 4 + 300);
        CHECK(bytes[0] == 0x65);
        CHECK(bytes[1] == 0xFE);
        CHECK(bytes[2] == 0x01);
        CHECK(bytes[3] == 0x2C);
    }
}

TEST_CASE("APDU longer than the maximum is not encoded", "[codec][encode]") {
    WriteProperty wp;
    wp.object_id = ObjectId(protocol::ObjectType::CharacterstringValue, 1);
    wp.values.push_back(std::string(protocol::MAX_APDU_LENGTH, 'x'));
    try {
        Encode(MakeConfirmedRequest(0, wp));
        FAIL("oversized APDU was encoded");
    } catch (const Error& e) {
        CHECK(e.kind() == ErrorKind::Codec);
    }
}

// ============================================================================
// Reply decoding
// ============================================================================

TEST_CASE("Decode I-Am", "[codec][decode]") {
    auto bytes = Frame({
        0x01, 0x00,
        0x10, 0x00,                   // unconfirmed i-am
        0xC4, 0x02, 0x00, 0x04, 0xD2, // device:1234
        0x22, 0x05, 0xC4,             // max apdu 1476
        0x91, 0x03,                   // segmentation none
        0x21, 0x0F,                   // vendor 15
    }, 0x0B);

    auto frame = DecodeBytes(bytes);
    CHECK(frame.function == protocol::bvlc::Function::OriginalBroadcastNpdu);
    const auto& request = std::get<UnconfirmedRequest>(RequireApdu(frame));
    const auto& i_am = std::get<IAm>(request.service);
    CHECK(i_am.device_id == ObjectId(protocol::ObjectType::Device, 1234));
    CHECK(i_am.max_apdu_length == 1476);
    CHECK(i_am.segmentation == protocol::Segmentation::None);
    CHECK(i_am.vendor_id == 15);

    SECTION("Forwarded through a BBMD") {
        std::vector<uint8_t> forwarded = {0x81, 0x04, 0x00, 0x00, 192, 168, 1, 20, 0xBA, 0xC0};
        forwarded.insert(forwarded.end(), bytes.begin() + 4, bytes.end());
        forwarded[3] = static_cast<uint8_t>(forwarded.size());
        auto f = DecodeBytes(forwarded);
        const auto& fr = std::get<UnconfirmedRequest>(RequireApdu(f));
        CHECK(std::get<IAm>(fr.service).device_id.instance == 1234);
    }

    SECTION("Routed I-Am carries its source network") {
        auto routed = Frame({
            0x01, 0x08, 0x00, 0x05, 0x01, 0x07, // SNET 5, SLEN 1, SADR 7
            0x10, 0x00, 0xC4, 0x02, 0x00, 0x04, 0xD2, 0x22, 0x05, 0xC4, 0x91, 0x03, 0x21, 0x0F,
        });
        auto f = DecodeBytes(routed);
        REQUIRE(f.npdu->source.has_value());
        CHECK(f.npdu->source->network == 5);
        CHECK(f.npdu->source->mac == std::vector<uint8_t>{0x07});
    }
}

TEST_CASE("Decode ReadProperty-ACK", "[codec][decode]") {
    auto bytes = Frame({
        0x01, 0x00,
        0x30, 0x01, 0x0C,             // complex ack, invoke 1, read-property
        0x0C, 0x00, 0x00, 0x00, 0x01, // analog-input:1
        0x19, 0x55,
        0x3E, 0x44, 0x41, 0xAC, 0x00, 0x00, 0x3F,
    });

    auto frame = DecodeBytes(bytes);
    const auto& ack = std::get<ComplexAck>(RequireApdu(frame));
    CHECK(ack.invoke_id == 1);
    CHECK(ack.service_choice() == 12);
    const auto& rp = std::get<ReadPropertyAck>(ack.service);
    CHECK(rp.object_id == ObjectId(protocol::ObjectType::AnalogInput, 1));
    CHECK(rp.property_id == 85);
    REQUIRE(rp.values.size() == 1);
    CHECK(std::get<float>(rp.values[0]) == 21.5f);

    SECTION("Decoded values do not alias the input") {
        auto copy = bytes;
        auto owned = DecodeBytes(copy);
        std::memset(copy.data(), 0, copy.size());
        const auto& v = std::get<ReadPropertyAck>(std::get<ComplexAck>(RequireApdu(owned)).service);
        CHECK(std::get<float>(v.values[0]) == 21.5f);
    }

    SECTION("ISO-8859-1 strings are converted to UTF-8") {
        auto latin = Frame({
            0x01, 0x00, 0x30, 0x01, 0x0C, 0x0C, 0x02, 0x00, 0x00, 0x01, 0x19, 0x4D,
            0x3E, 0x74, 0x05, 'c', 'a', 0xE9, 0x3F,
        });
        auto f = DecodeBytes(latin);
        const auto& v = std::get<ReadPropertyAck>(std::get<ComplexAck>(RequireApdu(f)).service);
        CHECK(std::get<std::string>(v.values[0]) == "ca\xC3\xA9");
    }
}

TEST_CASE("Decode ReadPropertyMultiple-ACK with a property error", "[codec][decode]") {
    auto bytes = Frame({
        0x01, 0x00,
        0x30, 0x07, 0x0E,
        0x0C, 0x00, 0x00, 0x00, 0x01, // analog-input:1
        0x1E,
        0x29, 0x55, 0x4E, 0x44, 0x41, 0xAC, 0x00, 0x00, 0x4F, // present-value = 21.5
        0x29, 0x1C, 0x5E, 0x91, 0x02, 0x91, 0x20, 0x5F,       // description: property/unknown-property
        0x1F,
    });

    auto frame = DecodeBytes(bytes);
    const auto& ack = std::get<ComplexAck>(RequireApdu(frame));
    const auto& rpm = std::get<ReadPropertyMultipleAck>(ack.service);
    REQUIRE(rpm.results.size() == 1);
    const auto& results = rpm.results[0].results;
    REQUIRE(results.size() == 2);
    CHECK(results[0].property_id == 85);
    CHECK(std::get<float>(results[0].values[0]) == 21.5f);
    CHECK_FALSE(results[0].error.has_value());
    CHECK(results[1].property_id == 28);
    REQUIRE(results[1].error.has_value());
    CHECK(results[1].error->error_class == 2);
    CHECK(results[1].error->error_code == 32);
}

TEST_CASE("Decode Error, Reject and Abort PDUs", "[codec][decode]") {
    SECTION("Error") {
        auto frame = DecodeBytes(Frame({0x01, 0x00, 0x50, 0x03, 0x0F, 0x91, 0x02, 0x91, 0x28}));
        const auto& error = std::get<ErrorPdu>(RequireApdu(frame));
        CHECK(error.invoke_id == 3);
        CHECK(error.service_choice == 15);
        CHECK(error.error_class == 2);
        CHECK(error.error_code == 40);
    }

    SECTION("Reject") {
        auto frame = DecodeBytes(Frame({0x01, 0x00, 0x60, 0x04, 0x09}));
        const auto& reject = std::get<RejectPdu>(RequireApdu(frame));
        CHECK(reject.invoke_id == 4);
        CHECK(reject.reason == 9);
    }

    SECTION("Abort from server") {
        auto frame = DecodeBytes(Frame({0x01, 0x00, 0x71, 0x05, 0x04}));
        const auto& abort = std::get<AbortPdu>(RequireApdu(frame));
        CHECK(abort.invoke_id == 5);
        CHECK(abort.reason == 4);
        CHECK(abort.from_server);
    }

    SECTION("SimpleAck") {
        auto frame = DecodeBytes(Frame({0x01, 0x00, 0x20, 0x06, 0x0F}));
        const auto& ack = std::get<SimpleAck>(RequireApdu(frame));
        CHECK(ack.invoke_id == 6);
        CHECK(ack.service_choice == 15);
    }
}

TEST_CASE("Unknown services keep their raw data", "[codec][decode]") {
    // unconfirmed i-have
    auto frame = DecodeBytes(Frame({0x01, 0x00, 0x10, 0x01, 0xAA, 0xBB}));
    const auto& request = std::get<UnconfirmedRequest>(RequireApdu(frame));
    const auto& unknown = std::get<UnknownService>(request.service);
    CHECK(unknown.service_choice == 1);
    CHECK(unknown.data == std::vector<uint8_t>{0xAA, 0xBB});
    CHECK(request.service_choice() == 1);
}

TEST_CASE("Frames without an APDU", "[codec][decode]") {
    SECTION("Network layer message") {
        auto frame = DecodeBytes(Frame({0x01, 0x80, 0x01, 0x00, 0x05}));
        REQUIRE(frame.npdu.has_value());
        CHECK(frame.npdu->network_message_type == uint8_t{0x01});
        CHECK(GetApdu(frame) == nullptr);
    }

    SECTION("BVLC result") {
        auto frame = DecodeBytes({0x81, 0x00, 0x00, 0x06, 0x00, 0x00});
        CHECK_FALSE(frame.npdu.has_value());
        CHECK(GetApdu(frame) == nullptr);
    }
}

// ============================================================================
// Malformed input
// ============================================================================

TEST_CASE("Malformed frames are codec errors", "[codec][decode][malformed]") {
    SECTION("Empty datagram") {
        CHECK(DecodeErrorKind({}) == ErrorKind::Codec);
    }

    SECTION("Not a BACnet/IP frame") {
        CHECK(DecodeErrorKind({0x82, 0x0A, 0x00, 0x06, 0x01, 0x00}) == ErrorKind::Codec);
    }

    SECTION("BVLC length larger than the datagram") {
        CHECK(DecodeErrorKind({0x81, 0x0A, 0x00, 0x20, 0x01, 0x00}) == ErrorKind::Codec);
    }

    SECTION("Unsupported NPDU version") {
        CHECK(DecodeErrorKind(Frame({0x02, 0x00, 0x20, 0x01, 0x0F})) == ErrorKind::Codec);
    }

    SECTION("Truncated ReadProperty-ACK") {
        std::vector<uint8_t> body = {
            0x01, 0x00, 0x30, 0x01, 0x0C, 0x0C, 0x00, 0x00, 0x00, 0x01, 0x19, 0x55,
            0x3E, 0x44, 0x41, 0xAC, 0x00, 0x00, 0x3F,
        };
        for (size_t cut = 1; cut < body.size(); ++cut) {
            std::vector<uint8_t> truncated(body.begin(), body.begin() + static_cast<long>(cut));
            INFO("cut at " << cut);
            CHECK(DecodeErrorKind(Frame(truncated)) == ErrorKind::Codec);
        }
    }

    SECTION("Segmented ComplexAck") {
        CHECK(DecodeErrorKind(Frame({0x01, 0x00, 0x3C, 0x01, 0x00, 0x04, 0x0C, 0x0C})) ==
              ErrorKind::Codec);
    }

    SECTION("Segment-ACK") {
        CHECK(DecodeErrorKind(Frame({0x01, 0x00, 0x40, 0x01, 0x00, 0x04})) == ErrorKind::Codec);
    }

    SECTION("Constructed property value") {
        CHECK(DecodeErrorKind(Frame({
                  0x01, 0x00, 0x30, 0x01, 0x0C, 0x0C, 0x00, 0x00, 0x00, 0x01, 0x19, 0x55,
                  0x3E, 0x0E, 0x21, 0x01, 0x0F, 0x3F,
              })) == ErrorKind::Codec);
    }

    SECTION("Unsupported character set") {
        CHECK(DecodeErrorKind(Frame({
                  0x01, 0x00, 0x30, 0x01, 0x0C, 0x0C, 0x00, 0x00, 0x00, 0x01, 0x19, 0x4D,
                  0x3E, 0x73, 0x04, 0x00, 0x41, 0x3F,
              })) == ErrorKind::Codec);
    }

    SECTION("Unsigned wider than 32 bits") {
        CHECK(DecodeErrorKind(Frame({
                  0x01, 0x00, 0x30, 0x01, 0x0C, 0x0C, 0x00, 0x00, 0x00, 0x01, 0x19, 0x55,
                  0x3E, 0x25, 0x05, 0x01, 0x02, 0x03, 0x04, 0x05, 0x3F,
              })) == ErrorKind::Codec);
    }

    SECTION("I-Am with an out-of-range segmentation") {
        CHECK(DecodeErrorKind(Frame({
                  0x01, 0x00, 0x10, 0x00, 0xC4, 0x02, 0x00, 0x04, 0xD2, 0x22, 0x05, 0xC4,
                  0x91, 0x07, 0x21, 0x0F,
              })) == ErrorKind::Codec);
    }
}

// ============================================================================
// Request decoding (simulated devices)
// ============================================================================

TEST_CASE("Requests decode back to what was encoded", "[codec][decode]") {
    SECTION("ReadPropertyMultiple") {
        ReadPropertyMultiple rpm;
        ReadAccessSpecification spec;
        spec.object_id = ObjectId(protocol::ObjectType::BinaryValue, 7);
        spec.properties.push_back(PropertyReference{85, std::nullopt});
        spec.properties.push_back(PropertyReference{87, 3});
        rpm.specifications.push_back(spec);

        auto bytes = Encode(MakeConfirmedRequest(9, rpm));
        auto frame = DecodeBytes(bytes);
        const auto& request = std::get<ConfirmedRequest>(RequireApdu(frame));
        CHECK(request.invoke_id == 9);
        CHECK(std::get<ReadPropertyMultiple>(request.service) == rpm);
        CHECK(frame.npdu->expecting_reply);
    }

    SECTION("WriteProperty without priority") {
        WriteProperty wp;
        wp.object_id = ObjectId(protocol::ObjectType::BinaryOutput, 2);
        wp.values.push_back(Enumerated{1});

        auto frame = DecodeBytes(Encode(MakeConfirmedRequest(0, wp)));
        const auto& request = std::get<ConfirmedRequest>(RequireApdu(frame));
        const auto& decoded = std::get<WriteProperty>(request.service);
        CHECK(decoded == wp);
        CHECK_FALSE(decoded.priority.has_value());
    }

    SECTION("Empty ReadPropertyMultiple is rejected") {
        CHECK_THROWS_AS(Encode(MakeConfirmedRequest(0, ReadPropertyMultiple{})), Error);
    }
}

TEST_CASE("Corrupted datagrams decode or fail as codec errors", "[codec][decode][malformed]") {
    IAm i_am;
    i_am.device_id = ObjectId(protocol::ObjectType::Device, 4194);
    i_am.max_apdu_length = 1476;
    i_am.segmentation = protocol::Segmentation::None;
    i_am.vendor_id = 260;
    const std::vector<uint8_t> seed = Encode(MakeReply(Apdu(UnconfirmedRequest{i_am})));

    std::mt19937 rng(47808);
    std::uniform_int_distribution<int> byte(0, 255);

    auto decode = [](const std::vector<uint8_t>& datagram) {
        try {
            auto frame = Decode(datagram.data(), datagram.size());
            (void)GetApdu(frame);
        } catch (const Error& e) {
            CHECK(e.kind() == ErrorKind::Codec);
        }
    };

    // Flip bytes of a valid I-Am
    for (int round = 0; round < 2000; ++round) {
        std::vector<uint8_t> datagram = seed;
        int flips = 1 + round % 4;
        for (int i = 0; i < flips; ++i) {
            datagram[rng() % datagram.size()] = static_cast<uint8_t>(byte(rng));
        }
        decode(datagram);
    }

    // Random bytes behind a plausible BVLC header
    for (int round = 0; round < 2000; ++round) {
        std::vector<uint8_t> datagram(4 + rng() % 40);
        for (auto& b : datagram) {
            b = static_cast<uint8_t>(byte(rng));
        }
        datagram[0] = 0x81;
        datagram[1] = 0x0A;
        datagram[2] = 0x00;
        datagram[3] = static_cast<uint8_t>(datagram.size());
        decode(datagram);
    }
}
