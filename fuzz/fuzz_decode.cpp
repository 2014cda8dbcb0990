// Fuzz target for BACnet/IP frame decoding
// Every datagram a discovery socket receives goes through message::Decode,
// so arbitrary input must either decode or throw a Codec error

#include "network/error.hpp"
#include "network/message.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace bacnet::message;
    using bacnet::network::Error;
    using bacnet::network::ErrorKind;

    DataLink frame;
    try {
        frame = Decode(data, size);
    } catch (const Error &e) {
        if (e.kind() != ErrorKind::Codec) {
            // Decoding never touches a socket - BUG!
            __builtin_trap();
        }
        return 0;
    }

    const Apdu *apdu = GetApdu(frame);
    if (!apdu) {
        return 0;
    }

    if (const auto *ack = std::get_if<ComplexAck>(apdu)) {
        if (const auto *rp = std::get_if<ReadPropertyAck>(&ack->service)) {
            // Decoded values must always be printable
            for (const auto &value : rp->values) {
                (void)FormatValue(value);
            }
        }
        return 0;
    }

    // I-Am is what discovery reports; our own encoding of it must decode
    // back to the same announcement
    const auto *request = std::get_if<UnconfirmedRequest>(apdu);
    const auto *i_am = request ? std::get_if<IAm>(&request->service) : nullptr;
    if (!i_am) {
        return 0;
    }

    IAm decoded;
    try {
        std::vector<uint8_t> encoded = Encode(MakeReply(Apdu(UnconfirmedRequest{*i_am})));
        DataLink again = Decode(encoded.data(), encoded.size());
        const auto &again_request = std::get<UnconfirmedRequest>(*GetApdu(again));
        decoded = std::get<IAm>(again_request.service);
    } catch (const Error &) {
        // Re-encoding a decoded I-Am failed - BUG!
        __builtin_trap();
    }

    if (!(decoded == *i_am)) {
        // I-Am changed during round-trip - BUG!
        __builtin_trap();
    }

    return 0;
}
