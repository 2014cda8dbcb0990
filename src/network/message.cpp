#include "network/message.hpp"
#include "network/error.hpp"
#include "util/endian.hpp"
#include "util/logging.hpp"
#include <cstring>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace bacnet {
namespace message {

using network::Error;
using network::ErrorKind;
using protocol::ApplicationTag;

namespace {

[[noreturn]] void Fail(const std::string &what) {
  LOG_CODEC_TRACE("codec error: {}", what);
  throw Error(ErrorKind::Codec, what);
}

// ============================================================================
// Tag header (clause 20.2.1)
// ============================================================================

struct Tag {
  uint8_t number = 0;
  bool context = false;
  bool opening = false;
  bool closing = false;
  // Length for primitive data; the value itself for application Booleans
  uint32_t lvt = 0;
};

constexpr uint8_t TAG_CLASS_CONTEXT = 0x08;
constexpr uint8_t LVT_EXTENDED = 5;
constexpr uint8_t LVT_OPENING = 6;
constexpr uint8_t LVT_CLOSING = 7;
constexpr uint8_t EXTENDED_TAG_NUMBER = 0x0F;

// Character sets of CharacterString (clause 20.2.9)
constexpr uint8_t CHARSET_UTF8 = 0;
constexpr uint8_t CHARSET_ISO_8859_1 = 5;

size_t UnsignedLength(uint32_t value) {
  if (value < 0x100)
    return 1;
  if (value < 0x10000)
    return 2;
  if (value < 0x1000000)
    return 3;
  return 4;
}

size_t SignedLength(int32_t value) {
  if (value >= -128 && value <= 127)
    return 1;
  if (value >= -32768 && value <= 32767)
    return 2;
  if (value >= -8388608 && value <= 8388607)
    return 3;
  return 4;
}

/**
 * Serialization buffer for building wire-format frames (big-endian)
 */
class MessageSerializer {
public:
  MessageSerializer() { buffer_.reserve(protocol::BUFFER_SIZE); }

  void write_uint8(uint8_t value) { buffer_.push_back(value); }

  void write_uint16(uint16_t value) {
    size_t pos = buffer_.size();
    buffer_.resize(pos + 2);
    endian::WriteBE16(buffer_.data() + pos, value);
  }

  void write_uint32(uint32_t value) {
    size_t pos = buffer_.size();
    buffer_.resize(pos + 4);
    endian::WriteBE32(buffer_.data() + pos, value);
  }

  void write_bytes(const uint8_t *data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
  }

  void write_bytes(const std::vector<uint8_t> &data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
  }

  void patch_uint16(size_t pos, uint16_t value) {
    endian::WriteBE16(buffer_.data() + pos, value);
  }

  void write_tag(uint8_t number, bool context, uint32_t lvt) {
    uint8_t first = context ? TAG_CLASS_CONTEXT : 0;
    bool extended_number = number >= EXTENDED_TAG_NUMBER;
    first |= extended_number ? 0xF0 : static_cast<uint8_t>(number << 4);

    if (lvt < LVT_EXTENDED) {
      write_uint8(first | static_cast<uint8_t>(lvt));
      if (extended_number)
        write_uint8(number);
      return;
    }

    write_uint8(first | LVT_EXTENDED);
    if (extended_number)
      write_uint8(number);
    if (lvt <= 253) {
      write_uint8(static_cast<uint8_t>(lvt));
    } else if (lvt <= 0xFFFF) {
      write_uint8(254);
      write_uint16(static_cast<uint16_t>(lvt));
    } else {
      write_uint8(255);
      write_uint32(lvt);
    }
  }

  void write_opening_tag(uint8_t number) { write_delimiter(number, LVT_OPENING); }
  void write_closing_tag(uint8_t number) { write_delimiter(number, LVT_CLOSING); }

  void write_context_unsigned(uint8_t number, uint32_t value) {
    size_t len = UnsignedLength(value);
    write_tag(number, true, static_cast<uint32_t>(len));
    write_unsigned_content(value, len);
  }

  void write_context_object_id(uint8_t number, const ObjectId &id) {
    check_object_id(id);
    write_tag(number, true, 4);
    write_uint32(id.raw());
  }

  void write_application_unsigned(uint32_t value) {
    size_t len = UnsignedLength(value);
    write_tag(static_cast<uint8_t>(ApplicationTag::UnsignedInt), false, static_cast<uint32_t>(len));
    write_unsigned_content(value, len);
  }

  void write_application_enumerated(uint32_t value) {
    size_t len = UnsignedLength(value);
    write_tag(static_cast<uint8_t>(ApplicationTag::Enumerated), false, static_cast<uint32_t>(len));
    write_unsigned_content(value, len);
  }

  void write_application_value(const ApplicationDataValue &value) {
    std::visit([this](const auto &v) { write_value(v); }, value);
  }

  const std::vector<uint8_t> &data() const { return buffer_; }
  size_t size() const { return buffer_.size(); }

private:
  void write_delimiter(uint8_t number, uint8_t kind) {
    if (number >= EXTENDED_TAG_NUMBER) {
      write_uint8(0xF0 | TAG_CLASS_CONTEXT | kind);
      write_uint8(number);
    } else {
      write_uint8(static_cast<uint8_t>(number << 4) | TAG_CLASS_CONTEXT | kind);
    }
  }

  void write_unsigned_content(uint32_t value, size_t len) {
    for (size_t i = len; i > 0; --i) {
      write_uint8(static_cast<uint8_t>(value >> (8 * (i - 1))));
    }
  }

  void write_app_tag(ApplicationTag tag, size_t len) {
    write_tag(static_cast<uint8_t>(tag), false, static_cast<uint32_t>(len));
  }

  static void check_object_id(const ObjectId &id) {
    if (id.type > protocol::MAX_OBJECT_TYPE || id.instance > protocol::MAX_OBJECT_INSTANCE) {
      Fail("object identifier out of range: " + id.to_string());
    }
  }

  void write_value(const Null &) { write_app_tag(ApplicationTag::Null, 0); }

  void write_value(bool v) { write_app_tag(ApplicationTag::Boolean, v ? 1 : 0); }

  void write_value(uint32_t v) { write_application_unsigned(v); }

  void write_value(int32_t v) {
    size_t len = SignedLength(v);
    write_app_tag(ApplicationTag::SignedInt, len);
    write_unsigned_content(static_cast<uint32_t>(v), len);
  }

  void write_value(float v) {
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    write_app_tag(ApplicationTag::Real, 4);
    write_uint32(bits);
  }

  void write_value(double v) {
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    write_app_tag(ApplicationTag::Double, 8);
    size_t pos = buffer_.size();
    buffer_.resize(pos + 8);
    endian::WriteBE64(buffer_.data() + pos, bits);
  }

  void write_value(const OctetString &v) {
    write_app_tag(ApplicationTag::OctetString, v.size());
    write_bytes(v);
  }

  void write_value(const std::string &v) {
    write_app_tag(ApplicationTag::CharacterString, v.size() + 1);
    write_uint8(CHARSET_UTF8);
    write_bytes(reinterpret_cast<const uint8_t *>(v.data()), v.size());
  }

  void write_value(const BitString &v) {
    if (v.unused_bits > 7 || (v.bytes.empty() && v.unused_bits != 0)) {
      Fail("invalid bit string");
    }
    write_app_tag(ApplicationTag::BitString, v.bytes.size() + 1);
    write_uint8(v.unused_bits);
    write_bytes(v.bytes);
  }

  void write_value(const Enumerated &v) { write_application_enumerated(v.value); }

  void write_value(const Date &v) {
    write_app_tag(ApplicationTag::Date, 4);
    write_uint8(v.year_since_1900);
    write_uint8(v.month);
    write_uint8(v.day);
    write_uint8(v.weekday);
  }

  void write_value(const Time &v) {
    write_app_tag(ApplicationTag::Time, 4);
    write_uint8(v.hour);
    write_uint8(v.minute);
    write_uint8(v.second);
    write_uint8(v.hundredths);
  }

  void write_value(const ObjectId &v) {
    check_object_id(v);
    write_app_tag(ApplicationTag::ObjectIdentifier, 4);
    write_uint32(v.raw());
  }

  std::vector<uint8_t> buffer_;
};

/**
 * Deserialization cursor for parsing wire-format frames
 *
 * Every read checks the remaining length and fails with a Codec error on
 * truncation; values are copied out, never referenced.
 */
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t *data, size_t size)
      : data_(data), size_(size), position_(0) {}

  uint8_t read_uint8() {
    check_available(1);
    return data_[position_++];
  }

  uint16_t read_uint16() {
    check_available(2);
    uint16_t value = endian::ReadBE16(data_ + position_);
    position_ += 2;
    return value;
  }

  uint32_t read_uint32() {
    check_available(4);
    uint32_t value = endian::ReadBE32(data_ + position_);
    position_ += 4;
    return value;
  }

  uint64_t read_uint64() {
    check_available(8);
    uint64_t value = endian::ReadBE64(data_ + position_);
    position_ += 8;
    return value;
  }

  std::vector<uint8_t> read_bytes(size_t count) {
    check_available(count);
    std::vector<uint8_t> out(data_ + position_, data_ + position_ + count);
    position_ += count;
    return out;
  }

  void skip(size_t count) {
    check_available(count);
    position_ += count;
  }

  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }
  bool at_end() const { return position_ >= size_; }

  Tag read_tag() {
    uint8_t first = read_uint8();
    Tag tag;
    tag.number = first >> 4;
    tag.context = (first & TAG_CLASS_CONTEXT) != 0;
    if (tag.number == EXTENDED_TAG_NUMBER) {
      tag.number = read_uint8();
    }

    uint8_t low = first & 0x07;
    if (low == LVT_OPENING || low == LVT_CLOSING) {
      if (!tag.context) {
        Fail("invalid application tag header");
      }
      tag.opening = low == LVT_OPENING;
      tag.closing = low == LVT_CLOSING;
      return tag;
    }

    if (low == LVT_EXTENDED) {
      uint8_t ext = read_uint8();
      if (ext == 254) {
        tag.lvt = read_uint16();
      } else if (ext == 255) {
        tag.lvt = read_uint32();
      } else {
        tag.lvt = ext;
      }
    } else {
      tag.lvt = low;
    }
    return tag;
  }

  Tag peek_tag() {
    size_t saved = position_;
    Tag tag = read_tag();
    position_ = saved;
    return tag;
  }

  bool peek_context(uint8_t number) {
    if (at_end())
      return false;
    Tag tag = peek_tag();
    return tag.context && !tag.opening && !tag.closing && tag.number == number;
  }

  bool peek_opening(uint8_t number) {
    if (at_end())
      return false;
    Tag tag = peek_tag();
    return tag.opening && tag.number == number;
  }

  bool peek_closing(uint8_t number) {
    if (at_end())
      return false;
    Tag tag = peek_tag();
    return tag.closing && tag.number == number;
  }

  void expect_opening(uint8_t number) {
    Tag tag = read_tag();
    if (!tag.opening || tag.number != number) {
      Fail("expected opening tag " + std::to_string(number));
    }
  }

  void expect_closing(uint8_t number) {
    Tag tag = read_tag();
    if (!tag.closing || tag.number != number) {
      Fail("expected closing tag " + std::to_string(number));
    }
  }

  uint32_t read_context_unsigned(uint8_t number) {
    Tag tag = read_tag();
    if (!tag.context || tag.opening || tag.closing || tag.number != number) {
      Fail("expected context tag " + std::to_string(number));
    }
    return read_unsigned_content(tag.lvt);
  }

  std::optional<uint32_t> read_optional_context_unsigned(uint8_t number) {
    if (!peek_context(number)) {
      return std::nullopt;
    }
    return read_context_unsigned(number);
  }

  ObjectId read_context_object_id(uint8_t number) {
    Tag tag = read_tag();
    if (!tag.context || tag.opening || tag.closing || tag.number != number || tag.lvt != 4) {
      Fail("expected object identifier in context tag " + std::to_string(number));
    }
    return ObjectId::from_raw(read_uint32());
  }

  uint32_t read_application_unsigned() {
    auto value = read_application_value();
    if (auto *v = std::get_if<uint32_t>(&value)) {
      return *v;
    }
    Fail("expected application unsigned");
  }

  uint32_t read_application_enumerated() {
    auto value = read_application_value();
    if (auto *v = std::get_if<Enumerated>(&value)) {
      return v->value;
    }
    Fail("expected application enumerated");
  }

  ObjectId read_application_object_id() {
    auto value = read_application_value();
    if (auto *v = std::get_if<ObjectId>(&value)) {
      return *v;
    }
    Fail("expected application object identifier");
  }

  ApplicationDataValue read_application_value() {
    Tag tag = read_tag();
    if (tag.context) {
      Fail("constructed or context-tagged values are not supported (tag " +
           std::to_string(tag.number) + ")");
    }

    switch (static_cast<ApplicationTag>(tag.number)) {
    case ApplicationTag::Null:
      if (tag.lvt != 0)
        Fail("invalid null length");
      return Null{};
    case ApplicationTag::Boolean:
      if (tag.lvt > 1)
        Fail("invalid boolean value");
      return tag.lvt == 1;
    case ApplicationTag::UnsignedInt:
      return read_unsigned_content(tag.lvt);
    case ApplicationTag::SignedInt:
      return read_signed_content(tag.lvt);
    case ApplicationTag::Real: {
      if (tag.lvt != 4)
        Fail("invalid real length");
      uint32_t bits = read_uint32();
      float v;
      std::memcpy(&v, &bits, sizeof(v));
      return v;
    }
    case ApplicationTag::Double: {
      if (tag.lvt != 8)
        Fail("invalid double length");
      uint64_t bits = read_uint64();
      double v;
      std::memcpy(&v, &bits, sizeof(v));
      return v;
    }
    case ApplicationTag::OctetString:
      return read_bytes(tag.lvt);
    case ApplicationTag::CharacterString:
      return read_character_string(tag.lvt);
    case ApplicationTag::BitString: {
      if (tag.lvt < 1)
        Fail("invalid bit string length");
      BitString bits;
      bits.unused_bits = read_uint8();
      if (bits.unused_bits > 7 || (tag.lvt == 1 && bits.unused_bits != 0))
        Fail("invalid bit string unused bits");
      bits.bytes = read_bytes(tag.lvt - 1);
      return bits;
    }
    case ApplicationTag::Enumerated:
      return Enumerated{read_unsigned_content(tag.lvt)};
    case ApplicationTag::Date: {
      if (tag.lvt != 4)
        Fail("invalid date length");
      Date d;
      d.year_since_1900 = read_uint8();
      d.month = read_uint8();
      d.day = read_uint8();
      d.weekday = read_uint8();
      return d;
    }
    case ApplicationTag::Time: {
      if (tag.lvt != 4)
        Fail("invalid time length");
      Time t;
      t.hour = read_uint8();
      t.minute = read_uint8();
      t.second = read_uint8();
      t.hundredths = read_uint8();
      return t;
    }
    case ApplicationTag::ObjectIdentifier:
      if (tag.lvt != 4)
        Fail("invalid object identifier length");
      return ObjectId::from_raw(read_uint32());
    }
    Fail("unsupported application tag " + std::to_string(tag.number));
  }

  // Reads application values up to and including closing tag `number`
  std::vector<ApplicationDataValue> read_values_until_closing(uint8_t number) {
    std::vector<ApplicationDataValue> values;
    while (!peek_closing(number)) {
      if (at_end()) {
        Fail("missing closing tag " + std::to_string(number));
      }
      values.push_back(read_application_value());
    }
    expect_closing(number);
    return values;
  }

private:
  void check_available(size_t bytes) {
    if (bytes_remaining() < bytes) {
      Fail("truncated message (need " + std::to_string(bytes) + " bytes at offset " +
           std::to_string(position_) + ", have " + std::to_string(bytes_remaining()) + ")");
    }
  }

  uint32_t read_unsigned_content(uint32_t len) {
    if (len == 0 || len > 4) {
      Fail("unsigned value of " + std::to_string(len) + " octets not supported");
    }
    uint32_t value = 0;
    for (uint32_t i = 0; i < len; ++i) {
      value = (value << 8) | read_uint8();
    }
    return value;
  }

  int32_t read_signed_content(uint32_t len) {
    if (len == 0 || len > 4) {
      Fail("signed value of " + std::to_string(len) + " octets not supported");
    }
    // Sign-extend from the first octet
    uint32_t value = (read_uint8() & 0x80) ? 0xFFFFFFFFu : 0u;
    position_ -= 1;
    for (uint32_t i = 0; i < len; ++i) {
      value = (value << 8) | read_uint8();
    }
    return static_cast<int32_t>(value);
  }

  std::string read_character_string(uint32_t len) {
    if (len < 1)
      Fail("invalid character string length");
    uint8_t charset = read_uint8();
    std::vector<uint8_t> raw = read_bytes(len - 1);
    if (charset == CHARSET_UTF8) {
      return std::string(raw.begin(), raw.end());
    }
    if (charset == CHARSET_ISO_8859_1) {
      std::string out;
      out.reserve(raw.size());
      for (uint8_t c : raw) {
        if (c < 0x80) {
          out.push_back(static_cast<char>(c));
        } else {
          out.push_back(static_cast<char>(0xC0 | (c >> 6)));
          out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
      }
      return out;
    }
    Fail("unsupported character set " + std::to_string(charset));
  }

  const uint8_t *data_;
  size_t size_;
  size_t position_;
};

void RequireEnd(MessageDeserializer &in, const char *what) {
  if (!in.at_end()) {
    Fail(std::string("trailing bytes after ") + what);
  }
}

// ============================================================================
// Services
// ============================================================================

void EncodeService(MessageSerializer &out, const ReadProperty &rp) {
  out.write_context_object_id(0, rp.object_id);
  out.write_context_unsigned(1, rp.property_id);
  if (rp.array_index) {
    out.write_context_unsigned(2, *rp.array_index);
  }
}

ReadProperty DecodeReadProperty(MessageDeserializer &in) {
  ReadProperty rp;
  rp.object_id = in.read_context_object_id(0);
  rp.property_id = in.read_context_unsigned(1);
  rp.array_index = in.read_optional_context_unsigned(2);
  RequireEnd(in, "ReadProperty");
  return rp;
}

void EncodeService(MessageSerializer &out, const ReadPropertyMultiple &rpm) {
  if (rpm.specifications.empty()) {
    Fail("ReadPropertyMultiple needs at least one object");
  }
  for (const auto &spec : rpm.specifications) {
    if (spec.properties.empty()) {
      Fail("ReadPropertyMultiple needs at least one property per object");
    }
    out.write_context_object_id(0, spec.object_id);
    out.write_opening_tag(1);
    for (const auto &ref : spec.properties) {
      out.write_context_unsigned(0, ref.property_id);
      if (ref.array_index) {
        out.write_context_unsigned(1, *ref.array_index);
      }
    }
    out.write_closing_tag(1);
  }
}

ReadPropertyMultiple DecodeReadPropertyMultiple(MessageDeserializer &in) {
  ReadPropertyMultiple rpm;
  while (!in.at_end()) {
    ReadAccessSpecification spec;
    spec.object_id = in.read_context_object_id(0);
    in.expect_opening(1);
    while (!in.peek_closing(1)) {
      PropertyReference ref;
      ref.property_id = in.read_context_unsigned(0);
      ref.array_index = in.read_optional_context_unsigned(1);
      spec.properties.push_back(ref);
    }
    in.expect_closing(1);
    rpm.specifications.push_back(std::move(spec));
  }
  if (rpm.specifications.empty()) {
    Fail("empty ReadPropertyMultiple");
  }
  return rpm;
}

void EncodeService(MessageSerializer &out, const WriteProperty &wp) {
  if (wp.values.empty()) {
    Fail("WriteProperty needs a value");
  }
  if (wp.priority && (*wp.priority < protocol::MIN_PRIORITY || *wp.priority > protocol::MAX_PRIORITY)) {
    Fail("write priority must be between 1 and 16, got " + std::to_string(*wp.priority));
  }
  out.write_context_object_id(0, wp.object_id);
  out.write_context_unsigned(1, wp.property_id);
  if (wp.array_index) {
    out.write_context_unsigned(2, *wp.array_index);
  }
  out.write_opening_tag(3);
  for (const auto &value : wp.values) {
    out.write_application_value(value);
  }
  out.write_closing_tag(3);
  if (wp.priority) {
    out.write_context_unsigned(4, *wp.priority);
  }
}

WriteProperty DecodeWriteProperty(MessageDeserializer &in) {
  WriteProperty wp;
  wp.object_id = in.read_context_object_id(0);
  wp.property_id = in.read_context_unsigned(1);
  wp.array_index = in.read_optional_context_unsigned(2);
  in.expect_opening(3);
  wp.values = in.read_values_until_closing(3);
  if (auto priority = in.read_optional_context_unsigned(4)) {
    if (*priority < protocol::MIN_PRIORITY || *priority > protocol::MAX_PRIORITY) {
      Fail("invalid write priority " + std::to_string(*priority));
    }
    wp.priority = static_cast<uint8_t>(*priority);
  }
  RequireEnd(in, "WriteProperty");
  return wp;
}

void EncodeService(MessageSerializer &out, const WhoIs &who_is) {
  if (who_is.low_limit.has_value() != who_is.high_limit.has_value()) {
    Fail("Who-Is needs both range limits or neither");
  }
  if (who_is.low_limit) {
    out.write_context_unsigned(0, *who_is.low_limit);
    out.write_context_unsigned(1, *who_is.high_limit);
  }
}

WhoIs DecodeWhoIs(MessageDeserializer &in) {
  WhoIs who_is;
  if (!in.at_end()) {
    who_is.low_limit = in.read_context_unsigned(0);
    who_is.high_limit = in.read_context_unsigned(1);
  }
  RequireEnd(in, "Who-Is");
  return who_is;
}

void EncodeService(MessageSerializer &out, const IAm &i_am) {
  out.write_application_value(i_am.device_id);
  out.write_application_unsigned(i_am.max_apdu_length);
  out.write_application_enumerated(static_cast<uint32_t>(i_am.segmentation));
  out.write_application_unsigned(i_am.vendor_id);
}

IAm DecodeIAm(MessageDeserializer &in) {
  IAm i_am;
  i_am.device_id = in.read_application_object_id();
  i_am.max_apdu_length = in.read_application_unsigned();
  uint32_t segmentation = in.read_application_enumerated();
  if (segmentation > static_cast<uint32_t>(protocol::Segmentation::None)) {
    Fail("invalid segmentation value " + std::to_string(segmentation));
  }
  i_am.segmentation = static_cast<protocol::Segmentation>(segmentation);
  uint32_t vendor_id = in.read_application_unsigned();
  if (vendor_id > 0xFFFF) {
    Fail("vendor identifier out of range");
  }
  i_am.vendor_id = static_cast<uint16_t>(vendor_id);
  RequireEnd(in, "I-Am");
  return i_am;
}

void EncodeService(MessageSerializer &out, const ReadPropertyAck &ack) {
  out.write_context_object_id(0, ack.object_id);
  out.write_context_unsigned(1, ack.property_id);
  if (ack.array_index) {
    out.write_context_unsigned(2, *ack.array_index);
  }
  out.write_opening_tag(3);
  for (const auto &value : ack.values) {
    out.write_application_value(value);
  }
  out.write_closing_tag(3);
}

ReadPropertyAck DecodeReadPropertyAck(MessageDeserializer &in) {
  ReadPropertyAck ack;
  ack.object_id = in.read_context_object_id(0);
  ack.property_id = in.read_context_unsigned(1);
  ack.array_index = in.read_optional_context_unsigned(2);
  in.expect_opening(3);
  ack.values = in.read_values_until_closing(3);
  RequireEnd(in, "ReadProperty-ACK");
  return ack;
}

void EncodeService(MessageSerializer &out, const ReadPropertyMultipleAck &ack) {
  for (const auto &result : ack.results) {
    out.write_context_object_id(0, result.object_id);
    out.write_opening_tag(1);
    for (const auto &property : result.results) {
      out.write_context_unsigned(2, property.property_id);
      if (property.array_index) {
        out.write_context_unsigned(3, *property.array_index);
      }
      if (property.error) {
        out.write_opening_tag(5);
        out.write_application_enumerated(property.error->error_class);
        out.write_application_enumerated(property.error->error_code);
        out.write_closing_tag(5);
      } else {
        out.write_opening_tag(4);
        for (const auto &value : property.values) {
          out.write_application_value(value);
        }
        out.write_closing_tag(4);
      }
    }
    out.write_closing_tag(1);
  }
}

ReadPropertyMultipleAck DecodeReadPropertyMultipleAck(MessageDeserializer &in) {
  ReadPropertyMultipleAck ack;
  while (!in.at_end()) {
    ReadAccessResult result;
    result.object_id = in.read_context_object_id(0);
    in.expect_opening(1);
    while (!in.peek_closing(1)) {
      PropertyResult property;
      property.property_id = in.read_context_unsigned(2);
      property.array_index = in.read_optional_context_unsigned(3);
      if (in.peek_opening(4)) {
        in.expect_opening(4);
        property.values = in.read_values_until_closing(4);
      } else if (in.peek_opening(5)) {
        in.expect_opening(5);
        PropertyAccessError error;
        error.error_class = in.read_application_enumerated();
        error.error_code = in.read_application_enumerated();
        in.expect_closing(5);
        property.error = error;
      } else {
        Fail("expected property value or property access error");
      }
      result.results.push_back(std::move(property));
    }
    in.expect_closing(1);
    ack.results.push_back(std::move(result));
  }
  return ack;
}

void EncodeService(MessageSerializer &out, const UnknownService &unknown) {
  out.write_bytes(unknown.data);
}

UnknownService DecodeUnknown(MessageDeserializer &in, uint8_t service_choice) {
  UnknownService unknown;
  unknown.service_choice = service_choice;
  unknown.data = in.read_bytes(in.bytes_remaining());
  return unknown;
}

template <typename Variant>
void EncodeServiceVariant(MessageSerializer &out, const Variant &service) {
  std::visit([&out](const auto &s) { EncodeService(out, s); }, service);
}

// ============================================================================
// APDU
// ============================================================================

uint8_t PduHeader(protocol::apdu::PduType type, uint8_t flags = 0) {
  return static_cast<uint8_t>(static_cast<uint8_t>(type) << 4) | flags;
}

void EncodeApdu(MessageSerializer &out, const Apdu &apdu) {
  using protocol::apdu::PduType;
  std::visit(
      [&out](const auto &pdu) {
        using T = std::decay_t<decltype(pdu)>;
        if constexpr (std::is_same_v<T, ConfirmedRequest>) {
          out.write_uint8(PduHeader(PduType::ConfirmedRequest));
          out.write_uint8(pdu.max_apdu_code & 0x0F);
          out.write_uint8(pdu.invoke_id);
          out.write_uint8(pdu.service_choice());
          EncodeServiceVariant(out, pdu.service);
        } else if constexpr (std::is_same_v<T, UnconfirmedRequest>) {
          out.write_uint8(PduHeader(PduType::UnconfirmedRequest));
          out.write_uint8(pdu.service_choice());
          EncodeServiceVariant(out, pdu.service);
        } else if constexpr (std::is_same_v<T, SimpleAck>) {
          out.write_uint8(PduHeader(PduType::SimpleAck));
          out.write_uint8(pdu.invoke_id);
          out.write_uint8(pdu.service_choice);
        } else if constexpr (std::is_same_v<T, ComplexAck>) {
          out.write_uint8(PduHeader(PduType::ComplexAck));
          out.write_uint8(pdu.invoke_id);
          out.write_uint8(pdu.service_choice());
          EncodeServiceVariant(out, pdu.service);
        } else if constexpr (std::is_same_v<T, ErrorPdu>) {
          out.write_uint8(PduHeader(PduType::Error));
          out.write_uint8(pdu.invoke_id);
          out.write_uint8(pdu.service_choice);
          out.write_application_enumerated(pdu.error_class);
          out.write_application_enumerated(pdu.error_code);
        } else if constexpr (std::is_same_v<T, RejectPdu>) {
          out.write_uint8(PduHeader(PduType::Reject));
          out.write_uint8(pdu.invoke_id);
          out.write_uint8(pdu.reason);
        } else if constexpr (std::is_same_v<T, AbortPdu>) {
          out.write_uint8(PduHeader(PduType::Abort, pdu.from_server ? protocol::apdu::ABORT_FROM_SERVER : 0));
          out.write_uint8(pdu.invoke_id);
          out.write_uint8(pdu.reason);
        }
      },
      apdu);
}

Apdu DecodeApdu(MessageDeserializer &in) {
  using protocol::apdu::PduType;
  uint8_t first = in.read_uint8();
  auto type = static_cast<PduType>(first >> 4);

  switch (type) {
  case PduType::ConfirmedRequest: {
    if (first & protocol::apdu::SEGMENTED_MESSAGE) {
      Fail("segmented requests are not supported");
    }
    ConfirmedRequest request;
    request.max_apdu_code = in.read_uint8() & 0x0F;
    request.invoke_id = in.read_uint8();
    uint8_t service = in.read_uint8();
    switch (static_cast<protocol::ConfirmedService>(service)) {
    case protocol::ConfirmedService::ReadProperty:
      request.service = DecodeReadProperty(in);
      break;
    case protocol::ConfirmedService::ReadPropertyMultiple:
      request.service = DecodeReadPropertyMultiple(in);
      break;
    case protocol::ConfirmedService::WriteProperty:
      request.service = DecodeWriteProperty(in);
      break;
    default:
      request.service = DecodeUnknown(in, service);
      break;
    }
    return request;
  }
  case PduType::UnconfirmedRequest: {
    UnconfirmedRequest request;
    uint8_t service = in.read_uint8();
    switch (static_cast<protocol::UnconfirmedService>(service)) {
    case protocol::UnconfirmedService::IAm:
      request.service = DecodeIAm(in);
      break;
    case protocol::UnconfirmedService::WhoIs:
      request.service = DecodeWhoIs(in);
      break;
    default:
      request.service = DecodeUnknown(in, service);
      break;
    }
    return request;
  }
  case PduType::SimpleAck: {
    SimpleAck ack;
    ack.invoke_id = in.read_uint8();
    ack.service_choice = in.read_uint8();
    return ack;
  }
  case PduType::ComplexAck: {
    if (first & protocol::apdu::SEGMENTED_MESSAGE) {
      Fail("segmented responses are not supported");
    }
    ComplexAck ack;
    ack.invoke_id = in.read_uint8();
    uint8_t service = in.read_uint8();
    switch (static_cast<protocol::ConfirmedService>(service)) {
    case protocol::ConfirmedService::ReadProperty:
      ack.service = DecodeReadPropertyAck(in);
      break;
    case protocol::ConfirmedService::ReadPropertyMultiple:
      ack.service = DecodeReadPropertyMultipleAck(in);
      break;
    default:
      ack.service = DecodeUnknown(in, service);
      break;
    }
    return ack;
  }
  case PduType::SegmentAck:
    Fail("segmentation is not supported");
  case PduType::Error: {
    ErrorPdu error;
    error.invoke_id = in.read_uint8();
    error.service_choice = in.read_uint8();
    // Some services wrap the error in opening/closing tag 0
    bool wrapped = in.peek_opening(0);
    if (wrapped)
      in.expect_opening(0);
    error.error_class = in.read_application_enumerated();
    error.error_code = in.read_application_enumerated();
    if (wrapped)
      in.expect_closing(0);
    return error;
  }
  case PduType::Reject: {
    RejectPdu reject;
    reject.invoke_id = in.read_uint8();
    reject.reason = in.read_uint8();
    return reject;
  }
  case PduType::Abort: {
    AbortPdu abort;
    abort.from_server = (first & protocol::apdu::ABORT_FROM_SERVER) != 0;
    abort.invoke_id = in.read_uint8();
    abort.reason = in.read_uint8();
    return abort;
  }
  }
  Fail("unknown APDU type " + std::to_string(first >> 4));
}

// ============================================================================
// NPDU
// ============================================================================

void EncodeNpdu(MessageSerializer &out, const NetworkPdu &npdu) {
  namespace np = protocol::npdu;
  uint8_t control = static_cast<uint8_t>(npdu.priority) & np::PRIORITY_MASK;
  if (npdu.expecting_reply)
    control |= np::EXPECTING_REPLY;
  if (npdu.destination)
    control |= np::DESTINATION_SPECIFIED;
  if (npdu.source)
    control |= np::SOURCE_SPECIFIED;
  if (npdu.network_message_type)
    control |= np::NETWORK_LAYER_MESSAGE;

  out.write_uint8(np::VERSION);
  out.write_uint8(control);
  if (npdu.destination) {
    if (npdu.destination->mac.size() > 0xFF)
      Fail("destination address too long");
    out.write_uint16(npdu.destination->network);
    out.write_uint8(static_cast<uint8_t>(npdu.destination->mac.size()));
    out.write_bytes(npdu.destination->mac);
  }
  if (npdu.source) {
    if (npdu.source->mac.empty() || npdu.source->mac.size() > 0xFF)
      Fail("invalid source address length");
    out.write_uint16(npdu.source->network);
    out.write_uint8(static_cast<uint8_t>(npdu.source->mac.size()));
    out.write_bytes(npdu.source->mac);
  }
  if (npdu.destination) {
    out.write_uint8(npdu.hop_count);
  }

  if (npdu.network_message_type) {
    out.write_uint8(*npdu.network_message_type);
    return;
  }
  if (!npdu.apdu) {
    Fail("NPDU without APDU or network message");
  }

  size_t apdu_start = out.size();
  EncodeApdu(out, *npdu.apdu);
  if (out.size() - apdu_start > protocol::MAX_APDU_LENGTH) {
    Fail("APDU of " + std::to_string(out.size() - apdu_start) +
         " bytes exceeds the maximum of " + std::to_string(protocol::MAX_APDU_LENGTH));
  }
}

NetworkPdu DecodeNpdu(MessageDeserializer &in) {
  namespace np = protocol::npdu;
  NetworkPdu npdu;

  uint8_t version = in.read_uint8();
  if (version != np::VERSION) {
    Fail("unsupported NPDU version " + std::to_string(version));
  }
  uint8_t control = in.read_uint8();
  npdu.priority = static_cast<np::MessagePriority>(control & np::PRIORITY_MASK);
  npdu.expecting_reply = (control & np::EXPECTING_REPLY) != 0;

  if (control & np::DESTINATION_SPECIFIED) {
    NetworkAddress dst;
    dst.network = in.read_uint16();
    dst.mac = in.read_bytes(in.read_uint8());
    npdu.destination = std::move(dst);
  }
  if (control & np::SOURCE_SPECIFIED) {
    NetworkAddress src;
    src.network = in.read_uint16();
    uint8_t len = in.read_uint8();
    if (len == 0) {
      Fail("source address with zero length");
    }
    src.mac = in.read_bytes(len);
    npdu.source = std::move(src);
  }
  if (npdu.destination) {
    npdu.hop_count = in.read_uint8();
  }

  if (control & np::NETWORK_LAYER_MESSAGE) {
    uint8_t type = in.read_uint8();
    if (type >= 0x80) {
      in.read_uint16(); // vendor id of proprietary network messages
    }
    npdu.network_message_type = type;
    return npdu;
  }

  npdu.apdu = DecodeApdu(in);
  return npdu;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

std::string ObjectId::to_string() const {
  return protocol::ObjectTypeName(type) + ":" + std::to_string(instance);
}

std::string FormatValue(const ApplicationDataValue &value) {
  std::ostringstream oss;
  std::visit(
      [&oss](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) {
          oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, uint32_t> || std::is_same_v<T, int32_t>) {
          oss << v;
        } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
          oss << v;
        } else if constexpr (std::is_same_v<T, OctetString>) {
          oss << "0x" << std::hex << std::setfill('0');
          for (uint8_t b : v) {
            oss << std::setw(2) << static_cast<int>(b);
          }
        } else if constexpr (std::is_same_v<T, std::string>) {
          oss << '"' << v << '"';
        } else if constexpr (std::is_same_v<T, BitString>) {
          oss << '{';
          for (size_t i = 0; i < v.size(); ++i) {
            oss << (i ? "," : "") << (v.test(i) ? "true" : "false");
          }
          oss << '}';
        } else if constexpr (std::is_same_v<T, Enumerated>) {
          oss << "enumerated(" << v.value << ")";
        } else if constexpr (std::is_same_v<T, Date>) {
          auto field = [&oss](uint8_t f, int offset, int width) {
            if (f == 0xFF) {
              oss << '*';
            } else {
              oss << std::setw(width) << std::setfill('0') << (f + offset);
            }
          };
          field(v.year_since_1900, 1900, 4);
          oss << '-';
          field(v.month, 0, 2);
          oss << '-';
          field(v.day, 0, 2);
        } else if constexpr (std::is_same_v<T, Time>) {
          auto field = [&oss](uint8_t f) {
            if (f == 0xFF) {
              oss << "**";
            } else {
              oss << std::setw(2) << std::setfill('0') << static_cast<int>(f);
            }
          };
          field(v.hour);
          oss << ':';
          field(v.minute);
          oss << ':';
          field(v.second);
          oss << '.';
          field(v.hundredths);
        } else if constexpr (std::is_same_v<T, ObjectId>) {
          oss << v.to_string();
        }
      },
      value);
  return oss.str();
}

uint8_t ConfirmedRequest::service_choice() const {
  return std::visit(
      [](const auto &s) -> uint8_t {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, ReadProperty>) {
          return static_cast<uint8_t>(protocol::ConfirmedService::ReadProperty);
        } else if constexpr (std::is_same_v<T, ReadPropertyMultiple>) {
          return static_cast<uint8_t>(protocol::ConfirmedService::ReadPropertyMultiple);
        } else if constexpr (std::is_same_v<T, WriteProperty>) {
          return static_cast<uint8_t>(protocol::ConfirmedService::WriteProperty);
        } else {
          return s.service_choice;
        }
      },
      service);
}

uint8_t UnconfirmedRequest::service_choice() const {
  return std::visit(
      [](const auto &s) -> uint8_t {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, IAm>) {
          return static_cast<uint8_t>(protocol::UnconfirmedService::IAm);
        } else if constexpr (std::is_same_v<T, WhoIs>) {
          return static_cast<uint8_t>(protocol::UnconfirmedService::WhoIs);
        } else {
          return s.service_choice;
        }
      },
      service);
}

uint8_t ComplexAck::service_choice() const {
  return std::visit(
      [](const auto &s) -> uint8_t {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, ReadPropertyAck>) {
          return static_cast<uint8_t>(protocol::ConfirmedService::ReadProperty);
        } else if constexpr (std::is_same_v<T, ReadPropertyMultipleAck>) {
          return static_cast<uint8_t>(protocol::ConfirmedService::ReadPropertyMultiple);
        } else {
          return s.service_choice;
        }
      },
      service);
}

std::vector<uint8_t> Encode(const DataLink &frame) {
  using protocol::bvlc::Function;
  if (frame.function != Function::OriginalUnicastNpdu &&
      frame.function != Function::OriginalBroadcastNpdu) {
    Fail("only original unicast/broadcast NPDUs can be encoded");
  }
  if (!frame.npdu) {
    Fail("frame has no NPDU");
  }

  MessageSerializer out;
  out.write_uint8(protocol::bvlc::TYPE_BACNET_IP);
  out.write_uint8(static_cast<uint8_t>(frame.function));
  out.write_uint16(0); // length, patched below
  EncodeNpdu(out, *frame.npdu);
  out.patch_uint16(2, static_cast<uint16_t>(out.size()));
  return out.data();
}

DataLink Decode(const uint8_t *data, size_t size) {
  using protocol::bvlc::Function;
  MessageDeserializer in(data, size);

  uint8_t type = in.read_uint8();
  if (type != protocol::bvlc::TYPE_BACNET_IP) {
    Fail("not a BACnet/IP frame (type " + std::to_string(type) + ")");
  }
  DataLink frame;
  frame.function = static_cast<Function>(in.read_uint8());
  uint16_t length = in.read_uint16();
  if (length < protocol::bvlc::HEADER_SIZE || length > size) {
    Fail("invalid BVLC length " + std::to_string(length) + " for datagram of " +
         std::to_string(size) + " bytes");
  }

  // Only the BVLC length counts; anything after it is link padding
  MessageDeserializer body(data + protocol::bvlc::HEADER_SIZE,
                           length - protocol::bvlc::HEADER_SIZE);
  switch (frame.function) {
  case Function::ForwardedNpdu:
    body.skip(protocol::bvlc::FORWARDED_ADDRESS_SIZE);
    frame.npdu = DecodeNpdu(body);
    break;
  case Function::OriginalUnicastNpdu:
  case Function::OriginalBroadcastNpdu:
  case Function::DistributeBroadcastToNetwork:
    frame.npdu = DecodeNpdu(body);
    break;
  default:
    // BBMD / foreign-device management: no NPDU
    break;
  }
  return frame;
}

DataLink MakeConfirmedRequest(uint8_t invoke_id, ConfirmedServiceRequest request) {
  ConfirmedRequest apdu;
  apdu.invoke_id = invoke_id;
  apdu.service = std::move(request);

  NetworkPdu npdu;
  npdu.expecting_reply = true;
  npdu.apdu = std::move(apdu);

  DataLink frame;
  frame.function = protocol::bvlc::Function::OriginalUnicastNpdu;
  frame.npdu = std::move(npdu);
  return frame;
}

DataLink MakeUnconfirmedRequest(UnconfirmedServiceRequest request, bool broadcast) {
  NetworkPdu npdu;
  npdu.apdu = UnconfirmedRequest{std::move(request)};

  DataLink frame;
  if (broadcast) {
    frame.function = protocol::bvlc::Function::OriginalBroadcastNpdu;
    npdu.destination = NetworkAddress{protocol::npdu::GLOBAL_BROADCAST_NETWORK, {}};
    npdu.hop_count = protocol::npdu::DEFAULT_HOP_COUNT;
  } else {
    frame.function = protocol::bvlc::Function::OriginalUnicastNpdu;
  }
  frame.npdu = std::move(npdu);
  return frame;
}

DataLink MakeReply(Apdu apdu) {
  NetworkPdu npdu;
  npdu.apdu = std::move(apdu);

  DataLink frame;
  frame.function = protocol::bvlc::Function::OriginalUnicastNpdu;
  frame.npdu = std::move(npdu);
  return frame;
}

const Apdu *GetApdu(const DataLink &frame) {
  if (!frame.npdu || !frame.npdu->apdu) {
    return nullptr;
  }
  return &*frame.npdu->apdu;
}

} // namespace message
} // namespace bacnet
