// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/der/parser.h"

#include "base/logging.h"

namespace trustpin {

namespace der {

namespace {

// Reads a DER length from |reader| into |length|. Returns false for the
// indefinite form and for any length that is not minimally encoded.
bool ReadLength(ByteReader* reader, size_t* length) {
  uint8_t length_first_byte;
  if (!reader->ReadByte(&length_first_byte))
    return false;

  if ((length_first_byte & 0x80) == 0) {
    // Short form: the length is the low 7 bits.
    *length = length_first_byte;
    return true;
  }

  // Long form: the low 7 bits give the number of subsequent length octets.
  // 0x80 by itself is the indefinite form, which DER forbids.
  size_t length_len = length_first_byte & 0x7f;
  if (length_len == 0 || length_len > sizeof(uint32_t))
    return false;

  uint32_t value = 0;
  for (size_t i = 0; i < length_len; ++i) {
    uint8_t length_byte;
    if (!reader->ReadByte(&length_byte))
      return false;
    // The first length octet may not be zero; that would not be minimal.
    if (i == 0 && length_byte == 0)
      return false;
    value = (value << 8) | length_byte;
  }

  // Lengths below 128 must use the short form.
  if (value < 0x80)
    return false;

  *length = value;
  return true;
}

}  // namespace

Parser::Parser() : input_(Input()), advance_len_(0) {}

Parser::Parser(const Input& input) : input_(input), advance_len_(0) {}

bool Parser::PeekTagAndValue(Tag* tag, Input* out) {
  ByteReader reader = input_;

  uint8_t tag_byte;
  if (!reader.ReadByte(&tag_byte))
    return false;
  // High tag number form (tag number 31 and above) is not supported.
  if ((tag_byte & kTagNumberMask) == kTagNumberMask)
    return false;

  size_t value_len;
  if (!ReadLength(&reader, &value_len))
    return false;

  size_t header_len = input_.BytesLeft() - reader.BytesLeft();
  if (!reader.ReadBytes(value_len, out))
    return false;

  advance_len_ = header_len + value_len;
  *tag = tag_byte;
  return true;
}

bool Parser::Advance() {
  if (advance_len_ == 0)
    return false;
  Input unused;
  bool ok = input_.ReadBytes(advance_len_, &unused);
  advance_len_ = 0;
  return ok;
}

bool Parser::HasMore() {
  return input_.HasMore();
}

bool Parser::ReadRawTLV(Input* out) {
  ByteReader start = input_;
  Tag tag;
  Input value;
  if (!PeekTagAndValue(&tag, &value))
    return false;
  if (!start.ReadBytes(advance_len_, out))
    return false;
  return Advance();
}

bool Parser::ReadTagAndValue(Tag* tag, Input* out) {
  if (!PeekTagAndValue(tag, out))
    return false;
  CHECK(Advance());
  return true;
}

bool Parser::ReadOptionalTag(Tag tag, Input* out, bool* present) {
  if (!HasMore()) {
    *present = false;
    return true;
  }
  Tag actual_tag;
  Input value;
  if (!PeekTagAndValue(&actual_tag, &value))
    return false;
  if (actual_tag == tag) {
    *present = true;
    *out = value;
    CHECK(Advance());
  } else {
    advance_len_ = 0;
    *present = false;
  }
  return true;
}

bool Parser::SkipOptionalTag(Tag tag, bool* present) {
  Input out;
  return ReadOptionalTag(tag, &out, present);
}

bool Parser::ReadTag(Tag tag, Input* out) {
  bool present;
  return ReadOptionalTag(tag, out, &present) && present;
}

bool Parser::SkipTag(Tag tag) {
  Input out;
  return ReadTag(tag, &out);
}

bool Parser::ReadConstructed(Tag tag, Parser* out) {
  if (!IsConstructed(tag))
    return false;
  Input data;
  if (!ReadTag(tag, &data))
    return false;
  *out = Parser(data);
  return true;
}

bool Parser::ReadSequence(Parser* out) {
  return ReadConstructed(kSequence, out);
}

}  // namespace der

}  // namespace trustpin
