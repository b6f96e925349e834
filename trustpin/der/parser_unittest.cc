// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/der/parser.h"

#include "gtest/gtest.h"
#include "trustpin/der/input.h"

namespace trustpin {
namespace der {
namespace test {

TEST(ParserTest, ConsumesAllBytesOfTLV) {
  const uint8_t der[] = {0x04 /* OCTET STRING */, 0x00};
  Parser parser((Input(der)));
  Tag tag;
  Input value;
  ASSERT_TRUE(parser.ReadTagAndValue(&tag, &value));
  ASSERT_EQ(kOctetString, tag);
  ASSERT_FALSE(parser.HasMore());
}

TEST(ParserTest, CanReadRawTLV) {
  const uint8_t der[] = {0x02, 0x01, 0x01};
  Parser parser((Input(der)));
  Input tlv;
  ASSERT_TRUE(parser.ReadRawTLV(&tlv));
  ByteReader tlv_reader(tlv);
  size_t tlv_len = tlv_reader.BytesLeft();
  ASSERT_EQ(3u, tlv_len);
  Input tlv_data;
  ASSERT_TRUE(tlv_reader.ReadBytes(tlv_len, &tlv_data));
  ASSERT_FALSE(parser.HasMore());
}

TEST(ParserTest, IgnoresContentsOfInnerValues) {
  // This is a SEQUENCE which has one element in it, which has a tag of
  // SEQUENCE and value of 0x00.
  const uint8_t der[] = {0x30, 0x02, 0x30, 0x00};
  Parser parser((Input(der)));
  Tag tag;
  Input value;
  ASSERT_TRUE(parser.ReadTagAndValue(&tag, &value));
}

TEST(ParserTest, FailsIfLengthOverlapsAnotherTLV) {
  // This DER encoding has 2 top-level TLV tuples. The first is a SEQUENCE;
  // the second is an INTEGER. The SEQUENCE contains an INTEGER, but its
  // length is longer than what it has contents for.
  const uint8_t der[] = {0x30, 0x02, 0x02, 0x01, 0x02, 0x01, 0x01};
  Parser parser((Input(der)));

  Parser inner_sequence;
  ASSERT_TRUE(parser.ReadSequence(&inner_sequence));
  Input inner_value;
  ASSERT_FALSE(inner_sequence.ReadTag(kInteger, &inner_value));
  ASSERT_TRUE(parser.SkipTag(kInteger));
  ASSERT_FALSE(parser.HasMore());
}

TEST(ParserTest, ReadOptionalTagPresent) {
  // DER encoding of 2 top-level TLV values:
  // INTEGER { 1 }, OCTET STRING { `02` }
  const uint8_t der[] = {0x02, 0x01, 0x01, 0x04, 0x01, 0x02};
  Parser parser((Input(der)));

  Input value;
  bool present;
  ASSERT_TRUE(parser.ReadOptionalTag(kInteger, &value, &present));
  ASSERT_TRUE(present);
  const uint8_t expected_int_value[] = {0x01};
  ASSERT_EQ(Input(expected_int_value), value);

  Tag tag;
  ASSERT_TRUE(parser.ReadTagAndValue(&tag, &value));
  ASSERT_EQ(kOctetString, tag);
  const uint8_t expected_octet_string_value[] = {0x02};
  ASSERT_EQ(Input(expected_octet_string_value), value);

  ASSERT_FALSE(parser.HasMore());
}

TEST(ParserTest, ReadOptionalTagNotPresent) {
  // DER encoding of 1 top-level TLV value:
  // OCTET STRING { `02` }
  const uint8_t der[] = {0x04, 0x01, 0x02};
  Parser parser((Input(der)));

  Input value;
  bool present;
  ASSERT_TRUE(parser.ReadOptionalTag(kInteger, &value, &present));
  ASSERT_FALSE(present);

  Tag tag;
  ASSERT_TRUE(parser.ReadTagAndValue(&tag, &value));
  ASSERT_EQ(kOctetString, tag);
  ASSERT_FALSE(parser.HasMore());
}

TEST(ParserTest, ReadOptionalTagAtEndOfInput) {
  Parser parser;
  Input value;
  bool present = true;
  ASSERT_TRUE(parser.ReadOptionalTag(kInteger, &value, &present));
  ASSERT_FALSE(present);
}

TEST(ParserTest, AcceptsMinimalLongFormLength) {
  std::string der = "\x04\x81\x80";
  der.append(0x80, 'a');
  Parser parser((Input(&der)));
  Input value;
  ASSERT_TRUE(parser.ReadTag(kOctetString, &value));
  EXPECT_EQ(0x80u, value.Length());
  EXPECT_FALSE(parser.HasMore());
}

TEST(ParserTest, RejectsLongFormForShortLength) {
  // The length 1 must be encoded in the short form.
  const uint8_t der[] = {0x02, 0x81, 0x01, 0x01};
  Parser parser((Input(der)));
  Input value;
  EXPECT_FALSE(parser.ReadTag(kInteger, &value));
}

TEST(ParserTest, RejectsLengthWithLeadingZero) {
  std::string der("\x04\x82\x00\x80", 4);
  der.append(0x80, 'a');
  Parser parser((Input(&der)));
  Input value;
  EXPECT_FALSE(parser.ReadTag(kOctetString, &value));
}

TEST(ParserTest, RejectsIndefiniteLength) {
  const uint8_t der[] = {0x30, 0x80, 0x02, 0x01, 0x01, 0x00, 0x00};
  Parser parser((Input(der)));
  Parser sequence;
  EXPECT_FALSE(parser.ReadSequence(&sequence));
}

TEST(ParserTest, RejectsTooManyLengthOctets) {
  const uint8_t der[] = {0x04, 0x85, 0x01, 0x00, 0x00, 0x00, 0x00};
  Parser parser((Input(der)));
  Input value;
  EXPECT_FALSE(parser.ReadTag(kOctetString, &value));
}

TEST(ParserTest, RejectsHighTagNumberForm) {
  const uint8_t der[] = {0x1f, 0x1f, 0x01, 0x00};
  Parser parser((Input(der)));
  Tag tag;
  Input value;
  EXPECT_FALSE(parser.ReadTagAndValue(&tag, &value));
}

TEST(ParserTest, RejectsTruncatedValue) {
  const uint8_t der[] = {0x04, 0x05, 0x01, 0x02};
  Parser parser((Input(der)));
  Input value;
  EXPECT_FALSE(parser.ReadTag(kOctetString, &value));
}

TEST(ParserTest, ReadConstructedFailsForPrimitiveTag) {
  const uint8_t der[] = {0x02, 0x01, 0x01};
  Parser parser((Input(der)));
  Parser inner;
  EXPECT_FALSE(parser.ReadConstructed(kInteger, &inner));
}

TEST(ParserTest, ReadConstructedContextSpecific) {
  // [0] { INTEGER 2 }
  const uint8_t der[] = {0xa0, 0x03, 0x02, 0x01, 0x02};
  Parser parser((Input(der)));
  Parser inner;
  ASSERT_TRUE(parser.ReadConstructed(ContextSpecificConstructed(0), &inner));
  Input value;
  ASSERT_TRUE(inner.ReadTag(kInteger, &value));
  EXPECT_FALSE(inner.HasMore());
  EXPECT_FALSE(parser.HasMore());
}

}  // namespace test
}  // namespace der
}  // namespace trustpin
