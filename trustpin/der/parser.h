// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_DER_PARSER_H_
#define TRUSTPIN_DER_PARSER_H_

#include <stdint.h>

#include "base/compiler_specific.h"
#include "base/macros.h"
#include "trustpin/base/trustpin_export.h"
#include "trustpin/der/input.h"
#include "trustpin/der/tag.h"

namespace trustpin {

namespace der {

// Parses a DER-encoded ASN.1 structure. DER (distinguished encoding rules)
// encodes each data value with a tag, length, and value (TLV). The tag
// indicates the type of the ASN.1 value. Depending on the type of the value,
// it could contain arbitrary bytes, so the length of the value is encoded
// after the tag and before the value to indicate how many bytes of value
// follow. DER also defines how the values are encoded for particular types.
//
// This Parser places a few restrictions on the DER encoding it can parse. The
// largest restriction is that it only supports tags which have a tag number
// no greater than 30 - these are the tags that fit in a single octet. The
// second restriction is that the maximum length for a value that can be parsed
// is 4GB. Both of these restrictions should be fine for any reasonable input.
//
// The Parser class is mainly focused on parsing the TLV structure of DER
// encoding, and does not handle parsing primitive values. When a Parser is
// created, it is passed in a reference to the encoded data. Because the
// encoded data is not owned by the Parser, the data cannot change during the
// lifespan of the Parser. The Parser functions by keeping a pointer to the
// current TLV which starts at the beginning of the input and advancing through
// the input as each TLV is read. As such, a Parser instance is thread-unsafe.
//
// Most methods for using the Parser write the current tag and/or value to
// the output parameters provided and then advance the input to the next TLV.
// None of the methods explicitly expose the length because it is part of the
// value. All methods return a boolean indicating whether there was a parsing
// error with the current TLV.
//
// The Parser also provides methods for handling constructed types: for
// example, ReadSequence() returns a Parser that can be used to read the
// elements of the sequence.
//
// Length encodings are held to DER: the indefinite form is rejected, the long
// form may not be used for lengths below 128, and long-form lengths may not
// carry leading zero octets.
class TRUSTPIN_EXPORT Parser {
 public:
  // Default constructor; equivalent to calling Parser(Input()). This only
  // exists so that a Parser can be stack allocated and passed in as an
  // out parameter.
  Parser();

  // Creates a parser to parse over the data represented by input. This class
  // assumes that the underlying data will not change over the lifetime of
  // the Parser object.
  explicit Parser(const Input& input);

  // Returns whether there is any more data left in the input to parse. This
  // does not guarantee that the data is parseable.
  bool HasMore();

  // Reads the current TLV from the input and advances. If the tag or length
  // encoding for the current value is invalid, this method returns false and
  // does not advance the input. Otherwise, it returns true, putting the
  // read tag in |tag| and the value in |out|.
  bool ReadTagAndValue(Tag* tag, Input* out) WARN_UNUSED_RESULT;

  // Reads the current TLV from the input and advances. Unlike ReadTagAndValue
  // where only the value is put in |out|, this puts the raw bytes from the
  // tag, length, and value in |out|.
  bool ReadRawTLV(Input* out) WARN_UNUSED_RESULT;

  // Basic methods for reading or skipping the current TLV, with an
  // expectation of what the current tag should be. It should be possible
  // to parse any structure with these 4 methods; convenience methods are also
  // provided to make some cases easier.

  // If the current tag in the input is |tag|, it puts the corresponding value
  // in |out|, sets |present| to true and advances the input to the next TLV.
  // If the current tag is something else, then |present| is set to false and
  // the input is not advanced. Like ReadTagAndValue, it returns false if the encoding is
  // invalid and does not advance the input.
  bool ReadOptionalTag(Tag tag,
                       Input* out,
                       bool* present) WARN_UNUSED_RESULT;

  // If the current tag in the input is |tag|, it advances the input to the
  // next TLV and sets |present| to true. If the current tag is something
  // else, then |present| is set to false and the input is not advanced. Like
  // ReadTagAndValue, it returns false if the encoding is invalid and does not
  // advance the input.
  bool SkipOptionalTag(Tag tag, bool* present) WARN_UNUSED_RESULT;

  // Reads the current TLV from the input, checks that the tag matches |tag|
  // and is a constructed tag, and creates a new Parser from the value.
  bool ReadConstructed(Tag tag, Parser* out) WARN_UNUSED_RESULT;

  // A more specific form of ReadConstructed that expects the current tag
  // to be 0x30 (SEQUENCE).
  bool ReadSequence(Parser* out) WARN_UNUSED_RESULT;

  // Reads the current TLV from the input. If the current tag doesn't match
  // |tag| or the encoding is invalid, returns false and does not advance.
  bool ReadTag(Tag tag, Input* out) WARN_UNUSED_RESULT;

  // Advances the input to the next TLV if the current tag matches |tag| and
  // the encoding is valid. Returns false otherwise.
  bool SkipTag(Tag tag) WARN_UNUSED_RESULT;

  // Reads the tag and value of the current TLV without advancing the input.
  bool PeekTagAndValue(Tag* tag, Input* out) WARN_UNUSED_RESULT;

 private:
  // Advances past the TLV that was last peeked. Must only be called after a
  // successful PeekTagAndValue().
  bool Advance();

  ByteReader input_;
  // Bytes taken up by the TLV last returned by PeekTagAndValue(); zero when
  // nothing has been peeked.
  size_t advance_len_;

  DISALLOW_COPY(Parser);
};

}  // namespace der

}  // namespace trustpin

#endif  // TRUSTPIN_DER_PARSER_H_
