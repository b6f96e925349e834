// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/base64.h"

#include <stddef.h>
#include <stdint.h>

#include <openssl/evp.h>

#include "base/logging.h"

namespace base {

void Base64Encode(std::string_view input, std::string* output) {
  // EVP_EncodeBlock writes 4 output bytes for every 3 input bytes, plus a NUL.
  std::string temp((input.size() + 2) / 3 * 4 + 1, '\0');
  int output_size =
      EVP_EncodeBlock(reinterpret_cast<uint8_t*>(&temp[0]),
                      reinterpret_cast<const uint8_t*>(input.data()),
                      input.size());
  CHECK_GE(output_size, 0);
  temp.resize(static_cast<size_t>(output_size));
  output->swap(temp);
}

bool Base64Decode(std::string_view input, std::string* output) {
  // Mirror the strict decoder: whole quanta only, at most two '=' at the end.
  if (input.size() % 4 != 0)
    return false;
  size_t padding = 0;
  if (!input.empty() && input[input.size() - 1] == '=')
    ++padding;
  if (input.size() > 1 && input[input.size() - 2] == '=')
    ++padding;
  if (input.find('=') < input.size() - padding)
    return false;

  std::string temp(input.size() / 4 * 3, '\0');
  int output_size =
      EVP_DecodeBlock(reinterpret_cast<uint8_t*>(&temp[0]),
                      reinterpret_cast<const uint8_t*>(input.data()),
                      input.size());
  if (output_size < 0)
    return false;

  // EVP_DecodeBlock counts padding bytes as decoded zeros.
  DCHECK_GE(static_cast<size_t>(output_size), padding);
  temp.resize(static_cast<size_t>(output_size) - padding);
  output->swap(temp);
  return true;
}

}  // namespace base
