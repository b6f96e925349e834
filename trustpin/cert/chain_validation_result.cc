// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/chain_validation_result.h"

namespace trustpin {

ChainValidationResult::ChainValidationResult() {
  Reset();
}

ChainValidationResult::ChainValidationResult(
    const ChainValidationResult& other) = default;

ChainValidationResult::~ChainValidationResult() = default;

ChainValidationResult& ChainValidationResult::operator=(
    const ChainValidationResult& other) = default;

void ChainValidationResult::Reset() {
  verified_chain.clear();
  cert_status = 0;
}

}  // namespace trustpin
