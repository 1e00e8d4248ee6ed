/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>

namespace ledgersync::crypto {

  namespace constants::ed25519 {
    enum {
      PUBLIC_KEY_SIZE = 32,
      SIGNATURE_SIZE = 64,
    };
  }  // namespace constants::ed25519

  using PublicKey = std::array<uint8_t, constants::ed25519::PUBLIC_KEY_SIZE>;
  using Signature = std::array<uint8_t, constants::ed25519::SIGNATURE_SIZE>;

}  // namespace ledgersync::crypto
