/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace ledgersync::primitives {

  using Version = uint64_t;
  using Epoch = uint64_t;
  using Round = uint64_t;
  using VotingPower = uint64_t;

  constexpr size_t kHashSize = 32;
  constexpr size_t kAccountAddressSize = 32;

  using HashValue = std::array<uint8_t, kHashSize>;
  using AccountAddress = std::array<uint8_t, kAccountAddressSize>;

  /// Address of the framework account emitting reconfiguration events
  constexpr AccountAddress kCoreCodeAddress = [] {
    AccountAddress address{};
    address.back() = 0x01;
    return address;
  }();

}  // namespace ledgersync::primitives
