// SPDX-License-Identifier: Apache-2.0
// Copyright 2018-2019 Peter A. Bigot

#include <samcxx/board.hpp>
#include <samcxx/clock.hpp>

namespace samcxx {
namespace board {

/* The fast RC oscillator at its highest setting: no crystal start-up
 * delay in host tests that bring the board up. */
clock::tree_config
clock_config ()
{
  clock::tree_config config;
  config.master = clock::source_id::main_rc;
  config.main_Hz = 12'000'000;
  return config;
}

} // ns board
} // ns samcxx
