// SPDX-License-Identifier: Apache-2.0
// Copyright 2018-2019 Peter A. Bigot

#include <samcxx/board.hpp>
#include <samcxx/clock.hpp>

namespace samcxx {
namespace board {

/* 12 MHz crystal x 14 = 168 MHz, halved to the 84 MHz ceiling. */
clock::tree_config
clock_config ()
{
  clock::tree_config config;
  config.master = clock::source_id::plla;
  config.reference = clock::source_id::main_xtal;
  config.main_Hz = main_xtal_Hz;
  config.pll_mul = 14;
  config.pll_div = 1;
  config.pll_div2 = true;
  config.prescaler = clock::prescaler_type::div1;
  config.slow_xtal = has_slow_xtal;
  return config;
}

} // ns board
} // ns samcxx
