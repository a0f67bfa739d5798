/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Board-specific header for host-based unit tests.
 *
 * Describes a SAM3X8E carrier with a 12 MHz main crystal and a
 * 32768 Hz slow crystal, matching the Arduino Due so tests exercise
 * the configuration most targets use.
 *
 * Pin | Role
 * :-- | :-----------
 *  8  | UART.URXD (PA8, peripheral A)
 *  9  | UART.UTXD (PA9, peripheral A)
 * 59  | LED0 (PB27)
 *
 * @file */

#ifndef SAMCXX_BOARD_HPP
#define SAMCXX_BOARD_HPP

namespace samcxx {
namespace board {

#define SAMCXX_BOARD_PSEL_LED0 59
#define SAMCXX_BOARD_PSEL_UART_URXD 8
#define SAMCXX_BOARD_PSEL_UART_UTXD 9

constexpr unsigned int main_xtal_Hz = 12'000'000;
constexpr bool has_slow_xtal = true;

} // namespace board
} // namespace samcxx
#endif /* SAMCXX_BOARD_HPP */
