/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Board-specific header for the Arduino Due (SAM3X8E).
 *
 * The main crystal is 12 MHz and a 32768 Hz crystal is fitted for the
 * slow clock.  The programming port is wired to the UART on PA8 and
 * PA9.  The amber "L" LED is on PB27.
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
constexpr bool led_active_low = false;

} // namespace board
} // namespace samcxx
#endif /* SAMCXX_BOARD_HPP */
