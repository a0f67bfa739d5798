// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2015-2019 Peter A. Bigot

/** Demonstrate pin ownership and peripheral clock gating.
 *
 * Hands the UART pins to the UART, shows that a second claimant is
 * refused, then blinks the board LED as a GPIO output owned by the
 * PIO controller it sits on. */

#include <samcxx/board.hpp>
#include <samcxx/clock.hpp>
#include <samcxx/gpio.hpp>
#include <samcxx/periph.hpp>
#include <samcxx/console/cstdio.hpp>

int
main (void)
{
  using namespace samcxx;

  csetvbuf();
  cputs("\n\n" __FILE__ " " __DATE__ " " __TIME__);

  hw::poll_counter ticks;
  clock::sequencer seq{hw::pmc(), hw::supc(), hw::efc(), ticks};
  auto rc = board::initialize(seq);
  cprintf("clock %s at %u Hz (%d)\n",
          clock::sequencer::state_name(seq.state()), seq.master_Hz(), rc);

  periph::gate gate{hw::pmc()};
  gpio::registry pins{hw::pio()};

  rc = gate.enable(periph::id::PIOA);
  cprintf("PIOA gate %d\n", rc);
  rc = gate.enable(periph::id::UART);
  cprintf("UART gate %d enabled %d\n", rc, gate.enabled(periph::id::UART));
  rc = pins.claim(SAMCXX_BOARD_PSEL_UART_URXD, gpio::function_type::periph_a, periph::id::UART);
  cprintf("URXD claim %d\n", rc);
  rc = pins.claim(SAMCXX_BOARD_PSEL_UART_UTXD, gpio::function_type::periph_a, periph::id::UART);
  cprintf("UTXD claim %d\n", rc);

  rc = pins.claim(SAMCXX_BOARD_PSEL_UART_UTXD, gpio::function_type::gpio_output, periph::id::USART0);
  cprintf("USART0 claim of UTXD %d (%x), owner %d\n", rc,
          gpio::registry::error_decoded(rc), pins.owner(SAMCXX_BOARD_PSEL_UART_UTXD));

  auto const led_owner = periph::id::PIOB;
  rc = gate.enable(led_owner);
  if (0 == rc) {
    rc = pins.claim(SAMCXX_BOARD_PSEL_LED0, gpio::function_type::gpio_output, led_owner);
  }
  if (0 == rc) {
    /* Start dark */
    rc = pins.write(SAMCXX_BOARD_PSEL_LED0, led_owner, board::led_active_low);
  }
  cprintf("LED claim %d\n", rc);

  while (0 == rc) {
    for (volatile unsigned int i = 0; i < (seq.master_Hz() / 8); ++i) {
    }
    rc = pins.toggle(SAMCXX_BOARD_PSEL_LED0, led_owner);
  }
  cprintf("LED toggle failed: %d\n", rc);
  return 0;
}
