// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2015-2019 Peter A. Bigot

/** Demonstrate clock tree bring-up.
 *
 * Runs the board clock configuration, displays the states the
 * sequencer passed through, and cross-checks the main clock against
 * the slow clock.  Then drops to a slow configuration and back to
 * show reconfiguration at run time. */

#include <samcxx/board.hpp>
#include <samcxx/clock.hpp>
#include <samcxx/console/cstdio.hpp>

namespace {

void
show_trace (samcxx::clock::sequencer& seq)
{
  using samcxx::clock::sequencer;
  sequencer::state_type st;
  cprintf("trace:");
  while (seq.trace_pop(st)) {
    cprintf(" %s", sequencer::state_name(st));
  }
  cputchar('\n');
}

} // ns anonymous

int
main (void)
{
  using namespace samcxx;
  using namespace samcxx::clock;

  csetvbuf();
  cputs("\n\n" __FILE__ " " __DATE__ " " __TIME__);

  model tree_model;
  hw::poll_counter ticks;
  sequencer seq{hw::pmc(), hw::supc(), hw::efc(), ticks};
  cprintf("%s boot: %u Hz\n", tree_model.variant().name, seq.master_Hz());

  auto rc = board::initialize(seq);
  show_trace(seq);
  if (0 > rc) {
    cprintf("initialize failed: %d (%x)\n", rc, sequencer::error_decoded(rc));
  }
  cprintf("master %u Hz peripheral %u Hz source %u\n",
          seq.master_Hz(), seq.peripheral_Hz(),
          static_cast<unsigned int>(seq.active_source()));
  cprintf("main measured %d Hz\n", seq.measure_main_Hz());

  tree_config slow = board::clock_config();
  slow.master = source_id::main_rc;
  slow.main_Hz = 4'000'000;
  slow.prescaler = prescaler_type::div4;

  validated_config low;
  validated_config high;
  rc = tree_model.validate(slow, low);
  if (0 > rc) {
    cprintf("low config rejected: %x\n", model::error_decoded(rc));
  }
  rc = tree_model.validate(board::clock_config(), high);
  if (0 > rc) {
    cprintf("board config rejected: %x\n", model::error_decoded(rc));
  }

  rc = seq.apply(low);
  cprintf("low: %d, %u Hz\n", rc, seq.master_Hz());
  show_trace(seq);
  rc = seq.apply(high);
  cprintf("high: %d, %u Hz\n", rc, seq.master_Hz());
  show_trace(seq);

  while (true) {
  }
  return 0;
}
