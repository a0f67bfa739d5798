// SPDX-License-Identifier: Apache-2.0
// Copyright 2018-2019 Peter A. Bigot

#include <gtest/gtest.h>

#include <samcxx/board.hpp>
#include <samcxx/clock.hpp>

#include "fake_hw.hpp"

namespace {

using namespace samcxx;
using namespace samcxx::clock;
using namespace std::literals;

class Sequencer : public ::testing::Test
{
protected:
  fake::pmc pmc;
  fake::supc supc;
  fake::efc efc{pmc.log};
  hw::poll_counter ticks;
  model tree;
  sequencer seq{pmc, supc, efc, ticks};

  validated_config validated (const tree_config& config)
  {
    validated_config vc;
    EXPECT_EQ(0, tree.validate(config, vc));
    return vc;
  }

  std::vector<sequencer::state_type> trace ()
  {
    std::vector<sequencer::state_type> rv;
    sequencer::state_type st;
    while (seq.trace_pop(st)) {
      rv.push_back(st);
    }
    return rv;
  }

  std::vector<std::string> log_since (size_t from)
  {
    return {pmc.log.begin() + from, pmc.log.end()};
  }

  static tree_config due ()
  {
    tree_config config;
    config.master = source_id::plla;
    config.reference = source_id::main_xtal;
    config.main_Hz = 12'000'000;
    config.pll_mul = 14;
    config.pll_div = 1;
    config.pll_div2 = true;
    config.slow_xtal = true;
    return config;
  }
};

TEST_F(Sequencer, Boot)
{
  ASSERT_EQ(sequencer::ST_unconfigured, seq.state());
  ASSERT_EQ(4'000'000U, seq.master_Hz());
  ASSERT_EQ(4'000'000U, seq.peripheral_Hz());
  ASSERT_EQ(source_id::main_rc, seq.active().config().master);
  ASSERT_EQ(source_id::main_rc, seq.active_source());
}

TEST_F(Sequencer, StateNames)
{
  ASSERT_STREQ("unconfigured", sequencer::state_name(sequencer::ST_unconfigured));
  ASSERT_STREQ("oscillator-stabilizing", sequencer::state_name(sequencer::ST_oscillator_stabilizing));
  ASSERT_STREQ("pll-locking", sequencer::state_name(sequencer::ST_pll_locking));
  ASSERT_STREQ("switch-pending", sequencer::state_name(sequencer::ST_switch_pending));
  ASSERT_STREQ("stable", sequencer::state_name(sequencer::ST_stable));
  ASSERT_STREQ("failed", sequencer::state_name(sequencer::ST_failed));
}

TEST_F(Sequencer, ResetIsNoop)
{
  ASSERT_EQ(0, seq.apply(validated(model::reset_config())));
  ASSERT_EQ(sequencer::ST_stable, seq.state());
  ASSERT_TRUE(pmc.log.empty());
  ASSERT_EQ(0U, supc.writes);

  std::vector<sequencer::state_type> const expected{
    sequencer::ST_unconfigured,
    sequencer::ST_oscillator_stabilizing,
    sequencer::ST_switch_pending,
    sequencer::ST_stable,
  };
  ASSERT_EQ(expected, trace());
}

TEST_F(Sequencer, DueBringUp)
{
  ASSERT_EQ(0, seq.apply(validated(due())));
  ASSERT_EQ(sequencer::ST_stable, seq.state());
  ASSERT_EQ(0, seq.failure());

  std::vector<sequencer::state_type> const states{
    sequencer::ST_unconfigured,
    sequencer::ST_oscillator_stabilizing,
    sequencer::ST_pll_locking,
    sequencer::ST_switch_pending,
    sequencer::ST_stable,
  };
  ASSERT_EQ(states, trace());

  /* Flash slowed down, crystal on, crystal selected, PLL programmed,
   * prescale on main, switch to PLL, RC off. */
  std::vector<std::string> const writes{"FMR", "MOR", "MOR", "PLLAR", "MCKR", "MCKR", "MOR"};
  ASSERT_EQ(writes, pmc.log);
  ASSERT_EQ(4U, efc.fws);

  ASSERT_EQ(1U, supc.writes);
  ASSERT_TRUE(supc.selected);

  ASSERT_TRUE(pmc.mor.xtal_enabled);
  ASSERT_TRUE(pmc.mor.xtal_selected);
  ASSERT_FALSE(pmc.mor.bypass);
  ASSERT_FALSE(pmc.mor.rc_enabled);
  ASSERT_EQ(sequencer::XtalStartup, pmc.mor.xtal_startup);

  ASSERT_EQ(14U, pmc.pllar.mul);
  ASSERT_EQ(1U, pmc.pllar.div);
  ASSERT_EQ(sequencer::PllaLockCount, pmc.pllar.count);

  ASSERT_EQ(2U, pmc.mckr_writes.size());
  ASSERT_EQ(hw::master_select::main, pmc.mckr_writes[0].css);
  ASSERT_TRUE(pmc.mckr_writes[0].plladiv2);
  ASSERT_EQ(hw::master_select::plla, pmc.mckr_writes[1].css);
  ASSERT_TRUE(pmc.mckr_writes[1].plladiv2);
  ASSERT_EQ(0U, pmc.mckr.pres);

  ASSERT_EQ(84'000'000U, seq.master_Hz());
  ASSERT_EQ(84'000'000U, seq.peripheral_Hz());
  ASSERT_EQ(source_id::plla, seq.active_source());
  ASSERT_EQ(source_id::plla, seq.active().config().master);
}

TEST_F(Sequencer, Idempotent)
{
  auto const vc = validated(due());
  ASSERT_EQ(0, seq.apply(vc));
  auto const writes = pmc.log.size();
  auto const mor = pmc.mor;

  ASSERT_EQ(0, seq.apply(vc));
  ASSERT_EQ(sequencer::ST_stable, seq.state());
  ASSERT_EQ(writes, pmc.log.size());
  ASSERT_EQ(1U, supc.writes);
  ASSERT_EQ(mor.xtal_selected, pmc.mor.xtal_selected);
  ASSERT_EQ(84'000'000U, seq.master_Hz());
}

TEST_F(Sequencer, PllTimeout)
{
  pmc.latency(hw::flag::plla_locked, -1);
  auto rc = seq.apply(validated(due()), 200us);
  ASSERT_GT(0, rc);
  ASSERT_EQ(sequencer::ERR_PLL_TIMEOUT, sequencer::error_decoded(rc));
  ASSERT_EQ(rc, seq.failure());
  ASSERT_EQ(sequencer::ST_failed, seq.state());

  std::vector<sequencer::state_type> const states{
    sequencer::ST_unconfigured,
    sequencer::ST_oscillator_stabilizing,
    sequencer::ST_pll_locking,
    sequencer::ST_failed,
  };
  ASSERT_EQ(states, trace());

  /* Master clock never moved; the record still shows reset.  The
   * flash keeps the wait states raised for the attempt. */
  ASSERT_EQ(0U, pmc.count("MCKR"));
  ASSERT_EQ(4U, efc.fws);
  ASSERT_EQ(hw::master_select::main, pmc.mckr.css);
  ASSERT_EQ(4'000'000U, seq.master_Hz());
  ASSERT_EQ(source_id::main_rc, seq.active().config().master);
}

TEST_F(Sequencer, OscillatorTimeout)
{
  pmc.latency(hw::flag::main_xtal_ready, -1);
  auto rc = seq.apply(validated(due()), 200us);
  ASSERT_EQ(sequencer::ERR_OSCILLATOR_TIMEOUT, sequencer::error_decoded(rc));
  ASSERT_EQ(sequencer::ST_failed, seq.state());
  ASSERT_EQ(0U, pmc.count("PLLAR"));
  ASSERT_EQ(0U, pmc.count("MCKR"));

  /* The RC oscillator is not released when the crystal fails. */
  ASSERT_TRUE(pmc.mor.rc_enabled);
  ASSERT_FALSE(pmc.mor.xtal_selected);
}

TEST_F(Sequencer, SlowXtalTimeout)
{
  supc.latency = -1;
  auto rc = seq.apply(validated(due()), 200us);
  ASSERT_EQ(sequencer::ERR_OSCILLATOR_TIMEOUT, sequencer::error_decoded(rc));
  ASSERT_TRUE(pmc.log.empty());
}

TEST_F(Sequencer, MasterReadyTimeout)
{
  pmc.latency(hw::flag::master_ready, -1);
  auto rc = seq.apply(validated(due()), 200us);
  ASSERT_EQ(sequencer::ERR_SWITCH_TIMEOUT, sequencer::error_decoded(rc));
  ASSERT_EQ(sequencer::ST_failed, seq.state());
  ASSERT_EQ(4'000'000U, seq.master_Hz());
}

TEST_F(Sequencer, SwitchReadback)
{
  pmc.css_stuck = true;
  auto rc = seq.apply(validated(due()), 200us);
  ASSERT_EQ(sequencer::ERR_SWITCH_TIMEOUT, sequencer::error_decoded(rc));
  ASSERT_EQ(source_id::main_xtal, seq.active_source());
  ASSERT_EQ(source_id::main_rc, seq.active().config().master);
}

TEST_F(Sequencer, TimeoutBoundsEachWait)
{
  pmc.latency(hw::flag::plla_locked, 50);
  auto const vc = validated(due());

  ASSERT_EQ(sequencer::ERR_PLL_TIMEOUT, sequencer::error_decoded(seq.apply(vc, 10us)));
  ASSERT_EQ(0, seq.apply(vc, 1ms));
  ASSERT_EQ(84'000'000U, seq.master_Hz());
}

TEST_F(Sequencer, ParkBeforeChangingMain)
{
  ASSERT_EQ(0, seq.apply(validated(due())));
  auto const from = pmc.log.size();
  auto const mckr_from = pmc.mckr_writes.size();

  tree_config config;
  config.main_Hz = 12'000'000;
  ASSERT_EQ(0, seq.apply(validated(config)));

  /* Master moved to main before the oscillator changed, prescaler
   * cleanup after the switch, flash sped up once the slower clock is
   * confirmed, crystal off last. */
  std::vector<std::string> const writes{"MCKR", "MOR", "MOR", "MCKR", "FMR", "MOR"};
  ASSERT_EQ(writes, log_since(from));
  ASSERT_EQ(0U, efc.fws);
  ASSERT_EQ(hw::master_select::main, pmc.mckr_writes[mckr_from].css);
  ASSERT_TRUE(pmc.mckr_writes[mckr_from].plladiv2);
  ASSERT_FALSE(pmc.mckr.plladiv2);

  ASSERT_TRUE(pmc.mor.rc_enabled);
  ASSERT_EQ(12'000'000U, pmc.mor.rc_Hz);
  ASSERT_FALSE(pmc.mor.xtal_enabled);
  ASSERT_FALSE(pmc.mor.xtal_selected);
  ASSERT_EQ(12'000'000U, seq.master_Hz());
  ASSERT_EQ(source_id::main_rc, seq.active_source());
}

TEST_F(Sequencer, ReprogramRunningPll)
{
  ASSERT_EQ(0, seq.apply(validated(due())));
  auto const from = pmc.log.size();

  auto config = due();
  config.pll_mul = 7;
  config.pll_div2 = false;
  ASSERT_EQ(0, seq.apply(validated(config)));

  std::vector<std::string> const writes{"MCKR", "PLLAR", "MCKR", "MCKR"};
  ASSERT_EQ(writes, log_since(from));
  ASSERT_EQ(7U, pmc.pllar.mul);
  ASSERT_EQ(hw::master_select::plla, pmc.mckr.css);
  ASSERT_FALSE(pmc.mckr.plladiv2);
  ASSERT_EQ(84'000'000U, seq.master_Hz());
}

TEST_F(Sequencer, PllRestartsAfterReferenceChange)
{
  ASSERT_EQ(0, seq.apply(validated(due())));
  auto const from = pmc.log.size();

  auto config = due();
  config.reference = source_id::main_rc;
  ASSERT_EQ(0, seq.apply(validated(config)));

  /* Park, RC on, RC selected, PLL off and on again, back to the PLL,
   * crystal off. */
  std::vector<std::string> const writes{"MCKR", "MOR", "MOR", "PLLAR", "PLLAR", "MCKR", "MOR"};
  ASSERT_EQ(writes, log_since(from));
  ASSERT_EQ(14U, pmc.pllar.mul);
  ASSERT_EQ(source_id::plla, seq.active_source());
  ASSERT_EQ(84'000'000U, seq.master_Hz());
}

TEST_F(Sequencer, PllRelockAwaitedAfterReferenceChange)
{
  ASSERT_EQ(0, seq.apply(validated(due())));

  pmc.latency(hw::flag::plla_locked, -1);
  auto config = due();
  config.reference = source_id::main_rc;
  auto rc = seq.apply(validated(config), 200us);
  ASSERT_EQ(sequencer::ERR_PLL_TIMEOUT, sequencer::error_decoded(rc));

  /* Left parked on the new main clock rather than the unlocked PLL. */
  ASSERT_EQ(source_id::main_rc, seq.active_source());
  ASSERT_EQ(source_id::main_xtal, seq.active().config().reference);
}

TEST_F(Sequencer, UpllRestartsAfterReferenceChange)
{
  tree_config config;
  config.master = source_id::upll;
  config.reference = source_id::main_xtal;
  config.main_Hz = 12'000'000;
  config.pll_div2 = true;
  config.prescaler = prescaler_type::div3;
  ASSERT_EQ(0, seq.apply(validated(config)));
  auto const from = pmc.log.size();

  config.reference = source_id::main_bypass;
  ASSERT_EQ(0, seq.apply(validated(config)));

  std::vector<std::string> const writes{"MCKR", "MOR", "UCKR", "UCKR", "MCKR"};
  ASSERT_EQ(writes, log_since(from));
  ASSERT_TRUE(pmc.upll);
  ASSERT_EQ(source_id::upll, seq.active_source());
}

TEST_F(Sequencer, FlashWaitStatesFollowMaster)
{
  ASSERT_EQ(0, seq.apply(validated(due())));
  ASSERT_EQ(4U, efc.fws);

  /* 84 MHz down to 42 MHz. */
  auto config = due();
  config.prescaler = prescaler_type::div2;
  auto const from = pmc.log.size();
  ASSERT_EQ(0, seq.apply(validated(config)));
  ASSERT_EQ(1U, efc.fws);
  auto const writes = log_since(from);
  ASSERT_EQ("FMR", writes.back());

  /* And back up: the flash is slowed before the clock rises. */
  auto const again = pmc.log.size();
  ASSERT_EQ(0, seq.apply(validated(due())));
  ASSERT_EQ(4U, efc.fws);
  ASSERT_EQ("FMR", log_since(again).front());
}

TEST_F(Sequencer, PrescalerAfterLeavingPll)
{
  ASSERT_EQ(0, seq.apply(validated(due())));
  auto const mckr_from = pmc.mckr_writes.size();

  tree_config config;
  config.master = source_id::slow;
  config.prescaler = prescaler_type::div2;
  ASSERT_EQ(0, seq.apply(validated(config)));

  std::vector<sequencer::state_type> const states{
    sequencer::ST_unconfigured,
    sequencer::ST_oscillator_stabilizing,
    sequencer::ST_switch_pending,
    sequencer::ST_stable,
  };
  ASSERT_EQ(states, trace());

  /* Source switch first, then the prescaler. */
  ASSERT_EQ(mckr_from + 2, pmc.mckr_writes.size());
  ASSERT_EQ(hw::master_select::slow, pmc.mckr_writes[mckr_from].css);
  ASSERT_EQ(0U, pmc.mckr_writes[mckr_from].pres);
  ASSERT_EQ(hw::master_select::slow, pmc.mckr_writes[mckr_from + 1].css);
  ASSERT_EQ(1U, pmc.mckr_writes[mckr_from + 1].pres);

  /* The slow clock was already on the crystal. */
  ASSERT_EQ(16'000U, seq.active().master_Hz());
  ASSERT_EQ(16'384U, seq.master_Hz());
  ASSERT_EQ(source_id::slow, seq.active_source());
}

TEST_F(Sequencer, PrescalerBeforeEnteringPll)
{
  tree_config config;
  config.master = source_id::upll;
  config.reference = source_id::main_xtal;
  config.main_Hz = 12'000'000;
  config.pll_div2 = true;
  config.prescaler = prescaler_type::div3;
  ASSERT_EQ(0, seq.apply(validated(config)));

  ASSERT_EQ(1U, pmc.count("UCKR"));
  ASSERT_TRUE(pmc.upll);
  ASSERT_EQ(2U, pmc.mckr_writes.size());
  ASSERT_EQ(hw::master_select::main, pmc.mckr_writes[0].css);
  ASSERT_EQ(7U, pmc.mckr_writes[0].pres);
  ASSERT_TRUE(pmc.mckr_writes[0].uplldiv2);
  ASSERT_FALSE(pmc.mckr_writes[0].plladiv2);
  ASSERT_EQ(hw::master_select::upll, pmc.mckr_writes[1].css);
  ASSERT_EQ(80'000'000U, seq.master_Hz());
  ASSERT_EQ(source_id::upll, seq.active_source());
}

TEST_F(Sequencer, Bypass)
{
  tree_config config;
  config.master = source_id::main_bypass;
  config.main_Hz = 20'000'000;
  ASSERT_EQ(0, seq.apply(validated(config)));

  ASSERT_TRUE(pmc.mor.bypass);
  ASSERT_FALSE(pmc.mor.xtal_enabled);
  ASSERT_TRUE(pmc.mor.xtal_selected);
  ASSERT_FALSE(pmc.mor.rc_enabled);
  ASSERT_EQ(0U, pmc.count("MCKR"));
  ASSERT_EQ("FMR", pmc.log.front());
  ASSERT_EQ(1U, efc.fws);
  ASSERT_EQ(20'000'000U, seq.master_Hz());
  ASSERT_EQ(source_id::main_bypass, seq.active_source());
}

TEST_F(Sequencer, MeasureMain)
{
  /* 12 MHz over 16 cycles of 32768 Hz */
  pmc.mainf = 5859;
  ASSERT_EQ(5859 * 2000, seq.measure_main_Hz());

  supc.selected = true;
  ASSERT_EQ(5859 * 2048, seq.measure_main_Hz());

  pmc.latency(hw::flag::main_frequency_ready, -1);
  pmc.unsettle(hw::flag::main_frequency_ready);
  auto rc = seq.measure_main_Hz(100us);
  ASSERT_EQ(sequencer::ERR_OSCILLATOR_TIMEOUT, sequencer::error_decoded(rc));
}

TEST_F(Sequencer, BoardInitialize)
{
  ASSERT_EQ(0, board::initialize(seq));
  ASSERT_EQ(sequencer::ST_stable, seq.state());
  ASSERT_EQ(board::clock_config().main_Hz, seq.master_Hz());
  ASSERT_EQ(source_id::main_rc, seq.active_source());
}

} // ns anonymous
