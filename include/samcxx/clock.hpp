/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Clock tree configuration.
 *
 * Configuring the master clock is split between two objects:
 *
 * * clock::model is a pure description of the sources the part
 *   provides.  It checks a requested clock::tree_config against the
 *   documented ranges and produces a clock::validated_config.  It has
 *   no access to registers.
 *
 * * clock::sequencer is the sole owner of the applied configuration.
 *   It accepts only a validated_config and programs the oscillators,
 *   PLLs and master clock selector in the one safe order, confirming
 *   each step through the hardware stability flags before starting
 *   the next.
 *
 * @file */
#ifndef SAMCXX_CLOCK_HPP
#define SAMCXX_CLOCK_HPP
#pragma once

#include <array>

#include <pabigot/container.hpp>

#include <samcxx/hw.hpp>

namespace samcxx {

/** Functions and classes related to clocks */
namespace clock {

/** Values for the `PMC_MCKR.PRES` master clock prescaler.
 *
 * The enumerator value is the register encoding. */
enum class prescaler_type : uint8_t
{
  div1 = 0,
  div2 = 1,
  div4 = 2,
  div8 = 3,
  div16 = 4,
  div32 = 5,
  div64 = 6,
  div3 = 7,
};

/** The division applied by @p pres. */
constexpr unsigned int divisor (prescaler_type pres)
{
  return (prescaler_type::div3 == pres) ? 3U : (1U << static_cast<unsigned int>(pres));
}

/** `true` iff @p sid is one of the ways of producing the main clock. */
constexpr bool is_main (source_id sid)
{
  return (source_id::main_rc == sid)
    || (source_id::main_xtal == sid)
    || (source_id::main_bypass == sid);
}

/** `true` iff @p sid is a PLL. */
constexpr bool is_pll (source_id sid)
{
  return (source_id::plla == sid) || (source_id::upll == sid);
}

/** The hardware flag that confirms @p sid is usable.
 *
 * A bypassed main clock has no start-up phase, so completion of the
 * main oscillator selection is its only confirmation. */
constexpr hw::flag ready_flag (source_id sid)
{
  switch (sid) {
    case source_id::main_rc:
      return hw::flag::main_rc_ready;
    case source_id::main_xtal:
      return hw::flag::main_xtal_ready;
    case source_id::main_bypass:
      return hw::flag::main_select_done;
    case source_id::plla:
      return hw::flag::plla_locked;
    case source_id::upll:
      return hw::flag::upll_locked;
    default:
      break;
  }
  return hw::flag::none;
}

/** Flash wait states (`EEFC_FMR.FWS`) needed to fetch at @p master_Hz. */
constexpr uint8_t flash_wait_states (unsigned int master_Hz)
{
  if (19'000'000 > master_Hz) {
    return 0;
  }
  if (50'000'000 > master_Hz) {
    return 1;
  }
  if (65'000'000 > master_Hz) {
    return 2;
  }
  if (78'000'000 > master_Hz) {
    return 3;
  }
  return 4;
}

/** Description of a clock source on a specific variant.
 *
 * Instances are created by clock::model and are never changed. */
struct source
{
  source_id id;

  /** Lowest frequency the source may be configured to supply. */
  unsigned int min_Hz;

  /** Highest frequency the source may be configured to supply. */
  unsigned int max_Hz;

  /** Flag confirming the source is running and stable. */
  hw::flag ready;
};

/** A requested clock tree.
 *
 * The default-constructed value is the power-on configuration: the
 * master clock runs undivided from the fast RC oscillator at 4 MHz. */
struct tree_config
{
  /** Source for the master clock. */
  source_id master = source_id::main_rc;

  /** Main clock feeding the PLL when #master is a PLL.  Ignored
   * otherwise. */
  source_id reference = source_id::main_rc;

  /** Frequency of the main clock: 4, 8 or 12 MHz for the fast RC
   * oscillator, otherwise the frequency of the crystal or the bypass
   * signal the board provides.  Ignored when #master is
   * source_id::slow. */
  unsigned int main_Hz = 4'000'000;

  /** PLLA multiplier.  Used only when #master is source_id::plla. */
  uint16_t pll_mul = 0;

  /** PLLA divider.  Used only when #master is source_id::plla. */
  uint8_t pll_div = 0;

  /** Halve the PLL output before the prescaler.  Used only when
   * #master is a PLL. */
  bool pll_div2 = false;

  prescaler_type prescaler = prescaler_type::div1;

  /** Move the slow clock to the 32 KiHz crystal if it is not already
   * there.  This cannot be undone without a reset. */
  bool slow_xtal = false;
};

class model;

/** A tree_config that clock::model has accepted, along with the
 * frequencies it produces.
 *
 * Only model::validate() produces these, other than the default
 * constructor which describes the power-on configuration. */
class validated_config
{
public:
  validated_config () = default;

  const tree_config& config () const
  {
    return config_;
  }

  /** The main clock this configuration runs, or source_id::slow if
   * it does not use the main clock. */
  source_id main_source () const
  {
    if (is_main(config_.master)) {
      return config_.master;
    }
    if (is_pll(config_.master)) {
      return config_.reference;
    }
    return source_id::slow;
  }

  /** Output of the selected source before PLL halving and
   * prescaling. */
  unsigned int source_Hz () const
  {
    return source_Hz_;
  }

  /** The master clock frequency. */
  unsigned int master_Hz () const
  {
    return master_Hz_;
  }

  /** The clock delivered to peripherals. */
  unsigned int peripheral_Hz () const
  {
    return peripheral_Hz_;
  }

private:
  friend class model;

  validated_config (const tree_config& config,
                    unsigned int source_Hz,
                    unsigned int master_Hz,
                    unsigned int peripheral_Hz) :
    config_{config},
    source_Hz_{source_Hz},
    master_Hz_{master_Hz},
    peripheral_Hz_{peripheral_Hz}
  { }

  tree_config config_{};
  unsigned int source_Hz_ = 4'000'000;
  unsigned int master_Hz_ = 4'000'000;
  unsigned int peripheral_Hz_ = 4'000'000;
};

/** The clock sources of a variant and the rules for combining them.
 *
 * Validation failures are reported as a negative @link
 * error_support::error_encoded encoded@endlink combination of one
 * error kind (#ERR_OUT_OF_RANGE or #ERR_INVALID_SOURCE) and one field
 * bit identifying what was wrong. */
class model : public error_support
{
public:
  /** A value is outside the documented range for the variant. */
  constexpr static error_type ERR_OUT_OF_RANGE = 0x01;

  /** A source is unavailable or cannot be used where requested. */
  constexpr static error_type ERR_INVALID_SOURCE = 0x02;

  /** Mask isolating the error kind. */
  constexpr static error_type ERR_KIND_Msk = 0xFF;

  constexpr static error_type FIELD_MASTER_SOURCE = 0x0100;
  constexpr static error_type FIELD_REFERENCE = 0x0200;
  constexpr static error_type FIELD_MAIN_FREQUENCY = 0x0400;
  constexpr static error_type FIELD_PRESCALER = 0x0800;
  constexpr static error_type FIELD_PLL_MUL = 0x1000;
  constexpr static error_type FIELD_PLL_DIV = 0x2000;
  constexpr static error_type FIELD_PLL_INPUT = 0x4000;
  constexpr static error_type FIELD_PLL_OUTPUT = 0x8000;
  constexpr static error_type FIELD_MASTER_FREQUENCY = 0x10000;
  constexpr static error_type FIELD_PERIPHERAL_FREQUENCY = 0x20000;

  /** Mask isolating the field bit. */
  constexpr static error_type FIELD_Msk = ~ERR_KIND_Msk;

  /** Slow clock frequency when driven by the RC oscillator. */
  constexpr static unsigned int SlowRC_Hz = 32000;

  /** Slow clock frequency when driven by the crystal. */
  constexpr static unsigned int SlowXtal_Hz = 32768;

  explicit model (const variant_type& variant = variant::current);

  const variant_type& variant () const
  {
    return variant_;
  }

  /** Return the description of @p sid, or a null pointer if the
   * variant does not provide it. */
  const source* find (source_id sid) const;

  /** Check @p config against the variant.
   *
   * Checks are made in order: the master source exists on the
   * variant; a PLL is fed from an available main clock; the main
   * clock frequency, prescaler, PLL multiplier, divider, input and
   * output are in range and the master clock does not exceed its
   * ceiling; the peripheral clock does not exceed its ceiling.  The
   * first failure is reported.
   *
   * @param config the requested tree.
   *
   * @param validated updated with the accepted configuration on
   * success, untouched on failure.
   *
   * @return zero on success, or a negative encoded error. */
  int validate (const tree_config& config,
                validated_config& validated) const;

  /** The configuration the part comes out of reset with. */
  static tree_config reset_config ()
  {
    return {};
  }

private:
  const variant_type& variant_;
  std::array<source, source_count> sources_;
};

/** Applies validated clock trees to the hardware.
 *
 * The sequencer owns the record of the last applied configuration.
 * Each apply() walks #ST_unconfigured, #ST_oscillator_stabilizing,
 * #ST_pll_locking (only for PLL sources), #ST_switch_pending and ends
 * in #ST_stable or #ST_failed.  Flash wait states are raised before
 * the first oscillator write to cover every master clock the sequence
 * passes through, and lowered once the new master clock is confirmed.
 * A PLL whose reference oscillator changed is restarted and must lock
 * again before it is selected.  Every wait for a hardware flag is
 * bounded by the caller's timeout as measured by the injected
 * hw::time_source.  Nothing is retried: on failure the hardware is
 * left as it was when the timeout expired and the record of the
 * active configuration is not changed.
 *
 * @note The sequencer does not protect itself against re-entry.  It
 * must not be invoked from interrupt context. */
class sequencer : public error_support
{
public:
  /** The selected oscillator did not stabilize. */
  constexpr static error_type ERR_OSCILLATOR_TIMEOUT = 0x01;

  /** The PLL did not lock. */
  constexpr static error_type ERR_PLL_TIMEOUT = 0x02;

  /** The master clock did not become ready, or the selected source
   * did not read back as requested. */
  constexpr static error_type ERR_SWITCH_TIMEOUT = 0x04;

  using duration_type = hw::time_source::duration_type;

  /** Sequencing states.  Values are recorded in the trace. */
  enum state_type : uint8_t
  {
    ST_unconfigured,
    ST_oscillator_stabilizing,
    ST_pll_locking,
    ST_switch_pending,
    ST_stable,
    ST_failed,
  };

  /** Bound used by board::initialize() for each stability wait. */
  constexpr static duration_type DefaultTimeout = std::chrono::milliseconds{100};

  /** Crystal start-up time written to `CKGR_MOR.MOSCXTST`. */
  constexpr static uint8_t XtalStartup = 8;

  /** Lock time written to `CKGR_PLLAR.PLLACOUNT`. */
  constexpr static uint8_t PllaLockCount = 0x3f;

  /** Lock time written to `CKGR_UCKR.UPLLCOUNT`. */
  constexpr static uint8_t UpllLockCount = 0x0f;

  /** Maximum number of states retained in the trace. */
  constexpr static size_t TraceLength = 8;

  /** Bind the sequencer to the register groups it drives.
   *
   * The active configuration is initialized to the reset
   * configuration, which is what the hardware runs at boot. */
  sequencer (hw::pmc_interface& pmc,
             hw::supc_interface& supc,
             hw::efc_interface& efc,
             hw::time_source& time);

  sequencer (const sequencer&) = delete;
  sequencer& operator= (const sequencer&) = delete;
  sequencer (sequencer&&) = delete;
  sequencer& operator= (sequencer&&) = delete;

  /** Program the hardware to run @p validated.
   *
   * Steps that are already in the requested state are confirmed
   * without writes, so applying the active configuration again
   * succeeds without disturbing the clocks.
   *
   * @param validated the tree to apply.
   *
   * @param timeout the bound on each wait for a stability flag.
   *
   * @return zero on success, or a negative encoded error
   * (#ERR_OSCILLATOR_TIMEOUT, #ERR_PLL_TIMEOUT, #ERR_SWITCH_TIMEOUT). */
  int apply (const validated_config& validated,
             duration_type timeout = DefaultTimeout);

  /** The current state. */
  state_type state () const
  {
    return state_;
  }

  /** The result of the most recent apply(). */
  int failure () const
  {
    return failure_;
  }

  /** Remove the oldest state from the trace of the most recent
   * apply().
   *
   * @return `false` if the trace is empty. */
  bool trace_pop (state_type& st);

  /** The configuration most recently applied successfully. */
  const validated_config& active () const
  {
    return active_;
  }

  /** The master clock frequency of the active configuration. */
  unsigned int master_Hz () const
  {
    return master_Hz_;
  }

  /** The peripheral clock frequency of the active configuration. */
  unsigned int peripheral_Hz () const
  {
    return peripheral_Hz_;
  }

  /** Read back the source actually driving the master clock. */
  source_id active_source () const;

  /** Measure the main clock against the slow clock.
   *
   * @return the main clock frequency in Hz, or a negative encoded
   * #ERR_OSCILLATOR_TIMEOUT if the measurement did not complete. */
  int measure_main_Hz (duration_type timeout = DefaultTimeout);

  /** Text name of @p st, for diagnostics. */
  static const char* state_name (state_type st);

private:
  void enter_ (state_type st);
  int fail_ (error_type ec);

  template <typename PRED>
  bool poll_ (PRED pred,
              duration_type timeout);

  bool wait_ (hw::flag f,
              duration_type timeout);

  int write_master_ (const hw::master_state& st,
                     duration_type timeout);
  int park_on_main_ (duration_type timeout);
  void raise_flash_ (unsigned int freq_Hz);
  void lower_flash_ (unsigned int freq_Hz);
  int stabilize_main_ (const validated_config& validated,
                       bool& reference_changed,
                       duration_type timeout);
  int lock_pll_ (const validated_config& validated,
                 bool restart,
                 duration_type timeout);
  int switch_master_ (const validated_config& validated,
                      duration_type timeout);
  void release_unused_main_ (const validated_config& validated);

  hw::pmc_interface& pmc_;
  hw::supc_interface& supc_;
  hw::efc_interface& efc_;
  hw::time_source& time_;

  validated_config active_{};
  unsigned int master_Hz_;
  unsigned int peripheral_Hz_;
  state_type state_ = ST_unconfigured;
  int failure_ = 0;

  std::array<uint8_t, TraceLength> trace_storage_{};
  pabigot::container::rr_adaptor<uint8_t> trace_;
};

} // namespace clock

namespace board {

/** The clock tree the board runs after initialize().
 *
 * Implemented in the board-specific `board.cc`. */
clock::tree_config clock_config ();

/** Bring the board's clock tree up.
 *
 * The default implementation validates board::clock_config() against
 * the current variant and applies it through @p seq.  Applications
 * may provide their own (strong) definition.
 *
 * @return zero on success, a negative encoded clock::model error if
 * the board configuration is invalid, or the result of
 * clock::sequencer::apply(). */
int initialize (clock::sequencer& seq,
                clock::sequencer::duration_type timeout = clock::sequencer::DefaultTimeout); // weak implemented in src/core.cc

} // namespace board
} // namespace samcxx

#endif /* SAMCXX_CLOCK_HPP */
