/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Register access surface.
 *
 * The clock sequencer, pin registry and clock gate never dereference
 * peripheral addresses.  They operate on the register groups through
 * the narrow interfaces declared here, which express the handful of
 * typed read, write and poll operations the core needs.
 *
 * On the target these are implemented in `src/sam3x/hw.cc` over the
 * CMSIS device structures (`PMC`, `SUPC`, `PIOA`...), which is also
 * where the write-protection keys are applied.  Host-based tests
 * substitute in-memory doubles.
 *
 * @file */

#ifndef SAMCXX_HW_HPP
#define SAMCXX_HW_HPP
#pragma once

#include <chrono>

#include <samcxx/variant.hpp>

namespace samcxx {

/** Abstractions of the register groups used by the core. */
namespace hw {

/** Hardware status flags that confirm a clock has settled.
 *
 * Each corresponds to a bit of `PMC_SR` (or `SUPC_SR` for
 * #slow_xtal_selected).  #none identifies a source that needs no
 * confirmation, such as the slow RC oscillator. */
enum class flag : uint8_t
{
  none,
  /** `PMC_SR.MOSCRCS`: fast RC oscillator stabilized */
  main_rc_ready,
  /** `PMC_SR.MOSCXTS`: main crystal oscillator stabilized */
  main_xtal_ready,
  /** `PMC_SR.MOSCSELS`: main oscillator selection complete */
  main_select_done,
  /** `PMC_SR.LOCKA`: PLLA locked */
  plla_locked,
  /** `PMC_SR.LOCKU`: UPLL locked */
  upll_locked,
  /** `PMC_SR.MCKRDY`: master clock ready */
  master_ready,
  /** `SUPC_SR.OSCSEL`: slow clock driven by the 32 KiHz crystal */
  slow_xtal_selected,
  /** `CKGR_MCFR.MAINFRDY`: main clock frequency count valid */
  main_frequency_ready,
};

/** Content of `CKGR_MOR`, less the write key. */
struct main_oscillator_state
{
  /** `MOSCRCEN` */
  bool rc_enabled = true;

  /** `MOSCRCF` expressed as a frequency: 4, 8 or 12 MHz. */
  unsigned int rc_Hz = 4'000'000;

  /** `MOSCXTEN` */
  bool xtal_enabled = false;

  /** `MOSCXTBY` */
  bool bypass = false;

  /** `MOSCSEL`: main clock taken from the crystal (or bypass) rather
   * than the fast RC oscillator. */
  bool xtal_selected = false;

  /** `MOSCXTST`: crystal start-up time in units of 8 slow clock
   * cycles. */
  uint8_t xtal_startup = 0;
};

/** Content of `CKGR_PLLAR`. */
struct pll_state
{
  /** Effective multiplier (`MULA + 1`), or zero when the PLL is
   * disabled. */
  uint16_t mul = 0;

  /** `DIVA` */
  uint8_t div = 0;

  /** `PLLACOUNT`: lock time in slow clock cycles. */
  uint8_t count = 0;

  bool operator== (const pll_state& rhs) const
  {
    return (mul == rhs.mul) && (div == rhs.div);
  }

  bool operator!= (const pll_state& rhs) const
  {
    return !(*this == rhs);
  }
};

/** Value of the `PMC_MCKR.CSS` field. */
enum class master_select : uint8_t
{
  slow = 0,
  main = 1,
  plla = 2,
  upll = 3,
};

/** Content of `PMC_MCKR`. */
struct master_state
{
  master_select css = master_select::main;

  /** `PRES` field encoding. */
  uint8_t pres = 0;

  /** `PLLADIV2` */
  bool plladiv2 = false;

  /** `UPLLDIV2` */
  bool uplldiv2 = false;
};

/** Typed access to the clock generator and power management
 * registers. */
class pmc_interface
{
public:
  virtual ~pmc_interface () = default;

  /** Return `true` iff the status bit identified by @p f is set.
   *
   * flag::none always reads as set. */
  virtual bool ready (flag f) const = 0;

  virtual main_oscillator_state main_oscillator () const = 0;

  /** Write `CKGR_MOR` (the implementation supplies the key). */
  virtual void main_oscillator (const main_oscillator_state& st) = 0;

  virtual pll_state plla () const = 0;

  /** Write `CKGR_PLLAR`.  Writing a zero multiplier disables PLLA. */
  virtual void plla (const pll_state& st) = 0;

  virtual bool upll_enabled () const = 0;

  /** Enable UPLL with a lock time of @p count x 8 slow clock cycles. */
  virtual void upll_enable (uint8_t count) = 0;

  virtual void upll_disable () = 0;

  virtual master_state master () const = 0;

  virtual void master (const master_state& st) = 0;

  /** Return `CKGR_MCFR.MAINF`: main clock cycles counted over 16
   * slow clock cycles.  Meaningful only when
   * flag::main_frequency_ready is set. */
  virtual unsigned int main_frequency_count () const = 0;

  /** Return `true` iff the clock gate for @p pid is open. */
  virtual bool peripheral_enabled (periph::id pid) const = 0;

  /** Write the `PMC_PCERx` bit for @p pid. */
  virtual void peripheral_enable (periph::id pid) = 0;

  /** Write the `PMC_PCDRx` bit for @p pid. */
  virtual void peripheral_disable (periph::id pid) = 0;
};

/** Typed access to the slow clock selection in the supply
 * controller. */
class supc_interface
{
public:
  virtual ~supc_interface () = default;

  /** Return `true` iff the slow clock is driven by the crystal. */
  virtual bool slow_xtal_selected () const = 0;

  /** Request the slow clock switch to the crystal.
   *
   * The switch is one-way: only a reset returns the slow clock to
   * the RC oscillator. */
  virtual void slow_xtal_select () = 0;
};

/** Typed access to the flash wait states.
 *
 * The part has one embedded flash controller per bank.  Both run
 * from the master clock, so they always carry the same setting. */
class efc_interface
{
public:
  virtual ~efc_interface () = default;

  /** `EEFC_FMR.FWS`: wait states added to each flash access. */
  virtual uint8_t wait_states () const = 0;

  /** Write `EEFC_FMR.FWS` on every flash controller. */
  virtual void wait_states (uint8_t fws) = 0;
};

/** Typed access to the PIO controllers.
 *
 * @p group is the controller ordinal (PIOA = 0) and @p mask selects
 * pins within the controller.  Each operation is a single register
 * write except select_peripheral(), which is a read-modify-write of
 * `PIO_ABSR`. */
class pio_interface
{
public:
  virtual ~pio_interface () = default;

  /** `PIO_ABSR`: route pins to peripheral B (`true`) or A. */
  virtual void select_peripheral (unsigned int group,
                                  uint32_t mask,
                                  bool b) = 0;

  /** `PIO_PER`: put pins under PIO control. */
  virtual void pio_enable (unsigned int group,
                           uint32_t mask) = 0;

  /** `PIO_PDR`: hand pins to the selected peripheral. */
  virtual void pio_disable (unsigned int group,
                            uint32_t mask) = 0;

  /** `PIO_OER` or `PIO_ODR` */
  virtual void output_enable (unsigned int group,
                              uint32_t mask,
                              bool enable) = 0;

  /** `PIO_PUER` or `PIO_PUDR` */
  virtual void pullup_enable (unsigned int group,
                              uint32_t mask,
                              bool enable) = 0;

  /** `PIO_MDER` or `PIO_MDDR` */
  virtual void multidrive_enable (unsigned int group,
                                  uint32_t mask,
                                  bool enable) = 0;

  /** `PIO_SODR` or `PIO_CODR` */
  virtual void output_set (unsigned int group,
                           uint32_t mask,
                           bool high) = 0;

  /** `PIO_ODSR` */
  virtual uint32_t output_data (unsigned int group) const = 0;

  /** `PIO_PDSR` */
  virtual uint32_t pin_data (unsigned int group) const = 0;
};

/** Monotonic time reference for bounded polling.
 *
 * No timer can be relied upon while the master clock is being
 * reconfigured, so the sequencer measures its waits against an
 * injected source rather than a peripheral. */
class time_source
{
public:
  /** Representation of elapsed time. */
  using duration_type = std::chrono::microseconds;

  virtual ~time_source () = default;

  /** Return the time elapsed since an arbitrary fixed epoch. */
  virtual duration_type now () = 0;
};

/** A time_source that counts polls.
 *
 * Each call to now() advances the clock by a fixed nominal cost,
 * making a timeout an iteration budget.  The cost should be the
 * worst-case duration of one poll at the slowest master clock the
 * system will run from. */
class poll_counter : public time_source
{
public:
  explicit poll_counter (duration_type per_poll = duration_type{1}) :
    per_poll_{per_poll}
  { }

  duration_type now () override
  {
    elapsed_ += per_poll_;
    return elapsed_;
  }

private:
  duration_type const per_poll_;
  duration_type elapsed_{};
};

#if (SAMCXX_CROSS_COMPILING - 0)
/** Register access for the part this image is built for.
 *
 * The returned objects are process-wide; the application passes them
 * to the core objects it owns. */
pmc_interface& pmc ();
supc_interface& supc ();
efc_interface& efc ();
pio_interface& pio ();
#endif /* SAMCXX_CROSS_COMPILING */

} // namespace hw
} // namespace samcxx

#endif /* SAMCXX_HW_HPP */
