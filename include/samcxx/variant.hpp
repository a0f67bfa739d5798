/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Description of the SAM3X/SAM3A part variants.
 *
 * The configuration space of the clock tree and pin multiplexer is
 * small and fixed per part: which PIO controllers are bonded out,
 * which peripheral identifiers exist, and the documented frequency
 * ranges of the oscillators and PLLs.  Those facts are captured in a
 * variant_type instance so validation can be expressed against data
 * rather than conditional compilation.
 *
 * The part is selected at build time by defining one of
 * `SAMCXX_VARIANT_SAM3A4C`, `SAMCXX_VARIANT_SAM3A8C`,
 * `SAMCXX_VARIANT_SAM3X4C`, `SAMCXX_VARIANT_SAM3X8C`,
 * `SAMCXX_VARIANT_SAM3X4E`, `SAMCXX_VARIANT_SAM3X8E` or
 * `SAMCXX_VARIANT_SAM3X8H`.  Host builds default to SAM3X8E.
 *
 * @file */

#ifndef SAMCXX_VARIANT_HPP
#define SAMCXX_VARIANT_HPP
#pragma once

#include <array>

#include <samcxx/core.hpp>

namespace samcxx {

namespace periph {

/** Peripheral identifiers.
 *
 * The value is the PID used both for the PMC peripheral clock gate and
 * for the NVIC interrupt line of the peripheral. */
enum class id : uint8_t
{
  SUPC = 0,
  RSTC = 1,
  RTC = 2,
  RTT = 3,
  WDT = 4,
  PMC = 5,
  EFC0 = 6,
  EFC1 = 7,
  UART = 8,
  SMC = 9,
  SDRAMC = 10,
  PIOA = 11,
  PIOB = 12,
  PIOC = 13,
  PIOD = 14,
  PIOE = 15,
  PIOF = 16,
  USART0 = 17,
  USART1 = 18,
  USART2 = 19,
  USART3 = 20,
  HSMCI = 21,
  TWI0 = 22,
  TWI1 = 23,
  SPI0 = 24,
  SPI1 = 25,
  SSC = 26,
  TC0 = 27,
  TC1 = 28,
  TC2 = 29,
  TC3 = 30,
  TC4 = 31,
  TC5 = 32,
  TC6 = 33,
  TC7 = 34,
  TC8 = 35,
  PWM = 36,
  ADC = 37,
  DACC = 38,
  DMAC = 39,
  UOTGHS = 40,
  TRNG = 41,
  EMAC = 42,
  CAN0 = 43,
  CAN1 = 44,
};

/** One past the largest peripheral identifier on any variant. */
constexpr unsigned int id_limit = 45;

/** Identifiers below this value are clocked unconditionally; the PMC
 * has no gate for them. */
constexpr unsigned int first_gated_id = static_cast<unsigned int>(id::UART);

/** Bit corresponding to @p pid in variant_type::peripherals. */
constexpr uint64_t id_bit (id pid)
{
  return uint64_t{1} << static_cast<unsigned int>(pid);
}

} // namespace periph

namespace clock {

/** Clock sources that may drive the master clock.
 *
 * `main_rc`, `main_xtal` and `main_bypass` are the three ways of
 * producing the main clock.  `plla` is PLL A; `upll` is the UTMI PLL
 * that serves as PLL B on this family. */
enum class source_id : uint8_t
{
  slow,
  main_rc,
  main_xtal,
  main_bypass,
  plla,
  upll,
};

/** Number of distinct source_id values. */
constexpr unsigned int source_count = 6;

/** Bit corresponding to @p sid in variant_type::clock_sources. */
constexpr unsigned int source_bit (source_id sid)
{
  return 1U << static_cast<unsigned int>(sid);
}

} // namespace clock

/** Static facts about a specific part.
 *
 * Frequencies are in Hz.  PLL multipliers are the effective
 * multiplication factor, i.e. the register `MULA` field plus one. */
struct variant_type
{
  /** Part name, for diagnostics. */
  const char* name;

  /** Number of PIO controllers, starting with PIOA. */
  uint8_t pio_groups;

  /** Per controller, the pins bonded out on the package. */
  std::array<uint32_t, 6> pio_pins;

  /** Bit set of periph::id_bit() for the peripherals present. */
  uint64_t peripherals;

  /** Bit set of clock::source_bit() for the sources present. */
  unsigned int clock_sources;

  /** Ceiling for the master (processor) clock. */
  unsigned int max_master_Hz;

  /** Ceiling for the clock delivered to peripherals. */
  unsigned int max_peripheral_Hz;

  unsigned int main_xtal_min_Hz;
  unsigned int main_xtal_max_Hz;
  unsigned int main_bypass_min_Hz;
  unsigned int main_bypass_max_Hz;

  unsigned int pll_mul_min;
  unsigned int pll_mul_max;
  unsigned int pll_div_min;
  unsigned int pll_div_max;

  /** Range of PLLA reference after the divider. */
  unsigned int plla_in_min_Hz;
  unsigned int plla_in_max_Hz;

  /** Range of the PLLA output. */
  unsigned int plla_out_min_Hz;
  unsigned int plla_out_max_Hz;

  /** The UPLL locks only to a main clock of exactly this frequency. */
  unsigned int upll_ref_Hz;

  /** Fixed UPLL multiplication factor. */
  unsigned int upll_mul;

  constexpr bool has_peripheral (periph::id pid) const
  {
    return (static_cast<unsigned int>(pid) < periph::id_limit)
      && (peripherals & periph::id_bit(pid));
  }

  constexpr bool has_source (clock::source_id sid) const
  {
    return (static_cast<unsigned int>(sid) < clock::source_count)
      && (clock_sources & clock::source_bit(sid));
  }

  constexpr bool has_pio_group (unsigned int group) const
  {
    return group < pio_groups;
  }

  constexpr bool has_pin (unsigned int group,
                          unsigned int pin) const
  {
    return has_pio_group(group)
      && (32 > pin)
      && (pio_pins[group] & (1U << pin));
  }
};

namespace variant {

/** @cond DOXYGEN_EXCLUDE */
namespace details {

using periph::id;
using periph::id_bit;

inline constexpr uint64_t common_peripherals = (id_bit(id::SUPC) | id_bit(id::RSTC)
                                                | id_bit(id::RTC) | id_bit(id::RTT)
                                                | id_bit(id::WDT) | id_bit(id::PMC)
                                                | id_bit(id::EFC0) | id_bit(id::EFC1)
                                                | id_bit(id::UART)
                                                | id_bit(id::PIOA) | id_bit(id::PIOB)
                                                | id_bit(id::USART0) | id_bit(id::USART1)
                                                | id_bit(id::USART2) | id_bit(id::HSMCI)
                                                | id_bit(id::TWI0) | id_bit(id::TWI1)
                                                | id_bit(id::SPI0) | id_bit(id::SSC)
                                                | id_bit(id::TC0) | id_bit(id::TC1)
                                                | id_bit(id::TC2) | id_bit(id::TC3)
                                                | id_bit(id::TC4) | id_bit(id::TC5)
                                                | id_bit(id::PWM) | id_bit(id::ADC)
                                                | id_bit(id::DACC) | id_bit(id::DMAC)
                                                | id_bit(id::UOTGHS) | id_bit(id::TRNG)
                                                | id_bit(id::CAN0) | id_bit(id::CAN1));

/* 144-pin packages */
inline constexpr uint64_t e_peripherals = (id_bit(id::PIOC) | id_bit(id::PIOD)
                                           | id_bit(id::USART3)
                                           | id_bit(id::TC6) | id_bit(id::TC7)
                                           | id_bit(id::TC8));

/* 217-pin package */
inline constexpr uint64_t h_peripherals = (e_peripherals
                                           | id_bit(id::SMC) | id_bit(id::SDRAMC)
                                           | id_bit(id::PIOE) | id_bit(id::PIOF)
                                           | id_bit(id::SPI1));

inline constexpr unsigned int all_sources = ((1U << clock::source_count) - 1);

/* Bonded pins: PA0..PA29 and PB0..PB31 on every package; PC0..PC30
 * and PD0..PD10 on 144 pins; PD0..PD30, PE0..PE31 and PF0..PF6 on
 * 217 pins. */
inline constexpr std::array<uint32_t, 6> c_pins{{0x3FFFFFFF, 0xFFFFFFFF}};
inline constexpr std::array<uint32_t, 6> e_pins{{0x3FFFFFFF, 0xFFFFFFFF, 0x7FFFFFFF, 0x000007FF}};
inline constexpr std::array<uint32_t, 6> h_pins{{0x3FFFFFFF, 0xFFFFFFFF, 0x7FFFFFFF,
                                          0x7FFFFFFF, 0xFFFFFFFF, 0x0000007F}};

constexpr variant_type make (const char* name,
                             uint8_t pio_groups,
                             const std::array<uint32_t, 6>& pio_pins,
                             uint64_t peripherals)
{
  return {
    name, pio_groups, pio_pins, peripherals, all_sources,
    84'000'000, 84'000'000,
    3'000'000, 20'000'000,
    3'000'000, 50'000'000,
    2, 2048,
    1, 255,
    8'000'000, 32'000'000,
    84'000'000, 192'000'000,
    12'000'000, 40,
  };
}

} // namespace details
/** @endcond */

inline constexpr variant_type sam3a4c = details::make("SAM3A4C", 2, details::c_pins,
                                                     details::common_peripherals);
inline constexpr variant_type sam3a8c = details::make("SAM3A8C", 2, details::c_pins,
                                                     details::common_peripherals);
inline constexpr variant_type sam3x4c = details::make("SAM3X4C", 2, details::c_pins,
                                                     (details::common_peripherals
                                                      | periph::id_bit(periph::id::EMAC)));
inline constexpr variant_type sam3x8c = details::make("SAM3X8C", 2, details::c_pins,
                                                     (details::common_peripherals
                                                      | periph::id_bit(periph::id::EMAC)));
inline constexpr variant_type sam3x4e = details::make("SAM3X4E", 4, details::e_pins,
                                                     (details::common_peripherals
                                                      | details::e_peripherals
                                                      | periph::id_bit(periph::id::EMAC)));
inline constexpr variant_type sam3x8e = details::make("SAM3X8E", 4, details::e_pins,
                                                     (details::common_peripherals
                                                      | details::e_peripherals
                                                      | periph::id_bit(periph::id::EMAC)));
inline constexpr variant_type sam3x8h = details::make("SAM3X8H", 6, details::h_pins,
                                                     (details::common_peripherals
                                                      | details::h_peripherals
                                                      | periph::id_bit(periph::id::EMAC)));

/** The variant selected for this build. */
inline constexpr const variant_type& current{
#if (SAMCXX_VARIANT_SAM3A4C - 0)
  sam3a4c
#elif (SAMCXX_VARIANT_SAM3A8C - 0)
  sam3a8c
#elif (SAMCXX_VARIANT_SAM3X4C - 0)
  sam3x4c
#elif (SAMCXX_VARIANT_SAM3X8C - 0)
  sam3x8c
#elif (SAMCXX_VARIANT_SAM3X4E - 0)
  sam3x4e
#elif (SAMCXX_VARIANT_SAM3X8H - 0)
  sam3x8h
#elif (SAMCXX_VARIANT_SAM3X8E - 0) || (SAMCXX_FAKED - 0) || !(SAMCXX_CROSS_COMPILING - 0)
  sam3x8e
#else
#error Unrecognized SAM3 variant
#endif
};

} // namespace variant

} // namespace samcxx

#endif /* SAMCXX_VARIANT_HPP */
