/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Pin multiplexing and ownership.
 *
 * Pins are identified by a global selector (`psel`) that combines the
 * PIO controller and the pin within it: `psel = 32 * group + pin`, so
 * PA0 is 0 and PB27 is 59.
 *
 * @file */

#ifndef SAMCXX_GPIO_HPP
#define SAMCXX_GPIO_HPP
#pragma once

#include <array>

#include <samcxx/hw.hpp>

namespace samcxx {

/** Functions and classes related to pin configuration. */
namespace gpio {

/** Number of pins in a PIO controller. */
constexpr unsigned int pins_per_group = 32;

/** Largest number of pins on any variant. */
constexpr unsigned int max_pins = 6 * pins_per_group;

/** Global selector for @p pin of PIO controller @p group. */
constexpr int psel (unsigned int group,
                    unsigned int pin)
{
  return static_cast<int>(pins_per_group * group + pin);
}

/** The PIO controller ordinal for @p psel. */
constexpr unsigned int group_of (int psel)
{
  return static_cast<unsigned int>(psel) / pins_per_group;
}

/** The bit for @p psel within its PIO controller registers. */
constexpr uint32_t bit_of (int psel)
{
  return uint32_t{1} << (static_cast<unsigned int>(psel) % pins_per_group);
}

/** Electrical role of a pin. */
enum class function_type : uint8_t
{
  /** The pin has no owner.  It is a PIO input with pull-up, as at
   * reset. */
  unassigned,
  gpio_input,
  gpio_input_pullup,
  gpio_output,
  gpio_output_open_drain,
  /** Peripheral function A. */
  periph_a,
  /** Peripheral function B. */
  periph_b,
};

/** Arbiter of pin ownership.
 *
 * A peripheral driver claims each pin it needs before using it and
 * releases it when done.  The registry refuses to hand a pin held by
 * one peripheral to another, and configures the multiplexer as a side
 * effect of a successful claim.
 *
 * Mutations are performed within a primask critical section so pins
 * may be claimed from interrupt handlers. */
class registry : public error_support
{
public:
  /** Another peripheral holds the pin. */
  constexpr static error_type ERR_ALREADY_CLAIMED = 0x01;

  /** The caller does not hold the pin. */
  constexpr static error_type ERR_NOT_OWNER = 0x02;

  /** The pin or the owner does not exist on the variant, or the
   * function is not one that can be claimed. */
  constexpr static error_type ERR_INVALID = 0x04;

  explicit registry (hw::pio_interface& pio,
                     const variant_type& variant = variant::current);

  registry (const registry&) = delete;
  registry& operator= (const registry&) = delete;
  registry (registry&&) = delete;
  registry& operator= (registry&&) = delete;

  /** `true` iff @p psel identifies a pin bonded out on the
   * variant. */
  bool valid (int psel) const
  {
    return (0 <= psel)
      && variant_.has_pin(group_of(psel), static_cast<unsigned int>(psel) % pins_per_group);
  }

  /** Assign @p psel to @p owner in role @p function.
   *
   * For peripheral functions the A/B select is written before the pin
   * is taken off PIO control.  For GPIO functions the direction,
   * pull-up and open-drain settings are written before the pin is put
   * under PIO control.
   *
   * A repeated claim of the same function by the owner succeeds
   * without register writes; a claim of a different function by the
   * owner reconfigures the pin.
   *
   * @return zero on success, or a negative encoded #ERR_INVALID or
   * #ERR_ALREADY_CLAIMED.  Nothing is written on failure. */
  int claim (int psel,
             function_type function,
             periph::id owner);

  /** Return @p psel to its reset configuration and clear the owner.
   *
   * @return zero on success, or a negative encoded #ERR_INVALID or
   * #ERR_NOT_OWNER. */
  int release (int psel,
               periph::id owner);

  /** The owner of @p psel as a periph::id value, or -1 if the pin is
   * unassigned or invalid. */
  int owner (int psel) const;

  /** The role assigned to @p psel. */
  function_type function (int psel) const;

  /** `true` iff @p owner holds @p psel. */
  bool owns (int psel,
             periph::id owner) const
  {
    return owner_of_(psel) == static_cast<uint8_t>(owner);
  }

  /** Drive an owned GPIO output high (@p level true) or low.
   *
   * @return zero on success, or a negative encoded #ERR_NOT_OWNER or
   * #ERR_INVALID if @p psel is not a GPIO output. */
  int write (int psel,
             periph::id owner,
             bool level);

  /** Invert the output level of an owned GPIO output. */
  int toggle (int psel,
              periph::id owner);

  /** Read the level at the pin.
   *
   * Any valid pin may be read regardless of ownership.
   *
   * @return 0 or 1 for the pin level, or a negative encoded
   * #ERR_INVALID. */
  int read (int psel) const;

private:
  constexpr static uint8_t NO_OWNER = 0xFF;

  uint8_t owner_of_ (int psel) const
  {
    return valid(psel) ? owner_[psel] : NO_OWNER;
  }

  void configure_ (int psel,
                   function_type function);
  int check_output_ (int psel,
                     periph::id owner) const;

  hw::pio_interface& pio_;
  const variant_type& variant_;
  std::array<uint8_t, max_pins> owner_;
  std::array<function_type, max_pins> function_;
};

} // namespace gpio
} // namespace samcxx

#endif /* SAMCXX_GPIO_HPP */
