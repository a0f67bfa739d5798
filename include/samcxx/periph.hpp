/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Peripheral clock gating.
 *
 * @file */

#ifndef SAMCXX_PERIPH_HPP
#define SAMCXX_PERIPH_HPP
#pragma once

#include <samcxx/hw.hpp>

namespace samcxx {

/** Functions and classes related to peripheral instances. */
namespace periph {

/** `true` iff @p pid has no gate and is always clocked. */
constexpr bool always_clocked (id pid)
{
  return static_cast<unsigned int>(pid) < first_gated_id;
}

/** Control of the PMC peripheral clock gates.
 *
 * A driver must enable the clock to its peripheral before touching
 * any other register of the peripheral.  Access to an unclocked
 * peripheral is not detected.
 *
 * Mutations are performed within a primask critical section so gates
 * may be changed from interrupt handlers. */
class gate : public error_support
{
public:
  /** The identifier does not name a peripheral of the variant. */
  constexpr static error_type ERR_UNKNOWN_PERIPHERAL = 0x01;

  explicit gate (hw::pmc_interface& pmc,
                 const variant_type& variant = variant::current) :
    pmc_{pmc},
    variant_{variant}
  { }

  gate (const gate&) = delete;
  gate& operator= (const gate&) = delete;
  gate (gate&&) = delete;
  gate& operator= (gate&&) = delete;

  /** Open the clock gate for @p pid.
   *
   * Enabling a peripheral that is already clocked succeeds without a
   * register write.
   *
   * @return zero on success, or a negative encoded
   * #ERR_UNKNOWN_PERIPHERAL. */
  int enable (id pid);

  /** Close the clock gate for @p pid.
   *
   * Unknown and always-clocked peripherals are ignored.  The caller
   * is responsible for ensuring no driver still uses the
   * peripheral. */
  void disable (id pid);

  /** `true` iff @p pid is a peripheral of the variant and is
   * clocked. */
  bool enabled (id pid) const;

private:
  hw::pmc_interface& pmc_;
  const variant_type& variant_;
};

} // namespace periph
} // namespace samcxx

#endif /* SAMCXX_PERIPH_HPP */
