// SPDX-License-Identifier: Apache-2.0
// Copyright 2015-2019 Peter A. Bigot

#include <samcxx/gpio.hpp>

namespace samcxx {
namespace gpio {

registry::registry (hw::pio_interface& pio,
                    const variant_type& variant) :
  pio_{pio},
  variant_{variant}
{
  owner_.fill(NO_OWNER);
  function_.fill(function_type::unassigned);
}

void
registry::configure_ (int psel,
                      function_type function)
{
  auto const group = group_of(psel);
  auto const bit = bit_of(psel);

  switch (function) {
    case function_type::periph_a:
    case function_type::periph_b:
      pio_.select_peripheral(group, bit, function_type::periph_b == function);
      pio_.pio_disable(group, bit);
      return;
    case function_type::gpio_output:
    case function_type::gpio_output_open_drain:
      pio_.pullup_enable(group, bit, false);
      pio_.multidrive_enable(group, bit, function_type::gpio_output_open_drain == function);
      pio_.output_enable(group, bit, true);
      break;
    case function_type::gpio_input:
      pio_.multidrive_enable(group, bit, false);
      pio_.output_enable(group, bit, false);
      pio_.pullup_enable(group, bit, false);
      break;
    case function_type::unassigned:
    case function_type::gpio_input_pullup:
      pio_.multidrive_enable(group, bit, false);
      pio_.output_enable(group, bit, false);
      pio_.pullup_enable(group, bit, true);
      break;
  }
  pio_.pio_enable(group, bit);
}

int
registry::claim (int psel,
                 function_type function,
                 periph::id owner)
{
  if ((!valid(psel))
      || (!variant_.has_peripheral(owner))
      || (function_type::unassigned == function)
      || (function_type::periph_b < function)) {
    return error_encoded(ERR_INVALID);
  }

  auto const oid = static_cast<uint8_t>(owner);
  primask mutex;
  auto const holder = owner_[psel];
  if ((NO_OWNER != holder) && (oid != holder)) {
    return error_encoded(ERR_ALREADY_CLAIMED);
  }
  if ((oid == holder) && (function == function_[psel])) {
    return 0;
  }
  configure_(psel, function);
  owner_[psel] = oid;
  function_[psel] = function;
  return 0;
}

int
registry::release (int psel,
                   periph::id owner)
{
  if (!valid(psel)) {
    return error_encoded(ERR_INVALID);
  }
  primask mutex;
  if (owner_[psel] != static_cast<uint8_t>(owner)) {
    return error_encoded(ERR_NOT_OWNER);
  }
  configure_(psel, function_type::unassigned);
  owner_[psel] = NO_OWNER;
  function_[psel] = function_type::unassigned;
  return 0;
}

int
registry::owner (int psel) const
{
  auto const oid = owner_of_(psel);
  return (NO_OWNER == oid) ? -1 : oid;
}

function_type
registry::function (int psel) const
{
  return valid(psel) ? function_[psel] : function_type::unassigned;
}

int
registry::check_output_ (int psel,
                         periph::id owner) const
{
  if (!valid(psel)) {
    return error_encoded(ERR_INVALID);
  }
  if (!owns(psel, owner)) {
    return error_encoded(ERR_NOT_OWNER);
  }
  auto const fn = function_[psel];
  if ((function_type::gpio_output != fn)
      && (function_type::gpio_output_open_drain != fn)) {
    return error_encoded(ERR_INVALID);
  }
  return 0;
}

int
registry::write (int psel,
                 periph::id owner,
                 bool level)
{
  auto rc = check_output_(psel, owner);
  if (0 == rc) {
    pio_.output_set(group_of(psel), bit_of(psel), level);
  }
  return rc;
}

int
registry::toggle (int psel,
                  periph::id owner)
{
  primask mutex;
  auto rc = check_output_(psel, owner);
  if (0 == rc) {
    auto const group = group_of(psel);
    auto const bit = bit_of(psel);
    pio_.output_set(group, bit, !(pio_.output_data(group) & bit));
  }
  return rc;
}

int
registry::read (int psel) const
{
  if (!valid(psel)) {
    return error_encoded(ERR_INVALID);
  }
  return (pio_.pin_data(group_of(psel)) & bit_of(psel)) ? 1 : 0;
}

} // namespace gpio
} // namespace samcxx
