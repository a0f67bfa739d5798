// SPDX-License-Identifier: Apache-2.0
// Copyright 2015-2019 Peter A. Bigot

#include <samcxx/periph.hpp>

namespace samcxx {
namespace periph {

int
gate::enable (id pid)
{
  if (!variant_.has_peripheral(pid)) {
    return error_encoded(ERR_UNKNOWN_PERIPHERAL);
  }
  if (always_clocked(pid)) {
    return 0;
  }
  primask mutex;
  if (!pmc_.peripheral_enabled(pid)) {
    pmc_.peripheral_enable(pid);
  }
  return 0;
}

void
gate::disable (id pid)
{
  if ((!variant_.has_peripheral(pid))
      || always_clocked(pid)) {
    return;
  }
  primask mutex;
  if (pmc_.peripheral_enabled(pid)) {
    pmc_.peripheral_disable(pid);
  }
}

bool
gate::enabled (id pid) const
{
  if (!variant_.has_peripheral(pid)) {
    return false;
  }
  return always_clocked(pid) || pmc_.peripheral_enabled(pid);
}

} // namespace periph
} // namespace samcxx
