// SPDX-License-Identifier: Apache-2.0
// Copyright 2018-2019 Peter A. Bigot

#include <samcxx/clock.hpp>

namespace samcxx {
namespace board {

/* Provide a default board initialization that brings up the clock
 * tree described by the board header. */
int
__attribute__((__weak__))
initialize (clock::sequencer& seq,
            clock::sequencer::duration_type timeout)
{
  clock::model model;
  clock::validated_config validated;
  auto rc = model.validate(clock_config(), validated);
  if (0 > rc) {
    return rc;
  }
  return seq.apply(validated, timeout);
}

} // namespace board
} // namespace samcxx
