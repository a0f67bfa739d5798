/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Primary header for samcxx interface dependencies.
 *
 * Including this module does not introduce a dependency on the CMSIS
 * device headers.  Only the register-surface implementation for the
 * target (`src/sam3x/hw.cc`) includes those; everything else reaches
 * hardware through the abstract interfaces in <samcxx/hw.hpp>.
 *
 * @anchor samcxx_mutex Mutex support: @link samcxx::primask@endlink
 *
 * @file */

#ifndef SAMCXX_CORE_HPP
#define SAMCXX_CORE_HPP
#pragma once

#include <cstddef>
#include <cstdint>

#ifndef SAMCXX_FAKED
/** Macro defined to preprocessor true for host-based testing.
 *
 * In that situation #SAMCXX_CROSS_COMPILING should be a preprocessor
 * false (i.e. 0), and the variant defaults to SAM3X8E. */
#define SAMCXX_FAKED 0
#endif /* SAMCXX_FAKED */

#ifndef SAMCXX_CROSS_COMPILING
/** Macro defined to preprocessor true when cross-compiling.
 *
 * This is defined to preprocessor false when building on a host for
 * non-embedded testing of implementation. */
#define SAMCXX_CROSS_COMPILING 1
#endif /* SAMCXX_CROSS_COMPILING */

/** Primary namespace for samcxx functionality */
namespace samcxx {

/** Namespace holding board-specific configuration data.
 *
 * Most material is put into this namespace through the board-specific
 * <samcxx/board.hpp> header. */
namespace board {
} // ns board

/** RAII class to block exceptions.
 *
 * The PRIMASK configuration is recorded and then disabled.  When the
 * instance is destructed the recorded PRIMASK configuration is
 * restored.
 *
 * Note that this class is safe to use in contexts where interrupts
 * are already disabled: they will not be re-enabled when the object
 * is destructed.
 *
 * This is the critical section used by every mutating operation of
 * the clock gate and pin registry, so those may be invoked from
 * interrupt handlers. */
class primask
{
public:
  primask () :
    in_mask_{}
  {
#if (SAMCXX_CROSS_COMPILING - 0)
    __asm__ volatile ("mrs\t%0, primask\n\t"
                      "cpsid\ti"
                      : "=r" (in_mask_)
                      :
                      : "memory");
#endif /* SAMCXX_CROSS_COMPILING */
  }

  ~primask ()
  {
#if (SAMCXX_CROSS_COMPILING - 0)
    __asm__ volatile ("msr\tprimask, %0"
                      :
                      : "r" (in_mask_)
                      : "memory");
#endif /* SAMCXX_CROSS_COMPILING */
  }

  primask (const primask&) = delete;
  primask& operator= (const primask&) = delete;
  primask (primask&& ) = delete;
  primask& operator= (primask&) = delete;

private:
  uint32_t in_mask_;
};

/** Abstracted support for error returns.
 *
 * Operations that can fail return an `int` that is zero (or a
 * non-negative result) on success and a negative value on failure.
 * The failure detail is an #error_type bit set defined by the class
 * that inherits this one, packed with error_encoded() and recovered
 * with error_decoded(). */
class error_support
{
public:
  /** The type used to encode module-specific error bits. */
  using error_type = unsigned int;

  /** Extract an encoded error value from an API return value.
   *
   * @param rc a result code, which is negative if it represents an
   * error.
   *
   * @return Zero if @p rc does not represent an error, otherwise the
   * corresponding #error_type value. */
  constexpr static error_type
  error_decoded (int rc)
  {
    return (0 <= rc) ? 0 : (static_cast<unsigned int>(-rc) - 1);
  }

  /** Pack an error value into a negative return value.
   *
   * @return Zero if @p ec is zero, otherwise the encoded error
   * value. */
  constexpr static int
  error_encoded (error_type ec)
  {
    return ec ? -(1 + static_cast<int>(ec)) : 0;
  }
};

} // namespace samcxx

#endif /* SAMCXX_CORE_HPP */
