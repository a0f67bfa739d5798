/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2018-2019 Peter A. Bigot */

/** Console output through C stdio.
 *
 * Include this into the application implementation file that reports
 * clock bring-up and pin assignment results.  On the target stdout is
 * whatever the newlib retargeting layer of the application connects
 * it to (typically the UART on PA8/PA9).  Host builds write to the
 * process stdout.
 *
 * Library code never includes this; only applications print.
 *
 * @file */

#ifndef SAMCXX_CONSOLE_HPP
#define SAMCXX_CONSOLE_HPP
#pragma once

#include <cstdio>

namespace {

/** Disable buffering on stdout.
 *
 * Output then survives a clock switch that stalls the core, and the
 * heap is spared the stdio buffer. */
inline void csetvbuf ()
{
  setvbuf(stdout, NULL, _IONBF, 0);
}

/** Formatted printf. */
template <typename ...Args>
inline void cprintf (const char* format, Args... args)
{
  printf(format, args...);
}

/** Text output with added newline. */
inline void cputs (const char* text)
{
  puts(text);
}

/** Output a single character. */
inline int cputchar (int ch)
{
  return putchar(ch);
}

/** Push any buffered output to the device.
 *
 * Call this before an operation that changes the master clock when
 * buffering has not been disabled. */
inline void cflush ()
{
  fflush(stdout);
}

} // ns anonymous

#endif /* SAMCXX_CONSOLE_HPP */
