// IRON: iron_headers
/*
 * Distribution A
 *
 * Approved for Public Release, Distribution Unlimited
 *
 * EdgeCT (IRON) Software Contract No.: HR0011-15-C-0097
 * DCOMP (GNAT)  Software Contract No.: HR0011-17-C-0050
 * Copyright (c) 2015-20 Raytheon BBN Technologies Corp.
 *
 * This material is based upon work supported by the Defense Advanced
 * Research Projects Agency under Contracts No. HR0011-15-C-0097 and
 * HR0011-17-C-0050. Any opinions, findings and conclusions or
 * recommendations expressed in this material are those of the author(s)
 * and do not necessarily reflect the views of the Defense Advanced
 * Research Project Agency.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
/* IRON: end */

#ifndef FCSWEEP_COMMON_ITIME_H
#define FCSWEEP_COMMON_ITIME_H

#include "log.h"

#include <limits>

#include <stdint.h>
#include <string>
#include <sys/time.h>
#include <time.h>

namespace fcsweep
{

  ///
  /// A class for time values and monotonic clock readings.
  ///
  /// All "now" readings come from CLOCK_MONOTONIC, so a Time obtained from
  /// Now() is only meaningful relative to another such reading.  The only
  /// wall clock access is GetWallClockString(), used for record timestamps.
  ///
  class Time
  {
    public:

    ///
    /// Default constructor.  The time is zero.
    ///
    inline Time() : t_val_()
    {
      t_val_.tv_sec  = 0;
      t_val_.tv_usec = 0;
    }

    ///
    /// Copy constructor.
    ///
    inline Time(const Time& other_time) : t_val_(other_time.t_val_) {}

    ///
    /// Constructor from a timeval.
    ///
    inline explicit Time(const timeval& t_val) : t_val_(t_val) {}

    ///
    /// Constructor from a timespec, rounded to the nearest microsecond.
    ///
    explicit Time(const timespec& t_spec);

    ///
    /// Constructor from fractional seconds.
    ///
    /// \param  fractional_time_in_seconds  The time, e.g. 1.25.
    ///
    explicit Time(double fractional_time_in_seconds);

    ///
    /// Destructor.
    ///
    virtual ~Time() {};

    static Time FromSec(time_t seconds);

    static Time FromMsec(int64_t milliseconds);

    static Time FromUsec(int64_t microseconds);

    ///
    /// Get the current monotonic time.
    ///
    /// \return  The current time.
    ///
    static Time Now();

    ///
    /// Get a time value that compares greater than every finite time.
    ///
    static Time Infinite();

    static Time Max(const Time& t1, const Time& t2);

    static Time Min(const Time& t1, const Time& t2);

    ///
    /// Sleep for the given duration, resuming after signal interruptions.
    ///
    /// \param  duration  How long to sleep.  Non-positive values return
    ///                   immediately.
    ///
    static void Sleep(const Time& duration);

    ///
    /// Get the current wall clock time as an ISO-8601 local time string with
    /// microseconds, e.g. "2026-10-19T14:03:11.412077".
    ///
    static std::string GetWallClockString();

    ///
    /// Returns a string representation of the time, e.g. "1.250000s".
    ///
    std::string ToString() const;

    inline timeval ToTval() const
    {
      return t_val_;
    }

    ///
    /// Convert the time into a timespec.
    ///
    timespec ToTspec() const;

    inline double ToDouble() const
    {
      return (static_cast<double>(t_val_.tv_sec) +
              (static_cast<double>(t_val_.tv_usec) / 1000000.0));
    }

    ///
    /// Set the object to the current monotonic time.
    ///
    /// \return  true on success.
    ///
    bool GetNow();

    inline Time operator+(const Time& time_to_add) const
    {
      timeval  ret_tval;
      timeradd(&t_val_, &time_to_add.t_val_, &ret_tval);
      return Time(ret_tval);
    }

    Time& operator+=(const Time& time_to_add);

    inline Time operator-(const Time& time_to_remove) const
    {
      timeval  ret_tval;
      timersub(&t_val_, &time_to_remove.t_val_, &ret_tval);
      return Time(ret_tval);
    }

    inline bool operator<(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, <) != 0);
    }

    inline bool operator>(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, >) != 0);
    }

    inline bool operator<=(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, >) == 0);
    }

    inline bool operator>=(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, <) == 0);
    }

    inline bool operator==(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, !=) == 0);
    }

    inline bool operator!=(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, !=) != 0);
    }

    inline Time& operator=(const Time& time_to_assign)
    {
      t_val_ = time_to_assign.t_val_;
      return *this;
    }

    ///
    /// Scale the time by a real multiplier.
    ///
    Time Multiply(double multiplier) const;

    inline bool IsZero() const
    {
      return ((t_val_.tv_sec == 0) && (t_val_.tv_usec == 0));
    }

    inline bool IsInfinite() const
    {
      return (t_val_.tv_sec == std::numeric_limits<time_t>::max());
    }

    int64_t GetTimeInMsec() const;

    int64_t GetTimeInUsec() const;

    private:

    /// The time value.
    timeval  t_val_;

  }; // end class Time

} // namespace fcsweep

#endif // FCSWEEP_COMMON_ITIME_H
