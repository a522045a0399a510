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

// \brief The fcsweep time source file.
//
// Provides the sweep harness with a monotonic time class.

#include "itime.h"
#include "unused.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <inttypes.h>


using ::fcsweep::Time;
using ::std::numeric_limits;
using ::std::string;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "Time";
}

//============================================================================
Time::Time(const timespec& t_spec)
    : t_val_()
{
  t_val_.tv_sec  = t_spec.tv_sec;
  t_val_.tv_usec = static_cast<suseconds_t>((t_spec.tv_nsec + 500) / 1000);

  while (t_val_.tv_usec >= 1000000)
  {
    t_val_.tv_sec  += 1;
    t_val_.tv_usec -= 1000000;
  }
}

//============================================================================
Time::Time(double fractional_time_in_seconds)
    : t_val_()
{
  double  sec = floor(fractional_time_in_seconds);

  t_val_.tv_sec  = static_cast<time_t>(sec);
  t_val_.tv_usec = static_cast<suseconds_t>(
    round((fractional_time_in_seconds - sec) * 1000000.0));

  if (t_val_.tv_usec >= 1000000)
  {
    t_val_.tv_sec  += 1;
    t_val_.tv_usec -= 1000000;
  }
}

//============================================================================
Time Time::FromSec(time_t seconds)
{
  timeval  tv;

  tv.tv_sec  = seconds;
  tv.tv_usec = 0;

  return Time(tv);
}

//============================================================================
Time Time::FromMsec(int64_t milliseconds)
{
  return Time::FromUsec(milliseconds * 1000);
}

//============================================================================
Time Time::FromUsec(int64_t microseconds)
{
  timeval  tv;

  if (microseconds >= 0)
  {
    tv.tv_sec  = static_cast<time_t>(microseconds / 1000000);
    tv.tv_usec = static_cast<suseconds_t>(microseconds % 1000000);
  }
  else if ((microseconds % 1000000) == 0)
  {
    tv.tv_sec  = static_cast<time_t>(microseconds / 1000000);
    tv.tv_usec = 0;
  }
  else
  {
    tv.tv_sec  = static_cast<time_t>((microseconds / 1000000) - 1);
    tv.tv_usec = static_cast<suseconds_t>(
      (1000000 - llabs(microseconds % 1000000)));
  }

  return Time(tv);
}

//============================================================================
Time Time::Now()
{
  Time  t;

  t.GetNow();

  return t;
}

//============================================================================
Time Time::Infinite()
{
  timeval  tv;

  tv.tv_sec  = numeric_limits<time_t>::max();
  tv.tv_usec = 0;

  return Time(tv);
}

//============================================================================
Time Time::Max(const Time& t1, const Time& t2)
{
  if (t1 > t2)
  {
    return t1;
  }

  return t2;
}

//============================================================================
Time Time::Min(const Time& t1, const Time& t2)
{
  if (t1 < t2)
  {
    return t1;
  }

  return t2;
}

//============================================================================
void Time::Sleep(const Time& duration)
{
  if ((duration.t_val_.tv_sec < 0) || duration.IsZero())
  {
    return;
  }

  timespec  sleep_time = duration.ToTspec();
  timespec  rem_time;

  while (nanosleep(&sleep_time, &rem_time) != 0)
  {
    if (errno != EINTR)
    {
      LogW(kClassName, __func__, "nanosleep error: %s\n", strerror(errno));
      return;
    }
    sleep_time = rem_time;
  }
}

//============================================================================
string Time::GetWallClockString()
{
  timeval  now;
  tm       tm_time;
  char     buf[32];
  char     ret_str[48];

  gettimeofday(&now, NULL);

  if ((localtime_r(&now.tv_sec, &tm_time) == NULL) ||
      (strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_time) == 0))
  {
    LogW(kClassName, __func__, "Unable to format wall clock time.\n");
    return "";
  }

  snprintf(ret_str, sizeof(ret_str), "%s.%06ld", buf,
           static_cast<long>(now.tv_usec));

  return ret_str;
}

//============================================================================
string Time::ToString() const
{
  char  ret_str[30];

  if (IsInfinite())
  {
    return "inf";
  }

  if (t_val_.tv_sec >= 0)
  {
    if (snprintf(ret_str, sizeof(ret_str), "%" PRId64 ".%06" PRId64 "s",
                 static_cast<int64_t>(t_val_.tv_sec),
                 static_cast<int64_t>(t_val_.tv_usec)) < 0)
    {
      return "Error";
    }
  }
  else
  {
    int64_t  usec = -GetTimeInUsec();

    if (snprintf(ret_str, sizeof(ret_str), "-%" PRId64 ".%06" PRId64 "s",
                 usec / 1000000, usec % 1000000) < 0)
    {
      return "Error";
    }
  }

  return ret_str;
}

//============================================================================
timespec Time::ToTspec() const
{
  timespec  ts;

  ts.tv_sec  = t_val_.tv_sec;
  ts.tv_nsec = static_cast<long>(t_val_.tv_usec) * 1000;

  return ts;
}

//============================================================================
bool Time::GetNow()
{
  timespec  t_spec;

  if (clock_gettime(CLOCK_MONOTONIC, &t_spec) != 0)
  {
    LogF(kClassName, __func__, "Monotonic clock failed with error %s\n",
         strerror(errno));
    t_val_.tv_sec  = 0;
    t_val_.tv_usec = 0;
    return false;
  }

  *this = Time(t_spec);

  return true;
}

//============================================================================
Time& Time::operator+=(const Time& time_to_add)
{
  timeval  ret_tval;

  timeradd(&t_val_, &time_to_add.t_val_, &ret_tval);

  t_val_ = ret_tval;

  return *this;
}

//============================================================================
Time Time::Multiply(double multiplier) const
{
  return Time::FromUsec(static_cast<int64_t>
                        (static_cast<double>(GetTimeInUsec()) * multiplier));
}

//============================================================================
int64_t Time::GetTimeInMsec() const
{
  return ((static_cast<int64_t>(t_val_.tv_sec) * (int64_t)1000) +
          static_cast<int64_t>(t_val_.tv_usec / 1000));
}

//============================================================================
int64_t Time::GetTimeInUsec() const
{
  return ((static_cast<int64_t>(t_val_.tv_sec) * (int64_t)1000000) +
          static_cast<int64_t>(t_val_.tv_usec));
}
