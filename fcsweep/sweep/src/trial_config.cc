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

#include "trial_config.h"

#include "string_utils.h"
#include "unused.h"

#include <cmath>
#include <limits>

using ::fcsweep::StringUtils;
using ::fcsweep::TrialConfig;
using ::std::string;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "TrialConfig";

  /// Bytes per "MB" of send rate.
  const double  kBytesPerMB = 1024.0 * 1024.0;

  /// Largest receive buffer request.  setsockopt() takes an int.
  const uint32_t  kMaxRecvBufBytes = 1024 * 1024 * 1024;

  /// Largest single read, which the receiver allocates up front.
  const uint32_t  kMaxReadChunkBytes = 64 * 1024 * 1024;
}

//============================================================================
TrialConfig::TrialConfig(uint32_t recv_buf_bytes, double read_delay_ms,
                         uint32_t read_chunk_bytes, double send_rate_mbps,
                         double duration_sec)
    : recv_buf_bytes_(recv_buf_bytes),
      read_delay_ms_(read_delay_ms),
      read_chunk_bytes_(read_chunk_bytes),
      send_rate_mbps_(send_rate_mbps),
      duration_sec_(duration_sec)
{
}

//============================================================================
TrialConfig::~TrialConfig()
{
}

//============================================================================
bool TrialConfig::IsValid(string& error) const
{
  if (!std::isfinite(read_delay_ms_) || (read_delay_ms_ < 0.0))
  {
    error = "read delay must be a non-negative number of milliseconds";
    return false;
  }

  if (recv_buf_bytes_ > kMaxRecvBufBytes)
  {
    error = "receive buffer must be at most " +
      StringUtils::ToString(kMaxRecvBufBytes) + " bytes";
    return false;
  }

  if (read_chunk_bytes_ == 0)
  {
    error = "read size must be positive";
    return false;
  }

  if (read_chunk_bytes_ > kMaxReadChunkBytes)
  {
    error = "read size must be at most " +
      StringUtils::ToString(kMaxReadChunkBytes) + " bytes";
    return false;
  }

  if (!std::isfinite(send_rate_mbps_) || (send_rate_mbps_ < 0.0))
  {
    error = "send rate must be a non-negative number of MB/s";
    return false;
  }

  if (!std::isfinite(duration_sec_) || (duration_sec_ <= 0.0))
  {
    error = "duration must be positive";
    return false;
  }

  return true;
}

//============================================================================
double TrialConfig::ReceiverCapacityBps() const
{
  if (read_delay_ms_ <= 0.0)
  {
    return std::numeric_limits<double>::infinity();
  }

  return (static_cast<double>(read_chunk_bytes_) / (read_delay_ms_ / 1000.0));
}

//============================================================================
double TrialConfig::SendRateBps() const
{
  return (send_rate_mbps_ * kBytesPerMB);
}

//============================================================================
double TrialConfig::OversubscriptionRatio() const
{
  double  capacity = ReceiverCapacityBps();

  if (std::isinf(capacity))
  {
    return 0.0;
  }

  if (capacity <= 0.0)
  {
    return std::numeric_limits<double>::infinity();
  }

  return (SendRateBps() / capacity);
}

//============================================================================
string TrialConfig::ToString() const
{
  return StringUtils::FormatString(
    160, "buf=%s, delay=%gms, read=%s, rate=%gMB/s",
    StringUtils::FormatBytes(recv_buf_bytes_).c_str(), read_delay_ms_,
    StringUtils::FormatBytes(read_chunk_bytes_).c_str(), send_rate_mbps_);
}
