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

#include "rate_limited_sender.h"

#include "config_info.h"
#include "fcsweep_defaults.h"
#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cerrno>
#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <inttypes.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

using ::fcsweep::ConfigInfo;
using ::fcsweep::RateLimitedSender;
using ::fcsweep::SenderResult;
using ::fcsweep::StringUtils;
using ::fcsweep::Time;
using ::fcsweep::TrialConfig;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "RateLimitedSender";
}

//============================================================================
RateLimitedSender::RateLimitedSender()
    : target_addr_(kDefaultTargetAddr),
      target_port_(kDefaultTrialPort),
      chunk_bytes_(kDefaultSendChunkBytes),
      block_threshold_(Time::FromMsec(kDefaultBlockThresholdMs)),
      send_timeout_(Time::FromMsec(kDefaultSendTimeoutMs)),
      no_delay_(kDefaultNoDelay)
{
}

//============================================================================
RateLimitedSender::~RateLimitedSender()
{
}

//============================================================================
bool RateLimitedSender::Initialize(const ConfigInfo& ci)
{
  target_addr_ = ci.Get("Trial.TargetAddr", kDefaultTargetAddr);

  unsigned int  port        = ci.GetUint("Trial.Port", kDefaultTrialPort);
  unsigned int  target_port = ci.GetUint("Trial.TargetPort", 0);

  target_port_ = static_cast<uint16_t>(target_port != 0 ? target_port : port);

  chunk_bytes_     = ci.GetUint("Sender.ChunkBytes", kDefaultSendChunkBytes);
  block_threshold_ = Time::FromMsec(
    ci.GetUint("Sender.BlockThresholdMs", kDefaultBlockThresholdMs));
  send_timeout_    = Time::FromMsec(
    ci.GetUint("Sender.SendTimeoutMs", kDefaultSendTimeoutMs));
  no_delay_        = ci.GetBool("Sender.NoDelay", kDefaultNoDelay);

  if (chunk_bytes_ == 0)
  {
    LogE(kClassName, __func__, "Sender.ChunkBytes must be positive.\n");
    return false;
  }

  in_addr  addr;

  if (inet_pton(AF_INET, target_addr_.c_str(), &addr) != 1)
  {
    LogE(kClassName, __func__, "Invalid target address: %s\n",
         target_addr_.c_str());
    return false;
  }

  LogI(kClassName, __func__, "Sender target %s:%" PRIu16 ", chunk %" PRIu32
       " bytes, block threshold %s.\n", target_addr_.c_str(), target_port_,
       chunk_bytes_, block_threshold_.ToString().c_str());

  return true;
}

//============================================================================
bool RateLimitedSender::Run(const TrialConfig& config,
                            volatile bool* stop_flag, SenderResult& result)
{
  result = SenderResult();

  int  fd = Connect(result.error);

  if (fd < 0)
  {
    return false;
  }

  result.connected = true;

  vector<char>  buf(chunk_bytes_, 'X');
  Time          interval = PacingInterval(chunk_bytes_, config.SendRateBps());
  Time          start    = Time::Now();
  Time          end      = start + Time(config.duration_sec());
  Time          next     = start;

  LogD(kClassName, __func__, "Pacing interval %s for %s.\n",
       interval.ToString().c_str(),
       StringUtils::FormatRate(config.SendRateBps()).c_str());

  result.termination = "duration elapsed";

  while (true)
  {
    if ((stop_flag != NULL) && *stop_flag)
    {
      result.termination = "interrupted";
      break;
    }

    Time  now = Time::Now();

    if (now >= end)
    {
      break;
    }

    if (!interval.IsZero())
    {
      if (next >= end)
      {
        break;
      }

      if (next > now)
      {
        Time::Sleep(next - now);
      }

      // Advance from the scheduled deadline, not from now.
      next += interval;
    }

    Time     send_start = Time::Now();
    ssize_t  n          = send(fd, &buf[0], buf.size(), MSG_NOSIGNAL);
    Time     send_time  = Time::Now() - send_start;

    if (send_time > block_threshold_)
    {
      ++result.block_count;
      result.blocked_time += send_time;

      LogD(kClassName, __func__, "Send blocked for %s.\n",
           send_time.ToString().c_str());
    }

    if (n > 0)
    {
      result.bytes_sent += static_cast<uint64_t>(n);
      continue;
    }

    if ((n < 0) && ((errno == EAGAIN) || (errno == EWOULDBLOCK) ||
                    (errno == EINTR)))
    {
      // Send timeout: the receiver's window stayed closed.
      continue;
    }

    result.termination = ((n == 0) ? string("connection closed") :
                          string(strerror(errno)));
    LogI(kClassName, __func__, "Send loop ended early: %s\n",
         result.termination.c_str());
    break;
  }

  close(fd);

  LogI(kClassName, __func__, "Sent %" PRIu64 " bytes, %" PRIu32 " blocks "
       "totalling %s (%s).\n", result.bytes_sent, result.block_count,
       result.blocked_time.ToString().c_str(), result.termination.c_str());

  return true;
}

//============================================================================
Time RateLimitedSender::PacingInterval(uint32_t chunk_bytes, double rate_bps)
{
  if (rate_bps <= 0.0)
  {
    return Time();
  }

  return Time(static_cast<double>(chunk_bytes) / rate_bps);
}

//============================================================================
int RateLimitedSender::Connect(string& error)
{
  int  fd = socket(AF_INET, SOCK_STREAM, 0);

  if (fd < 0)
  {
    error = string("socket: ") + strerror(errno);
    LogE(kClassName, __func__, "%s\n", error.c_str());
    return -1;
  }

  if (no_delay_)
  {
    int  opt = 1;

    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) != 0)
    {
      LogW(kClassName, __func__, "Failed to set TCP_NODELAY: %s\n",
           strerror(errno));
    }
  }

  timeval  tv = send_timeout_.ToTval();

  if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
  {
    LogW(kClassName, __func__, "Failed to set send timeout: %s\n",
         strerror(errno));
  }

  sockaddr_in  addr;

  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(target_port_);

  if (inet_pton(AF_INET, target_addr_.c_str(), &addr.sin_addr) != 1)
  {
    error = "invalid target address " + target_addr_;
    close(fd);
    return -1;
  }

  if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
  {
    error = StringUtils::FormatString(
      128, "connect %s:%" PRIu16 ": %s", target_addr_.c_str(), target_port_,
      strerror(errno));
    LogE(kClassName, __func__, "%s\n", error.c_str());
    close(fd);
    return -1;
  }

  return fd;
}
