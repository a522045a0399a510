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

#ifndef FCSWEEP_SWEEP_RATE_LIMITED_SENDER_H
#define FCSWEEP_SWEEP_RATE_LIMITED_SENDER_H

#include "itime.h"
#include "trial_config.h"

#include <string>

#include <stdint.h>

namespace fcsweep
{
  class ConfigInfo;

  ///
  /// What the sender observed during one run.
  ///
  struct SenderResult
  {
    SenderResult()
        : connected(false), bytes_sent(0), block_count(0), blocked_time(),
          error(), termination()
    { }

    /// Whether the connection to the receiver was established.
    bool         connected;

    /// Bytes accepted by the kernel.
    uint64_t     bytes_sent;

    /// Number of send calls that took longer than the block threshold.
    uint32_t     block_count;

    /// Total time spent in those send calls.
    Time         blocked_time;

    /// The setup error, when the connection could not be established.
    std::string  error;

    /// Why the send loop ended: "duration elapsed", "interrupted", or the
    /// socket error that ended it early.
    std::string  termination;
  };

  ///
  /// A TCP client that offers load at a target rate and measures how often
  /// the receiver's backpressure stalls it.
  ///
  /// Writes are fixed-size chunks paced against a schedule of deadlines.
  /// Each deadline advances from the previous scheduled deadline, never
  /// from the current time, so a single stalled write does not shift the
  /// rest of the schedule.  A write that takes longer than the block
  /// threshold counts as a block.  A send timeout bounds each write, so a
  /// fully stalled receiver cannot hold the sender past the end of the
  /// trial; a timed-out write counts as a block of zero bytes.
  ///
  /// The following configuration items are used:
  ///
  /// - Trial.TargetAddr        : Receiver address. Default 127.0.0.1.
  /// - Trial.Port              : Receiver port. Default 9999.
  /// - Trial.TargetPort        : Overrides Trial.Port for the sender only.
  ///                             Default 0 (unset).
  /// - Sender.ChunkBytes       : Bytes per write. Default 8192.
  /// - Sender.BlockThresholdMs : Write duration counted as a block.
  ///                             Default 100.
  /// - Sender.SendTimeoutMs    : Send timeout per write. Default 1000.
  /// - Sender.NoDelay          : Set TCP_NODELAY. Default true.
  ///
  class RateLimitedSender
  {
    public:

    ///
    /// Constructor.
    ///
    RateLimitedSender();

    ///
    /// Destructor.
    ///
    virtual ~RateLimitedSender();

    ///
    /// Initialize the sender from configuration.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  true on success, false if the target address is invalid or
    ///          the chunk size is zero.
    ///
    bool Initialize(const ConfigInfo& ci);

    ///
    /// Connect to the receiver and send for the configured duration.
    ///
    /// Socket errors after the connection is up end the run early and are
    /// recorded in the result's termination reason; they are not a failure.
    ///
    /// \param  config     The trial configuration supplying the rate and
    ///                    duration.
    /// \param  stop_flag  Checked before each write.  If it becomes true the
    ///                    run ends early.  May be NULL.
    /// \param  result     Filled in with the measurements.
    ///
    /// \return  false if the connection could not be established.
    ///
    bool Run(const TrialConfig& config, volatile bool* stop_flag,
             SenderResult& result);

    ///
    /// The interval between writes for a chunk size and target rate.
    ///
    /// \return  chunk_bytes / rate_bps, or zero (unpaced) for a zero rate.
    ///
    static Time PacingInterval(uint32_t chunk_bytes, double rate_bps);

    inline uint16_t target_port() const
    {
      return target_port_;
    }

    private:

    RateLimitedSender(const RateLimitedSender& other);
    RateLimitedSender& operator=(const RateLimitedSender& other);

    ///
    /// Create the socket, set its options and connect.
    ///
    /// \return  The connected socket, or -1 with error set.
    ///
    int Connect(std::string& error);

    std::string  target_addr_;
    uint16_t     target_port_;
    uint32_t     chunk_bytes_;
    Time         block_threshold_;
    Time         send_timeout_;
    bool         no_delay_;

  }; // end class RateLimitedSender

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_RATE_LIMITED_SENDER_H
