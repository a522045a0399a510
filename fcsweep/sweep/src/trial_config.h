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

#ifndef FCSWEEP_SWEEP_TRIAL_CONFIG_H
#define FCSWEEP_SWEEP_TRIAL_CONFIG_H

#include <string>

#include <stdint.h>

namespace fcsweep
{
  ///
  /// One point in the configuration space: the parameters of a single trial
  /// and the quantities derived from them.
  ///
  /// Objects are immutable once constructed.  Rates given in "MB/s" use
  /// 1 MB = 1024 * 1024 bytes.
  ///
  class TrialConfig
  {
    public:

    ///
    /// Constructor.
    ///
    /// \param  recv_buf_bytes    The receive buffer size requested on the
    ///                           receiver's sockets.  Zero leaves the
    ///                           operating system default in place.
    /// \param  read_delay_ms     The receiver's sleep before each read.  Zero
    ///                           means no throttling.
    /// \param  read_chunk_bytes  The most the receiver reads per call.
    /// \param  send_rate_mbps    The sender's target rate in MB/s.  Zero
    ///                           means unpaced.
    /// \param  duration_sec      How long the sender runs.
    ///
    TrialConfig(uint32_t recv_buf_bytes, double read_delay_ms,
                uint32_t read_chunk_bytes, double send_rate_mbps,
                double duration_sec);

    ///
    /// Destructor.
    ///
    virtual ~TrialConfig();

    ///
    /// Check the invariants: non-negative sizes, rates and delays, a
    /// positive read size of at most 64 MB, a receive buffer of at most
    /// 1 GB, and a positive duration.
    ///
    /// \param  error  Set to a description of the first violation.
    ///
    /// \return  true if the configuration can be run.
    ///
    bool IsValid(std::string& error) const;

    ///
    /// The most the receiver can consume, in bytes per second.
    ///
    /// \return  read_chunk_bytes / (read_delay_ms / 1000), or positive
    ///          infinity when the read delay is zero.
    ///
    double ReceiverCapacityBps() const;

    ///
    /// The sender's target rate in bytes per second.
    ///
    double SendRateBps() const;

    ///
    /// The offered rate over the receiver's capacity.  Zero when the
    /// capacity is unbounded.
    ///
    double OversubscriptionRatio() const;

    ///
    /// A one line description for logging, e.g.
    /// "buf=8.0 KB, delay=100ms, read=1.0 KB, rate=1MB/s".
    ///
    std::string ToString() const;

    inline uint32_t recv_buf_bytes() const
    {
      return recv_buf_bytes_;
    }

    inline double read_delay_ms() const
    {
      return read_delay_ms_;
    }

    inline uint32_t read_chunk_bytes() const
    {
      return read_chunk_bytes_;
    }

    inline double send_rate_mbps() const
    {
      return send_rate_mbps_;
    }

    inline double duration_sec() const
    {
      return duration_sec_;
    }

    private:

    uint32_t  recv_buf_bytes_;
    double    read_delay_ms_;
    uint32_t  read_chunk_bytes_;
    double    send_rate_mbps_;
    double    duration_sec_;

  }; // end class TrialConfig

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_TRIAL_CONFIG_H
