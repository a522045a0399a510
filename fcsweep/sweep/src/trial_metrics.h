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

#ifndef FCSWEEP_SWEEP_TRIAL_METRICS_H
#define FCSWEEP_SWEEP_TRIAL_METRICS_H

#include "trial_config.h"

#include <string>
#include <vector>

#include <stdint.h>

namespace fcsweep
{
  ///
  /// What became of the packet capture for a trial.
  ///
  enum CaptureStatus
  {
    CAPTURE_DISABLED = 0,
    CAPTURE_OK,
    CAPTURE_UNAVAILABLE,
    CAPTURE_PARTIAL
  };

  ///
  /// The record of one trial: the configuration echoed in, the derived
  /// quantities, the measurements, and the outcome.
  ///
  /// A record is filled in by the TrialRunner and frozen once it has been
  /// appended to the result store.  Capture-derived fields stay at zero when
  /// the capture was disabled or unavailable.
  ///
  struct TrialMetrics
  {
    ///
    /// Constructor.  Echoes the configuration and its derived quantities,
    /// and zeroes every measurement.
    ///
    /// \param  config  The trial's configuration.
    ///
    explicit TrialMetrics(const TrialConfig& config);

    ///
    /// Fill in the values that follow from the measurements:
    /// actual_throughput_kbps, zero_window_duration_ms and zero_window_pct.
    ///
    /// \param  zero_window_event_ms  The estimated duration of a single
    ///                               zero-window event.
    ///
    void ComputeDerived(double zero_window_event_ms);

    ///
    /// Render the record as one CSV row, without the line terminator, with
    /// the columns in FieldNames() order.
    ///
    std::string ToCsvRow() const;

    ///
    /// The column names, in the fixed result store order.
    ///
    static const std::vector<std::string>& FieldNames();

    ///
    /// The CSV header row, without the line terminator.
    ///
    static std::string CsvHeader();

    ///
    /// The text written for a capture status.
    ///
    static const char* CaptureStatusToString(CaptureStatus status);

    ///
    /// Quote a CSV field if it contains a comma, a double quote or a line
    /// break.  Embedded quotes are doubled.
    ///
    static std::string CsvEscape(const std::string& field);

    // Configuration echo.
    uint32_t       recv_buf;
    double         delay_ms;
    uint32_t       read_size;
    double         send_rate_mbps;
    double         duration;

    // Derived.
    double         receiver_capacity_bps;
    double         send_rate_bps;
    double         oversubscription_ratio;

    // Measured.
    double         duration_actual;
    uint64_t       bytes_transferred;
    uint64_t       bytes_received;
    double         actual_throughput_kbps;
    uint32_t       sender_block_count;
    double         sender_blocked_ms;

    // Flow-control signals.
    uint32_t       zero_window_count;
    double         zero_window_duration_ms;
    double         zero_window_pct;
    uint32_t       window_min;
    uint32_t       window_max;
    double         window_mean;
    uint32_t       window_oscillations;
    uint32_t       total_packets;
    uint32_t       retransmit_count;
    uint32_t       dup_ack_count;
    CaptureStatus  capture_status;

    // Outcome.
    std::string    timestamp;
    bool           success;
    std::string    error;

  }; // end struct TrialMetrics

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_TRIAL_METRICS_H
