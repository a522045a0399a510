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

#ifndef FCSWEEP_SWEEP_CAPTURE_ANALYZER_H
#define FCSWEEP_SWEEP_CAPTURE_ANALYZER_H

#include "itime.h"

#include <string>
#include <vector>

#include <stdint.h>

namespace fcsweep
{
  class ConfigInfo;

  /// Whether an analysis query produced an answer.
  enum QueryStatus
  {
    /// The tool ran and its output was read.  It may have matched nothing.
    QUERY_OK = 0,

    /// The tool is missing, failed, timed out, or the trace is missing or
    /// empty.  The values are unknown, not zero.
    QUERY_UNAVAILABLE
  };

  ///
  /// The output of one analysis query: one entry per non-empty output line.
  ///
  struct QueryResult
  {
    QueryResult() : status(QUERY_UNAVAILABLE), values() { }

    QueryStatus               status;
    std::vector<std::string>  values;
  };

  ///
  /// Statistics over the advertised window sizes in a trace.
  ///
  struct WindowStats
  {
    WindowStats()
        : min(0), max(0), mean(0.0), oscillations(0), samples(0)
    { }

    uint32_t  min;
    uint32_t  max;
    double    mean;

    /// Consecutive samples differing by more than the oscillation threshold
    /// times the maximum.
    uint32_t  oscillations;

    /// Number of TCP packets carrying a window value.
    uint32_t  samples;
  };

  ///
  /// The flow-control signals extracted from one trace.
  ///
  struct CaptureAnalysis
  {
    CaptureAnalysis()
        : zero_window_count(0), window(), retransmit_count(0),
          dup_ack_count(0), queries_run(0), queries_ok(0)
    { }

    uint32_t     zero_window_count;
    WindowStats  window;
    uint32_t     retransmit_count;
    uint32_t     dup_ack_count;

    uint32_t     queries_run;
    uint32_t     queries_ok;
  };

  ///
  /// Extracts flow-control signals from a packet trace with an external
  /// analysis tool (tshark by default).
  ///
  /// Each signal is a separate query of the form
  /// "<tool> -r <trace> -Y <filter> -T fields -e <field>".  A query that
  /// cannot be answered leaves its signal at zero and is counted as
  /// unavailable; it never fails the trial.
  ///
  /// The following configuration items are used:
  ///
  /// - Analyzer.Tool                 : Analysis program. Default tshark.
  /// - Analyzer.TimeoutMs            : Per-query time limit. Default 30000.
  /// - Analyzer.OscillationThreshold : Fraction of the maximum window that a
  ///                                   consecutive change must exceed to
  ///                                   count as an oscillation. Default 0.2.
  ///
  class CaptureAnalyzer
  {
    public:

    ///
    /// Constructor.
    ///
    CaptureAnalyzer();

    ///
    /// Destructor.
    ///
    virtual ~CaptureAnalyzer();

    ///
    /// Initialize the analyzer from configuration.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  true on success, false if the threshold is out of range.
    ///
    bool Initialize(const ConfigInfo& ci);

    ///
    /// Run every query over a trace.
    ///
    /// \param  trace_path  The trace file.
    /// \param  analysis    Filled in with the signals.  Signals whose query
    ///                     was unavailable are zero.
    ///
    void Analyze(const std::string& trace_path, CaptureAnalysis& analysis);

    ///
    /// Run one query.
    ///
    /// \param  trace_path  The trace file.
    /// \param  filter      The display filter selecting packets.
    /// \param  field       The field printed for each selected packet.
    ///
    /// \return  The query result.
    ///
    QueryResult RunQuery(const std::string& trace_path,
                         const std::string& filter,
                         const std::string& field);

    ///
    /// Compute window statistics over a series of window sizes.
    ///
    /// \param  windows    The window sizes in trace order.
    /// \param  threshold  The oscillation threshold as a fraction of the
    ///                    maximum.
    ///
    /// \return  The statistics.  All zero for an empty series.
    ///
    static WindowStats ComputeWindowStats(const std::vector<uint32_t>& windows,
                                          double threshold);

    ///
    /// Convert query output lines to window sizes, skipping lines that are
    /// not unsigned integers.
    ///
    static void ParseWindowValues(const std::vector<std::string>& lines,
                                  std::vector<uint32_t>& windows);

    private:

    CaptureAnalyzer(const CaptureAnalyzer& other);
    CaptureAnalyzer& operator=(const CaptureAnalyzer& other);

    ///
    /// Run a query and count the packets it selects.
    ///
    uint32_t CountPackets(const std::string& trace_path,
                          const std::string& filter,
                          CaptureAnalysis& analysis);

    std::string  tool_;
    Time         timeout_;
    double       oscillation_threshold_;

  }; // end class CaptureAnalyzer

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_CAPTURE_ANALYZER_H
