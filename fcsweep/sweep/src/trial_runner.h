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

#ifndef FCSWEEP_SWEEP_TRIAL_RUNNER_H
#define FCSWEEP_SWEEP_TRIAL_RUNNER_H

#include "capture_analyzer.h"
#include "capture_controller.h"
#include "itime.h"
#include "rate_limited_sender.h"
#include "throttled_receiver.h"
#include "trial_config.h"
#include "trial_metrics.h"

#include <string>

#include <stdint.h>

namespace fcsweep
{
  class ConfigInfo;

  ///
  /// Runs one trial: capture, receiver and sender for a single
  /// configuration, then analysis of the trace, producing a TrialMetrics
  /// record.
  ///
  /// A trial moves through PREPARING, CAPTURING, TRANSFERRING and ANALYZING
  /// to RECORDED, or to FAILED from any of them.  A failed trial still
  /// yields a record, with success false and the error filled in.  The
  /// teardown order is fixed: after the sender finishes, a drain delay, then
  /// the receiver stops, then the capture stops, then analysis runs.  The
  /// trace file is removed on every path.
  ///
  /// The following configuration items are used, in addition to those of
  /// the receiver, sender, capture controller and analyzer:
  ///
  /// - Capture.Enabled            : Capture and analyze traffic. Default
  ///                                true.
  /// - Trial.Port                 : The trial port. Default 9999.
  /// - Trial.DrainDelayMs         : Delay between the end of sending and
  ///                                the receiver stop. Default 200.
  /// - Analyzer.ZeroWindowEventMs : Estimated duration of one zero-window
  ///                                event. Default 10.
  ///
  class TrialRunner
  {
    public:

    /// The trial states.
    enum TrialState
    {
      PREPARING = 0,
      CAPTURING,
      TRANSFERRING,
      ANALYZING,
      RECORDED,
      FAILED
    };

    ///
    /// Constructor.
    ///
    TrialRunner();

    ///
    /// Destructor.
    ///
    virtual ~TrialRunner();

    ///
    /// Initialize the runner and its components from configuration.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  true on success.
    ///
    bool Initialize(const ConfigInfo& ci);

    ///
    /// Run one trial.
    ///
    /// \param  config     The trial configuration.
    /// \param  stop_flag  When it becomes true the sender stops early and
    ///                    the trial goes through its normal teardown.  May
    ///                    be NULL.
    ///
    /// \return  The trial's record.
    ///
    TrialMetrics RunTrial(const TrialConfig& config, volatile bool* stop_flag);

    ///
    /// The state the last trial ended in.
    ///
    inline TrialState state() const
    {
      return state_;
    }

    inline bool capture_enabled() const
    {
      return capture_enabled_;
    }

    ///
    /// The name of a trial state, for logging.
    ///
    static const char* StateToString(TrialState state);

    private:

    TrialRunner(const TrialRunner& other);
    TrialRunner& operator=(const TrialRunner& other);

    ///
    /// Move to a new state.
    ///
    void SetState(TrialState state);

    ///
    /// Mark the record failed.
    ///
    void Fail(TrialMetrics& metrics, const std::string& error);

    ///
    /// Analyze the trace into the record and set its capture status.
    ///
    void AnalyzeTrace(const std::string& trace_path, bool capture_complete,
                      TrialMetrics& metrics);

    ThrottledReceiver  receiver_;
    RateLimitedSender  sender_;
    CaptureController  capture_;
    CaptureAnalyzer    analyzer_;

    bool               capture_enabled_;
    uint16_t           port_;
    Time               drain_delay_;
    double             zero_window_event_ms_;
    TrialState         state_;

  }; // end class TrialRunner

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_TRIAL_RUNNER_H
