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

#ifndef FCSWEEP_SWEEP_SWEEP_CONTROLLER_H
#define FCSWEEP_SWEEP_SWEEP_CONTROLLER_H

#include "config_space.h"
#include "itime.h"
#include "result_store.h"
#include "trial_config.h"
#include "trial_metrics.h"
#include "trial_runner.h"

#include <string>
#include <vector>

#include <stdint.h>

namespace fcsweep
{
  class ConfigInfo;

  ///
  /// Runs every configuration of a sweep, one trial at a time, appending
  /// each record to the result store as soon as its trial ends.
  ///
  /// Records are appended in configuration order.  A failed trial is
  /// recorded and the sweep moves on; only a result store failure ends the
  /// sweep early.  A stop request lets the trial in progress finish its
  /// teardown and be recorded, then no further trials start.
  ///
  /// The following configuration items are used, in addition to those of
  /// ConfigSpace::LoadParams() and the TrialRunner:
  ///
  /// - Sweep.Output            : Result store path. Default
  ///                             sweep_results.csv.
  /// - Sweep.SummaryFile       : JSON summary path. Default empty (none).
  /// - Sweep.InterTrialPauseMs : Pause between trials. Default 500.
  ///
  class SweepController
  {
    public:

    ///
    /// Constructor.
    ///
    SweepController();

    ///
    /// Destructor.
    ///
    virtual ~SweepController();

    ///
    /// Initialize the sweep from configuration and generate the
    /// configurations to run.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  true on success, false on an invalid configuration.
    ///
    bool Initialize(const ConfigInfo& ci);

    ///
    /// Run the sweep.
    ///
    /// \return  false if the result store could not be written, true
    ///          otherwise (even if trials failed or the sweep was stopped).
    ///
    bool Run();

    ///
    /// Request a stop.  Safe to call from a signal handler.
    ///
    inline void set_done(bool done)
    {
      done_ = done;
    }

    ///
    /// Whether every configuration was run and every trial succeeded.
    ///
    bool AllSucceeded() const;

    inline const std::vector<TrialConfig>& configs() const
    {
      return configs_;
    }

    inline const std::vector<TrialMetrics>& results() const
    {
      return results_;
    }

    inline uint32_t num_succeeded() const
    {
      return num_succeeded_;
    }

    inline uint32_t num_with_zero_window() const
    {
      return num_with_zero_window_;
    }

    inline bool interrupted() const
    {
      return interrupted_;
    }

    private:

    SweepController(const SweepController& other);
    SweepController& operator=(const SweepController& other);

    ///
    /// Log the sweep plan before the first trial.
    ///
    void ReportPlan() const;

    ///
    /// Log the outcome of one trial.
    ///
    void ReportTrial(const TrialMetrics& metrics) const;

    ///
    /// Log the totals after the last trial.
    ///
    void ReportSummary(const Time& elapsed) const;

    ///
    /// Write the JSON summary file, if one is configured.
    ///
    bool WriteSummaryFile(const Time& elapsed) const;

    SweepParams                params_;
    std::vector<TrialConfig>   configs_;
    std::vector<TrialMetrics>  results_;
    TrialRunner                runner_;
    ResultStore                store_;
    std::string                output_path_;
    std::string                summary_path_;
    Time                       inter_trial_pause_;
    uint32_t                   num_succeeded_;
    uint32_t                   num_with_zero_window_;
    bool                       interrupted_;
    volatile bool              done_;

  }; // end class SweepController

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_SWEEP_CONTROLLER_H
