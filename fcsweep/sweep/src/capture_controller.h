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

#ifndef FCSWEEP_SWEEP_CAPTURE_CONTROLLER_H
#define FCSWEEP_SWEEP_CAPTURE_CONTROLLER_H

#include "child_process.h"
#include "itime.h"

#include <string>
#include <vector>

#include <stdint.h>

namespace fcsweep
{
  class ConfigInfo;

  ///
  /// Binds an external packet capture process to the lifetime of one trial.
  ///
  /// The capture tool (tcpdump by default) runs as a child process writing
  /// loopback traffic on the trial port to a trial-scoped trace file.  The
  /// capture is best-effort: a tool that is missing or exits during the
  /// settle window makes the capture unavailable, not the trial fail.
  ///
  /// The following configuration items are used:
  ///
  /// - Capture.Tool             : Capture program. Default tcpdump.
  /// - Capture.Interface        : Interface to capture on. Default lo.
  /// - Capture.SettleMs         : Delay after start before traffic begins.
  ///                              Default 300.
  /// - Capture.StopTimeoutMs    : Bounded wait after SIGTERM before SIGKILL.
  ///                              Default 2000.
  /// - Capture.PostStopSettleMs : Delay after stop before analysis.
  ///                              Default 200.
  /// - Capture.TmpDir           : Directory for trace files. Default /tmp.
  ///
  class CaptureController
  {
    public:

    /// Outcome of Start().
    enum StartResult
    {
      CAPTURE_STARTED = 0,
      CAPTURE_TOOL_UNAVAILABLE,
      CAPTURE_START_FAILED
    };

    ///
    /// Constructor.
    ///
    CaptureController();

    ///
    /// Destructor.  Stops a running capture.
    ///
    virtual ~CaptureController();

    ///
    /// Initialize the controller from configuration.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  true on success.
    ///
    bool Initialize(const ConfigInfo& ci);

    ///
    /// Create a uniquely named, empty trace file for one trial.
    ///
    /// \param  path   Set to the trace file path.
    /// \param  error  Set to a description of the failure.
    ///
    /// \return  true on success.
    ///
    bool CreateTraceFile(std::string& path, std::string& error);

    ///
    /// Start capturing traffic on a port into a trace file, then wait for
    /// the settle delay.
    ///
    /// \param  trace_path  The trace file to write.
    /// \param  port        The trial port.
    /// \param  error       Set to a description of the problem when the
    ///                     result is not CAPTURE_STARTED.
    ///
    /// \return  CAPTURE_STARTED if the tool is running after the settle
    ///          delay, CAPTURE_TOOL_UNAVAILABLE if it could not be executed
    ///          or exited early, CAPTURE_START_FAILED if the process could
    ///          not be created at all.
    ///
    StartResult Start(const std::string& trace_path, uint16_t port,
                      std::string& error);

    ///
    /// Stop the capture: SIGTERM, bounded wait, SIGKILL fallback, then the
    /// post-stop settle delay so the trace is flushed before analysis.
    /// Does nothing if no capture is running.
    ///
    /// \return  true if the capture exited on SIGTERM (its trace is
    ///          complete), false if it had to be killed.
    ///
    bool Stop();

    ///
    /// Delete a trace file.  A missing file is not an error.
    ///
    static void RemoveTraceFile(const std::string& path);

    ///
    /// The capture command line.
    ///
    static std::vector<std::string> BuildArgv(const std::string& tool,
                                              const std::string& interface,
                                              const std::string& trace_path,
                                              uint16_t port);

    inline bool IsActive() const
    {
      return (process_ != NULL);
    }

    private:

    CaptureController(const CaptureController& other);
    CaptureController& operator=(const CaptureController& other);

    std::string    tool_;
    std::string    interface_;
    Time           settle_;
    Time           stop_timeout_;
    Time           post_stop_settle_;
    std::string    tmp_dir_;

    /// The running capture, or NULL.
    ChildProcess*  process_;

  }; // end class CaptureController

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_CAPTURE_CONTROLLER_H
