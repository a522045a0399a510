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

#include "trial_runner.h"

#include "config_info.h"
#include "fcsweep_defaults.h"
#include "log.h"
#include "unused.h"

#include <inttypes.h>

using ::fcsweep::CaptureAnalysis;
using ::fcsweep::CaptureController;
using ::fcsweep::ConfigInfo;
using ::fcsweep::SenderResult;
using ::fcsweep::Time;
using ::fcsweep::TrialConfig;
using ::fcsweep::TrialMetrics;
using ::fcsweep::TrialRunner;
using ::std::string;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "TrialRunner";
}

//============================================================================
TrialRunner::TrialRunner()
    : receiver_(),
      sender_(),
      capture_(),
      analyzer_(),
      capture_enabled_(kDefaultCaptureEnabled),
      port_(kDefaultTrialPort),
      drain_delay_(Time::FromMsec(kDefaultDrainDelayMs)),
      zero_window_event_ms_(kDefaultZeroWindowEventMs),
      state_(PREPARING)
{
}

//============================================================================
TrialRunner::~TrialRunner()
{
}

//============================================================================
bool TrialRunner::Initialize(const ConfigInfo& ci)
{
  capture_enabled_      = ci.GetBool("Capture.Enabled",
                                     kDefaultCaptureEnabled);
  port_                 = static_cast<uint16_t>(
    ci.GetUint("Trial.Port", kDefaultTrialPort));
  drain_delay_          = Time::FromMsec(
    ci.GetUint("Trial.DrainDelayMs", kDefaultDrainDelayMs));
  zero_window_event_ms_ = ci.GetDouble("Analyzer.ZeroWindowEventMs",
                                       kDefaultZeroWindowEventMs);

  if (port_ == 0)
  {
    LogE(kClassName, __func__, "Trial.Port must be non-zero.\n");
    return false;
  }

  if (zero_window_event_ms_ < 0.0)
  {
    LogE(kClassName, __func__, "Analyzer.ZeroWindowEventMs must not be "
         "negative.\n");
    return false;
  }

  if (!receiver_.Initialize(ci) || !sender_.Initialize(ci))
  {
    return false;
  }

  if (capture_enabled_ &&
      (!capture_.Initialize(ci) || !analyzer_.Initialize(ci)))
  {
    return false;
  }

  LogI(kClassName, __func__, "Trial port %" PRIu16 ", capture %s.\n", port_,
       (capture_enabled_ ? "enabled" : "disabled"));

  return true;
}

//============================================================================
TrialMetrics TrialRunner::RunTrial(const TrialConfig& config,
                                   volatile bool* stop_flag)
{
  TrialMetrics  metrics(config);
  string        error;
  string        trace_path;

  metrics.timestamp = Time::GetWallClockString();

  SetState(PREPARING);

  if (!config.IsValid(error))
  {
    Fail(metrics, error);
    return metrics;
  }

  if (capture_enabled_ && !capture_.CreateTraceFile(trace_path, error))
  {
    Fail(metrics, error);
    return metrics;
  }

  SetState(CAPTURING);

  metrics.capture_status = fcsweep::CAPTURE_DISABLED;

  if (capture_enabled_)
  {
    switch (capture_.Start(trace_path, port_, error))
    {
      case CaptureController::CAPTURE_STARTED:
        metrics.capture_status = fcsweep::CAPTURE_OK;
        break;

      case CaptureController::CAPTURE_TOOL_UNAVAILABLE:
        metrics.capture_status = fcsweep::CAPTURE_UNAVAILABLE;
        break;

      case CaptureController::CAPTURE_START_FAILED:
        CaptureController::RemoveTraceFile(trace_path);
        Fail(metrics, "capture: " + error);
        return metrics;
    }
  }

  if (!receiver_.Start(config, error))
  {
    capture_.Stop();
    CaptureController::RemoveTraceFile(trace_path);
    Fail(metrics, "receiver: " + error);
    return metrics;
  }

  SetState(TRANSFERRING);

  SenderResult  sent;
  Time          start     = Time::Now();
  bool          connected = sender_.Run(config, stop_flag, sent);

  metrics.duration_actual = (Time::Now() - start).ToDouble();

  // Endpoints close before the capture stops so teardown is captured too.
  Time::Sleep(drain_delay_);
  receiver_.Stop();

  bool  capture_complete = capture_.Stop();

  metrics.bytes_transferred  = sent.bytes_sent;
  metrics.bytes_received     = receiver_.bytes_received();
  metrics.sender_block_count = sent.block_count;
  metrics.sender_blocked_ms  = sent.blocked_time.ToDouble() * 1000.0;

  if (!connected)
  {
    CaptureController::RemoveTraceFile(trace_path);
    Fail(metrics, "sender: " + sent.error);
    return metrics;
  }

  SetState(ANALYZING);

  if (metrics.capture_status == fcsweep::CAPTURE_OK)
  {
    AnalyzeTrace(trace_path, capture_complete, metrics);
  }

  CaptureController::RemoveTraceFile(trace_path);

  metrics.ComputeDerived(zero_window_event_ms_);
  metrics.success = true;

  SetState(RECORDED);

  LogD(kClassName, __func__, "Sender stopped: %s.\n",
       sent.termination.c_str());

  return metrics;
}

//============================================================================
const char* TrialRunner::StateToString(TrialState state)
{
  switch (state)
  {
    case PREPARING:
      return "PREPARING";

    case CAPTURING:
      return "CAPTURING";

    case TRANSFERRING:
      return "TRANSFERRING";

    case ANALYZING:
      return "ANALYZING";

    case RECORDED:
      return "RECORDED";

    case FAILED:
      return "FAILED";
  }

  return "UNKNOWN";
}

//============================================================================
void TrialRunner::SetState(TrialState state)
{
  LogD(kClassName, __func__, "%s -> %s\n", StateToString(state_),
       StateToString(state));

  state_ = state;
}

//============================================================================
void TrialRunner::Fail(TrialMetrics& metrics, const string& error)
{
  LogW(kClassName, __func__, "Trial failed in state %s: %s\n",
       StateToString(state_), error.c_str());

  metrics.error   = error;
  metrics.success = false;
  metrics.ComputeDerived(zero_window_event_ms_);

  SetState(FAILED);
}

//============================================================================
void TrialRunner::AnalyzeTrace(const string& trace_path,
                               bool capture_complete, TrialMetrics& metrics)
{
  CaptureAnalysis  analysis;

  analyzer_.Analyze(trace_path, analysis);

  metrics.zero_window_count   = analysis.zero_window_count;
  metrics.window_min          = analysis.window.min;
  metrics.window_max          = analysis.window.max;
  metrics.window_mean         = analysis.window.mean;
  metrics.window_oscillations = analysis.window.oscillations;
  metrics.total_packets       = analysis.window.samples;
  metrics.retransmit_count    = analysis.retransmit_count;
  metrics.dup_ack_count       = analysis.dup_ack_count;

  if (analysis.queries_ok == 0)
  {
    metrics.capture_status = fcsweep::CAPTURE_UNAVAILABLE;
  }
  else if ((analysis.queries_ok < analysis.queries_run) || !capture_complete)
  {
    metrics.capture_status = fcsweep::CAPTURE_PARTIAL;
  }
  else
  {
    metrics.capture_status = fcsweep::CAPTURE_OK;
  }
}
