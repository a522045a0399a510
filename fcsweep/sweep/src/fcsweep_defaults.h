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

///
/// Default values for the sweep harness configuration keys.
///

#ifndef FCSWEEP_SWEEP_FCSWEEP_DEFAULTS_H
#define FCSWEEP_SWEEP_FCSWEEP_DEFAULTS_H

#include <stdint.h>

namespace fcsweep
{
  // Sweep.
  const char* const  kDefaultPreset            = "default";
  const char* const  kDefaultOutputFile        = "sweep_results.csv";
  const uint32_t     kDefaultInterTrialPauseMs = 500;

  // Trial.
  const uint16_t     kDefaultTrialPort         = 9999;
  const char* const  kDefaultBindAddr          = "0.0.0.0";
  const char* const  kDefaultTargetAddr        = "127.0.0.1";
  const uint32_t     kDefaultDrainDelayMs      = 200;

  // Capture.
  const bool         kDefaultCaptureEnabled    = true;
  const char* const  kDefaultCaptureTool       = "tcpdump";
  const char* const  kDefaultCaptureInterface  = "lo";
  const uint32_t     kDefaultCaptureSettleMs   = 300;
  const uint32_t     kDefaultCaptureStopMs     = 2000;
  const uint32_t     kDefaultPostStopSettleMs  = 200;
  const char* const  kDefaultCaptureTmpDir     = "/tmp";

  // Analyzer.
  const char* const  kDefaultAnalyzerTool      = "tshark";
  const uint32_t     kDefaultAnalyzerTimeoutMs = 30000;

  /// A window change larger than this fraction of the observed maximum
  /// counts as an oscillation.
  const double       kDefaultOscillationThreshold = 0.2;

  /// Estimated duration of one zero-window event.  This is a fixed
  /// heuristic, not a timeline reconstruction.
  const double       kDefaultZeroWindowEventMs = 10.0;

  // Sender.
  const uint32_t     kDefaultSendChunkBytes    = 8192;
  const uint32_t     kDefaultBlockThresholdMs  = 100;
  const uint32_t     kDefaultSendTimeoutMs     = 1000;
  const bool         kDefaultNoDelay           = true;

  // Receiver.
  const uint32_t     kDefaultAcceptTimeoutMs   = 1000;
  const uint32_t     kDefaultReadyTimeoutMs    = 2000;
  const uint32_t     kDefaultStopTimeoutMs     = 2000;

  // Logging.
  const char* const  kDefaultLogLevel          = "FEWI";

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_FCSWEEP_DEFAULTS_H
