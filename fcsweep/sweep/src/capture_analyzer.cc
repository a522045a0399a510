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

#include "capture_analyzer.h"

#include "child_process.h"
#include "config_info.h"
#include "fcsweep_defaults.h"
#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <inttypes.h>
#include <sys/stat.h>

using ::fcsweep::CaptureAnalysis;
using ::fcsweep::CaptureAnalyzer;
using ::fcsweep::ChildProcess;
using ::fcsweep::ConfigInfo;
using ::fcsweep::QueryResult;
using ::fcsweep::StringUtils;
using ::fcsweep::Time;
using ::fcsweep::WindowStats;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "CaptureAnalyzer";

  // Display filters.
  const char*  kZeroWindowFilter = "tcp.analysis.zero_window";
  const char*  kTcpFilter        = "tcp";
  const char*  kRetransFilter    = "tcp.analysis.retransmission";
  const char*  kDupAckFilter     = "tcp.analysis.duplicate_ack";

  // Printed fields.
  const char*  kFrameField       = "frame.number";
  const char*  kWindowField      = "tcp.window_size";

  /// How long to wait for the tool to exit after its output ends.
  const int64_t  kExitWaitMsec = 1000;
}

//============================================================================
CaptureAnalyzer::CaptureAnalyzer()
    : tool_(kDefaultAnalyzerTool),
      timeout_(Time::FromMsec(kDefaultAnalyzerTimeoutMs)),
      oscillation_threshold_(kDefaultOscillationThreshold)
{
}

//============================================================================
CaptureAnalyzer::~CaptureAnalyzer()
{
}

//============================================================================
bool CaptureAnalyzer::Initialize(const ConfigInfo& ci)
{
  tool_                  = ci.Get("Analyzer.Tool", kDefaultAnalyzerTool);
  timeout_               = Time::FromMsec(
    ci.GetUint("Analyzer.TimeoutMs", kDefaultAnalyzerTimeoutMs));
  oscillation_threshold_ = ci.GetDouble("Analyzer.OscillationThreshold",
                                        kDefaultOscillationThreshold);

  if ((oscillation_threshold_ < 0.0) || (oscillation_threshold_ > 1.0))
  {
    LogE(kClassName, __func__, "Analyzer.OscillationThreshold %f is not "
         "in [0, 1].\n", oscillation_threshold_);
    return false;
  }

  return true;
}

//============================================================================
void CaptureAnalyzer::Analyze(const string& trace_path,
                              CaptureAnalysis& analysis)
{
  analysis = CaptureAnalysis();

  analysis.zero_window_count = CountPackets(trace_path, kZeroWindowFilter,
                                            analysis);

  QueryResult  windows = RunQuery(trace_path, kTcpFilter, kWindowField);

  ++analysis.queries_run;

  if (windows.status == fcsweep::QUERY_OK)
  {
    vector<uint32_t>  values;

    ++analysis.queries_ok;
    ParseWindowValues(windows.values, values);
    analysis.window = ComputeWindowStats(values, oscillation_threshold_);
  }

  analysis.retransmit_count = CountPackets(trace_path, kRetransFilter,
                                           analysis);
  analysis.dup_ack_count    = CountPackets(trace_path, kDupAckFilter,
                                           analysis);

  LogD(kClassName, __func__, "%s: %" PRIu32 "/%" PRIu32 " queries answered, "
       "%" PRIu32 " zero-window, %" PRIu32 " window samples.\n",
       trace_path.c_str(), analysis.queries_ok, analysis.queries_run,
       analysis.zero_window_count, analysis.window.samples);
}

//============================================================================
QueryResult CaptureAnalyzer::RunQuery(const string& trace_path,
                                      const string& filter,
                                      const string& field)
{
  QueryResult  result;
  struct stat  st;

  if (stat(trace_path.c_str(), &st) != 0)
  {
    LogW(kClassName, __func__, "Trace %s unavailable: %s\n",
         trace_path.c_str(), strerror(errno));
    return result;
  }

  if (st.st_size == 0)
  {
    LogW(kClassName, __func__, "Trace %s is empty.\n", trace_path.c_str());
    return result;
  }

  vector<string>  argv;

  argv.push_back(tool_);
  argv.push_back("-r");
  argv.push_back(trace_path);
  argv.push_back("-Y");
  argv.push_back(filter);
  argv.push_back("-T");
  argv.push_back("fields");
  argv.push_back("-e");
  argv.push_back(field);

  ChildProcess  process;

  if (!process.Start(argv, true))
  {
    LogW(kClassName, __func__, "Cannot run %s: %s\n", tool_.c_str(),
         (process.exec_errno() != 0 ? strerror(process.exec_errno()) :
          "start failed"));
    return result;
  }

  string  output;

  if (!process.ReadOutput(timeout_, output))
  {
    LogW(kClassName, __func__, "Query \"%s\" did not complete within %s.\n",
         filter.c_str(), timeout_.ToString().c_str());
    process.Terminate(Time::FromMsec(kExitWaitMsec));
    return result;
  }

  if (!process.Wait(Time::FromMsec(kExitWaitMsec)))
  {
    process.Terminate(Time::FromMsec(kExitWaitMsec));
  }

  if (!process.ExitedCleanly())
  {
    LogW(kClassName, __func__, "Query \"%s\" failed: %s\n", filter.c_str(),
         process.DescribeExit().c_str());
    return result;
  }

  vector<string>  lines;

  StringUtils::Tokenize(output, "\n", lines);

  for (size_t i = 0; i < lines.size(); ++i)
  {
    string  line = StringUtils::Trim(lines[i]);

    if (!line.empty())
    {
      result.values.push_back(line);
    }
  }

  result.status = fcsweep::QUERY_OK;

  return result;
}

//============================================================================
WindowStats CaptureAnalyzer::ComputeWindowStats(
  const vector<uint32_t>& windows, double threshold)
{
  WindowStats  stats;

  if (windows.empty())
  {
    return stats;
  }

  uint64_t  sum = 0;

  stats.min = windows[0];
  stats.max = windows[0];

  for (size_t i = 0; i < windows.size(); ++i)
  {
    if (windows[i] < stats.min)
    {
      stats.min = windows[i];
    }
    if (windows[i] > stats.max)
    {
      stats.max = windows[i];
    }
    sum += windows[i];
  }

  stats.samples = static_cast<uint32_t>(windows.size());
  stats.mean    = static_cast<double>(sum) / windows.size();

  double  limit = stats.max * threshold;

  for (size_t i = 1; i < windows.size(); ++i)
  {
    double  change = static_cast<double>(windows[i]) -
      static_cast<double>(windows[i - 1]);

    if (change < 0.0)
    {
      change = -change;
    }

    if (change > limit)
    {
      ++stats.oscillations;
    }
  }

  return stats;
}

//============================================================================
void CaptureAnalyzer::ParseWindowValues(const vector<string>& lines,
                                        vector<uint32_t>& windows)
{
  windows.clear();

  for (size_t i = 0; i < lines.size(); ++i)
  {
    const string&  line = lines[i];

    if (line.empty() || (line.find_first_not_of("0123456789") != string::npos))
    {
      LogD(kClassName, __func__, "Skipping window value \"%s\".\n",
           line.c_str());
      continue;
    }

    char*          end   = NULL;
    errno                = 0;
    unsigned long  value = strtoul(line.c_str(), &end, 10);

    if ((errno != 0) || (value > UINT32_MAX))
    {
      continue;
    }

    windows.push_back(static_cast<uint32_t>(value));
  }
}

//============================================================================
uint32_t CaptureAnalyzer::CountPackets(const string& trace_path,
                                       const string& filter,
                                       CaptureAnalysis& analysis)
{
  QueryResult  result = RunQuery(trace_path, filter, kFrameField);

  ++analysis.queries_run;

  if (result.status != fcsweep::QUERY_OK)
  {
    return 0;
  }

  ++analysis.queries_ok;

  return static_cast<uint32_t>(result.values.size());
}
