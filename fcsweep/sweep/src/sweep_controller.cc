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

#include "sweep_controller.h"

#include "config_info.h"
#include "fcsweep_defaults.h"
#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <inttypes.h>

using ::fcsweep::ConfigInfo;
using ::fcsweep::ConfigSpace;
using ::fcsweep::StringUtils;
using ::fcsweep::SweepController;
using ::fcsweep::Time;
using ::fcsweep::TrialConfig;
using ::fcsweep::TrialMetrics;
using ::rapidjson::StringBuffer;
using ::rapidjson::Writer;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "SweepController";

  /// Render a list of byte sizes as "[4.0 KB, 8.0 KB]".
  string FormatByteList(const vector<uint32_t>& values)
  {
    string  str("[");

    for (size_t i = 0; i < values.size(); ++i)
    {
      if (i > 0)
      {
        str.append(", ");
      }
      str.append(StringUtils::FormatBytes(values[i]));
    }

    str.append("]");

    return str;
  }

  /// Write a list of unsigned values as a JSON array.
  void WriteArray(Writer<StringBuffer>& writer, const vector<uint32_t>& values)
  {
    writer.StartArray();
    for (size_t i = 0; i < values.size(); ++i)
    {
      writer.Uint(values[i]);
    }
    writer.EndArray();
  }

  /// Write a list of floating point values as a JSON array.
  void WriteArray(Writer<StringBuffer>& writer, const vector<double>& values)
  {
    writer.StartArray();
    for (size_t i = 0; i < values.size(); ++i)
    {
      writer.Double(values[i]);
    }
    writer.EndArray();
  }
}

//============================================================================
SweepController::SweepController()
    : params_(),
      configs_(),
      results_(),
      runner_(),
      store_(),
      output_path_(kDefaultOutputFile),
      summary_path_(),
      inter_trial_pause_(Time::FromMsec(kDefaultInterTrialPauseMs)),
      num_succeeded_(0),
      num_with_zero_window_(0),
      interrupted_(false),
      done_(false)
{
}

//============================================================================
SweepController::~SweepController()
{
}

//============================================================================
bool SweepController::Initialize(const ConfigInfo& ci)
{
  string  error;

  if (!ConfigSpace::LoadParams(ci, params_, error))
  {
    LogE(kClassName, __func__, "Invalid sweep parameters: %s\n",
         error.c_str());
    return false;
  }

  ConfigSpace::Generate(params_, configs_);

  output_path_       = ci.Get("Sweep.Output", kDefaultOutputFile);
  summary_path_      = ci.Get("Sweep.SummaryFile", "");
  inter_trial_pause_ = Time::FromMsec(
    ci.GetUint("Sweep.InterTrialPauseMs", kDefaultInterTrialPauseMs));

  if (output_path_.empty())
  {
    LogE(kClassName, __func__, "Sweep.Output must not be empty.\n");
    return false;
  }

  return runner_.Initialize(ci);
}

//============================================================================
bool SweepController::Run()
{
  string  error;

  results_.clear();
  num_succeeded_        = 0;
  num_with_zero_window_ = 0;
  interrupted_          = false;

  if (!store_.Open(output_path_, error))
  {
    LogE(kClassName, __func__, "Cannot record results: %s\n",
         error.c_str());
    return false;
  }

  ReportPlan();

  Time  start = Time::Now();

  for (size_t i = 0; i < configs_.size(); ++i)
  {
    if (done_)
    {
      interrupted_ = true;
      break;
    }

    const TrialConfig&  config = configs_[i];

    LogI(kClassName, __func__, "[%zu/%zu] Running: %s (oversub=%.1fx)\n",
         i + 1, configs_.size(), config.ToString().c_str(),
         config.OversubscriptionRatio());

    TrialMetrics  metrics = runner_.RunTrial(config, &done_);

    if (!store_.Append(metrics, error))
    {
      LogE(kClassName, __func__, "Aborting sweep, cannot record results: "
           "%s\n", error.c_str());
      store_.Close();
      return false;
    }

    results_.push_back(metrics);

    if (metrics.success)
    {
      ++num_succeeded_;

      if (metrics.zero_window_count > 0)
      {
        ++num_with_zero_window_;
      }
    }

    ReportTrial(metrics);

    if (done_)
    {
      interrupted_ = true;
      break;
    }

    if (i + 1 < configs_.size())
    {
      Time::Sleep(inter_trial_pause_);
    }
  }

  store_.Close();

  Time  elapsed = Time::Now() - start;

  ReportSummary(elapsed);

  if (!WriteSummaryFile(elapsed))
  {
    LogW(kClassName, __func__, "Summary file %s not written.\n",
         summary_path_.c_str());
  }

  return true;
}

//============================================================================
bool SweepController::AllSucceeded() const
{
  return (!interrupted_ && (results_.size() == configs_.size()) &&
          (num_succeeded_ == results_.size()));
}

//============================================================================
void SweepController::ReportPlan() const
{
  LogI(kClassName, __func__, "TCP flow control parameter sweep\n");
  LogI(kClassName, __func__, "Configurations: %zu\n", configs_.size());
  LogI(kClassName, __func__, "Duration per trial: %gs\n",
       params_.duration_sec);
  LogI(kClassName, __func__, "Estimated total time: %.0fs\n",
       configs_.size() * (params_.duration_sec + 1.0));
  LogI(kClassName, __func__, "Output: %s\n", output_path_.c_str());
  LogI(kClassName, __func__, "Capture: %s\n",
       (runner_.capture_enabled() ? "enabled" : "disabled"));
  LogI(kClassName, __func__, "Receive buffers: %s\n",
       FormatByteList(params_.recv_bufs).c_str());
  LogI(kClassName, __func__, "Delays: [%s] ms\n",
       StringUtils::JoinList(params_.delays_ms).c_str());
  LogI(kClassName, __func__, "Read sizes: %s\n",
       FormatByteList(params_.read_sizes).c_str());
  LogI(kClassName, __func__, "Send rates: [%s] MB/s\n",
       StringUtils::JoinList(params_.rates_mbps).c_str());
}

//============================================================================
void SweepController::ReportTrial(const TrialMetrics& metrics) const
{
  if (metrics.success)
  {
    LogI(kClassName, __func__, "  -> zero_window=%" PRIu32 ", throughput="
         "%.0fKB/s, oscillations=%" PRIu32 ", capture=%s\n",
         metrics.zero_window_count, metrics.actual_throughput_kbps,
         metrics.window_oscillations,
         TrialMetrics::CaptureStatusToString(metrics.capture_status));
  }
  else
  {
    LogW(kClassName, __func__, "  -> FAILED: %s\n", metrics.error.c_str());
  }
}

//============================================================================
void SweepController::ReportSummary(const Time& elapsed) const
{
  LogI(kClassName, __func__, "Sweep %s\n",
       (interrupted_ ? "interrupted" : "complete"));
  LogI(kClassName, __func__, "Total time: %.0fs\n", elapsed.ToDouble());
  LogI(kClassName, __func__, "Successful: %" PRIu32 "/%zu\n",
       num_succeeded_, results_.size());
  LogI(kClassName, __func__, "With zero-window events: %" PRIu32 "/%"
       PRIu32 "\n", num_with_zero_window_, num_succeeded_);
  LogI(kClassName, __func__, "Results saved to: %s\n", output_path_.c_str());
}

//============================================================================
bool SweepController::WriteSummaryFile(const Time& elapsed) const
{
  if (summary_path_.empty())
  {
    return true;
  }

  StringBuffer          str_buf;
  Writer<StringBuffer>  writer(str_buf);

  writer.StartObject();

  writer.Key("output");
  writer.String(output_path_.c_str());

  writer.Key("configurations");
  writer.Uint(static_cast<unsigned>(configs_.size()));

  writer.Key("trials_run");
  writer.Uint(static_cast<unsigned>(results_.size()));

  writer.Key("successful");
  writer.Uint(num_succeeded_);

  writer.Key("with_zero_window");
  writer.Uint(num_with_zero_window_);

  writer.Key("interrupted");
  writer.Bool(interrupted_);

  writer.Key("elapsed_sec");
  writer.Double(elapsed.ToDouble());

  writer.Key("capture");
  writer.Bool(runner_.capture_enabled());

  writer.Key("params");
  writer.StartObject();
  writer.Key("recv_bufs");
  WriteArray(writer, params_.recv_bufs);
  writer.Key("delays_ms");
  WriteArray(writer, params_.delays_ms);
  writer.Key("read_sizes");
  WriteArray(writer, params_.read_sizes);
  writer.Key("send_rates_mbps");
  WriteArray(writer, params_.rates_mbps);
  writer.Key("duration");
  writer.Double(params_.duration_sec);
  writer.EndObject();

  writer.EndObject();

  FILE*  fp = fopen(summary_path_.c_str(), "w");

  if (fp == NULL)
  {
    LogE(kClassName, __func__, "Cannot open %s: %s\n", summary_path_.c_str(),
         strerror(errno));
    return false;
  }

  bool  ok = ((fwrite(str_buf.GetString(), 1, str_buf.GetSize(), fp) ==
               str_buf.GetSize()) && (fputc('\n', fp) != EOF));

  if (fclose(fp) != 0)
  {
    ok = false;
  }

  if (!ok)
  {
    LogE(kClassName, __func__, "Error writing %s.\n", summary_path_.c_str());
  }

  return ok;
}
