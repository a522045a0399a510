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

#include "config_space.h"

#include "config_info.h"
#include "fcsweep_defaults.h"
#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cmath>

using ::fcsweep::ConfigInfo;
using ::fcsweep::ConfigSpace;
using ::fcsweep::StringUtils;
using ::fcsweep::SweepParams;
using ::fcsweep::TrialConfig;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "ConfigSpace";

  const uint32_t  kDefaultRecvBufs[]  = { 4096, 8192, 16384, 32768, 65536 };
  const double    kDefaultDelays[]    = { 10, 25, 50, 100, 200 };
  const uint32_t  kDefaultReadSizes[] = { 2048, 4096, 8192 };
  const double    kDefaultRates[]     = { 0.1, 0.25, 0.5, 1.0, 2.0 };
  const double    kDefaultDuration    = 10.0;

  const uint32_t  kQuickRecvBufs[]    = { 8192, 32768 };
  const double    kQuickDelays[]      = { 25, 100 };
  const uint32_t  kQuickReadSizes[]   = { 4096 };
  const double    kQuickRates[]       = { 0.25, 1.0 };
  const double    kQuickDuration      = 5.0;

  template <typename T, size_t N>
  vector<T> ToVector(const T (&values)[N])
  {
    return vector<T>(values, values + N);
  }
}

//============================================================================
void ConfigSpace::Generate(const SweepParams& params,
                           vector<TrialConfig>& configs)
{
  configs.clear();
  configs.reserve(Count(params));

  for (size_t b = 0; b < params.recv_bufs.size(); ++b)
  {
    for (size_t d = 0; d < params.delays_ms.size(); ++d)
    {
      for (size_t r = 0; r < params.read_sizes.size(); ++r)
      {
        for (size_t s = 0; s < params.rates_mbps.size(); ++s)
        {
          configs.push_back(TrialConfig(params.recv_bufs[b],
                                        params.delays_ms[d],
                                        params.read_sizes[r],
                                        params.rates_mbps[s],
                                        params.duration_sec));
        }
      }
    }
  }
}

//============================================================================
SweepParams ConfigSpace::DefaultParams()
{
  SweepParams  params;

  params.recv_bufs    = ToVector(kDefaultRecvBufs);
  params.delays_ms    = ToVector(kDefaultDelays);
  params.read_sizes   = ToVector(kDefaultReadSizes);
  params.rates_mbps   = ToVector(kDefaultRates);
  params.duration_sec = kDefaultDuration;

  return params;
}

//============================================================================
SweepParams ConfigSpace::QuickParams()
{
  SweepParams  params;

  params.recv_bufs    = ToVector(kQuickRecvBufs);
  params.delays_ms    = ToVector(kQuickDelays);
  params.read_sizes   = ToVector(kQuickReadSizes);
  params.rates_mbps   = ToVector(kQuickRates);
  params.duration_sec = kQuickDuration;

  return params;
}

//============================================================================
bool ConfigSpace::GetPreset(const string& name, SweepParams& params)
{
  if (name == "default")
  {
    params = DefaultParams();
    return true;
  }

  if (name == "quick")
  {
    params = QuickParams();
    return true;
  }

  return false;
}

//============================================================================
bool ConfigSpace::LoadParams(const ConfigInfo& ci, SweepParams& params,
                             string& error)
{
  string       preset = ci.Get("Sweep.Preset", kDefaultPreset);
  SweepParams  result;

  if (!GetPreset(preset, result))
  {
    error = "unknown preset \"" + preset + "\" (expected default or quick)";
    return false;
  }

  if (ci.Has("Sweep.RecvBufs") &&
      !StringUtils::ParseUintList(ci.Get("Sweep.RecvBufs"), result.recv_bufs))
  {
    error = "invalid receive buffer list \"" + ci.Get("Sweep.RecvBufs") +
      "\"";
    return false;
  }

  if (ci.Has("Sweep.Delays") &&
      !StringUtils::ParseDoubleList(ci.Get("Sweep.Delays"), result.delays_ms))
  {
    error = "invalid delay list \"" + ci.Get("Sweep.Delays") + "\"";
    return false;
  }

  if (ci.Has("Sweep.ReadSizes") &&
      !StringUtils::ParseUintList(ci.Get("Sweep.ReadSizes"),
                                  result.read_sizes))
  {
    error = "invalid read size list \"" + ci.Get("Sweep.ReadSizes") + "\"";
    return false;
  }

  if (ci.Has("Sweep.Rates") &&
      !StringUtils::ParseDoubleList(ci.Get("Sweep.Rates"), result.rates_mbps))
  {
    error = "invalid rate list \"" + ci.Get("Sweep.Rates") + "\"";
    return false;
  }

  if (ci.Has("Sweep.Duration"))
  {
    vector<double>  duration;

    if (!StringUtils::ParseDoubleList(ci.Get("Sweep.Duration"), duration) ||
        (duration.size() != 1))
    {
      error = "invalid duration \"" + ci.Get("Sweep.Duration") + "\"";
      return false;
    }

    result.duration_sec = duration[0];
  }

  if (!Validate(result, error))
  {
    return false;
  }

  params = result;

  LogC(kClassName, __func__, "Sweep parameters: preset %s, bufs %s, delays "
       "%s, read sizes %s, rates %s, duration %g s.\n", preset.c_str(),
       StringUtils::JoinList(params.recv_bufs).c_str(),
       StringUtils::JoinList(params.delays_ms).c_str(),
       StringUtils::JoinList(params.read_sizes).c_str(),
       StringUtils::JoinList(params.rates_mbps).c_str(), params.duration_sec);

  return true;
}

//============================================================================
bool ConfigSpace::Validate(const SweepParams& params, string& error)
{
  if (params.recv_bufs.empty() || params.delays_ms.empty() ||
      params.read_sizes.empty() || params.rates_mbps.empty())
  {
    error = "every parameter list must have at least one value";
    return false;
  }

  if (!std::isfinite(params.duration_sec) || (params.duration_sec <= 0.0))
  {
    error = "duration must be positive";
    return false;
  }

  //
  // Every combination shares the per-dimension values, so checking one
  // configuration per value covers the whole space.
  //

  for (size_t i = 0; i < params.recv_bufs.size(); ++i)
  {
    TrialConfig  tc(params.recv_bufs[i], params.delays_ms[0],
                    params.read_sizes[0], params.rates_mbps[0],
                    params.duration_sec);

    if (!tc.IsValid(error))
    {
      return false;
    }
  }

  for (size_t i = 0; i < params.delays_ms.size(); ++i)
  {
    TrialConfig  tc(params.recv_bufs[0], params.delays_ms[i],
                    params.read_sizes[0], params.rates_mbps[0],
                    params.duration_sec);

    if (!tc.IsValid(error))
    {
      return false;
    }
  }

  for (size_t i = 0; i < params.read_sizes.size(); ++i)
  {
    TrialConfig  tc(params.recv_bufs[0], params.delays_ms[0],
                    params.read_sizes[i], params.rates_mbps[0],
                    params.duration_sec);

    if (!tc.IsValid(error))
    {
      return false;
    }
  }

  for (size_t i = 0; i < params.rates_mbps.size(); ++i)
  {
    TrialConfig  tc(params.recv_bufs[0], params.delays_ms[0],
                    params.read_sizes[0], params.rates_mbps[i],
                    params.duration_sec);

    if (!tc.IsValid(error))
    {
      return false;
    }
  }

  return true;
}

//============================================================================
size_t ConfigSpace::Count(const SweepParams& params)
{
  return (params.recv_bufs.size() * params.delays_ms.size() *
          params.read_sizes.size() * params.rates_mbps.size());
}
