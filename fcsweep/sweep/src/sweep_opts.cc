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

#include "sweep_opts.h"

#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cstdio>
#include <cstdlib>

#include <popt.h>

using ::fcsweep::ConfigInfo;
using ::fcsweep::Log;
using ::fcsweep::StringUtils;
using ::fcsweep::SweepOpts;
using ::std::string;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "SweepOpts";

  /// Add a string option to the configuration, if it was given, and free
  /// the popt copy.
  void AddOpt(ConfigInfo& ci, const char* key, char*& value)
  {
    if (value != NULL)
    {
      ci.Add(key, value);
      free(value);
      value = NULL;
    }
  }
}

//============================================================================
SweepOpts::SweepOpts()
    : config_info_()
{
}

//============================================================================
SweepOpts::~SweepOpts()
{
}

//============================================================================
bool SweepOpts::ParseArgs(int argc, const char** argv)
{
  char*  output      = NULL;
  char*  preset      = NULL;
  char*  recv_bufs   = NULL;
  char*  delays      = NULL;
  char*  read_sizes  = NULL;
  char*  rates       = NULL;
  char*  duration    = NULL;
  char*  config_file = NULL;
  char*  summary     = NULL;
  char*  log_file    = NULL;
  char*  log_level   = NULL;
  int    quick       = 0;
  int    no_pcap     = 0;
  int    verbose     = 0;
  int    debug       = 0;
  int    log_stderr  = 0;
  int    port        = 0;

  struct poptOption options[] = {
      { "output", 'o', POPT_ARG_STRING, &output, 0,
        "Result CSV file (default sweep_results.csv).", "<file>" },
      { "quick", 'q', POPT_ARG_NONE, &quick, 0,
        "Run the quick preset (8 configurations).", NULL },
      { "preset", 'P', POPT_ARG_STRING, &preset, 0,
        "Preset name: default or quick.", "<name>" },
      { "recv-bufs", '\0', POPT_ARG_STRING, &recv_bufs, 0,
        "Receive buffer sizes in bytes.", "<n,n,...>" },
      { "delays", '\0', POPT_ARG_STRING, &delays, 0,
        "Read delays in milliseconds.", "<ms,ms,...>" },
      { "read-sizes", '\0', POPT_ARG_STRING, &read_sizes, 0,
        "Read sizes in bytes.", "<n,n,...>" },
      { "rates", '\0', POPT_ARG_STRING, &rates, 0,
        "Send rates in MB/s.", "<r,r,...>" },
      { "duration", '\0', POPT_ARG_STRING, &duration, 0,
        "Seconds per trial.", "<sec>" },
      { "no-pcap", '\0', POPT_ARG_NONE, &no_pcap, 0,
        "Skip packet capture (faster, no flow-control metrics).", NULL },
      { "port", 'p', POPT_ARG_INT, &port, 0,
        "Trial TCP port (default 9999).", "<port>" },
      { "config", 'c', POPT_ARG_STRING, &config_file, 0,
        "Configuration file name.", "<file>" },
      { "summary", 'j', POPT_ARG_STRING, &summary, 0,
        "Write a JSON summary to this file.", "<file>" },
      { "log-file", 'l', POPT_ARG_STRING, &log_file, 0,
        "The fully qualified name of the log file.", "<name>" },
      { "log-stderr", 'e', POPT_ARG_NONE, &log_stderr, 0,
        "Log to stderr instead of stdout.", NULL },
      { "log-level", 'L', POPT_ARG_STRING, &log_level, 0,
        "The log level as a string (e.g., FEWIAD).", "<log levels>" },
      { "verbose", 'v', POPT_ARG_NONE, &verbose, 0,
        "Verbose logging (FEWIA).", NULL },
      { "debug", 'd', POPT_ARG_NONE, &debug, 0,
        "Log everything.", NULL },
      POPT_AUTOHELP POPT_TABLEEND
    };

  poptContext  opt_con = poptGetContext(NULL, argc, argv, options, 0);
  int          rc;

  while ((rc = poptGetNextOpt(opt_con)) > 0)
  {
  }

  bool  ok = true;

  if (rc < -1)
  {
    fprintf(stderr, "%s: %s\n",
            poptBadOption(opt_con, POPT_BADOPTION_NOALIAS), poptStrerror(rc));
    poptPrintUsage(opt_con, stderr, 0);
    ok = false;
  }
  else if (poptPeekArg(opt_con) != NULL)
  {
    fprintf(stderr, "Unexpected argument: %s\n", poptPeekArg(opt_con));
    poptPrintUsage(opt_con, stderr, 0);
    ok = false;
  }
  else if ((port < 0) || (port > 65535))
  {
    fprintf(stderr, "Invalid port: %d\n", port);
    poptPrintUsage(opt_con, stderr, 0);
    ok = false;
  }

  poptFreeContext(opt_con);

  // The configuration file first, so the command line overrides it.
  if (ok && (config_file != NULL) && !config_info_.LoadFromFile(config_file))
  {
    LogE(kClassName, __func__, "Error loading configuration information "
         "from file %s.\n", config_file);
    ok = false;
  }

  if (config_file != NULL)
  {
    free(config_file);
    config_file = NULL;
  }

  if (log_stderr)
  {
    Log::SetOutputToStdErr();
  }

  // A log file takes precedence over stderr.
  if (log_file != NULL)
  {
    if (ok && !Log::SetOutputFile(log_file, false))
    {
      ok = false;
    }
    free(log_file);
    log_file = NULL;
  }

  if (quick)
  {
    config_info_.Add("Sweep.Preset", "quick");
  }

  AddOpt(config_info_, "Sweep.Preset", preset);
  AddOpt(config_info_, "Sweep.Output", output);
  AddOpt(config_info_, "Sweep.RecvBufs", recv_bufs);
  AddOpt(config_info_, "Sweep.Delays", delays);
  AddOpt(config_info_, "Sweep.ReadSizes", read_sizes);
  AddOpt(config_info_, "Sweep.Rates", rates);
  AddOpt(config_info_, "Sweep.Duration", duration);
  AddOpt(config_info_, "Sweep.SummaryFile", summary);

  if (no_pcap)
  {
    config_info_.Add("Capture.Enabled", "false");
  }

  if (port > 0)
  {
    config_info_.Add("Trial.Port", StringUtils::ToString(port));
  }

  if (verbose)
  {
    config_info_.Add("Log.DefaultLevel", "FEWIA");
  }

  AddOpt(config_info_, "Log.DefaultLevel", log_level);

  if (debug)
  {
    config_info_.Add("Log.DefaultLevel", "ALL");
  }

  return ok;
}
