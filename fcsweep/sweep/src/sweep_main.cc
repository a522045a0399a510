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

#include "fcsweep_defaults.h"
#include "log.h"
#include "sweep_controller.h"
#include "sweep_opts.h"
#include "unused.h"

#include <csignal>
#include <cstdlib>
#include <new>
#include <string>

using ::fcsweep::Log;
using ::fcsweep::SweepController;
using ::fcsweep::SweepOpts;
using ::std::string;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "sweep_main";

  /// The sweep.
  SweepController*  sweep = NULL;
}

//============================================================================
void CleanUp()
{
  if (sweep != NULL)
  {
    delete sweep;
    sweep = NULL;
  }

  Log::Flush();
  Log::Destroy();
}

//============================================================================
void Finalize(int sig_num)
{
  Log::OnSignal();

  LogI(kClassName, __func__, "Signal %d received, stopping after the "
       "current trial.\n", sig_num);

  // Finish the trial in progress, then stop.
  if (sweep != NULL)
  {
    sweep->set_done(true);
  }
}

//============================================================================
static void SetSignalHandlers()
{
  if (signal(SIGINT, Finalize) == SIG_ERR)
  {
    LogE(kClassName, __func__, "Error setting up SIGINT signal handler.\n");
  }

  if (signal(SIGTERM, Finalize) == SIG_ERR)
  {
    LogE(kClassName, __func__, "Error setting up SIGTERM signal handler.\n");
  }

  // Socket errors are reported by send() instead.
  if (signal(SIGPIPE, SIG_IGN) == SIG_ERR)
  {
    LogE(kClassName, __func__, "Error ignoring SIGPIPE.\n");
  }
}

//============================================================================
int main(int argc, const char* argv[])
{
  SweepOpts  opts;

  if (!opts.ParseArgs(argc, argv))
  {
    CleanUp();
    return 2;
  }

  Log::SetDefaultLevel(opts.config_info_.Get("Log.DefaultLevel",
                                             fcsweep::kDefaultLogLevel));

  sweep = new (std::nothrow) SweepController();

  if (sweep == NULL)
  {
    LogF(kClassName, __func__, "Error allocating SweepController.\n");
  }

  if (!sweep->Initialize(opts.config_info_))
  {
    LogE(kClassName, __func__, "Error initializing the sweep.\n");
    CleanUp();
    return 2;
  }

  SetSignalHandlers();

  int  rv = 0;

  if (!sweep->Run())
  {
    rv = 2;
  }
  else if (!sweep->AllSucceeded())
  {
    rv = 1;
  }

  CleanUp();

  return rv;
}
