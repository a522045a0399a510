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

#include "capture_controller.h"

#include "config_info.h"
#include "fcsweep_defaults.h"
#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <new>

#include <unistd.h>

using ::fcsweep::CaptureController;
using ::fcsweep::ChildProcess;
using ::fcsweep::ConfigInfo;
using ::fcsweep::StringUtils;
using ::fcsweep::Time;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "CaptureController";

  /// Trace file name template, relative to the temporary directory.
  const char*  kTraceTemplate = "fcsweep_trial_XXXXXX.pcap";

  /// Length of the ".pcap" suffix in kTraceTemplate.
  const int    kTraceSuffixLen = 5;
}

//============================================================================
CaptureController::CaptureController()
    : tool_(kDefaultCaptureTool),
      interface_(kDefaultCaptureInterface),
      settle_(Time::FromMsec(kDefaultCaptureSettleMs)),
      stop_timeout_(Time::FromMsec(kDefaultCaptureStopMs)),
      post_stop_settle_(Time::FromMsec(kDefaultPostStopSettleMs)),
      tmp_dir_(kDefaultCaptureTmpDir),
      process_(NULL)
{
}

//============================================================================
CaptureController::~CaptureController()
{
  if (process_ != NULL)
  {
    process_->Terminate(stop_timeout_);
    delete process_;
    process_ = NULL;
  }
}

//============================================================================
bool CaptureController::Initialize(const ConfigInfo& ci)
{
  tool_             = ci.Get("Capture.Tool", kDefaultCaptureTool);
  interface_        = ci.Get("Capture.Interface", kDefaultCaptureInterface);
  settle_           = Time::FromMsec(
    ci.GetUint("Capture.SettleMs", kDefaultCaptureSettleMs));
  stop_timeout_     = Time::FromMsec(
    ci.GetUint("Capture.StopTimeoutMs", kDefaultCaptureStopMs));
  post_stop_settle_ = Time::FromMsec(
    ci.GetUint("Capture.PostStopSettleMs", kDefaultPostStopSettleMs));
  tmp_dir_          = ci.Get("Capture.TmpDir", kDefaultCaptureTmpDir);

  if (tool_.empty())
  {
    LogE(kClassName, __func__, "Capture.Tool must not be empty.\n");
    return false;
  }

  LogI(kClassName, __func__, "Capture with %s on %s, traces in %s.\n",
       tool_.c_str(), interface_.c_str(), tmp_dir_.c_str());

  return true;
}

//============================================================================
bool CaptureController::CreateTraceFile(string& path, string& error)
{
  string        name = tmp_dir_ + "/" + kTraceTemplate;
  vector<char>  buf(name.begin(), name.end());

  buf.push_back('\0');

  int  fd = mkstemps(&buf[0], kTraceSuffixLen);

  if (fd < 0)
  {
    error = "cannot create trace file in " + tmp_dir_ + ": " +
      strerror(errno);
    LogE(kClassName, __func__, "%s\n", error.c_str());
    return false;
  }

  close(fd);

  path = &buf[0];

  LogD(kClassName, __func__, "Trace file %s.\n", path.c_str());

  return true;
}

//============================================================================
CaptureController::StartResult CaptureController::Start(
  const string& trace_path, uint16_t port, string& error)
{
  if (process_ != NULL)
  {
    error = "capture already running";
    LogE(kClassName, __func__, "Capture already running.\n");
    return CAPTURE_START_FAILED;
  }

  process_ = new (std::nothrow) ChildProcess();

  if (process_ == NULL)
  {
    error = "cannot allocate capture process";
    LogE(kClassName, __func__, "%s\n", error.c_str());
    return CAPTURE_START_FAILED;
  }

  if (!process_->Start(BuildArgv(tool_, interface_, trace_path, port),
                       false))
  {
    int  exec_errno = process_->exec_errno();

    delete process_;
    process_ = NULL;

    if (exec_errno != 0)
    {
      error = tool_ + ": " + strerror(exec_errno);
      LogW(kClassName, __func__, "Capture unavailable: %s\n", error.c_str());
      return CAPTURE_TOOL_UNAVAILABLE;
    }

    error = "cannot start " + tool_;
    LogE(kClassName, __func__, "%s\n", error.c_str());
    return CAPTURE_START_FAILED;
  }

  // Let the tool open the interface before the first packet is sent.
  Time::Sleep(settle_);

  if (!process_->IsRunning())
  {
    error = tool_ + " exited during startup (" + process_->DescribeExit() +
      ")";
    LogW(kClassName, __func__, "Capture unavailable: %s\n", error.c_str());

    delete process_;
    process_ = NULL;

    return CAPTURE_TOOL_UNAVAILABLE;
  }

  LogD(kClassName, __func__, "Capture running as pid %d.\n",
       static_cast<int>(process_->pid()));

  return CAPTURE_STARTED;
}

//============================================================================
bool CaptureController::Stop()
{
  if (process_ == NULL)
  {
    return true;
  }

  bool  graceful = process_->Terminate(stop_timeout_);

  if (!graceful)
  {
    LogW(kClassName, __func__, "%s did not exit within %s and was killed, "
         "its trace may be truncated.\n", tool_.c_str(),
         stop_timeout_.ToString().c_str());
  }

  delete process_;
  process_ = NULL;

  // Let trailing packets reach the trace file.
  Time::Sleep(post_stop_settle_);

  return graceful;
}

//============================================================================
void CaptureController::RemoveTraceFile(const string& path)
{
  if (path.empty())
  {
    return;
  }

  if ((unlink(path.c_str()) != 0) && (errno != ENOENT))
  {
    LogW(kClassName, __func__, "Cannot remove trace file %s: %s\n",
         path.c_str(), strerror(errno));
  }
}

//============================================================================
vector<string> CaptureController::BuildArgv(const string& tool,
                                            const string& interface,
                                            const string& trace_path,
                                            uint16_t port)
{
  vector<string>  argv;

  argv.push_back(tool);
  argv.push_back("-i");
  argv.push_back(interface);
  argv.push_back("-w");
  argv.push_back(trace_path);
  argv.push_back("port");
  argv.push_back(StringUtils::ToString(static_cast<uint32_t>(port)));

  return argv;
}
