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

#include "child_process.h"
#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>


using ::fcsweep::ChildProcess;
using ::fcsweep::StringUtils;
using ::fcsweep::Time;
using ::std::string;
using ::std::vector;


namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "ChildProcess";

  /// Poll interval while waiting for the program to exit.
  const int64_t  kWaitPollUsec = 10000;

  /// Grace period after SIGKILL before giving up on the reap.
  const int64_t  kKillWaitMsec = 1000;
}

//============================================================================
ChildProcess::ChildProcess()
    : pid_(-1),
      out_fd_(-1),
      status_(0),
      reaped_(false),
      exec_errno_(0),
      name_()
{
}

//============================================================================
ChildProcess::~ChildProcess()
{
  if (pid_ > 0)
  {
    Terminate(Time::FromMsec(500));
  }

  CloseOutput();
}

//============================================================================
bool ChildProcess::Start(const vector<string>& argv, bool capture_stdout)
{
  if (argv.empty())
  {
    LogE(kClassName, __func__, "Empty argument vector.\n");
    return false;
  }

  if (pid_ > 0)
  {
    LogE(kClassName, __func__, "%s is already running as pid %d.\n",
         name_.c_str(), static_cast<int>(pid_));
    return false;
  }

  name_       = argv[0];
  reaped_     = false;
  status_     = 0;
  exec_errno_ = 0;

  //
  // The exec status pipe is close-on-exec: a successful exec closes it with
  // nothing written, a failed exec writes errno into it.
  //

  int  exec_pipe[2];
  int  out_pipe[2] = { -1, -1 };

  if (::pipe2(exec_pipe, O_CLOEXEC) != 0)
  {
    LogE(kClassName, __func__, "pipe2 error: %s\n", strerror(errno));
    return false;
  }

  if (capture_stdout && (::pipe2(out_pipe, O_CLOEXEC) != 0))
  {
    LogE(kClassName, __func__, "pipe2 error: %s\n", strerror(errno));
    ::close(exec_pipe[0]);
    ::close(exec_pipe[1]);
    return false;
  }

  vector<char*>  c_argv;

  for (size_t i = 0; i < argv.size(); ++i)
  {
    c_argv.push_back(const_cast<char*>(argv[i].c_str()));
  }
  c_argv.push_back(NULL);

  pid_t  pid = ::fork();

  if (pid < 0)
  {
    LogE(kClassName, __func__, "fork error: %s\n", strerror(errno));
    ::close(exec_pipe[0]);
    ::close(exec_pipe[1]);
    if (capture_stdout)
    {
      ::close(out_pipe[0]);
      ::close(out_pipe[1]);
    }
    return false;
  }

  if (pid == 0)
  {
    //
    // Child.  Only async-signal-safe calls from here to the exec.
    //

    int  dev_null = ::open("/dev/null", O_RDWR);

    if (dev_null >= 0)
    {
      ::dup2(dev_null, STDIN_FILENO);
      ::dup2(dev_null, STDERR_FILENO);
      if (!capture_stdout)
      {
        ::dup2(dev_null, STDOUT_FILENO);
      }
    }

    if (capture_stdout)
    {
      ::dup2(out_pipe[1], STDOUT_FILENO);
    }

    // A terminal interrupt goes to the harness's process group only.  The
    // harness stops the child itself, in its own teardown order.
    ::setpgid(0, 0);

    // Restore default dispositions the harness may have changed.
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    ::signal(SIGPIPE, SIG_DFL);

    sigset_t  no_signals;
    sigemptyset(&no_signals);
    ::sigprocmask(SIG_SETMASK, &no_signals, NULL);

    ::execvp(c_argv[0], &c_argv[0]);

    int  err = errno;
    ssize_t  UNUSED(rv) = ::write(exec_pipe[1], &err, sizeof(err));
    ::_exit(127);
  }

  //
  // Parent.
  //

  ::close(exec_pipe[1]);
  if (capture_stdout)
  {
    ::close(out_pipe[1]);
    out_fd_ = out_pipe[0];
  }

  pid_ = pid;

  int      err = 0;
  ssize_t  n   = 0;

  do
  {
    n = ::read(exec_pipe[0], &err, sizeof(err));
  }
  while ((n < 0) && (errno == EINTR));

  ::close(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(err)))
  {
    exec_errno_ = err;
    LogW(kClassName, __func__, "Unable to execute %s: %s\n", name_.c_str(),
         strerror(err));
    Reap(0);
    CloseOutput();
    return false;
  }

  LogA(kClassName, __func__, "Started %s as pid %d.\n", name_.c_str(),
       static_cast<int>(pid_));

  return true;
}

//============================================================================
bool ChildProcess::IsRunning()
{
  if (pid_ <= 0)
  {
    return false;
  }

  return !Reap(WNOHANG);
}

//============================================================================
bool ChildProcess::ReadOutput(const Time& timeout, string& output)
{
  if (out_fd_ < 0)
  {
    LogE(kClassName, __func__, "Output of %s is not being captured.\n",
         name_.c_str());
    return false;
  }

  Time  deadline = Time::Now() + timeout;
  char  buf[4096];

  while (true)
  {
    Time  now = Time::Now();

    if (now >= deadline)
    {
      LogW(kClassName, __func__, "Timed out reading output of %s.\n",
           name_.c_str());
      return false;
    }

    struct pollfd  pfd;
    pfd.fd      = out_fd_;
    pfd.events  = POLLIN;
    pfd.revents = 0;

    int  wait_ms = static_cast<int>((deadline - now).GetTimeInMsec()) + 1;
    int  rv      = ::poll(&pfd, 1, wait_ms);

    if (rv < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      LogE(kClassName, __func__, "poll error: %s\n", strerror(errno));
      return false;
    }

    if (rv == 0)
    {
      continue;
    }

    ssize_t  n = ::read(out_fd_, buf, sizeof(buf));

    if (n > 0)
    {
      output.append(buf, static_cast<size_t>(n));
    }
    else if (n == 0)
    {
      CloseOutput();
      return true;
    }
    else if (errno != EINTR)
    {
      LogE(kClassName, __func__, "read error: %s\n", strerror(errno));
      return false;
    }
  }
}

//============================================================================
bool ChildProcess::Wait(const Time& timeout)
{
  if (pid_ <= 0)
  {
    return true;
  }

  Time  deadline = Time::Now() + timeout;

  while (!Reap(WNOHANG))
  {
    if (Time::Now() >= deadline)
    {
      return false;
    }
    Time::Sleep(Time::FromUsec(kWaitPollUsec));
  }

  return true;
}

//============================================================================
bool ChildProcess::Terminate(const Time& timeout)
{
  if (pid_ <= 0)
  {
    return true;
  }

  if ((::kill(pid_, SIGTERM) != 0) && (errno != ESRCH))
  {
    LogE(kClassName, __func__, "kill(SIGTERM) of %s error: %s\n",
         name_.c_str(), strerror(errno));
  }

  if (Wait(timeout))
  {
    return true;
  }

  LogW(kClassName, __func__, "%s (pid %d) ignored SIGTERM, sending "
       "SIGKILL.\n", name_.c_str(), static_cast<int>(pid_));

  if ((::kill(pid_, SIGKILL) != 0) && (errno != ESRCH))
  {
    LogE(kClassName, __func__, "kill(SIGKILL) of %s error: %s\n",
         name_.c_str(), strerror(errno));
  }

  if (!Wait(Time::FromMsec(kKillWaitMsec)))
  {
    // SIGKILL cannot be ignored, so block until the kernel delivers it.
    Reap(0);
  }

  return false;
}

//============================================================================
bool ChildProcess::ExitedCleanly() const
{
  return (reaped_ && WIFEXITED(status_) && (WEXITSTATUS(status_) == 0));
}

//============================================================================
string ChildProcess::DescribeExit() const
{
  if (exec_errno_ != 0)
  {
    return StringUtils::FormatString(128, "exec failed: %s",
                                      strerror(exec_errno_));
  }

  if (!reaped_)
  {
    return "running";
  }

  if (WIFEXITED(status_))
  {
    return StringUtils::FormatString(64, "exit status %d",
                                      WEXITSTATUS(status_));
  }

  if (WIFSIGNALED(status_))
  {
    return StringUtils::FormatString(64, "killed by signal %d",
                                      WTERMSIG(status_));
  }

  return "unknown status";
}

//============================================================================
bool ChildProcess::Reap(int options)
{
  int    status = 0;
  pid_t  rv;

  do
  {
    rv = ::waitpid(pid_, &status, options);
  }
  while ((rv < 0) && (errno == EINTR));

  if (rv == 0)
  {
    return false;
  }

  if (rv < 0)
  {
    LogE(kClassName, __func__, "waitpid of %s error: %s\n", name_.c_str(),
         strerror(errno));
  }
  else
  {
    status_ = status;
    reaped_ = true;
  }

  LogA(kClassName, __func__, "%s (pid %d) ended: %s.\n", name_.c_str(),
       static_cast<int>(pid_), DescribeExit().c_str());

  pid_ = -1;

  return true;
}

//============================================================================
void ChildProcess::CloseOutput()
{
  if (out_fd_ >= 0)
  {
    ::close(out_fd_);
    out_fd_ = -1;
  }
}
