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

#include "thread.h"
#include "log.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <time.h>


using ::fcsweep::Thread;
using ::fcsweep::RunnableIf;
using ::fcsweep::Time;


//
// Class name used for logging.
//
static const char  kCn[] = "Thread";


//============================================================================
Thread::Thread() : thread_(), is_running_(false)
{
}

//============================================================================
Thread::~Thread()
{
  if (is_running_)
  {
    LogW(kCn, __func__, "Thread still running at destruction.\n");
    CancelThread();
  }
}

//============================================================================
bool Thread::StartThread(runner_t* fn, void* arg)
{
  pthread_attr_t  attr;
  int             rv;

  if (fn == NULL)
  {
    LogE(kCn, __func__, "Null function pointer provided.\n");
    return false;
  }

  if (is_running_)
  {
    LogW(kCn, __func__, "Thread is already running.\n");
    return true;
  }

  LogA(kCn, __func__, "Starting thread.\n");

  if (pthread_attr_init(&attr) != 0)
  {
    LogE(kCn, __func__, "pthread_attr_init error.\n");
    return false;
  }

  if (pthread_attr_setdetachstate(&attr, PTHREAD_CREATE_JOINABLE) != 0)
  {
    LogE(kCn, __func__, "pthread_attr_setdetachedstate error.\n");
    pthread_attr_destroy(&attr);
    return false;
  }

  if ((rv = pthread_create(&thread_, &attr, fn, arg)) != 0)
  {
    LogE(kCn, __func__, "pthread_create error: %s\n", strerror(rv));
    pthread_attr_destroy(&attr);
    return false;
  }

  LogA(kCn, __func__, "Thread created.\n");

  if (pthread_attr_destroy(&attr) != 0)
  {
    LogE(kCn, __func__, "pthread_attr_destroy error.\n");
  }

  is_running_ = true;

  return true;
}

//============================================================================
bool Thread::StartThread(fcsweep::RunnableIf* object)
{
  if (object == NULL)
  {
    LogE(kCn, __func__, "Null runnable provided.\n");
    return false;
  }

  return StartThread(Thread::Run, object);
}

//============================================================================
bool Thread::JoinThread(const Time& timeout)
{
  if (!is_running_)
  {
    return true;
  }

  //
  // pthread_timedjoin_np() takes an absolute CLOCK_REALTIME deadline.
  //

  timespec  deadline;

  if (clock_gettime(CLOCK_REALTIME, &deadline) != 0)
  {
    LogE(kCn, __func__, "clock_gettime error: %s\n", strerror(errno));
    CancelThread();
    return false;
  }

  timespec  delta = timeout.ToTspec();

  deadline.tv_sec  += delta.tv_sec;
  deadline.tv_nsec += delta.tv_nsec;

  if (deadline.tv_nsec >= 1000000000L)
  {
    deadline.tv_sec  += 1;
    deadline.tv_nsec -= 1000000000L;
  }

  int  rv = pthread_timedjoin_np(thread_, NULL, &deadline);

  if (rv == 0)
  {
    is_running_ = false;
    LogA(kCn, __func__, "Thread joined.\n");
    return true;
  }

  LogW(kCn, __func__, "Thread did not exit within %s (%s), cancelling.\n",
       timeout.ToString().c_str(), strerror(rv));
  CancelThread();

  return false;
}

//============================================================================
void Thread::CancelThread()
{
  int  rv;

  if ((rv = pthread_cancel(thread_)) != 0)
  {
    LogE(kCn, __func__, "pthread_cancel error: %s\n", strerror(rv));
  }

  if ((rv = pthread_join(thread_, NULL)) != 0)
  {
    LogE(kCn, __func__, "pthread_join error: %s\n", strerror(rv));
  }

  is_running_ = false;

  LogI(kCn, __func__, "Thread cancelled.\n");
}

//============================================================================
void* Thread::Run(void* arg)
{
  RunnableIf*  runnable = static_cast<RunnableIf*>(arg);

  //
  // Block the termination signals in this thread.
  //

  sigset_t  blockedSignals;

  sigemptyset(&blockedSignals);
  sigaddset(&blockedSignals, SIGINT);
  sigaddset(&blockedSignals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &blockedSignals, NULL);

  //
  // Fire the runnable's run method.
  //

  runnable->Run();

  return NULL;
}
