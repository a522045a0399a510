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
/// Provides the sweep harness with a simple class to streamline the
/// threading of an object.
///

#ifndef FCSWEEP_COMMON_THREAD_H
#define FCSWEEP_COMMON_THREAD_H


#include "itime.h"
#include "runnable_if.h"

#include <pthread.h>


//
// Definition of function type for execution within a thread.
//
typedef void* runner_t(void*);


namespace fcsweep
{
  ///
  /// A simple class to streamline the threading of an object.
  ///
  /// Threads are joinable.  The owner starts the thread with either a static
  /// runner_t function or a RunnableIf object, arranges for the thread's
  /// work to end (typically by setting a flag the Run() method polls), and
  /// then calls JoinThread() with a bound on how long to wait:
  ///
  /// \code
  ///   class Worker : public RunnableIf
  ///   {
  ///     public:
  ///
  ///     void Run()
  ///     {
  ///       while (!stop_)
  ///       {
  ///         ...
  ///       }
  ///     }
  ///
  ///     volatile bool  stop_;
  ///   };
  ///
  ///   Worker  worker;
  ///   Thread  thread;
  ///
  ///   thread.StartThread(&worker);
  ///   ...
  ///   worker.stop_ = true;
  ///   thread.JoinThread(Time::FromSec(2));
  /// \endcode
  ///
  /// SIGINT and SIGTERM are blocked in the new thread so that they are
  /// delivered to the main thread.
  ///
  class Thread
  {
    public:

    ///
    /// Default no-arg constructor.
    ///
    Thread();

    ///
    /// Destructor.  A thread still running is cancelled and joined.
    ///
    virtual ~Thread();

    ///
    /// Start a thread. This will launch the thread executing against the
    /// provided static runner_t method with the provided argument.
    ///
    /// \param  fn   The static runner_t method that will be called inside the
    ///              new thread.
    /// \param  arg  The argument passed to the static runner_t method.
    ///
    /// \return true if successful, false if an error occurs.
    ///
    bool StartThread(runner_t* fn, void* arg);

    ///
    /// Start a thread. This will lauch a thread executing against the
    /// fcsweep::RunnableIf object's run method.
    ///
    /// \param  object  The runnable object to execute.
    ///
    /// \return true if successful, false if an error occurs.
    ///
    bool StartThread(fcsweep::RunnableIf* object);

    ///
    /// Wait for the thread to exit.  If it has not exited when the timeout
    /// expires, it is cancelled and then joined.
    ///
    /// \param  timeout  The maximum time to wait for a voluntary exit.
    ///
    /// \return true if the thread exited on its own (or was not running),
    ///         false if it had to be cancelled.
    ///
    bool JoinThread(const Time& timeout);

    ///
    /// Check whether a thread has been started and not yet joined.
    ///
    inline bool IsRunning() const
    {
      return is_running_;
    }

    private:

    /// Copy Constructor.
    Thread(const Thread& other);

    /// Copy operator.
    Thread& operator=(const Thread& other);

    ///
    /// The static routine that binds the thread to the abstract run method on
    /// a fcsweep::RunnableIf object.
    ///
    static void* Run(void* arg);

    ///
    /// Cancel the thread and join it.
    ///
    void CancelThread();

    /// The thread. Not valid when is_running_ is false.
    pthread_t  thread_;

    /// A flag for recording if the thread has been started and not joined.
    bool       is_running_;

  }; // end class Thread

} // namespace fcsweep

#endif // FCSWEEP_COMMON_THREAD_H
