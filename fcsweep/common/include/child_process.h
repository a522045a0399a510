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
/// Provides the sweep harness with a class for running external programs.
///

#ifndef FCSWEEP_COMMON_CHILD_PROCESS_H
#define FCSWEEP_COMMON_CHILD_PROCESS_H

#include "itime.h"

#include <string>
#include <vector>

#include <sys/types.h>

namespace fcsweep
{
  ///
  /// A forked and exec'd external program, e.g. a packet capture tool.
  ///
  /// The program is located via PATH.  Its stdin and stderr are connected to
  /// /dev/null, and its stdout is either connected to /dev/null or captured
  /// through a pipe that is drained with ReadOutput().
  ///
  /// A program that cannot be executed (missing from PATH, not executable)
  /// is reported by Start() returning false, with exec_errno() holding the
  /// reason.
  ///
  /// The destructor terminates and reaps a program that is still running,
  /// so a ChildProcess never leaves a zombie or an orphan behind.
  ///
  class ChildProcess
  {
    public:

    ///
    /// Constructor.
    ///
    ChildProcess();

    ///
    /// Destructor.
    ///
    virtual ~ChildProcess();

    ///
    /// Launch the program.
    ///
    /// \param  argv            The program name followed by its arguments.
    /// \param  capture_stdout  If true, the program's stdout is available to
    ///                         ReadOutput().
    ///
    /// \return  true if the program was executed, false otherwise.
    ///
    bool Start(const std::vector<std::string>& argv, bool capture_stdout);

    ///
    /// Check whether the program is still running, reaping it if it has
    /// exited.
    ///
    /// \return  true if the program is running.
    ///
    bool IsRunning();

    ///
    /// Read the program's stdout until it is closed or the timeout expires.
    ///
    /// \param  timeout  The maximum time to spend reading.
    /// \param  output   The string to which the output is appended.
    ///
    /// \return  true if end of file was reached, false on a timeout or a
    ///          read error.
    ///
    bool ReadOutput(const Time& timeout, std::string& output);

    ///
    /// Wait for the program to exit on its own.
    ///
    /// \param  timeout  The maximum time to wait.
    ///
    /// \return  true if the program has exited, false if it is still
    ///          running when the timeout expires.
    ///
    bool Wait(const Time& timeout);

    ///
    /// Send SIGTERM, wait up to the timeout, and then send SIGKILL if the
    /// program is still running.  The program is always reaped on return.
    ///
    /// \param  timeout  How long to wait after SIGTERM.
    ///
    /// \return  true if the program exited after SIGTERM, false if SIGKILL
    ///          was needed.
    ///
    bool Terminate(const Time& timeout);

    ///
    /// \return  true if the program exited normally with status 0.
    ///
    bool ExitedCleanly() const;

    ///
    /// \return  A description of how the program ended, e.g.
    ///          "exit status 1" or "killed by signal 15".
    ///
    std::string DescribeExit() const;

    inline pid_t pid() const
    {
      return pid_;
    }

    inline int exec_errno() const
    {
      return exec_errno_;
    }

    private:

    /// Copy constructor.
    ChildProcess(const ChildProcess& other);

    /// Copy operator.
    ChildProcess& operator=(const ChildProcess& other);

    ///
    /// Reap the program with the given waitpid() options.
    ///
    /// \return  true if the program has been reaped.
    ///
    bool Reap(int options);

    ///
    /// Close the stdout pipe, if open.
    ///
    void CloseOutput();

    /// The program's process id, or -1 when no program is running.
    pid_t        pid_;

    /// The read end of the stdout pipe, or -1.
    int          out_fd_;

    /// The waitpid() status once the program has been reaped.
    int          status_;

    /// Whether status_ holds a valid value.
    bool         reaped_;

    /// The errno from a failed exec, or 0.
    int          exec_errno_;

    /// The program name, for logging.
    std::string  name_;

  }; // end class ChildProcess

} // namespace fcsweep

#endif // FCSWEEP_COMMON_CHILD_PROCESS_H
