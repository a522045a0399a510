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

#ifndef FCSWEEP_SWEEP_THROTTLED_RECEIVER_H
#define FCSWEEP_SWEEP_THROTTLED_RECEIVER_H

#include "itime.h"
#include "runnable_if.h"
#include "thread.h"
#include "trial_config.h"

#include <string>

#include <pthread.h>
#include <stdint.h>

namespace fcsweep
{
  class ConfigInfo;

  ///
  /// A TCP acceptor that emulates a slow consumer.
  ///
  /// The receiver runs in its own thread for the lifetime of one trial.  It
  /// accepts a single connection on the trial port, then repeatedly sleeps
  /// for the configured read delay and reads at most the configured read
  /// size, counting the bytes it reads.  The requested receive buffer size
  /// is applied to the listening socket and again to the accepted
  /// connection.  The kernel may clamp it; the effective size is logged.
  ///
  /// Accept timeout, connection reset and end of stream all end the read
  /// loop normally.  The count of bytes read remains the measurement.
  ///
  /// The following configuration items are used:
  ///
  /// - Trial.BindAddr            : Listen address. Default 0.0.0.0.
  /// - Trial.Port                : Listen port. Default 9999.
  /// - Receiver.AcceptTimeoutMs  : How long to wait for the sender to
  ///                               connect. Default 1000.
  /// - Receiver.ReadyTimeoutMs   : How long Start() waits for the listener
  ///                               to be bound. Default 2000.
  /// - Receiver.StopTimeoutMs    : How long Stop() waits for the thread
  ///                               before cancelling it. Default 2000.
  ///
  class ThrottledReceiver : public RunnableIf
  {
    public:

    ///
    /// Constructor.
    ///
    ThrottledReceiver();

    ///
    /// Destructor.  Stops a running receiver.
    ///
    virtual ~ThrottledReceiver();

    ///
    /// Initialize the receiver from configuration.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  true on success, false if the bind address is invalid.
    ///
    bool Initialize(const ConfigInfo& ci);

    ///
    /// Start the receiver thread and wait until its listener is bound and
    /// listening.
    ///
    /// \param  config  The trial configuration supplying the buffer size,
    ///                 read delay and read size.
    /// \param  error   Set to a description of the failure.
    ///
    /// \return  true once the receiver is ready to accept, false if the
    ///          listener could not be set up in time.
    ///
    bool Start(const TrialConfig& config, std::string& error);

    ///
    /// Stop the receiver: end the read loop, join the thread (bounded), and
    /// close the sockets.  Calling Stop() on a stopped receiver does
    /// nothing.
    ///
    void Stop();

    ///
    /// The thread body.  Called by Thread, not by users.
    ///
    virtual void Run();

    ///
    /// The number of bytes read so far.
    ///
    uint64_t bytes_received() const;

    ///
    /// The receive buffer size the kernel reported for the accepted
    /// connection, or 0 if no connection was accepted.
    ///
    int effective_rcvbuf() const;

    inline uint16_t port() const
    {
      return port_;
    }

    private:

    ThrottledReceiver(const ThrottledReceiver& other);
    ThrottledReceiver& operator=(const ThrottledReceiver& other);

    /// Receiver thread readiness states.
    enum ReadyState
    {
      NOT_READY = 0,
      READY,
      SETUP_FAILED
    };

    ///
    /// Create, configure, bind and listen on the listening socket.
    ///
    bool OpenListener(std::string& error);

    ///
    /// Report the outcome of OpenListener() to the thread blocked in
    /// Start().
    ///
    void SignalReady(ReadyState state, const std::string& error);

    ///
    /// Wait for the sender to connect.
    ///
    /// \return  true if a connection was accepted.
    ///
    bool AcceptConnection();

    ///
    /// Throttled read loop over the accepted connection.
    ///
    void ReadLoop();

    ///
    /// Wait until the connection is readable or a stop is requested.
    ///
    /// \return  true if the connection is readable (or has an error or end
    ///          of stream to report).
    ///
    bool WaitReadable();

    ///
    /// Apply the requested receive buffer size and return the size the
    /// kernel reports.
    ///
    int ApplyRecvBuf(int fd, const char* which);

    ///
    /// Close both sockets.
    ///
    void CloseSockets();

    bool is_stop_requested() const;

    std::string      bind_addr_;
    uint16_t         port_;
    Time             accept_timeout_;
    Time             ready_timeout_;
    Time             stop_timeout_;

    // Per-trial parameters, set by Start().
    uint32_t         recv_buf_bytes_;
    double           read_delay_ms_;
    uint32_t         read_chunk_bytes_;

    Thread           thread_;

    /// Protects everything below.
    mutable pthread_mutex_t  mutex_;

    /// Signalled when ready_state_ leaves NOT_READY.
    pthread_cond_t   ready_cond_;

    ReadyState       ready_state_;
    std::string      setup_error_;
    bool             stop_requested_;
    int              listen_fd_;
    int              conn_fd_;
    uint64_t         bytes_received_;
    int              effective_rcvbuf_;

  }; // end class ThrottledReceiver

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_THROTTLED_RECEIVER_H
