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

#include "throttled_receiver.h"

#include "config_info.h"
#include "fcsweep_defaults.h"
#include "log.h"
#include "scoped_lock.h"
#include "string_utils.h"
#include "unused.h"

#include <cerrno>
#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <inttypes.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <time.h>
#include <unistd.h>

using ::fcsweep::ConfigInfo;
using ::fcsweep::ScopedLock;
using ::fcsweep::StringUtils;
using ::fcsweep::ThrottledReceiver;
using ::fcsweep::Time;
using ::fcsweep::TrialConfig;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "ThrottledReceiver";

  /// Longest single wait in the accept and read loops, so that a stop
  /// request is noticed promptly.
  const int  kPollSliceMs = 100;
}

//============================================================================
ThrottledReceiver::ThrottledReceiver()
    : bind_addr_(kDefaultBindAddr),
      port_(kDefaultTrialPort),
      accept_timeout_(Time::FromMsec(kDefaultAcceptTimeoutMs)),
      ready_timeout_(Time::FromMsec(kDefaultReadyTimeoutMs)),
      stop_timeout_(Time::FromMsec(kDefaultStopTimeoutMs)),
      recv_buf_bytes_(0),
      read_delay_ms_(0.0),
      read_chunk_bytes_(0),
      thread_(),
      mutex_(),
      ready_cond_(),
      ready_state_(NOT_READY),
      setup_error_(),
      stop_requested_(false),
      listen_fd_(-1),
      conn_fd_(-1),
      bytes_received_(0),
      effective_rcvbuf_(0)
{
  pthread_mutex_init(&mutex_, NULL);
  pthread_cond_init(&ready_cond_, NULL);
}

//============================================================================
ThrottledReceiver::~ThrottledReceiver()
{
  Stop();

  pthread_cond_destroy(&ready_cond_);
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool ThrottledReceiver::Initialize(const ConfigInfo& ci)
{
  bind_addr_ = ci.Get("Trial.BindAddr", kDefaultBindAddr);
  port_      = static_cast<uint16_t>(ci.GetUint("Trial.Port",
                                                kDefaultTrialPort));

  accept_timeout_ = Time::FromMsec(
    ci.GetUint("Receiver.AcceptTimeoutMs", kDefaultAcceptTimeoutMs));
  ready_timeout_  = Time::FromMsec(
    ci.GetUint("Receiver.ReadyTimeoutMs", kDefaultReadyTimeoutMs));
  stop_timeout_   = Time::FromMsec(
    ci.GetUint("Receiver.StopTimeoutMs", kDefaultStopTimeoutMs));

  in_addr  addr;

  if (inet_pton(AF_INET, bind_addr_.c_str(), &addr) != 1)
  {
    LogE(kClassName, __func__, "Invalid bind address: %s\n",
         bind_addr_.c_str());
    return false;
  }

  LogI(kClassName, __func__, "Receiver listen address %s:%" PRIu16 ".\n",
       bind_addr_.c_str(), port_);

  return true;
}

//============================================================================
bool ThrottledReceiver::Start(const TrialConfig& config, string& error)
{
  if (thread_.IsRunning())
  {
    error = "receiver already running";
    LogE(kClassName, __func__, "Receiver already running.\n");
    return false;
  }

  recv_buf_bytes_   = config.recv_buf_bytes();
  read_delay_ms_    = config.read_delay_ms();
  read_chunk_bytes_ = config.read_chunk_bytes();

  {
    ScopedLock  lock(&mutex_);

    ready_state_      = NOT_READY;
    setup_error_.clear();
    stop_requested_   = false;
    bytes_received_   = 0;
    effective_rcvbuf_ = 0;
  }

  if (!thread_.StartThread(this))
  {
    error = "cannot start receiver thread";
    return false;
  }

  //
  // Wait for the thread to report that the listener is bound.
  // pthread_cond_timedwait() takes an absolute CLOCK_REALTIME deadline.
  //

  timespec  deadline;

  if (clock_gettime(CLOCK_REALTIME, &deadline) != 0)
  {
    error = string("clock_gettime: ") + strerror(errno);
    Stop();
    return false;
  }

  timespec  delta = ready_timeout_.ToTspec();

  deadline.tv_sec  += delta.tv_sec;
  deadline.tv_nsec += delta.tv_nsec;

  if (deadline.tv_nsec >= 1000000000L)
  {
    deadline.tv_sec  += 1;
    deadline.tv_nsec -= 1000000000L;
  }

  ReadyState  state;

  pthread_mutex_lock(&mutex_);

  while (ready_state_ == NOT_READY)
  {
    int  rv = pthread_cond_timedwait(&ready_cond_, &mutex_, &deadline);

    if (rv == ETIMEDOUT)
    {
      break;
    }
  }

  state = ready_state_;
  error = setup_error_;

  pthread_mutex_unlock(&mutex_);

  if (state == READY)
  {
    return true;
  }

  if (state == NOT_READY)
  {
    error = "receiver not ready within " + ready_timeout_.ToString();
  }

  LogE(kClassName, __func__, "Receiver setup failed: %s\n", error.c_str());
  Stop();

  return false;
}

//============================================================================
void ThrottledReceiver::Stop()
{
  {
    ScopedLock  lock(&mutex_);

    stop_requested_ = true;
  }

  if (thread_.IsRunning())
  {
    if (!thread_.JoinThread(stop_timeout_))
    {
      LogW(kClassName, __func__, "Receiver thread cancelled after %s.\n",
           stop_timeout_.ToString().c_str());
    }
  }

  // The thread has exited, so its sockets can be closed here.
  CloseSockets();
}

//============================================================================
void ThrottledReceiver::Run()
{
  string  error;

  if (!OpenListener(error))
  {
    SignalReady(SETUP_FAILED, error);
    CloseSockets();
    return;
  }

  SignalReady(READY, "");

  if (AcceptConnection())
  {
    ReadLoop();
  }

  CloseSockets();

  LogI(kClassName, __func__, "Receiver done, %" PRIu64 " bytes read.\n",
       bytes_received());
}

//============================================================================
uint64_t ThrottledReceiver::bytes_received() const
{
  ScopedLock  lock(&mutex_);

  return bytes_received_;
}

//============================================================================
int ThrottledReceiver::effective_rcvbuf() const
{
  ScopedLock  lock(&mutex_);

  return effective_rcvbuf_;
}

//============================================================================
bool ThrottledReceiver::OpenListener(string& error)
{
  int  fd = socket(AF_INET, SOCK_STREAM, 0);

  if (fd < 0)
  {
    error = string("socket: ") + strerror(errno);
    return false;
  }

  {
    ScopedLock  lock(&mutex_);

    listen_fd_ = fd;
  }

  int  opt = 1;

  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0)
  {
    LogW(kClassName, __func__, "Failed to set SO_REUSEADDR: %s\n",
         strerror(errno));
  }

  ApplyRecvBuf(fd, "listener");

  sockaddr_in  addr;

  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(port_);

  if (inet_pton(AF_INET, bind_addr_.c_str(), &addr.sin_addr) != 1)
  {
    error = "invalid bind address " + bind_addr_;
    return false;
  }

  if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
  {
    error = StringUtils::FormatString(
      128, "bind %s:%" PRIu16 ": %s", bind_addr_.c_str(), port_,
      strerror(errno));
    return false;
  }

  if (listen(fd, 1) != 0)
  {
    error = string("listen: ") + strerror(errno);
    return false;
  }

  LogD(kClassName, __func__, "Listening on %s:%" PRIu16 ".\n",
       bind_addr_.c_str(), port_);

  return true;
}

//============================================================================
void ThrottledReceiver::SignalReady(ReadyState state, const string& error)
{
  ScopedLock  lock(&mutex_);

  ready_state_ = state;
  setup_error_ = error;

  pthread_cond_signal(&ready_cond_);
}

//============================================================================
bool ThrottledReceiver::AcceptConnection()
{
  int   fd;
  Time  deadline = Time::Now() + accept_timeout_;

  {
    ScopedLock  lock(&mutex_);

    fd = listen_fd_;
  }

  while (!is_stop_requested())
  {
    Time  now = Time::Now();

    if (now >= deadline)
    {
      LogW(kClassName, __func__, "No connection within %s.\n",
           accept_timeout_.ToString().c_str());
      return false;
    }

    int      wait_ms = static_cast<int>(
      Time::Min(deadline - now, Time::FromMsec(kPollSliceMs)).GetTimeInMsec());
    pollfd   pfd;

    pfd.fd      = fd;
    pfd.events  = POLLIN;
    pfd.revents = 0;

    int  rv = poll(&pfd, 1, (wait_ms > 0 ? wait_ms : 1));

    if (rv == 0)
    {
      continue;
    }

    if (rv < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }

      LogW(kClassName, __func__, "poll error: %s\n", strerror(errno));
      return false;
    }

    int  conn = accept(fd, NULL, NULL);

    if (conn < 0)
    {
      if ((errno == EINTR) || (errno == EAGAIN) || (errno == ECONNABORTED))
      {
        continue;
      }

      LogW(kClassName, __func__, "accept error: %s\n", strerror(errno));
      return false;
    }

    int  effective = ApplyRecvBuf(conn, "connection");

    {
      ScopedLock  lock(&mutex_);

      conn_fd_          = conn;
      effective_rcvbuf_ = effective;
    }

    LogI(kClassName, __func__, "Connection accepted, effective receive "
         "buffer %d bytes.\n", effective);

    return true;
  }

  return false;
}

//============================================================================
void ThrottledReceiver::ReadLoop()
{
  int           fd;
  vector<char>  buf(read_chunk_bytes_);
  Time          delay = Time::FromUsec(
    static_cast<int64_t>(read_delay_ms_ * 1000.0));

  {
    ScopedLock  lock(&mutex_);

    fd = conn_fd_;
  }

  while (!is_stop_requested())
  {
    if (read_delay_ms_ > 0.0)
    {
      Time::Sleep(delay);
    }

    if (!WaitReadable())
    {
      break;
    }

    ssize_t  n = recv(fd, &buf[0], buf.size(), 0);

    if (n > 0)
    {
      ScopedLock  lock(&mutex_);

      bytes_received_ += static_cast<uint64_t>(n);
      continue;
    }

    if (n == 0)
    {
      LogD(kClassName, __func__, "End of stream.\n");
      break;
    }

    if (errno == EINTR)
    {
      continue;
    }

    LogI(kClassName, __func__, "Read loop ended: %s\n", strerror(errno));
    break;
  }
}

//============================================================================
bool ThrottledReceiver::WaitReadable()
{
  int  fd;

  {
    ScopedLock  lock(&mutex_);

    fd = conn_fd_;
  }

  while (!is_stop_requested())
  {
    pollfd  pfd;

    pfd.fd      = fd;
    pfd.events  = POLLIN;
    pfd.revents = 0;

    int  rv = poll(&pfd, 1, kPollSliceMs);

    if (rv > 0)
    {
      return true;
    }

    if ((rv < 0) && (errno != EINTR))
    {
      LogW(kClassName, __func__, "poll error: %s\n", strerror(errno));
      return false;
    }
  }

  return false;
}

//============================================================================
int ThrottledReceiver::ApplyRecvBuf(int fd, const char* which)
{
  if (recv_buf_bytes_ > 0)
  {
    int  size = static_cast<int>(recv_buf_bytes_);

    if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &size, sizeof(size)) != 0)
    {
      LogW(kClassName, __func__, "Failed to set %s receive buffer size to "
           "%d: %s\n", which, size, strerror(errno));
    }
  }

  int        effective = 0;
  socklen_t  len       = sizeof(effective);

  if (getsockopt(fd, SOL_SOCKET, SO_RCVBUF, &effective, &len) != 0)
  {
    LogW(kClassName, __func__, "Failed to get %s receive buffer size: %s\n",
         which, strerror(errno));
    return 0;
  }

  LogD(kClassName, __func__, "%s receive buffer: requested %" PRIu32
       ", effective %d.\n", which, recv_buf_bytes_, effective);

  return effective;
}

//============================================================================
void ThrottledReceiver::CloseSockets()
{
  ScopedLock  lock(&mutex_);

  if (conn_fd_ >= 0)
  {
    close(conn_fd_);
    conn_fd_ = -1;
  }

  if (listen_fd_ >= 0)
  {
    close(listen_fd_);
    listen_fd_ = -1;
  }
}

//============================================================================
bool ThrottledReceiver::is_stop_requested() const
{
  ScopedLock  lock(&mutex_);

  return stop_requested_;
}
