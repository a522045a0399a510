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

#ifndef FCSWEEP_TESTTOOLS_PORT_NUMBER_MGR_H
#define FCSWEEP_TESTTOOLS_PORT_NUMBER_MGR_H

#include <string>

#include <stdint.h>

namespace fcsweep
{
  ///
  /// Hands out loopback TCP ports to unit tests so that concurrently running
  /// test programs do not collide with each other or with a real sweep on
  /// the default port.
  ///
  /// Each process claims one chunk of the port range, recorded in a shared
  /// file under /tmp, and releases it at exit.  Ports inside the chunk are
  /// handed out in order, skipping any that something else already has
  /// bound.
  ///
  class PortNumberMgr
  {
    public:

    ///
    /// Get the per-process instance.
    ///
    static PortNumberMgr& GetInstance();

    ///
    /// Get the next port that is free to listen on.
    ///
    /// \return  The port number, in host byte order.
    ///
    uint16_t NextAvailable();

    ///
    /// Get the next port as a string, for use as a configuration value.
    ///
    std::string NextAvailableStr();

    private:

    PortNumberMgr();

    virtual ~PortNumberMgr();

    PortNumberMgr(const PortNumberMgr& other);

    PortNumberMgr& operator=(const PortNumberMgr& other);

    ///
    /// Claim the lowest chunk not listed in the used file, under an
    /// exclusive lock on that file.
    ///
    /// \return  The chunk index, or -1 on error.
    ///
    int ClaimChunk();

    ///
    /// Remove this process's chunk from the used file.
    ///
    void ReleaseChunk();

    ///
    /// Check whether a loopback TCP port can currently be bound.
    ///
    static bool IsBindable(uint16_t port);

    int  chunk_;
    int  next_;
    int  min_;
    int  max_;

    static const char* kUsedFile;
    static const int   kMinPort      = 33000;
    static const int   kMaxPort      = 35000;
    static const int   kPortsPerChunk = 100;
    static const int   kMaxChunks    = (kMaxPort - kMinPort) / kPortsPerChunk;

  }; // end class PortNumberMgr

} // namespace fcsweep

#endif // FCSWEEP_TESTTOOLS_PORT_NUMBER_MGR_H
