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

#include "port_number_mgr.h"

#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

using ::fcsweep::PortNumberMgr;
using ::fcsweep::StringUtils;
using ::std::string;
using ::std::vector;

namespace
{
  const char*  UNUSED(kClassName) = "PortNumberMgr";

  ///
  /// Read the chunk indices listed in an open used file, one per line.
  ///
  void ReadChunks(int fd, vector<int>& chunks)
  {
    string   contents;
    char     buf[512];
    ssize_t  n;

    ::lseek(fd, 0, SEEK_SET);

    while ((n = ::read(fd, buf, sizeof(buf))) > 0)
    {
      contents.append(buf, static_cast<size_t>(n));
    }

    vector<string>  lines;
    StringUtils::Tokenize(contents, "\n", lines);

    for (size_t i = 0; i < lines.size(); ++i)
    {
      int  chunk = StringUtils::GetInt(lines[i], -1);

      if (chunk >= 0)
      {
        chunks.push_back(chunk);
      }
      else
      {
        LogE(kClassName, __func__, "Value in port range use file (%s) is "
             "not a chunk index.\n", lines[i].c_str());
      }
    }
  }

  ///
  /// Replace the contents of an open used file.
  ///
  bool WriteChunks(int fd, const vector<int>& chunks)
  {
    string  contents;

    for (size_t i = 0; i < chunks.size(); ++i)
    {
      contents.append(StringUtils::ToString(chunks[i]));
      contents.append("\n");
    }

    if (::ftruncate(fd, 0) != 0)
    {
      return false;
    }

    ::lseek(fd, 0, SEEK_SET);

    return (::write(fd, contents.data(), contents.size()) ==
            static_cast<ssize_t>(contents.size()));
  }
}

const char* PortNumberMgr::kUsedFile = "/tmp/fcsweep_test_used_ports.txt";


//============================================================================
PortNumberMgr& PortNumberMgr::GetInstance()
{
  static PortNumberMgr instance;
  return instance;
}

//============================================================================
PortNumberMgr::PortNumberMgr()
    : chunk_(-1), next_(0), min_(0), max_(0)
{
  chunk_ = ClaimChunk();

  if (chunk_ < 0)
  {
    LogF(kClassName, __func__, "Unable to claim a test port range.\n");
    return;
  }

  min_  = kMinPort + (chunk_ * kPortsPerChunk);
  next_ = min_;
  max_  = min_ + kPortsPerChunk;
}

//============================================================================
PortNumberMgr::~PortNumberMgr()
{
  ReleaseChunk();
}

//============================================================================
int PortNumberMgr::ClaimChunk()
{
  int  fd = ::open(kUsedFile, O_RDWR | O_CREAT, 0666);

  if (fd < 0)
  {
    LogE(kClassName, __func__, "Unable to open %s: %s\n", kUsedFile,
         strerror(errno));
    return -1;
  }

  // Let test runs under other users share the file.
  ::fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH);

  if (::flock(fd, LOCK_EX) != 0)
  {
    LogE(kClassName, __func__, "Unable to lock %s: %s\n", kUsedFile,
         strerror(errno));
    ::close(fd);
    return -1;
  }

  vector<int>  chunks;
  ReadChunks(fd, chunks);
  std::sort(chunks.begin(), chunks.end());

  int  free_chunk = 0;

  for (size_t i = 0; i < chunks.size(); ++i)
  {
    if (free_chunk < chunks[i])
    {
      break;
    }
    free_chunk = chunks[i] + 1;
  }

  if (free_chunk >= kMaxChunks)
  {
    // Stale entries from crashed runs; start over from the bottom.
    LogW(kClassName, __func__, "All %d port chunks in use, reusing chunk "
         "0.\n", kMaxChunks);
    free_chunk = 0;
  }

  chunks.push_back(free_chunk);

  if (!WriteChunks(fd, chunks))
  {
    LogE(kClassName, __func__, "Unable to update %s: %s\n", kUsedFile,
         strerror(errno));
  }

  ::flock(fd, LOCK_UN);
  ::close(fd);

  return free_chunk;
}

//============================================================================
void PortNumberMgr::ReleaseChunk()
{
  if (chunk_ < 0)
  {
    return;
  }

  int  fd = ::open(kUsedFile, O_RDWR);

  if (fd < 0)
  {
    LogE(kClassName, __func__, "Unable to open %s, chunk being removed is "
         "%d\n", kUsedFile, chunk_);
    return;
  }

  if (::flock(fd, LOCK_EX) == 0)
  {
    vector<int>  chunks;
    vector<int>  remaining;

    ReadChunks(fd, chunks);

    bool  removed = false;

    for (size_t i = 0; i < chunks.size(); ++i)
    {
      if (!removed && (chunks[i] == chunk_))
      {
        removed = true;
        continue;
      }
      remaining.push_back(chunks[i]);
    }

    if (!WriteChunks(fd, remaining))
    {
      LogE(kClassName, __func__, "Unable to update %s.\n", kUsedFile);
    }

    ::flock(fd, LOCK_UN);
  }

  ::close(fd);
}

//============================================================================
bool PortNumberMgr::IsBindable(uint16_t port)
{
  int  fd = ::socket(AF_INET, SOCK_STREAM, 0);

  if (fd < 0)
  {
    return false;
  }

  struct sockaddr_in  addr;
  ::memset(&addr, 0, sizeof(addr));
  addr.sin_family      = AF_INET;
  addr.sin_port        = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  int  on = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

  bool  ok = (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr),
                     sizeof(addr)) == 0);

  ::close(fd);

  return ok;
}

//============================================================================
uint16_t PortNumberMgr::NextAvailable()
{
  for (int tries = 0; tries < kPortsPerChunk; ++tries)
  {
    if (next_ >= max_)
    {
      LogW(kClassName, __func__, "Reached max port number %d in chunk, "
           "restarting at %d\n", max_, min_);
      next_ = min_;
    }

    uint16_t  port = static_cast<uint16_t>(next_++);

    if (IsBindable(port))
    {
      return port;
    }
  }

  LogE(kClassName, __func__, "No bindable port in range %d-%d.\n", min_,
       max_ - 1);

  return static_cast<uint16_t>(min_);
}

//============================================================================
string PortNumberMgr::NextAvailableStr()
{
  return StringUtils::ToString(static_cast<uint32_t>(NextAvailable()));
}
