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

#include "result_store.h"

#include "log.h"
#include "unused.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

using ::fcsweep::ResultStore;
using ::fcsweep::TrialMetrics;
using ::std::string;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "ResultStore";
}

//============================================================================
ResultStore::ResultStore()
    : path_(), fd_(-1), num_records_(0)
{
}

//============================================================================
ResultStore::~ResultStore()
{
  Close();
}

//============================================================================
bool ResultStore::Open(const string& path, string& error)
{
  Close();

  fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);

  if (fd_ < 0)
  {
    error = "cannot open " + path + ": " + strerror(errno);
    LogE(kClassName, __func__, "%s\n", error.c_str());
    return false;
  }

  path_        = path;
  num_records_ = 0;

  return WriteLine(TrialMetrics::CsvHeader(), error);
}

//============================================================================
bool ResultStore::Append(const TrialMetrics& metrics, string& error)
{
  if (fd_ < 0)
  {
    error = "result store is not open";
    LogE(kClassName, __func__, "%s\n", error.c_str());
    return false;
  }

  if (!WriteLine(metrics.ToCsvRow(), error))
  {
    return false;
  }

  ++num_records_;

  return true;
}

//============================================================================
void ResultStore::Close()
{
  if (fd_ >= 0)
  {
    if (::close(fd_) != 0)
    {
      LogW(kClassName, __func__, "Error closing %s: %s\n", path_.c_str(),
           strerror(errno));
    }
    fd_ = -1;
  }
}

//============================================================================
bool ResultStore::WriteLine(const string& line, string& error)
{
  string       buf = line + "\n";
  const char*  pos = buf.data();
  size_t       len = buf.size();

  // A single write normally takes the whole row.
  while (len > 0)
  {
    ssize_t  n = ::write(fd_, pos, len);

    if (n < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }

      error = "write to " + path_ + " failed: " + strerror(errno);
      LogE(kClassName, __func__, "%s\n", error.c_str());
      return false;
    }

    pos += n;
    len -= static_cast<size_t>(n);
  }

  if (::fsync(fd_) != 0)
  {
    error = "fsync of " + path_ + " failed: " + strerror(errno);
    LogE(kClassName, __func__, "%s\n", error.c_str());
    return false;
  }

  return true;
}
