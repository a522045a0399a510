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

#ifndef FCSWEEP_SWEEP_RESULT_STORE_H
#define FCSWEEP_SWEEP_RESULT_STORE_H

#include "trial_metrics.h"

#include <string>

#include <stdint.h>

namespace fcsweep
{
  ///
  /// The append-only CSV file of trial records.
  ///
  /// Open() truncates the file and writes the header row.  Each Append()
  /// writes one complete row and syncs it to disk before returning, so an
  /// interrupted sweep keeps every record appended before the interruption.
  ///
  class ResultStore
  {
    public:

    ///
    /// Constructor.
    ///
    ResultStore();

    ///
    /// Destructor.  Closes the file.
    ///
    virtual ~ResultStore();

    ///
    /// Create (or truncate) the file and write the header row.
    ///
    /// \param  path   The file path.
    /// \param  error  Set to a description of the failure.
    ///
    /// \return  true on success.
    ///
    bool Open(const std::string& path, std::string& error);

    ///
    /// Append one record.
    ///
    /// \param  metrics  The record.
    /// \param  error    Set to a description of the failure.
    ///
    /// \return  true if the row was written and synced.
    ///
    bool Append(const TrialMetrics& metrics, std::string& error);

    ///
    /// Close the file.
    ///
    void Close();

    inline const std::string& path() const
    {
      return path_;
    }

    inline uint32_t num_records() const
    {
      return num_records_;
    }

    private:

    ResultStore(const ResultStore& other);
    ResultStore& operator=(const ResultStore& other);

    ///
    /// Write a line and sync the file.
    ///
    bool WriteLine(const std::string& line, std::string& error);

    std::string  path_;
    int          fd_;
    uint32_t     num_records_;

  }; // end class ResultStore

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_RESULT_STORE_H
