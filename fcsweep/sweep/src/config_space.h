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

#ifndef FCSWEEP_SWEEP_CONFIG_SPACE_H
#define FCSWEEP_SWEEP_CONFIG_SPACE_H

#include "trial_config.h"

#include <string>
#include <vector>

#include <stdint.h>

namespace fcsweep
{
  class ConfigInfo;

  ///
  /// The candidate values for each swept dimension.
  ///
  struct SweepParams
  {
    SweepParams()
        : recv_bufs(), delays_ms(), read_sizes(), rates_mbps(),
          duration_sec(0.0)
    { }

    std::vector<uint32_t>  recv_bufs;
    std::vector<double>    delays_ms;
    std::vector<uint32_t>  read_sizes;
    std::vector<double>    rates_mbps;
    double                 duration_sec;
  };

  ///
  /// Expands sweep parameters into the ordered list of trial
  /// configurations.
  ///
  /// The order is that of nested loops with the receive buffer size
  /// outermost, then the read delay, then the read size, and the send rate
  /// innermost.  Generation is a pure function of its input.
  ///
  class ConfigSpace
  {
    public:

    ///
    /// Generate the cross product of the parameter lists.
    ///
    /// \param  params   The sweep parameters.
    /// \param  configs  The vector in which to return the configurations.
    ///                  It is cleared first.
    ///
    static void Generate(const SweepParams& params,
                         std::vector<TrialConfig>& configs);

    ///
    /// The "default" wide sweep: 375 configurations of 10 seconds each.
    ///
    static SweepParams DefaultParams();

    ///
    /// The "quick" reduced sweep: 8 configurations of 5 seconds each.
    ///
    static SweepParams QuickParams();

    ///
    /// Look up a preset by name.
    ///
    /// \param  name    "default" or "quick".
    /// \param  params  Set to the preset's parameters on success.
    ///
    /// \return  false if the name is not a known preset.
    ///
    static bool GetPreset(const std::string& name, SweepParams& params);

    ///
    /// Build the sweep parameters from configuration: start from the preset
    /// named by Sweep.Preset and replace each dimension that has an override
    /// key (Sweep.RecvBufs, Sweep.Delays, Sweep.ReadSizes, Sweep.Rates,
    /// Sweep.Duration).
    ///
    /// \param  ci      The configuration.
    /// \param  params  Set to the resulting parameters on success.
    /// \param  error   Set to a description of the problem on failure.
    ///
    /// \return  true if the preset is known and every value is valid.
    ///
    static bool LoadParams(const ConfigInfo& ci, SweepParams& params,
                           std::string& error);

    ///
    /// Check that every list is non-empty and every value is valid.
    ///
    static bool Validate(const SweepParams& params, std::string& error);

    ///
    /// The number of configurations Generate() would produce.
    ///
    static size_t Count(const SweepParams& params);

    private:

    ConfigSpace();
    ConfigSpace(const ConfigSpace& other);
    ConfigSpace& operator=(const ConfigSpace& other);

  }; // end class ConfigSpace

} // namespace fcsweep

#endif // FCSWEEP_SWEEP_CONFIG_SPACE_H
