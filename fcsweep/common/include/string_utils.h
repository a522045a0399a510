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
/// Provides the sweep harness with a collection of methods for manipulating
/// std::string objects.
///

#ifndef FCSWEEP_COMMON_STRING_UTILS_H
#define FCSWEEP_COMMON_STRING_UTILS_H

#include <string>
#include <vector>

#include <inttypes.h>
#include <stdint.h>

namespace fcsweep
{
  ///
  /// A class that provides a set of static utility methods that deal with
  /// strings. This class enables us to capture frequently used string
  /// manipulation routines in a common place.
  ///
  class StringUtils
  {
    public:

    /// \brief Tokenize a string into a vector of tokens.
    ///
    /// Empty tokens (adjacent delimiters) are skipped.
    ///
    /// \param  str     The string to tokenize.
    /// \param  delim   The characters to use as the delimiter between the
    ///                 tokens.
    /// \param  tokens  The vector in which to return the tokens.  It is
    ///                 cleared first.
    static void Tokenize(const std::string& str,
                         const char* delim,
                         std::vector<std::string>& tokens);

    /// \brief Remove leading and trailing whitespace.
    ///
    /// \param  str  The string to trim.
    ///
    /// \return  The trimmed copy.
    static std::string Trim(const std::string& str);

    /// \brief Convert the provided string to a boolean value.
    ///
    /// The default value is used if there is an error interpreting the
    /// provided string value as a boolean.
    ///
    /// Valid boolean values can be specified as:
    /// - Case insensitive characters 'true' evaluate to true
    /// - '1' evaluates to true
    /// - Case insensitive characters 'false' evaluate to false
    /// - '0' evaluates to false
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The value returned on a conversion error.
    ///
    /// \return  The converted value or the default value.
    static bool GetBool(const std::string& str, const bool default_value);

    /// \brief Convert the provided string to an integer value.
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The value returned on a conversion error.
    ///
    /// \return  The converted value or the default value.
    static int GetInt(const std::string& str, const int default_value);

    /// \brief Convert the provided string to an unsigned integer value.
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The value returned on a conversion error.
    ///
    /// \return  The converted value or the default value.
    static unsigned int GetUint(const std::string& str,
                                const unsigned int default_value);

    /// \brief Convert the provided string to a uint64_t value.
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The value returned on a conversion error.
    ///
    /// \return  The converted value or the default value.
    static uint64_t GetUint64(const std::string& str,
                              const uint64_t default_value);

    /// \brief Convert the provided string to a double value.
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The value returned on a conversion error.
    ///
    /// \return  The converted value or the default value.
    static double GetDouble(const std::string& str,
                            const double default_value);

    /// \brief Parse a comma separated list of non-negative integers.
    ///
    /// Every element must be a complete, non-negative decimal integer.
    ///
    /// \param  str     The list, e.g. "4096,8192".
    /// \param  values  The vector in which to return the values.  Only
    ///                 modified on success.
    ///
    /// \return  True if the list is non-empty and every element parsed.
    static bool ParseUintList(const std::string& str,
                              std::vector<uint32_t>& values);

    /// \brief Parse a comma separated list of non-negative reals.
    ///
    /// \param  str     The list, e.g. "0.25,1.0".
    /// \param  values  The vector in which to return the values.  Only
    ///                 modified on success.
    ///
    /// \return  True if the list is non-empty and every element parsed.
    static bool ParseDoubleList(const std::string& str,
                                std::vector<double>& values);

    /// \brief Join a list of unsigned integers with commas.
    static std::string JoinList(const std::vector<uint32_t>& values);

    /// \brief Join a list of reals with commas, using the shortest form.
    static std::string JoinList(const std::vector<double>& values);

    static std::string ToString(int value);
    static std::string ToString(uint32_t value);
    static std::string ToString(uint64_t value);

    /// \brief Convert a double to a string with a fixed number of digits.
    ///
    /// Infinity is rendered as "inf".
    ///
    /// \param  value      The value to convert.
    /// \param  precision  The number of digits after the decimal point.
    ///
    /// \return  The string representation.
    static std::string ToString(double value, int precision = 6);

    /// \brief Render a byte count in human readable units, e.g. "8.0 KB".
    ///
    /// \param  num_bytes  The number of bytes.
    ///
    /// \return  The formatted string, with one decimal place.
    static std::string FormatBytes(double num_bytes);

    /// \brief Render a byte rate as a bit rate, e.g. "8.4 Mbps".
    ///
    /// \param  bytes_per_sec  The rate in bytes per second.
    ///
    /// \return  The formatted string, with one decimal place.
    static std::string FormatRate(double bytes_per_sec);

    /// \brief Create a formatted string.
    ///
    /// \param  size    The maximum size of the result, including the
    ///                 terminating NUL.
    /// \param  format  The printf-style format string.
    ///
    /// \return  The formatted string.
    static std::string FormatString(int size, const char* format, ...)
      __attribute__ ((format (printf, 2, 3)));

  }; // end class StringUtils

} // namespace fcsweep

#endif // FCSWEEP_COMMON_STRING_UTILS_H
