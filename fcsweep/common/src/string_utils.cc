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

#include "string_utils.h"
#include "log.h"
#include "unused.h"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>

using ::fcsweep::StringUtils;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "StringUtils";

  /// Byte units for FormatBytes().
  const char*  kByteUnits[] = { "B", "KB", "MB", "GB", "TB" };

  /// Bit rate units for FormatRate().
  const char*  kRateUnits[] = { "bps", "Kbps", "Mbps", "Gbps" };
}


//============================================================================
void StringUtils::Tokenize(const string& str, const char* delim,
                           vector<string>& tokens)
{
  tokens.clear();

  string::size_type  start = str.find_first_not_of(delim);

  while (start != string::npos)
  {
    string::size_type  end = str.find_first_of(delim, start);

    if (end == string::npos)
    {
      tokens.push_back(str.substr(start));
      break;
    }

    tokens.push_back(str.substr(start, end - start));
    start = str.find_first_not_of(delim, end);
  }
}

//============================================================================
string StringUtils::Trim(const string& str)
{
  const char*        kWhitespace = " \t\r\n";
  string::size_type  first       = str.find_first_not_of(kWhitespace);

  if (first == string::npos)
  {
    return "";
  }

  string::size_type  last = str.find_last_not_of(kWhitespace);

  return str.substr(first, (last - first + 1));
}

//============================================================================
bool StringUtils::GetBool(const string& str, const bool default_value)
{
  bool  rv = default_value;

  //
  // Use strncasecmp() to do a case-insensitive comparisons on "true" and
  // "false". Also permits the value "0" to be used to represent false or the
  // value "1" to be used to represent true.
  //

  if (::strncasecmp(str.c_str(), "true", 4) == 0)
  {
    rv = true;
  }
  else if (::strncasecmp(str.c_str(), "false", 5) == 0)
  {
    rv = false;
  }
  else if (::strncmp(str.c_str(), "0", 1) == 0)
  {
    rv = false;
  }
  else if (::strncmp(str.c_str(), "1", 1) == 0)
  {
    rv = true;
  }

  return rv;
}

//============================================================================
int StringUtils::GetInt(const string& str, const int default_value)
{
  char*        end_ptr = NULL;
  const char*  str_ptr = str.c_str();

  // Clear errno before the call, per strtol(3).
  errno = 0;

  long  val = ::strtol(str_ptr, &end_ptr, 10);

  // Check for overflow, underflow, and any other conversion error.
  if (((errno == ERANGE) && ((val == LONG_MAX) || (val == LONG_MIN)))
      || ((errno != 0) && (val == 0)) || (val > INT_MAX) || (val < INT_MIN))
  {
    LogE(kClassName, __func__, "Error converting string %s to int: %s\n",
         str_ptr, strerror(errno));
    return default_value;
  }

  // Check for no conversion.
  if (end_ptr == str_ptr)
  {
    LogE(kClassName, __func__, "Error converting string %s to int.\n",
         str_ptr);
    return default_value;
  }

  return static_cast<int>(val);
}

//============================================================================
unsigned int StringUtils::GetUint(const string& str,
                                  const unsigned int default_value)
{
  char*        end_ptr = NULL;
  const char*  str_ptr = str.c_str();

  if (::strchr(str_ptr, '-') != NULL)
  {
    LogE(kClassName, __func__, "Error converting negative string %s to "
         "unsigned int.\n", str_ptr);
    return default_value;
  }

  // Clear errno before the call, per strtoul(3).
  errno = 0;

  unsigned long  val = ::strtoul(str_ptr, &end_ptr, 10);

  // Check for overflow, underflow, and any other conversion error.
  if (((errno == ERANGE) && (val == ULONG_MAX))
      || ((errno != 0) && (val == 0)) || (val > UINT_MAX))
  {
    LogE(kClassName, __func__, "Error converting string %s to unsigned int: "
         "%s\n", str_ptr, strerror(errno));
    return default_value;
  }

  // Check for no conversion.
  if (end_ptr == str_ptr)
  {
    LogE(kClassName, __func__, "Error converting string %s to unsigned "
         "int.\n", str_ptr);
    return default_value;
  }

  return static_cast<unsigned int>(val);
}

//============================================================================
uint64_t StringUtils::GetUint64(const string& str,
                                const uint64_t default_value)
{
  char*        end_ptr = NULL;
  const char*  str_ptr = str.c_str();

  if (::strchr(str_ptr, '-') != NULL)
  {
    LogE(kClassName, __func__, "Error converting negative string %s to "
         "uint64_t.\n", str_ptr);
    return default_value;
  }

  // Clear errno before the call, per strtoull(3).
  errno = 0;

  unsigned long long  val = ::strtoull(str_ptr, &end_ptr, 10);

  // Check for overflow, underflow, and any other conversion error.
  if (((errno == ERANGE) && (val == ULLONG_MAX))
      || ((errno != 0) && (val == 0)))
  {
    LogE(kClassName, __func__, "Error converting string %s to uint64_t: %s\n",
         str_ptr, strerror(errno));
    return default_value;
  }

  // Check for no conversion.
  if (end_ptr == str_ptr)
  {
    LogE(kClassName, __func__, "Error converting string %s to uint64_t.\n",
         str_ptr);
    return default_value;
  }

  return static_cast<uint64_t>(val);
}

//============================================================================
double StringUtils::GetDouble(const string& str, const double default_value)
{
  char*        end_ptr = NULL;
  const char*  str_ptr = str.c_str();

  // Clear errno before the call, per strtod(3).
  errno = 0;

  double  val = ::strtod(str_ptr, &end_ptr);

  // Check for overflow, underflow, and any other conversion error.
  if (((errno == ERANGE) && ((val == HUGE_VAL) || (val == 0.0)))
      || ((errno != 0) && (val == 0.0)))
  {
    LogE(kClassName, __func__, "Error converting string %s to double: %s\n",
         str_ptr, strerror(errno));
    return default_value;
  }

  // Check for no conversion.
  if (end_ptr == str_ptr)
  {
    LogE(kClassName, __func__, "Error converting string %s to double.\n",
         str_ptr);
    return default_value;
  }

  return val;
}

//============================================================================
bool StringUtils::ParseUintList(const string& str, vector<uint32_t>& values)
{
  vector<string>    tokens;
  vector<uint32_t>  parsed;

  Tokenize(str, ", ", tokens);

  if (tokens.empty())
  {
    LogE(kClassName, __func__, "Empty list.\n");
    return false;
  }

  for (size_t i = 0; i < tokens.size(); ++i)
  {
    const char*    tok     = tokens[i].c_str();
    char*          end_ptr = NULL;

    errno = 0;
    unsigned long  val = ::strtoul(tok, &end_ptr, 10);

    if ((tok[0] == '-') || (errno != 0) || (end_ptr == tok) ||
        (*end_ptr != '\0') || (val > UINT32_MAX))
    {
      LogE(kClassName, __func__, "Invalid list element \"%s\" in \"%s\".\n",
           tok, str.c_str());
      return false;
    }

    parsed.push_back(static_cast<uint32_t>(val));
  }

  values.swap(parsed);
  return true;
}

//============================================================================
bool StringUtils::ParseDoubleList(const string& str, vector<double>& values)
{
  vector<string>  tokens;
  vector<double>  parsed;

  Tokenize(str, ", ", tokens);

  if (tokens.empty())
  {
    LogE(kClassName, __func__, "Empty list.\n");
    return false;
  }

  for (size_t i = 0; i < tokens.size(); ++i)
  {
    const char*  tok     = tokens[i].c_str();
    char*        end_ptr = NULL;

    errno = 0;
    double  val = ::strtod(tok, &end_ptr);

    if ((errno != 0) || (end_ptr == tok) || (*end_ptr != '\0') ||
        !std::isfinite(val) || (val < 0.0))
    {
      LogE(kClassName, __func__, "Invalid list element \"%s\" in \"%s\".\n",
           tok, str.c_str());
      return false;
    }

    parsed.push_back(val);
  }

  values.swap(parsed);
  return true;
}

//============================================================================
string StringUtils::JoinList(const vector<uint32_t>& values)
{
  string  result;

  for (size_t i = 0; i < values.size(); ++i)
  {
    if (i > 0)
    {
      result.append(",");
    }
    result.append(ToString(values[i]));
  }

  return result;
}

//============================================================================
string StringUtils::JoinList(const vector<double>& values)
{
  string  result;

  for (size_t i = 0; i < values.size(); ++i)
  {
    if (i > 0)
    {
      result.append(",");
    }
    result.append(FormatString(32, "%g", values[i]));
  }

  return result;
}

//============================================================================
string StringUtils::ToString(int value)
{
  int   rv;
  char  buf[16];

  rv = snprintf(buf, sizeof(buf), "%d", value);

  if (rv <= 0)
  {
    LogE(kClassName, __func__, "Error converting integer %d to a string.\n",
         value);
    buf[0] = '?';
    buf[1] = '\0';
  }

  return buf;
}

//============================================================================
string StringUtils::ToString(uint32_t value)
{
  int   rv;
  char  buf[16];

  rv = snprintf(buf, sizeof(buf), "%" PRIu32, value);

  if (rv <= 0)
  {
    LogE(kClassName, __func__, "Error converting integer %" PRIu32
         " to a string.\n", value);
    buf[0] = '?';
    buf[1] = '\0';
  }

  return buf;
}

//============================================================================
string StringUtils::ToString(uint64_t value)
{
  int   rv;
  char  buf[32];

  rv = snprintf(buf, sizeof(buf), "%" PRIu64, value);

  if (rv <= 0)
  {
    LogE(kClassName, __func__, "Error converting integer %" PRIu64
         " to a string.\n", value);
    buf[0] = '?';
    buf[1] = '\0';
  }

  return buf;
}

//============================================================================
string StringUtils::ToString(double value, int precision)
{
  if (std::isinf(value))
  {
    return ((value > 0.0) ? "inf" : "-inf");
  }

  int   rv;
  char  buf[64];

  rv = snprintf(buf, sizeof(buf), "%.*f", precision, value);

  if (rv <= 0)
  {
    LogE(kClassName, __func__, "Error converting double %f to a string.\n",
         value);
    buf[0] = '?';
    buf[1] = '\0';
  }

  return buf;
}

//============================================================================
string StringUtils::FormatBytes(double num_bytes)
{
  size_t  num_units = sizeof(kByteUnits) / sizeof(kByteUnits[0]);

  for (size_t i = 0; i < num_units; ++i)
  {
    if (fabs(num_bytes) < 1024.0)
    {
      return FormatString(32, "%.1f %s", num_bytes, kByteUnits[i]);
    }
    num_bytes /= 1024.0;
  }

  return FormatString(32, "%.1f PB", num_bytes);
}

//============================================================================
string StringUtils::FormatRate(double bytes_per_sec)
{
  double  bits_per_sec = bytes_per_sec * 8.0;
  size_t  num_units    = sizeof(kRateUnits) / sizeof(kRateUnits[0]);

  if (std::isinf(bits_per_sec))
  {
    return "unbounded";
  }

  for (size_t i = 0; i < num_units; ++i)
  {
    if (fabs(bits_per_sec) < 1000.0)
    {
      return FormatString(32, "%.1f %s", bits_per_sec, kRateUnits[i]);
    }
    bits_per_sec /= 1000.0;
  }

  return FormatString(32, "%.1f Tbps", bits_per_sec);
}

//============================================================================
string StringUtils::FormatString(int size, const char* format, ...)
{
  if ((size < 2) || (format == NULL))
  {
    return "";
  }

  vector<char>  format_str(size, '\0');
  va_list       vargs;

  //
  // Use vsnprintf(), which is made to take in the variable argument list.
  //

  va_start(vargs, format);
  if (vsnprintf(&format_str[0], size, format, vargs) >= size)
  {
    LogW(kClassName, __func__, "String was truncated during formatting.\n");
  }
  va_end(vargs);

  return &format_str[0];
}
