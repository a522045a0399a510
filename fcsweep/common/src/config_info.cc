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

#include "config_info.h"
#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cstdio>
#include <cstring>
#include <libgen.h>
#include <vector>


using ::fcsweep::ConfigInfo;
using ::fcsweep::StringUtils;
using ::std::map;
using ::std::string;
using ::std::vector;


namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "ConfigInfo";

  /// The longest line accepted in a configuration file.
  const size_t  kMaxLineLen = 1024;
}

//============================================================================
ConfigInfo::ConfigInfo()
    : config_items_()
{
}

//============================================================================
ConfigInfo::~ConfigInfo()
{
  //
  // Nothing to destroy.
  //
}

//============================================================================
void ConfigInfo::Add(const string& key, const string& value)
{
  if (key.empty() || value.empty())
  {
    LogE(kClassName, __func__, "Bad argument. Missing key or value.\n");
    return;
  }

  config_items_[key] = value;
}

//============================================================================
bool ConfigInfo::LoadFromFile(const string& file_name)
{
  if (file_name.empty())
  {
    LogE(kClassName, __func__, "No configuration file specified\n");
    return false;
  }

  FILE*  input_file = ::fopen(file_name.c_str(), "r");

  if (input_file == NULL)
  {
    LogE(kClassName, __func__, "Unable to open configuration file %s\n",
         file_name.c_str());
    return false;
  }

  char  line[kMaxLineLen];

  while (::fgets(line, sizeof(line), input_file) != NULL)
  {
    size_t  line_len = ::strlen(line);

    if ((line_len > 0) && (line[line_len - 1] == '\n'))
    {
      line[line_len - 1] = '\0';
    }
    else if (!::feof(input_file))
    {
      LogE(kClassName, __func__, "Line longer than %zu characters in %s.\n",
           kMaxLineLen - 1, file_name.c_str());
      ::fclose(input_file);
      return false;
    }

    string  trimmed = StringUtils::Trim(line);

    if (trimmed.empty() || (trimmed[0] == '#'))
    {
      //
      // Skip blank and comment lines.
      //
      continue;
    }

    string::size_type  split = trimmed.find_first_of(" \t");
    string             key   = trimmed.substr(0, split);
    string             value;

    if (split != string::npos)
    {
      value = StringUtils::Trim(trimmed.substr(split));
    }

    if (value.empty())
    {
      LogW(kClassName, __func__, "Key %s in %s has no value, ignoring.\n",
           key.c_str(), file_name.c_str());
      continue;
    }

    if (key == "include")
    {
      //
      // If the file that we are including starts with a '/' character, we
      // will interpret it as an absolute path. Otherwise, it will be relative
      // to the location of the file that is currently being loaded.
      //

      string  file_to_load = value;

      if (value[0] != '/')
      {
        vector<char>  file_name_dup(file_name.begin(), file_name.end());
        file_name_dup.push_back('\0');

        file_to_load  = ::dirname(&file_name_dup[0]);
        file_to_load.append("/");
        file_to_load.append(value);
      }

      if (!LoadFromFile(file_to_load))
      {
        LogE(kClassName, __func__, "Error loading file %s.\n",
             file_to_load.c_str());
        ::fclose(input_file);
        return false;
      }
    }
    else
    {
      Add(key, value);
    }
  }

  ::fclose(input_file);

  return true;
}

//============================================================================
string ConfigInfo::ToString() const
{
  string                               result;
  map<string, string>::const_iterator  it;

  result.append("\n");
  for (it  = config_items_.begin();
       it != config_items_.end();
       ++it)
  {
    result.append(it->first);
    result.append(" ");
    result.append(it->second);
    result.append("\n");
  }

  return result;
}

//============================================================================
bool ConfigInfo::Has(const string& key) const
{
  return (config_items_.find(key) != config_items_.end());
}

//============================================================================
string ConfigInfo::Get(const string& key,
                       const string& default_value,
                       bool log_customizations) const
{
  map<string, string>::const_iterator it;

  it = config_items_.find(key);

  if (it != config_items_.end())
  {
    if (log_customizations &&
        !default_value.empty() &&
        (it->second.compare(default_value) != 0))
    {
      LogC(kClassName, __func__,
           "CUSTOMIZATION Key %s mismatch: value is %s, default is %s.\n",
           key.c_str(), it->second.c_str(), default_value.c_str());
    }
    return it->second;
  }
  else
  {
    return default_value;
  }
}

//============================================================================
bool ConfigInfo::GetBool(const string& key, const bool default_value,
                         bool log_customizations) const
{
  const string value = Get(key);

  if (value.empty())
  {
    return default_value;
  }

  bool to_return = StringUtils::GetBool(value, default_value);
  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %c, default is %c.\n",
         key.c_str(), (to_return ? 'T' : 'F'), (default_value ? 'T' : 'F'));
  }
  return to_return;
}

//============================================================================
int ConfigInfo::GetInt(const string& key, const int default_value,
                       bool log_customizations) const
{
  const string  value = Get(key);

  if (value.empty())
  {
    return default_value;
  }

  int to_return = StringUtils::GetInt(value, default_value);
  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %d, default is %d.\n",
         key.c_str(), to_return, default_value);
  }
  return to_return;
}

//============================================================================
unsigned int ConfigInfo::GetUint(const string& key,
                                 const unsigned int default_value,
                                 bool log_customizations) const
{
  const string  value = Get(key);

  if (value.empty())
  {
    return default_value;
  }

  unsigned int to_return = StringUtils::GetUint(value, default_value);
  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %u, default is %u.\n",
         key.c_str(), to_return, default_value);
  }
  return to_return;
}

//============================================================================
uint64_t ConfigInfo::GetUint64(const string& key,
                               const uint64_t default_value,
                               bool log_customizations) const
{
  const string  value = Get(key);

  if (value.empty())
  {
    return default_value;
  }

  uint64_t to_return = StringUtils::GetUint64(value, default_value);
  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %" PRIu64
         ", default is %" PRIu64 ".\n",
         key.c_str(), to_return, default_value);
  }
  return to_return;
}

//============================================================================
double ConfigInfo::GetDouble(const string& key,
                             const double default_value,
                             bool log_customizations) const
{
  const string  value = Get(key);

  if (value.empty())
  {
    return default_value;
  }

  double to_return = StringUtils::GetDouble(value, default_value);
  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %f, default is %f.\n",
         key.c_str(), to_return, default_value);
  }
  return to_return;
}
