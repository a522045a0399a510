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

/// \brief The fcsweep logging source file.
///
/// Provides the sweep harness with a flexible logging capability.  May be
/// directed to stdout, stderr, or a file.  The logging levels to be output
/// are dynamically selectable.

#include "log.h"

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <unistd.h>
#include <sys/time.h>


using ::fcsweep::Log;


//
// Uncomment for log messages to use relative times.  Leave commented out for
// log messages to use absolute times (better for correlating the log with a
// packet capture taken on the same host).
//

// #define LOG_RELATIVE_TIME 1

//
// Static class members.
//

int                         Log::mask_           = (LOG_FATAL |
                                                    LOG_ERROR |
                                                    LOG_WARNING |
                                                    LOG_INFO);
std::map<std::string, int>  Log::cmask_map_;
FILE*                       Log::output_fd_      = stdout;
bool                        Log::start_time_set_ = false;
struct timeval              Log::start_time_     = {0, 0};
pthread_mutex_t             Log::mutex_          = PTHREAD_MUTEX_INITIALIZER;
bool                        Log::logc_active_    = true;
std::string                 Log::output_file_name_ = "";

//============================================================================
void Log::SetDefaultLevel(const std::string& levels)
{
  Log::mask_ = Log::StringToMask(levels);
}

//============================================================================
std::string Log::GetDefaultLevel()
{
  char  mask_str[8];

  Log::MaskToString(Log::mask_, mask_str);

  return std::string(mask_str);
}

//============================================================================
void Log::SetClassLevel(const std::string& class_name,
                        const std::string& levels)
{
  Log::cmask_map_[class_name] = Log::StringToMask(levels);
}

//============================================================================
void Log::SetOutputToStdOut()
{
  Log::output_file_name_.clear();
  Log::SetNewFileDescriptor(stdout);
}

//============================================================================
void Log::SetOutputToStdErr()
{
  Log::output_file_name_.clear();
  Log::SetNewFileDescriptor(stderr);
}

//============================================================================
bool Log::SetOutputFile(const std::string& file_name, bool append)
{

  //
  // Attempt to open the output file.  If successful, then make the change.
  //

  FILE*  new_fd = fopen(file_name.c_str(), (append ? "a" : "w"));

  if (new_fd == NULL)
  {
    return false;
  }
  Log::output_file_name_ = file_name;

  Log::SetNewFileDescriptor(new_fd);

  return true;
}

//============================================================================
std::string Log::GetOutputFileName()
{
  return Log::output_file_name_;
}

//============================================================================
void Log::Flush()
{
  fflush(Log::output_fd_);
}

//============================================================================
bool Log::SetConfigLoggingActive(bool config_active)
{
  bool old_setting = logc_active_;
  logc_active_ = config_active;
  return old_setting;
}

//============================================================================
bool Log::WouldLog(Level level, const char* cn)
{
#ifndef DEBUG
  if (level == LOG_DEBUG)
  {
    // debug is compiled out for optimized
    return false;
  }
#endif

  if (level == LOG_CONFIG)
  {
    return logc_active_;
  }

  // Only check for a class name logging level if there is a class name and
  // there is at least one class name in the map.
  int mask = mask_;
  if (!cmask_map_.empty() && cn != NULL)
  {
    std::map<std::string, int>::const_iterator it =
      cmask_map_.find(std::string(cn));
    if (it != cmask_map_.end())
    {
      mask = it->second;
    }
  }
  return ((mask & level) != 0);
}

//============================================================================
void Log::GetLogTime(time_t& sec, suseconds_t& usec)
{
  struct timeval  curr_time;
  gettimeofday(&curr_time, 0);

  if (!Log::start_time_set_)
  {
    Log::start_time_ = curr_time;
  }

#ifdef LOG_RELATIVE_TIME

  //
  // Output the relative time since the start time with microsecond
  // accuracy.
  //

  sec = (curr_time.tv_sec - Log::start_time_.tv_sec);

  if (curr_time.tv_usec < Log::start_time_.tv_usec)
  {
    usec = (1000000 + curr_time.tv_usec - Log::start_time_.tv_usec);
    sec -= 1;
  }
  else
  {
    usec = (curr_time.tv_usec - Log::start_time_.tv_usec);
  }

#else

  //
  // Output the absolute time with microsecond accuracy.
  //

  sec  = curr_time.tv_sec;
  usec = curr_time.tv_usec;

#endif // LOG_RELATIVE_TIME
}

//============================================================================
void Log::InternalLog(Log::Level level, const char* ln, const char* cn,
                      const char* mn, const char* format, ...)
{
  va_list  args;
  va_start(args, format);

  if (WouldLog(level, cn))
  {
    int  err;
    if ((err = pthread_mutex_lock(&Log::mutex_)) != 0)
    {
      fprintf(stderr, "Log::InternalLog(): Error %d locking mutex.\n", err);
      va_end(args);
      return;
    }

    bool         first_call = !Log::start_time_set_;
    time_t       log_sec    = 0;
    suseconds_t  log_usec   = 0;

    Log::GetLogTime(log_sec, log_usec);

    //
    // If this is also the start time, then print out the current time in the
    // format "Fri Sep 13 00:00:00:000000 1986".
    //

    if (first_call)
    {
      //
      // Note that ctime_r() requires at least 26 characters, and we need to
      // allow space for microseconds.
      //

      unsigned int  year    = 0;
      char          buf[48];
      char*         cptr;
      time_t        wall_sec = time(NULL);

      ctime_r(&wall_sec, buf);
      cptr = &buf[strlen(buf) - 6];  // Get location right after seconds.
      if (sscanf(cptr, "%u", &year) == 1)
      {
        snprintf(cptr, sizeof(buf) - (cptr - buf), ":%06ld %u",
                 static_cast<long>(log_usec), year);
      }

      fprintf(Log::output_fd_, "%ld.%06ld Logging Started at: %s\n",
              static_cast<long>(log_sec), static_cast<long>(log_usec), buf);

      Log::start_time_set_ = true;
      fflush(Log::output_fd_);
    }

    //
    // Log the message.
    //

    fprintf(Log::output_fd_, "%ld.%06ld %s [%s::%s] ",
            static_cast<long>(log_sec), static_cast<long>(log_usec), ln, cn,
            mn);
    vfprintf(Log::output_fd_, format, args);

    //
    // Errors and warnings are flushed immediately so that they survive a
    // crash later in a long sweep.
    //

    if ((level == LOG_FATAL) || (level == LOG_ERROR) ||
        (level == LOG_WARNING))
    {
      fflush(Log::output_fd_);
    }

    if ((err = pthread_mutex_unlock(&Log::mutex_)) != 0)
    {
      fprintf(stderr, "Log::InternalLog(): Error %d unlocking mutex.\n", err);
    }
  }

  va_end(args);

  //
  // If necessary, dump core and exit.  Do not depend on whether
  // LOG_FATAL is in the mask.
  //

  if (level == LOG_FATAL)
  {
    fflush(Log::output_fd_);
    abort();
  }
}

//============================================================================
void Log::OnSignal()
{
  // Attempt to lock the mutex.  If it is not already locked, it will lock it
  // and return immediately.  If it is already locked, this will not block
  // and will return EBUSY.
  int  err = pthread_mutex_trylock(&Log::mutex_);

  // Now that we know that the mutex is locked, unlock it.
  if ((err = pthread_mutex_unlock(&Log::mutex_)) != 0)
  {
    fprintf(stderr, "Log::OnSignal(): Error %d unlocking mutex.\n", err);
  }
}

//============================================================================
void Log::Destroy()
{

  //
  // This method logs a message indicating application shutdown, but it cannot
  // call into the InternalLog() method.  This is because a signal might have
  // interrupted the InternalLog() method while the mutex lock was locked, and
  // calling back into the InternalLog() method would cause a deadlock.  Thus,
  // this method must log the message manually.
  //

  if (Log::mask_ & LOG_INFO)
  {
    time_t       log_sec  = 0;
    suseconds_t  log_usec = 0;

    Log::GetLogTime(log_sec, log_usec);

    fprintf(Log::output_fd_, "%ld.%06ld I [Log::Destroy] Application "
            "shutdown.\n", static_cast<long>(log_sec),
            static_cast<long>(log_usec));
  }

  //
  // If the current output file descriptor is not equal to stdout or stderr,
  // then we must close it without disrupting users of Log::output_fd_.
  //

  if ((Log::output_fd_ != stdout) && (Log::output_fd_ != stderr))
  {
    FILE*  old_fd    = Log::output_fd_;
    Log::output_fd_ = stdout;
    Log::output_file_name_.clear();

    fflush(old_fd);
    fclose(old_fd);
  }

  fflush(Log::output_fd_);
}

//============================================================================
int Log::StringToMask(const std::string& levels)
{
  int          mask     = 0;
  const char*  mask_str = levels.c_str();

  if (strcasecmp(mask_str, "all") == 0)
  {
    mask = LOG_ALL;
  }
  else if (strcasecmp(mask_str, "none") == 0)
  {
    mask = 0;
  }
  else
  {
    if (strchr(mask_str, 'F') || strchr(mask_str, 'f'))
    {
      mask |= LOG_FATAL;
    }
    if (strchr(mask_str, 'E') || strchr(mask_str, 'e'))
    {
      mask |= LOG_ERROR;
    }
    if (strchr(mask_str, 'W') || strchr(mask_str, 'w'))
    {
      mask |= LOG_WARNING;
    }
    if (strchr(mask_str, 'I') || strchr(mask_str, 'i'))
    {
      mask |= LOG_INFO;
    }
    if (strchr(mask_str, 'A') || strchr(mask_str, 'a'))
    {
      mask |= LOG_ANALYSIS;
    }
    if (strchr(mask_str, 'D') || strchr(mask_str, 'd'))
    {
      mask |= LOG_DEBUG;
    }
  }

  return mask;
}

//============================================================================
void Log::MaskToString(int mask, char* levels)
{
  static const int   kLevels[] = { LOG_FATAL, LOG_ERROR, LOG_WARNING,
                                   LOG_INFO, LOG_ANALYSIS, LOG_DEBUG };
  static const char  kNames[]  = "FEWIAD";

  int  i = 0;

  for (size_t idx = 0; idx < (sizeof(kLevels) / sizeof(kLevels[0])); ++idx)
  {
    if (mask & kLevels[idx])
    {
      levels[i++] = kNames[idx];
    }
  }

  levels[i] = '\0';
}

//============================================================================
void Log::SetNewFileDescriptor(FILE* new_fd)
{

  //
  // If the current output file descriptor is not equal to stdout or stderr,
  // then we must close it without disrupting users of Log::output_fd_.
  //

  pthread_mutex_lock(&Log::mutex_);

  FILE*  old_fd    = Log::output_fd_;
  Log::output_fd_ = new_fd;

  pthread_mutex_unlock(&Log::mutex_);

  if ((old_fd != stdout) && (old_fd != stderr) && (old_fd != new_fd))
  {
    fflush(old_fd);
    fclose(old_fd);
  }
}
