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

#include <cppunit/extensions/HelperMacros.h>

#include "log.h"

#include <cstdio>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>

using ::fcsweep::Log;


//============================================================================
class LogTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(LogTest);

  CPPUNIT_TEST(TestDefaultLevels);
  CPPUNIT_TEST(TestLogToFile_DefaultLevels);
  CPPUNIT_TEST(TestLogToFile_ClassLevel);
  CPPUNIT_TEST(TestLogToFile_ConfigInactive);
  CPPUNIT_TEST(TestWouldLog);
  CPPUNIT_TEST(TestLogToStdErr);
  CPPUNIT_TEST(TestOnSignal);

  CPPUNIT_TEST_SUITE_END();

public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void tearDown()
  {
    Log::Destroy();

    // Delete the log files this program generated.
    remove("/tmp/fcsweep_log_test_01.txt");
    remove("/tmp/fcsweep_log_test_02.txt");
    remove("/tmp/fcsweep_log_test_03.txt");
    remove("/tmp/fcsweep_log_test_04.txt");
    remove("/tmp/fcsweep_log_test_05.txt");

    Log::SetDefaultLevel("FEWI");
    Log::SetConfigLoggingActive(false);
  }

  //==========================================================================
  void LogToFile(const char* fn, const char* cn)
  {
    CPPUNIT_ASSERT(Log::SetOutputFile(fn, false));
    CPPUNIT_ASSERT(Log::GetOutputFileName() == fn);

    LogE(cn, "Method", "Error %d %s\n", 1234, "trial");
    LogW(cn, "Method", "Warning %d %s\n", 1234, "trial");
    LogI(cn, "Method", "Info %d %s\n", 1234, "trial");
    LogA(cn, "Method", "Analysis %d %s\n", 1234, "trial");
    LogC(cn, "Method", "Config %d %s\n", 1234, "trial");

    Log::Flush();
  }

  //==========================================================================
  std::string ProcessLogFile(const char* fn)
  {
    // Examine a log file to see what levels it contains.
    char         line[256];
    std::string  result;
    FILE*        fd = fopen(fn, "r");

    if (fd != NULL)
    {
      while (fgets(line, sizeof(line), fd) != NULL)
      {
        if (strstr(line, " Error 1234 trial") != NULL)
        {
          result.append("E");
        }
        if (strstr(line, " Warning 1234 trial") != NULL)
        {
          result.append("W");
        }
        if (strstr(line, " Info 1234 trial") != NULL)
        {
          result.append("I");
        }
        if (strstr(line, " Analysis 1234 trial") != NULL)
        {
          result.append("A");
        }
        if (strstr(line, " Config 1234 trial") != NULL)
        {
          result.append("C");
        }
      }

      fclose(fd);
    }

    return result;
  }

  //==========================================================================
  void TestDefaultLevels()
  {
    CPPUNIT_ASSERT(Log::GetDefaultLevel() == "FEWI");

    Log::SetDefaultLevel("");
    CPPUNIT_ASSERT(Log::GetDefaultLevel() == "");

    Log::SetDefaultLevel("all");
    CPPUNIT_ASSERT(Log::GetDefaultLevel() == "FEWIAD");

    Log::SetDefaultLevel("NONE");
    CPPUNIT_ASSERT(Log::GetDefaultLevel() == "");

    Log::SetDefaultLevel("wfa");
    CPPUNIT_ASSERT(Log::GetDefaultLevel() == "FWA");
  }

  //==========================================================================
  void TestLogToFile_DefaultLevels()
  {
    Log::SetConfigLoggingActive(true);
    LogToFile("/tmp/fcsweep_log_test_01.txt", "TrialRunner");
    Log::SetOutputToStdOut();

    CPPUNIT_ASSERT(ProcessLogFile("/tmp/fcsweep_log_test_01.txt") == "EWIC");
  }

  //==========================================================================
  void TestLogToFile_ClassLevel()
  {
    Log::SetConfigLoggingActive(false);
    Log::SetClassLevel("NoisyClass", "EA");
    LogToFile("/tmp/fcsweep_log_test_02.txt", "NoisyClass");
    Log::SetOutputToStdOut();
    Log::SetClassLevel("NoisyClass", "FEWI");

    CPPUNIT_ASSERT(ProcessLogFile("/tmp/fcsweep_log_test_02.txt") == "EA");
  }

  //==========================================================================
  void TestLogToFile_ConfigInactive()
  {
    Log::SetConfigLoggingActive(false);
    Log::SetDefaultLevel("ALL");
    LogToFile("/tmp/fcsweep_log_test_03.txt", "SweepController");
    Log::SetOutputToStdOut();

    CPPUNIT_ASSERT(ProcessLogFile("/tmp/fcsweep_log_test_03.txt") == "EWIA");
  }

  //==========================================================================
  void TestWouldLog()
  {
    Log::SetDefaultLevel("FE");
    Log::SetConfigLoggingActive(true);

    CPPUNIT_ASSERT(WouldLogE("X"));
    CPPUNIT_ASSERT(!WouldLogW("X"));
    CPPUNIT_ASSERT(!WouldLogI("X"));
    CPPUNIT_ASSERT(Log::WouldLog(Log::LOG_CONFIG, "X"));

    Log::SetConfigLoggingActive(false);
    CPPUNIT_ASSERT(!Log::WouldLog(Log::LOG_CONFIG, "X"));
  }

  //==========================================================================
  void TestLogToStdErr()
  {
    const char*  fn = "/tmp/fcsweep_log_test_04.txt";

    // Point file descriptor 2 at a file for the duration of the test.
    fflush(stderr);

    int  saved_fd = dup(STDERR_FILENO);
    int  file_fd  = open(fn, O_WRONLY | O_CREAT | O_TRUNC, 0644);

    CPPUNIT_ASSERT(saved_fd >= 0);
    CPPUNIT_ASSERT(file_fd >= 0);
    CPPUNIT_ASSERT(dup2(file_fd, STDERR_FILENO) >= 0);
    close(file_fd);

    Log::SetOutputToStdErr();
    CPPUNIT_ASSERT(Log::GetOutputFileName().empty());

    LogE("TrialRunner", "Method", "Error %d %s\n", 1234, "trial");
    LogW("TrialRunner", "Method", "Warning %d %s\n", 1234, "trial");
    LogA("TrialRunner", "Method", "Analysis %d %s\n", 1234, "trial");

    Log::Flush();
    fflush(stderr);

    dup2(saved_fd, STDERR_FILENO);
    close(saved_fd);
    Log::SetOutputToStdOut();

    CPPUNIT_ASSERT(ProcessLogFile(fn) == "EW");
  }

  //==========================================================================
  void TestOnSignal()
  {
    const char*  fn = "/tmp/fcsweep_log_test_05.txt";

    // Recovery from a signal leaves the logger usable, whether or not the
    // mutex was held.
    Log::SetConfigLoggingActive(false);
    Log::OnSignal();
    Log::OnSignal();

    LogToFile(fn, "TrialRunner");
    Log::SetOutputToStdOut();

    CPPUNIT_ASSERT(ProcessLogFile(fn) == "EWI");
  }

}; // end class LogTest

CPPUNIT_TEST_SUITE_REGISTRATION(LogTest);
