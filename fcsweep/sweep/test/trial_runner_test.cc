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

#include "config_info.h"
#include "log.h"
#include "port_number_mgr.h"
#include "trial_config.h"
#include "trial_metrics.h"
#include "trial_runner.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>


using ::fcsweep::ConfigInfo;
using ::fcsweep::Log;
using ::fcsweep::PortNumberMgr;
using ::fcsweep::TrialConfig;
using ::fcsweep::TrialMetrics;
using ::fcsweep::TrialRunner;
using ::std::ifstream;
using ::std::string;
using ::std::vector;


namespace
{
  /// Writes a non-empty trace to the path given with -w, then waits to be
  /// stopped.
  const char*  kFakeCapture =
    "printf 'trace' > \"$4\"\n"
    "exec sleep 30\n";

  /// Answers each query by its display filter.
  const char*  kFakeAnalyzer =
    "case \"$4\" in\n"
    "  tcp.analysis.zero_window) printf '11\\n12\\n13\\n' ;;\n"
    "  tcp) printf '4000\\n0\\n4000\\n2000\\n' ;;\n"
    "  tcp.analysis.retransmission) printf '40\\n' ;;\n"
    "  tcp.analysis.duplicate_ack) printf '41\\n42\\n' ;;\n"
    "  *) exit 2 ;;\n"
    "esac\n";

  /// Records into $EVENTS when it starts, and on SIGTERM whether any socket
  /// on the trial port (the sixth argument) is still listening or connected.
  const char*  kOrderedCapture =
    "printf 'trace' > \"$4\"\n"
    "port=$(printf '%04X' \"$6\")\n"
    "on_term() {\n"
    "  state=closed\n"
    "  if awk -v p=\":$port\" 'NR > 1 && "
    "($4 == \"0A\" || $4 == \"01\" || $4 == \"08\") && "
    "(substr($2, length($2) - 4) == p || substr($3, length($3) - 4) == p) "
    "{ found = 1 } END { exit !found }' /proc/net/tcp; then\n"
    "    state=open\n"
    "  fi\n"
    "  echo \"capture-stopped $state\" >> \"$EVENTS\"\n"
    "  kill $pid 2>/dev/null\n"
    "  exit 0\n"
    "}\n"
    "trap on_term TERM\n"
    "echo capture-started >> \"$EVENTS\"\n"
    "sleep 30 &\n"
    "pid=$!\n"
    "wait $pid\n";
}


//============================================================================
class TrialRunnerTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(TrialRunnerTest);

  CPPUNIT_TEST(TestInitialize);
  CPPUNIT_TEST(TestNoCapture);
  CPPUNIT_TEST(TestNoListener);
  CPPUNIT_TEST(TestInvalidConfig);
  CPPUNIT_TEST(TestCaptureToolMissing);
  CPPUNIT_TEST(TestCaptureAndAnalysis);
  CPPUNIT_TEST(TestTeardownOrder);
  CPPUNIT_TEST(TestStopFlag);

  CPPUNIT_TEST_SUITE_END();

private:

  ConfigInfo*  ci_;
  string       dir_;

public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    char  tmpl[] = "/tmp/fcsweep_runner_test_XXXXXX";

    CPPUNIT_ASSERT(mkdtemp(tmpl) != NULL);
    dir_ = tmpl;

    ci_ = new ConfigInfo();
    ci_->Add("Trial.Port", PortNumberMgr::GetInstance().NextAvailableStr());
    ci_->Add("Trial.BindAddr", "127.0.0.1");
    ci_->Add("Trial.TargetAddr", "127.0.0.1");
    ci_->Add("Trial.DrainDelayMs", "50");
    ci_->Add("Receiver.AcceptTimeoutMs", "500");
    ci_->Add("Capture.Enabled", "false");
    ci_->Add("Capture.TmpDir", dir_);
    ci_->Add("Capture.SettleMs", "100");
    ci_->Add("Capture.StopTimeoutMs", "500");
    ci_->Add("Capture.PostStopSettleMs", "0");
    ci_->Add("Analyzer.TimeoutMs", "5000");
  }

  //==========================================================================
  void tearDown()
  {
    delete ci_;
    ci_ = NULL;

    string  cmd = "rm -rf " + dir_;

    if (system(cmd.c_str()) != 0)
    {
      LogW("TrialRunnerTest", __func__, "Cannot remove %s.\n",
           dir_.c_str());
    }

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  string WriteScript(const char* name, const char* body)
  {
    string  path = dir_ + "/" + name;
    FILE*   fp   = fopen(path.c_str(), "w");

    CPPUNIT_ASSERT(fp != NULL);
    fprintf(fp, "#!/bin/sh\n%s\n", body);
    fclose(fp);

    CPPUNIT_ASSERT(chmod(path.c_str(), 0755) == 0);

    return path;
  }

  //==========================================================================
  int CountTraceFiles()
  {
    DIR*  dir = opendir(dir_.c_str());

    CPPUNIT_ASSERT(dir != NULL);

    int             count = 0;
    struct dirent*  ent   = NULL;

    while ((ent = readdir(dir)) != NULL)
    {
      if (strncmp(ent->d_name, "fcsweep_trial_", 14) == 0)
      {
        ++count;
      }
    }

    closedir(dir);

    return count;
  }

  //==========================================================================
  void TestInitialize()
  {
    {
      TrialRunner  runner;

      CPPUNIT_ASSERT(runner.Initialize(*ci_));
      CPPUNIT_ASSERT(!runner.capture_enabled());
    }

    {
      TrialRunner  runner;

      ci_->Add("Trial.Port", "0");
      CPPUNIT_ASSERT(!runner.Initialize(*ci_));
      ci_->Add("Trial.Port", "9999");
    }

    {
      TrialRunner  runner;

      ci_->Add("Analyzer.ZeroWindowEventMs", "-1");
      CPPUNIT_ASSERT(!runner.Initialize(*ci_));
    }

    CPPUNIT_ASSERT_EQUAL(string("TRANSFERRING"), string(
      TrialRunner::StateToString(TrialRunner::TRANSFERRING)));
    CPPUNIT_ASSERT_EQUAL(string("FAILED"), string(
      TrialRunner::StateToString(TrialRunner::FAILED)));
  }

  //==========================================================================
  void TestNoCapture()
  {
    TrialRunner   runner;

    CPPUNIT_ASSERT(runner.Initialize(*ci_));

    TrialMetrics  tm = runner.RunTrial(TrialConfig(262144, 0.0, 65536, 0.5,
                                                   1.0), NULL);

    CPPUNIT_ASSERT(tm.success);
    CPPUNIT_ASSERT(tm.error.empty());
    CPPUNIT_ASSERT_EQUAL(TrialRunner::RECORDED, runner.state());
    CPPUNIT_ASSERT_EQUAL(fcsweep::CAPTURE_DISABLED, tm.capture_status);
    CPPUNIT_ASSERT(!tm.timestamp.empty());

    CPPUNIT_ASSERT(tm.duration_actual >= 0.95);
    CPPUNIT_ASSERT(tm.duration_actual < 1.5);
    CPPUNIT_ASSERT(tm.bytes_transferred > 0);
    CPPUNIT_ASSERT(tm.bytes_received > 0);
    CPPUNIT_ASSERT(tm.bytes_received <= tm.bytes_transferred);

    // About 512 KB/s offered and accepted.
    CPPUNIT_ASSERT(tm.actual_throughput_kbps > 400.0);
    CPPUNIT_ASSERT(tm.actual_throughput_kbps < 560.0);

    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(0), tm.zero_window_count);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, tm.zero_window_pct, 1e-12);
  }

  //==========================================================================
  void TestNoListener()
  {
    TrialRunner  runner;

    // The sender dials a port nobody listens on.
    ci_->Add("Trial.TargetPort",
             PortNumberMgr::GetInstance().NextAvailableStr());

    CPPUNIT_ASSERT(runner.Initialize(*ci_));

    TrialMetrics  tm = runner.RunTrial(TrialConfig(8192, 10.0, 1024, 1.0,
                                                   1.0), NULL);

    CPPUNIT_ASSERT(!tm.success);
    CPPUNIT_ASSERT_EQUAL(TrialRunner::FAILED, runner.state());
    CPPUNIT_ASSERT(tm.error.find("sender: connect") == 0);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint64_t>(0), tm.bytes_transferred);

    // The configuration echo survives a failure.
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(8192), tm.recv_buf);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(102400.0, tm.receiver_capacity_bps, 1e-6);
  }

  //==========================================================================
  void TestInvalidConfig()
  {
    TrialRunner  runner;

    CPPUNIT_ASSERT(runner.Initialize(*ci_));

    TrialMetrics  tm = runner.RunTrial(TrialConfig(8192, 10.0, 1024, 1.0,
                                                   0.0), NULL);

    CPPUNIT_ASSERT(!tm.success);
    CPPUNIT_ASSERT(!tm.error.empty());
    CPPUNIT_ASSERT_EQUAL(TrialRunner::FAILED, runner.state());
    CPPUNIT_ASSERT_EQUAL(static_cast<uint64_t>(0), tm.bytes_transferred);
  }

  //==========================================================================
  void TestCaptureToolMissing()
  {
    TrialRunner  runner;

    ci_->Add("Capture.Enabled", "true");
    ci_->Add("Capture.Tool", "/nonexistent/fcsweep-capture-tool");

    CPPUNIT_ASSERT(runner.Initialize(*ci_));
    CPPUNIT_ASSERT(runner.capture_enabled());

    TrialMetrics  tm = runner.RunTrial(TrialConfig(65536, 0.0, 8192, 0.25,
                                                   0.5), NULL);

    // Capture is best-effort: the transfer is still measured.
    CPPUNIT_ASSERT(tm.success);
    CPPUNIT_ASSERT_EQUAL(fcsweep::CAPTURE_UNAVAILABLE, tm.capture_status);
    CPPUNIT_ASSERT(tm.bytes_transferred > 0);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(0), tm.zero_window_count);
    CPPUNIT_ASSERT_EQUAL(0, CountTraceFiles());
  }

  //==========================================================================
  void TestCaptureAndAnalysis()
  {
    TrialRunner  runner;

    ci_->Add("Capture.Enabled", "true");
    ci_->Add("Capture.Tool", WriteScript("tcpdump.sh", kFakeCapture));
    ci_->Add("Analyzer.Tool", WriteScript("tshark.sh", kFakeAnalyzer));

    CPPUNIT_ASSERT(runner.Initialize(*ci_));

    TrialMetrics  tm = runner.RunTrial(TrialConfig(65536, 0.0, 8192, 0.25,
                                                   0.5), NULL);

    CPPUNIT_ASSERT(tm.success);
    CPPUNIT_ASSERT_EQUAL(TrialRunner::RECORDED, runner.state());
    CPPUNIT_ASSERT_EQUAL(fcsweep::CAPTURE_OK, tm.capture_status);

    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(3), tm.zero_window_count);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(30.0, tm.zero_window_duration_ms, 1e-9);
    CPPUNIT_ASSERT(tm.zero_window_pct > 0.0);

    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(0), tm.window_min);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(4000), tm.window_max);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(2500.0, tm.window_mean, 1e-9);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(3), tm.window_oscillations);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(4), tm.total_packets);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(1), tm.retransmit_count);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(2), tm.dup_ack_count);

    // The trace is gone once the record is made.
    CPPUNIT_ASSERT_EQUAL(0, CountTraceFiles());
  }

  //==========================================================================
  void TestStopFlag()
  {
    TrialRunner    runner;
    volatile bool  stop = true;

    CPPUNIT_ASSERT(runner.Initialize(*ci_));

    TrialMetrics  tm = runner.RunTrial(TrialConfig(65536, 0.0, 8192, 1.0,
                                                   10.0), &stop);

    // An interrupted trial still tears down and records.
    CPPUNIT_ASSERT(tm.success);
    CPPUNIT_ASSERT_EQUAL(TrialRunner::RECORDED, runner.state());
    CPPUNIT_ASSERT_EQUAL(static_cast<uint64_t>(0), tm.bytes_transferred);
    CPPUNIT_ASSERT(tm.duration_actual < 1.0);
  }

  //==========================================================================
  vector<string> ReadLines(const string& path)
  {
    vector<string>  lines;
    ifstream        in(path.c_str());
    string          line;

    while (getline(in, line))
    {
      lines.push_back(line);
    }

    return lines;
  }

  //==========================================================================
  void TestTeardownOrder()
  {
    TrialRunner  runner;
    string       events  = dir_ + "/events";
    string       capture = string("EVENTS=") + events + "\n" +
      kOrderedCapture;
    string       analyze = string("echo \"analyze $4\" >> ") + events +
      "\n" + kFakeAnalyzer;

    ci_->Add("Capture.Enabled", "true");
    ci_->Add("Capture.Tool", WriteScript("tcpdump.sh", capture.c_str()));
    ci_->Add("Analyzer.Tool", WriteScript("tshark.sh", analyze.c_str()));

    CPPUNIT_ASSERT(runner.Initialize(*ci_));

    TrialMetrics  tm = runner.RunTrial(TrialConfig(65536, 0.0, 8192, 0.25,
                                                   0.5), NULL);

    CPPUNIT_ASSERT(tm.success);
    CPPUNIT_ASSERT(tm.bytes_transferred > 0);
    CPPUNIT_ASSERT_EQUAL(fcsweep::CAPTURE_OK, tm.capture_status);

    vector<string>  lines = ReadLines(events);

    // Both endpoints were closed before the capture was told to stop, and
    // every query ran after the capture had exited.
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(6), lines.size());
    CPPUNIT_ASSERT_EQUAL(string("capture-started"), lines[0]);
    CPPUNIT_ASSERT_EQUAL(string("capture-stopped closed"), lines[1]);

    for (size_t i = 2; i < lines.size(); ++i)
    {
      CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(0), lines[i].find("analyze "));
    }
  }

}; // end class TrialRunnerTest

CPPUNIT_TEST_SUITE_REGISTRATION(TrialRunnerTest);
