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
#include "sweep_controller.h"
#include "trial_metrics.h"

#include "rapidjson/document.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>


using ::fcsweep::ConfigInfo;
using ::fcsweep::Log;
using ::fcsweep::PortNumberMgr;
using ::fcsweep::SweepController;
using ::fcsweep::TrialMetrics;
using ::rapidjson::Document;
using ::std::ifstream;
using ::std::string;
using ::std::stringstream;
using ::std::vector;


//============================================================================
class SweepControllerTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(SweepControllerTest);

  CPPUNIT_TEST(TestInitialize);
  CPPUNIT_TEST(TestInitialize_Errors);
  CPPUNIT_TEST(TestRun);
  CPPUNIT_TEST(TestRun_AllFail);
  CPPUNIT_TEST(TestRun_BadOutput);
  CPPUNIT_TEST(TestRun_DoneBeforeStart);

  CPPUNIT_TEST_SUITE_END();

private:

  ConfigInfo*  ci_;
  string       dir_;

public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    char  tmpl[] = "/tmp/fcsweep_controller_test_XXXXXX";

    CPPUNIT_ASSERT(mkdtemp(tmpl) != NULL);
    dir_ = tmpl;

    // Two short unthrottled trials.
    ci_ = new ConfigInfo();
    ci_->Add("Sweep.RecvBufs", "65536");
    ci_->Add("Sweep.Delays", "0");
    ci_->Add("Sweep.ReadSizes", "8192");
    ci_->Add("Sweep.Rates", "0.25,0.5");
    ci_->Add("Sweep.Duration", "0.5");
    ci_->Add("Sweep.Output", dir_ + "/results.csv");
    ci_->Add("Sweep.SummaryFile", dir_ + "/summary.json");
    ci_->Add("Sweep.InterTrialPauseMs", "50");
    ci_->Add("Trial.Port", PortNumberMgr::GetInstance().NextAvailableStr());
    ci_->Add("Trial.BindAddr", "127.0.0.1");
    ci_->Add("Trial.DrainDelayMs", "50");
    ci_->Add("Receiver.AcceptTimeoutMs", "300");
    ci_->Add("Capture.Enabled", "false");
  }

  //==========================================================================
  void tearDown()
  {
    delete ci_;
    ci_ = NULL;

    string  cmd = "rm -rf " + dir_;

    if (system(cmd.c_str()) != 0)
    {
      LogW("SweepControllerTest", __func__, "Cannot remove %s.\n",
           dir_.c_str());
    }

    Log::SetDefaultLevel("FEWI");
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
  bool ReadJson(const string& path, Document& doc)
  {
    ifstream      in(path.c_str());
    stringstream  ss;

    if (!in)
    {
      return false;
    }

    ss << in.rdbuf();
    doc.Parse(ss.str().c_str());

    return !doc.HasParseError() && doc.IsObject();
  }

  //==========================================================================
  void TestInitialize()
  {
    SweepController  sc;

    CPPUNIT_ASSERT(sc.Initialize(*ci_));
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), sc.configs().size());
    CPPUNIT_ASSERT_DOUBLES_EQUAL(0.25, sc.configs()[0].send_rate_mbps(),
                                 1e-12);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(0.5, sc.configs()[0].duration_sec(), 1e-12);

    // Nothing has run yet.
    CPPUNIT_ASSERT(sc.results().empty());
    CPPUNIT_ASSERT(!sc.AllSucceeded());
  }

  //==========================================================================
  void TestInitialize_Errors()
  {
    {
      SweepController  sc;

      ci_->Add("Sweep.Preset", "enormous");
      CPPUNIT_ASSERT(!sc.Initialize(*ci_));
    }

    {
      SweepController  sc;

      ci_->Add("Sweep.Preset", "quick");
      ci_->Add("Sweep.Rates", "1,fast");
      CPPUNIT_ASSERT(!sc.Initialize(*ci_));
    }

    {
      SweepController  sc;

      ci_->Add("Sweep.Rates", "1");
      ci_->Add("Trial.BindAddr", "localhost:80");
      CPPUNIT_ASSERT(!sc.Initialize(*ci_));
    }
  }

  //==========================================================================
  void TestRun()
  {
    SweepController  sc;

    CPPUNIT_ASSERT(sc.Initialize(*ci_));
    CPPUNIT_ASSERT(sc.Run());

    CPPUNIT_ASSERT(sc.AllSucceeded());
    CPPUNIT_ASSERT(!sc.interrupted());
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(2), sc.num_succeeded());
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(0), sc.num_with_zero_window());

    // One row per trial, in generation order.
    vector<string>  lines = ReadLines(dir_ + "/results.csv");

    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(3), lines.size());
    CPPUNIT_ASSERT_EQUAL(TrialMetrics::CsvHeader(), lines[0]);
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(0),
                         lines[1].find("65536,0.0,8192,0.25,0.5,inf,"));
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(0),
                         lines[2].find("65536,0.0,8192,0.5,0.5,inf,"));

    Document  doc;

    CPPUNIT_ASSERT(ReadJson(dir_ + "/summary.json", doc));
    CPPUNIT_ASSERT_EQUAL(2u, doc["configurations"].GetUint());
    CPPUNIT_ASSERT_EQUAL(2u, doc["trials_run"].GetUint());
    CPPUNIT_ASSERT_EQUAL(2u, doc["successful"].GetUint());
    CPPUNIT_ASSERT_EQUAL(0u, doc["with_zero_window"].GetUint());
    CPPUNIT_ASSERT(!doc["interrupted"].GetBool());
    CPPUNIT_ASSERT(!doc["capture"].GetBool());
    CPPUNIT_ASSERT_EQUAL(dir_ + "/results.csv",
                         string(doc["output"].GetString()));
    CPPUNIT_ASSERT(doc["params"]["send_rates_mbps"].IsArray());
    CPPUNIT_ASSERT_EQUAL(static_cast<rapidjson::SizeType>(2),
                         doc["params"]["send_rates_mbps"].Size());
    CPPUNIT_ASSERT_DOUBLES_EQUAL(0.5, doc["params"]["duration"].GetDouble(),
                                 1e-12);
  }

  //==========================================================================
  void TestRun_AllFail()
  {
    SweepController  sc;

    // Every connect is refused; each trial is still recorded.
    ci_->Add("Trial.TargetPort",
             PortNumberMgr::GetInstance().NextAvailableStr());

    CPPUNIT_ASSERT(sc.Initialize(*ci_));
    CPPUNIT_ASSERT(sc.Run());

    CPPUNIT_ASSERT(!sc.AllSucceeded());
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), sc.results().size());
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(0), sc.num_succeeded());
    CPPUNIT_ASSERT(!sc.results()[1].success);
    CPPUNIT_ASSERT(sc.results()[1].error.find("sender: connect") == 0);

    vector<string>  lines = ReadLines(dir_ + "/results.csv");

    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(3), lines.size());
    CPPUNIT_ASSERT(lines[1].find(",False,sender: connect") != string::npos);
  }

  //==========================================================================
  void TestRun_BadOutput()
  {
    SweepController  sc;

    ci_->Add("Sweep.Output", dir_ + "/missing/results.csv");

    CPPUNIT_ASSERT(sc.Initialize(*ci_));
    CPPUNIT_ASSERT(!sc.Run());
    CPPUNIT_ASSERT(sc.results().empty());
  }

  //==========================================================================
  void TestRun_DoneBeforeStart()
  {
    SweepController  sc;

    CPPUNIT_ASSERT(sc.Initialize(*ci_));

    sc.set_done(true);

    CPPUNIT_ASSERT(sc.Run());
    CPPUNIT_ASSERT(sc.interrupted());
    CPPUNIT_ASSERT(!sc.AllSucceeded());
    CPPUNIT_ASSERT(sc.results().empty());

    // The file still has its header.
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1),
                         ReadLines(dir_ + "/results.csv").size());

    Document  doc;

    CPPUNIT_ASSERT(ReadJson(dir_ + "/summary.json", doc));
    CPPUNIT_ASSERT(doc["interrupted"].GetBool());
    CPPUNIT_ASSERT_EQUAL(0u, doc["trials_run"].GetUint());
  }

}; // end class SweepControllerTest

CPPUNIT_TEST_SUITE_REGISTRATION(SweepControllerTest);
