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
#include "itime.h"
#include "log.h"
#include "port_number_mgr.h"
#include "rate_limited_sender.h"
#include "throttled_receiver.h"
#include "trial_config.h"

#include <string>


using ::fcsweep::ConfigInfo;
using ::fcsweep::Log;
using ::fcsweep::PortNumberMgr;
using ::fcsweep::RateLimitedSender;
using ::fcsweep::SenderResult;
using ::fcsweep::ThrottledReceiver;
using ::fcsweep::Time;
using ::fcsweep::TrialConfig;
using ::std::string;


//============================================================================
class RateLimitedSenderTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(RateLimitedSenderTest);

  CPPUNIT_TEST(TestPacingInterval);
  CPPUNIT_TEST(TestInitialize);
  CPPUNIT_TEST(TestNoListener);
  CPPUNIT_TEST(TestPacedRate);
  CPPUNIT_TEST(TestStopFlag);
  CPPUNIT_TEST(TestBlockedBySlowReceiver);

  CPPUNIT_TEST_SUITE_END();

private:

  ConfigInfo*  ci_;

public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    ci_ = new ConfigInfo();
    ci_->Add("Trial.Port", PortNumberMgr::GetInstance().NextAvailableStr());
    ci_->Add("Trial.BindAddr", "127.0.0.1");
    ci_->Add("Trial.TargetAddr", "127.0.0.1");
  }

  //==========================================================================
  void tearDown()
  {
    delete ci_;
    ci_ = NULL;

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestPacingInterval()
  {
    // 8 KB chunks at 0.5 MB/s: 64 chunks per second.
    CPPUNIT_ASSERT_DOUBLES_EQUAL(
      0.015625, RateLimitedSender::PacingInterval(8192, 524288.0).ToDouble(),
      1e-6);

    CPPUNIT_ASSERT_DOUBLES_EQUAL(
      0.001, RateLimitedSender::PacingInterval(1000, 1000000.0).ToDouble(),
      1e-6);

    // A zero rate means no pacing at all.
    CPPUNIT_ASSERT(RateLimitedSender::PacingInterval(8192, 0.0).IsZero());
    CPPUNIT_ASSERT(RateLimitedSender::PacingInterval(8192, -1.0).IsZero());
  }

  //==========================================================================
  void TestInitialize()
  {
    RateLimitedSender  sender;

    ci_->Add("Trial.Port", "7000");
    CPPUNIT_ASSERT(sender.Initialize(*ci_));
    CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(7000), sender.target_port());

    // An explicit target port overrides the trial port.
    ci_->Add("Trial.TargetPort", "7001");
    CPPUNIT_ASSERT(sender.Initialize(*ci_));
    CPPUNIT_ASSERT_EQUAL(static_cast<uint16_t>(7001), sender.target_port());

    ci_->Add("Sender.ChunkBytes", "0");
    CPPUNIT_ASSERT(!sender.Initialize(*ci_));

    ci_->Add("Sender.ChunkBytes", "1024");
    ci_->Add("Trial.TargetAddr", "not-an-address");
    CPPUNIT_ASSERT(!sender.Initialize(*ci_));
  }

  //==========================================================================
  void TestNoListener()
  {
    RateLimitedSender  sender;
    SenderResult       result;

    CPPUNIT_ASSERT(sender.Initialize(*ci_));
    CPPUNIT_ASSERT(!sender.Run(TrialConfig(8192, 10.0, 1024, 1.0, 1.0), NULL,
                               result));

    CPPUNIT_ASSERT(!result.connected);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint64_t>(0), result.bytes_sent);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(0), result.block_count);
    CPPUNIT_ASSERT(result.error.find("connect 127.0.0.1:") == 0);
  }

  //==========================================================================
  void TestPacedRate()
  {
    ThrottledReceiver  rcvr;
    RateLimitedSender  sender;
    SenderResult       result;
    string             error;

    // The receiver keeps up easily, so pacing alone sets the volume.
    TrialConfig  config(262144, 0.0, 65536, 0.5, 1.0);

    CPPUNIT_ASSERT(rcvr.Initialize(*ci_));
    CPPUNIT_ASSERT(sender.Initialize(*ci_));
    CPPUNIT_ASSERT(rcvr.Start(config, error));

    Time  start = Time::Now();

    CPPUNIT_ASSERT(sender.Run(config, NULL, result));

    Time  elapsed = Time::Now() - start;

    rcvr.Stop();

    CPPUNIT_ASSERT(result.connected);
    CPPUNIT_ASSERT_EQUAL(string("duration elapsed"), result.termination);
    CPPUNIT_ASSERT(result.error.empty());

    // 64 chunks of 8 KB, give or take one.
    CPPUNIT_ASSERT(result.bytes_sent >= 516096);
    CPPUNIT_ASSERT(result.bytes_sent <= 532480);

    CPPUNIT_ASSERT(elapsed >= Time(0.95));
    CPPUNIT_ASSERT(elapsed < Time(1.5));
  }

  //==========================================================================
  void TestStopFlag()
  {
    ThrottledReceiver  rcvr;
    RateLimitedSender  sender;
    SenderResult       result;
    string             error;
    volatile bool      stop = true;

    TrialConfig  config(65536, 0.0, 8192, 1.0, 10.0);

    CPPUNIT_ASSERT(rcvr.Initialize(*ci_));
    CPPUNIT_ASSERT(sender.Initialize(*ci_));
    CPPUNIT_ASSERT(rcvr.Start(config, error));

    Time  start = Time::Now();

    CPPUNIT_ASSERT(sender.Run(config, &stop, result));
    CPPUNIT_ASSERT((Time::Now() - start) < Time(1.0));

    rcvr.Stop();

    CPPUNIT_ASSERT(result.connected);
    CPPUNIT_ASSERT_EQUAL(string("interrupted"), result.termination);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint64_t>(0), result.bytes_sent);
  }

  //==========================================================================
  void TestBlockedBySlowReceiver()
  {
    ThrottledReceiver  rcvr;
    RateLimitedSender  sender;
    SenderResult       result;
    string             error;

    // 1 KB every 200 ms against 20 MB/s offered.
    TrialConfig  config(4096, 200.0, 1024, 20.0, 2.0);

    ci_->Add("Sender.SendTimeoutMs", "300");
    ci_->Add("Receiver.AcceptTimeoutMs", "2000");

    CPPUNIT_ASSERT(rcvr.Initialize(*ci_));
    CPPUNIT_ASSERT(sender.Initialize(*ci_));
    CPPUNIT_ASSERT(rcvr.Start(config, error));
    CPPUNIT_ASSERT(sender.Run(config, NULL, result));

    rcvr.Stop();

    CPPUNIT_ASSERT(result.connected);
    CPPUNIT_ASSERT(result.block_count > 0);
    CPPUNIT_ASSERT(result.blocked_time > Time::FromMsec(100));

    // Far less than the offered 40 MB got through.
    CPPUNIT_ASSERT(result.bytes_sent < 20 * 1024 * 1024);
    CPPUNIT_ASSERT(rcvr.bytes_received() < result.bytes_sent);
  }

}; // end class RateLimitedSenderTest

CPPUNIT_TEST_SUITE_REGISTRATION(RateLimitedSenderTest);
