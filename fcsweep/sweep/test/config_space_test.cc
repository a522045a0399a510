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
#include "config_space.h"
#include "log.h"
#include "trial_config.h"

#include <string>
#include <vector>


using ::fcsweep::ConfigInfo;
using ::fcsweep::ConfigSpace;
using ::fcsweep::Log;
using ::fcsweep::SweepParams;
using ::fcsweep::TrialConfig;
using ::std::string;
using ::std::vector;


//============================================================================
class ConfigSpaceTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(ConfigSpaceTest);

  CPPUNIT_TEST(TestGenerateOrder);
  CPPUNIT_TEST(TestGenerateDeterministic);
  CPPUNIT_TEST(TestPresets);
  CPPUNIT_TEST(TestLoadParams);
  CPPUNIT_TEST(TestLoadParams_Errors);
  CPPUNIT_TEST(TestValidate);

  CPPUNIT_TEST_SUITE_END();

public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");
  }

  //==========================================================================
  void tearDown()
  {
    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  SweepParams SmallParams()
  {
    SweepParams  params;

    params.recv_bufs.push_back(4096);
    params.recv_bufs.push_back(8192);
    params.delays_ms.push_back(10.0);
    params.delays_ms.push_back(50.0);
    params.read_sizes.push_back(1024);
    params.rates_mbps.push_back(0.5);
    params.rates_mbps.push_back(1.0);
    params.rates_mbps.push_back(2.0);
    params.duration_sec = 2.0;

    return params;
  }

  //==========================================================================
  void TestGenerateOrder()
  {
    vector<TrialConfig>  configs;

    ConfigSpace::Generate(SmallParams(), configs);

    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(12), configs.size());
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(12),
                         ConfigSpace::Count(SmallParams()));

    // Send rate varies fastest, receive buffer slowest.
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(4096),
                         configs[0].recv_buf_bytes());
    CPPUNIT_ASSERT_DOUBLES_EQUAL(10.0, configs[0].read_delay_ms(), 1e-12);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(0.5, configs[0].send_rate_mbps(), 1e-12);

    CPPUNIT_ASSERT_DOUBLES_EQUAL(1.0, configs[1].send_rate_mbps(), 1e-12);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(2.0, configs[2].send_rate_mbps(), 1e-12);

    CPPUNIT_ASSERT_DOUBLES_EQUAL(50.0, configs[3].read_delay_ms(), 1e-12);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(0.5, configs[3].send_rate_mbps(), 1e-12);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(4096),
                         configs[5].recv_buf_bytes());

    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(8192),
                         configs[6].recv_buf_bytes());
    CPPUNIT_ASSERT_DOUBLES_EQUAL(10.0, configs[6].read_delay_ms(), 1e-12);

    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(8192),
                         configs[11].recv_buf_bytes());
    CPPUNIT_ASSERT_DOUBLES_EQUAL(2.0, configs[11].send_rate_mbps(), 1e-12);

    for (size_t i = 0; i < configs.size(); ++i)
    {
      CPPUNIT_ASSERT_DOUBLES_EQUAL(2.0, configs[i].duration_sec(), 1e-12);
    }

    // The output vector is replaced, not appended to.
    ConfigSpace::Generate(SmallParams(), configs);
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(12), configs.size());
  }

  //==========================================================================
  void TestGenerateDeterministic()
  {
    vector<TrialConfig>  first;
    vector<TrialConfig>  second;

    ConfigSpace::Generate(ConfigSpace::DefaultParams(), first);
    ConfigSpace::Generate(ConfigSpace::DefaultParams(), second);

    CPPUNIT_ASSERT_EQUAL(first.size(), second.size());

    for (size_t i = 0; i < first.size(); ++i)
    {
      CPPUNIT_ASSERT_EQUAL(first[i].recv_buf_bytes(),
                           second[i].recv_buf_bytes());
      CPPUNIT_ASSERT_EQUAL(first[i].read_delay_ms(),
                           second[i].read_delay_ms());
      CPPUNIT_ASSERT_EQUAL(first[i].read_chunk_bytes(),
                           second[i].read_chunk_bytes());
      CPPUNIT_ASSERT_EQUAL(first[i].send_rate_mbps(),
                           second[i].send_rate_mbps());
    }
  }

  //==========================================================================
  void TestPresets()
  {
    SweepParams          params;
    vector<TrialConfig>  configs;

    CPPUNIT_ASSERT(ConfigSpace::GetPreset("default", params));
    ConfigSpace::Generate(params, configs);
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(375), configs.size());
    CPPUNIT_ASSERT_DOUBLES_EQUAL(10.0, params.duration_sec, 1e-12);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(4096), params.recv_bufs[0]);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(65536), params.recv_bufs[4]);

    CPPUNIT_ASSERT(ConfigSpace::GetPreset("quick", params));
    ConfigSpace::Generate(params, configs);
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(8), configs.size());
    CPPUNIT_ASSERT_DOUBLES_EQUAL(5.0, params.duration_sec, 1e-12);
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(8192),
                         configs[0].recv_buf_bytes());
    CPPUNIT_ASSERT_DOUBLES_EQUAL(25.0, configs[0].read_delay_ms(), 1e-12);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(0.25, configs[0].send_rate_mbps(), 1e-12);

    CPPUNIT_ASSERT(!ConfigSpace::GetPreset("huge", params));
    CPPUNIT_ASSERT(!ConfigSpace::GetPreset("", params));
  }

  //==========================================================================
  void TestLoadParams()
  {
    ConfigInfo   ci;
    SweepParams  params;
    string       error;

    // No keys at all: the default preset.
    CPPUNIT_ASSERT(ConfigSpace::LoadParams(ci, params, error));
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(375), ConfigSpace::Count(params));

    // Overrides replace only the dimension they name.
    ci.Add("Sweep.Preset", "quick");
    ci.Add("Sweep.Rates", "0.5, 1.5, 3");
    ci.Add("Sweep.Delays", "0,12.5");
    ci.Add("Sweep.Duration", "2.5");

    CPPUNIT_ASSERT(ConfigSpace::LoadParams(ci, params, error));

    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), params.recv_bufs.size());
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(32768), params.recv_bufs[1]);
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), params.read_sizes.size());

    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(3), params.rates_mbps.size());
    CPPUNIT_ASSERT_DOUBLES_EQUAL(1.5, params.rates_mbps[1], 1e-12);

    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), params.delays_ms.size());
    CPPUNIT_ASSERT_DOUBLES_EQUAL(12.5, params.delays_ms[1], 1e-12);

    CPPUNIT_ASSERT_DOUBLES_EQUAL(2.5, params.duration_sec, 1e-12);
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(12), ConfigSpace::Count(params));

    ci.Add("Sweep.RecvBufs", "1024");
    ci.Add("Sweep.ReadSizes", "512,256");

    CPPUNIT_ASSERT(ConfigSpace::LoadParams(ci, params, error));
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), params.recv_bufs.size());
    CPPUNIT_ASSERT_EQUAL(static_cast<uint32_t>(256), params.read_sizes[1]);
  }

  //==========================================================================
  void TestLoadParams_Errors()
  {
    SweepParams  params = SmallParams();
    string       error;

    {
      ConfigInfo  ci;

      ci.Add("Sweep.Preset", "nonsense");
      CPPUNIT_ASSERT(!ConfigSpace::LoadParams(ci, params, error));
      CPPUNIT_ASSERT(error.find("nonsense") != string::npos);
    }

    {
      ConfigInfo  ci;

      error.clear();
      ci.Add("Sweep.Rates", "fast");
      CPPUNIT_ASSERT(!ConfigSpace::LoadParams(ci, params, error));
      CPPUNIT_ASSERT(!error.empty());
    }

    {
      ConfigInfo  ci;

      error.clear();
      ci.Add("Sweep.Delays", "10,-5");
      CPPUNIT_ASSERT(!ConfigSpace::LoadParams(ci, params, error));
      CPPUNIT_ASSERT(!error.empty());
    }

    {
      ConfigInfo  ci;

      error.clear();
      ci.Add("Sweep.ReadSizes", "0");
      CPPUNIT_ASSERT(!ConfigSpace::LoadParams(ci, params, error));
      CPPUNIT_ASSERT(!error.empty());
    }

    {
      ConfigInfo  ci;

      error.clear();
      ci.Add("Sweep.Duration", "0");
      CPPUNIT_ASSERT(!ConfigSpace::LoadParams(ci, params, error));
      CPPUNIT_ASSERT(!error.empty());
    }

    {
      ConfigInfo  ci;

      error.clear();
      ci.Add("Sweep.Duration", "5,10");
      CPPUNIT_ASSERT(!ConfigSpace::LoadParams(ci, params, error));
      CPPUNIT_ASSERT(!error.empty());
    }

    // A failed load leaves the output untouched.
    CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(12), ConfigSpace::Count(params));
  }

  //==========================================================================
  void TestValidate()
  {
    string       error;
    SweepParams  params = SmallParams();

    CPPUNIT_ASSERT(ConfigSpace::Validate(params, error));

    params.rates_mbps.clear();
    CPPUNIT_ASSERT(!ConfigSpace::Validate(params, error));
    CPPUNIT_ASSERT(!error.empty());

    params = SmallParams();
    params.duration_sec = -1.0;
    CPPUNIT_ASSERT(!ConfigSpace::Validate(params, error));

    params = SmallParams();
    params.read_sizes.push_back(0);
    CPPUNIT_ASSERT(!ConfigSpace::Validate(params, error));

    // An oversized value anywhere in a list is caught.
    params = SmallParams();
    params.recv_bufs.push_back(4294967295U);
    CPPUNIT_ASSERT(!ConfigSpace::Validate(params, error));
    CPPUNIT_ASSERT(error.find("receive buffer") == 0);

    params = SmallParams();
    params.read_sizes.push_back(128 * 1024 * 1024);
    CPPUNIT_ASSERT(!ConfigSpace::Validate(params, error));
    CPPUNIT_ASSERT(error.find("read size") == 0);
  }

}; // end class ConfigSpaceTest

CPPUNIT_TEST_SUITE_REGISTRATION(ConfigSpaceTest);
