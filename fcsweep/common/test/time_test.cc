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

#include "itime.h"
#include "log.h"

#include <string>

using ::fcsweep::Log;
using ::fcsweep::Time;


//============================================================================
class TimeTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(TimeTest);

  CPPUNIT_TEST(TestConversions);
  CPPUNIT_TEST(TestNegative);
  CPPUNIT_TEST(TestArithmetic);
  CPPUNIT_TEST(TestInfinite);
  CPPUNIT_TEST(TestSleep);
  CPPUNIT_TEST(TestWallClockString);

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
  void TestConversions()
  {
    Time  t = Time::FromMsec(1250);

    CPPUNIT_ASSERT(t.GetTimeInMsec() == 1250);
    CPPUNIT_ASSERT(t.GetTimeInUsec() == 1250000);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(1.25, t.ToDouble(), 1e-9);
    CPPUNIT_ASSERT(t.ToString() == "1.250000s");

    CPPUNIT_ASSERT(Time(0.3).GetTimeInMsec() == 300);
    CPPUNIT_ASSERT(Time::FromSec(2) == Time::FromUsec(2000000));
    CPPUNIT_ASSERT(Time().IsZero());

    timespec  ts = Time::FromUsec(1500001).ToTspec();
    CPPUNIT_ASSERT(ts.tv_sec == 1);
    CPPUNIT_ASSERT(ts.tv_nsec == 500001000L);
  }

  //==========================================================================
  void TestNegative()
  {
    Time  t = Time::FromMsec(-1500);

    CPPUNIT_ASSERT(t.GetTimeInMsec() == -1500);
    CPPUNIT_ASSERT(t.ToString() == "-1.500000s");
    CPPUNIT_ASSERT(Time::FromMsec(-2000).GetTimeInUsec() == -2000000);
    CPPUNIT_ASSERT(t < Time());
  }

  //==========================================================================
  void TestArithmetic()
  {
    Time  a = Time::FromMsec(700);
    Time  b = Time::FromMsec(500);

    CPPUNIT_ASSERT((a + b).GetTimeInMsec() == 1200);
    CPPUNIT_ASSERT((a - b).GetTimeInMsec() == 200);
    CPPUNIT_ASSERT(a > b);
    CPPUNIT_ASSERT(b <= a);
    CPPUNIT_ASSERT(a != b);
    CPPUNIT_ASSERT(Time::Max(a, b) == a);
    CPPUNIT_ASSERT(Time::Min(a, b) == b);
    CPPUNIT_ASSERT(b.Multiply(2.5).GetTimeInMsec() == 1250);

    a += b;
    CPPUNIT_ASSERT(a.GetTimeInMsec() == 1200);
  }

  //==========================================================================
  void TestInfinite()
  {
    Time  inf = Time::Infinite();

    CPPUNIT_ASSERT(inf.IsInfinite());
    CPPUNIT_ASSERT(inf > Time::FromSec(1000000));
    CPPUNIT_ASSERT(inf.ToString() == "inf");
  }

  //==========================================================================
  void TestSleep()
  {
    Time  start = Time::Now();

    Time::Sleep(Time::FromMsec(50));

    Time  elapsed = Time::Now() - start;

    CPPUNIT_ASSERT(elapsed >= Time::FromMsec(50));

    // Non-positive durations do not sleep.
    start = Time::Now();
    Time::Sleep(Time::FromMsec(-100));
    CPPUNIT_ASSERT((Time::Now() - start) < Time::FromMsec(50));
  }

  //==========================================================================
  void TestWallClockString()
  {
    std::string  ts = Time::GetWallClockString();

    // e.g. 2026-10-19T14:03:11.412077
    CPPUNIT_ASSERT(ts.size() == 26);
    CPPUNIT_ASSERT(ts[4] == '-');
    CPPUNIT_ASSERT(ts[10] == 'T');
    CPPUNIT_ASSERT(ts[19] == '.');
  }

}; // end class TimeTest

CPPUNIT_TEST_SUITE_REGISTRATION(TimeTest);
