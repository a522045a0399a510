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

#include <getopt.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include <cppunit/extensions/TestFactoryRegistry.h>
#include <cppunit/ui/text/TestRunner.h>
#include <cppunit/XmlOutputter.h>

#include "log.h"

using std::ofstream;
using std::string;

//============================================================================
static void Usage(const char* prog)
{
  fprintf(stderr, "Usage: %s [-x|--xmlfile <file>] [<test name>]\n", prog);
}

//============================================================================
// Runs the common tests, or the single fixture or test named on the command
// line, e.g. "common_tests ChildProcessTest".
int main(int argc, char** argv)
{
  string  xmlfile;
  int     c;

  static struct option  long_options[] = {
    {"xmlfile", required_argument, 0, 'x'},
    {0,         0,                 0,  0 }
  };

  while ((c = getopt_long(argc, argv, "x:", long_options, NULL)) != -1)
  {
    if (c != 'x')
    {
      Usage(argv[0]);
      return 2;
    }
    xmlfile = optarg;
  }

  string  test_name;

  if (optind < argc)
  {
    test_name = argv[optind];
  }

  // Configuration logging is noise in test output.
  fcsweep::Log::SetConfigLoggingActive(false);

  CppUnit::TextUi::TestRunner  runner;

  runner.addTest(CppUnit::TestFactoryRegistry::getRegistry().makeTest());

  ofstream  outfile;

  if (!xmlfile.empty())
  {
    outfile.open(xmlfile.c_str());
    runner.setOutputter(new CppUnit::XmlOutputter(&runner.result(), outfile));
  }

  try
  {
    return (runner.run(test_name, false) ? 0 : 1);
  }
  catch (const std::invalid_argument&)
  {
    fprintf(stderr, "No such test: %s\n", test_name.c_str());
    Usage(argv[0]);
    return 2;
  }
}
