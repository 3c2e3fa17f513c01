/* mpipe: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "mpipe/test/test_config.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <sstream>

namespace mpipe::test
{

Test_config::Test_config() :
  m_sev(flow::log::Sev::S_INFO)
{
  // That's it.
}

Test_config& Test_config::get_singleton() // Static.
{
  static Test_config s_config;
  return s_config;
}

bool Test_config::parse_args(int* argc, char** argv, std::string* err_msg)
{
  using flow::log::Sev;
  using boost::algorithm::iequals;
  using std::string;

  const string SEV_PREFIX = "--minimum-log-severity=";

  int out_idx = 1;
  for (int in_idx = 1; in_idx != *argc; ++in_idx)
  {
    const string arg(argv[in_idx]);
    if (arg.compare(0, SEV_PREFIX.size(), SEV_PREFIX) != 0)
    {
      argv[out_idx++] = argv[in_idx];
      continue;
    }
    // else

    const string sev_str = arg.substr(SEV_PREFIX.size());
    std::istringstream is(sev_str);
    Sev sev;
    is >> sev;
    // An unknown name maps to some default value; so check that it reads back the same.
    std::ostringstream os;
    os << sev;
    if (!iequals(os.str(), sev_str))
    {
      *err_msg = "Unrecognized severity in [" + arg + "].";
      return false;
    }
    // else
    m_sev = sev;
  }

  *argc = out_idx;
  argv[out_idx] = nullptr;
  return true;
} // Test_config::parse_args()

} // namespace mpipe::test
