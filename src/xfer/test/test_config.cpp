/* Flow-Xfer: Core
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

#include "xfer/test/test_config.hpp"
#include <iostream>
#include <sstream>

namespace xfer::test
{

const std::string Test_config::S_MIN_SEVERITY_OPTION = "--minimum-log-severity=";
const std::string Test_config::S_COMPONENT_SEVERITY_OPTION = "--component-log-severity=";

Test_config::Test_config() :
  m_sev(flow::log::Sev::S_WARNING)
{
  // That's it.
}

Test_config& Test_config::get_singleton()
{
  static Test_config s_config;
  return s_config;
}

void Test_config::parse_args(int* argc, char** argv)
{
  using flow::log::Sev;
  using std::string;

  const auto starts_with = [](const string& arg, const string& prefix) -> bool
  {
    return arg.compare(0, prefix.size(), prefix) == 0;
  };

  int n_kept = 1; // Program name stays put.
  for (int idx = 1; idx < *argc; ++idx)
  {
    const string arg(argv[idx]);
    if (starts_with(arg, S_MIN_SEVERITY_OPTION))
    {
      Sev sev;
      if (parse_sev(arg, arg.substr(S_MIN_SEVERITY_OPTION.size()), &sev))
      {
        m_sev = sev;
      }
    }
    else if (starts_with(arg, S_COMPONENT_SEVERITY_OPTION))
    {
      const auto value = arg.substr(S_COMPONENT_SEVERITY_OPTION.size());
      const auto colon_pos = value.rfind(':');
      if ((colon_pos == string::npos) || (colon_pos == 0))
      {
        std::cerr << "Expected <component>:<severity> in [" << arg << "]; ignoring.\n";
        continue;
      }
      // else
      Sev sev;
      if (parse_sev(arg, value.substr(colon_pos + 1), &sev))
      {
        m_component_sevs.emplace_back(value.substr(0, colon_pos), sev);
      }
    }
    else
    {
      argv[n_kept++] = argv[idx];
    }
  } // for (idx)

  *argc = n_kept;
  argv[n_kept] = nullptr;
} // Test_config::parse_args()

bool Test_config::parse_sev(const std::string& arg, const std::string& sev_str, flow::log::Sev* sev) // Static.
{
  using flow::log::Sev;

  std::istringstream is(sev_str);
  *sev = Sev::S_END_SENTINEL;
  is >> *sev;
  if (*sev == Sev::S_END_SENTINEL)
  {
    std::cerr << "Unrecognized log severity in [" << arg << "]; ignoring.\n";
    return false;
  }
  // else
  return true;
}

} // namespace xfer::test
