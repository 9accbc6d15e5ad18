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

#include "xfer/transfer/processor_config.hpp"
#include "xfer/transfer/error.hpp"
#include "xfer/test/test_logger.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <sstream>

namespace xfer::transfer::test
{

TEST(Processor_config, Defaults)
{
  xfer::test::Test_logger logger;
  const Processor_config config;

  EXPECT_EQ(config.m_poll_interval, Processor_config::S_DEFAULT_POLL_INTERVAL);
  EXPECT_EQ(config.m_poll_interval, util::Fine_duration(boost::chrono::milliseconds(100)));
  EXPECT_EQ(config.m_worker_nickname, "xfer");
  EXPECT_EQ(config.m_n_registry_shards, Processor_config::S_DEFAULT_N_REGISTRY_SHARDS);

  Error_code err_code;
  EXPECT_TRUE(config.validate(&logger, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(config.validate(&logger)); // Does not throw.

  std::ostringstream os;
  os << config;
  EXPECT_NE(os.str().find("worker_nickname[xfer]"), std::string::npos) << os.str();
}

TEST(Processor_config, Invalid)
{
  xfer::test::Test_logger logger;
  Error_code err_code;

  Processor_config config;
  config.m_poll_interval = util::Fine_duration::zero();
  EXPECT_FALSE(config.validate(&logger, &err_code));
  EXPECT_EQ(err_code, error::make_error_code(error::Code::S_INVALID_ARGUMENT));
  EXPECT_THROW(config.validate(&logger), flow::error::Runtime_error);

  config = Processor_config();
  config.m_worker_nickname.clear();
  EXPECT_FALSE(config.validate(&logger, &err_code));
  EXPECT_EQ(err_code, error::make_error_code(error::Code::S_INVALID_ARGUMENT));

  config = Processor_config();
  config.m_n_registry_shards = 0;
  EXPECT_FALSE(config.validate(&logger, &err_code));
  EXPECT_EQ(err_code, error::make_error_code(error::Code::S_INVALID_ARGUMENT));
}

} // namespace xfer::transfer::test
