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

#include "xfer/transfer/completion_record.hpp"
#include "xfer/transfer/error.hpp"
#include <gtest/gtest.h>
#include <boost/unordered_set.hpp>
#include <unordered_set>
#include <sstream>

namespace xfer::transfer::test
{

namespace
{
using boost::chrono::milliseconds;
using boost::chrono::seconds;
} // Anonymous namespace.

TEST(Request_descriptor, Identity)
{
  const Request_descriptor req1("GET", "http://example.com/a");
  const Request_descriptor req2("GET", "http://example.com/a"); // Same content; different request.
  const auto req1_copy = req1;

  EXPECT_NE(req1.id(), req2.id());
  EXPECT_NE(req1, req2);
  EXPECT_EQ(req1, req1_copy);
  EXPECT_EQ(req1.id(), req1_copy.id());
  EXPECT_TRUE((req1 < req2) != (req2 < req1));
  EXPECT_FALSE(req1 < req1_copy);

  EXPECT_EQ(hash_value(req1), hash_value(req1_copy));
  EXPECT_EQ(std::hash<Request_descriptor>()(req1), std::hash<Request_descriptor>()(req1_copy));

  boost::unordered_set<Request_descriptor> boost_set{ req1, req2, req1_copy };
  EXPECT_EQ(boost_set.size(), 2u);
  std::unordered_set<Request_descriptor> std_set{ req1, req2, req1_copy };
  EXPECT_EQ(std_set.size(), 2u);
}

TEST(Request_descriptor, Accessors)
{
  const Headers hdrs{ { "Accept", "*/*" }, { "X-Thing", "1" } };
  const Request_descriptor req("POST", "http://example.com/submit", hdrs, "payload",
                               seconds(2), milliseconds(1500));

  EXPECT_EQ(req.method(), "POST");
  EXPECT_EQ(req.target(), "http://example.com/submit");
  EXPECT_EQ(req.headers(), hdrs);
  EXPECT_EQ(req.body(), "payload");
  EXPECT_EQ(req.connect_timeout(), util::Fine_duration(seconds(2)));
  EXPECT_EQ(req.request_timeout(), util::Fine_duration(milliseconds(1500)));

  std::ostringstream os;
  os << req;
  const auto str = os.str();
  EXPECT_NE(str.find("POST http://example.com/submit"), std::string::npos) << str;
  EXPECT_NE(str.find("hdrs[2]"), std::string::npos) << str;
  EXPECT_NE(str.find("body[7b]"), std::string::npos) << str;
  EXPECT_NE(str.find("conn_to["), std::string::npos) << str;
  EXPECT_NE(str.find("req_to["), std::string::npos) << str;

  const Request_descriptor plain("GET", "http://example.com/");
  EXPECT_EQ(plain.connect_timeout(), util::Fine_duration::zero());
  os.str("");
  os << plain;
  EXPECT_EQ(os.str().find("conn_to["), std::string::npos) << os.str();
}

TEST(Completion_record, Success)
{
  const Request_descriptor req("GET", "http://example.com/");
  Response_data response;
  response.m_status_code = 200;
  response.m_headers.emplace_back("Content-Type", "text/plain");
  response.m_body = "hello";

  auto record = Completion_record::success(req, std::move(response));
  EXPECT_TRUE(record.succeeded());
  EXPECT_FALSE(record.cause());
  EXPECT_EQ(record.request(), req);
  EXPECT_EQ(record.response().m_status_code, 200u);

  std::ostringstream os;
  os << record;
  EXPECT_NE(os.str().find("success"), std::string::npos) << os.str();

  const Response_data released = record.release_response();
  EXPECT_EQ(released.m_body, "hello");
  ASSERT_EQ(released.m_headers.size(), 1u);
  EXPECT_EQ(released.m_headers.front().first, "Content-Type");
}

TEST(Completion_record, Failure)
{
  const Request_descriptor req("GET", "http://example.com/");
  const Error_code cause = error::Code::S_TRANSFER_FAILED;

  const auto record = Completion_record::failure(req, cause);
  EXPECT_FALSE(record.succeeded());
  EXPECT_EQ(record.cause(), cause);
  EXPECT_EQ(record.request(), req);

  std::ostringstream os;
  os << record;
  EXPECT_NE(os.str().find("failure"), std::string::npos) << os.str();
}

} // namespace xfer::transfer::test
