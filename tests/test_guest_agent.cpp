/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "encoding.hpp"
#include "errors.hpp"
#include "guest_agent.hpp"
#include "mock_hypervisor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

using namespace compute;
using namespace compute::test;
using ::testing::_;
using ::testing::AllOf;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

const std::string exec_supported = agent_reply(
	"{\"version\":\"8.1.0\",\"supported_commands\":["
	"{\"name\":\"guest-exec\",\"enabled\":true},"
	"{\"name\":\"guest-exec-status\",\"enabled\":true},"
	"{\"name\":\"guest-set-vcpus\",\"enabled\":false}]}");

class Guest_agent_test :
	public ::testing::Test
{
protected:
	void SetUp() override
	{
		domain = std::make_shared<NiceMock<Mock_domain>>();
		ON_CALL(*domain, name()).WillByDefault(Return("vm1"));
		EXPECT_CALL(*domain, agent_command(_, _)).Times(AnyNumber());
		ON_CALL(*domain, agent_command(HasSubstr("\"guest-info\""), _)).WillByDefault(Return(exec_supported));
		ON_CALL(*domain, agent_command(HasSubstr("\"guest-exec\""), _)).WillByDefault(Return(agent_reply("{\"pid\":42}")));
	}

	std::shared_ptr<NiceMock<Mock_domain>> domain;
};

} // namespace

TEST_F(Guest_agent_test, execute_returns_reply)
{
	EXPECT_CALL(*domain, agent_command("{\"execute\":\"guest-ping\"}", 60)).WillOnce(Return(agent_reply("{}")));
	Guest_agent agent(domain);
	EXPECT_TRUE(agent.execute("guest-ping").isObject());
}

TEST_F(Guest_agent_test, error_reply_throws)
{
	EXPECT_CALL(*domain, agent_command(HasSubstr("guest-get-users"), _))
		.WillOnce(Return("{\"error\":{\"class\":\"GenericError\",\"desc\":\"permission denied\"}}"));
	Guest_agent agent(domain);
	try {
		agent.execute("guest-get-users");
		FAIL() << "expected a guest_agent error";
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::guest_agent);
		EXPECT_NE(std::string(e.what()).find("permission denied"), std::string::npos);
	}
}

TEST_F(Guest_agent_test, unavailable_agent)
{
	EXPECT_CALL(*domain, agent_command(HasSubstr("guest-ping"), _))
		.WillOnce(Throw(Compute_error(Error_kind::guest_agent_unavailable, "Guest agent is not responding")));
	Guest_agent agent(domain);
	EXPECT_FALSE(agent.is_available());
}

TEST_F(Guest_agent_test, connection_errors_are_not_swallowed)
{
	EXPECT_CALL(*domain, agent_command(HasSubstr("guest-ping"), _))
		.WillOnce(Throw(Compute_error(Error_kind::connection, "connection lost")));
	Guest_agent agent(domain);
	EXPECT_THROW(agent.is_available(), Compute_error);
}

TEST_F(Guest_agent_test, unsupported_command)
{
	Guest_agent agent(domain);
	EXPECT_EQ(agent.supported_commands().count("guest-set-vcpus"), 0u);
	try {
		agent.ensure_supported({"guest-exec", "guest-set-vcpus"});
		FAIL() << "expected a command_not_supported error";
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::command_not_supported);
		EXPECT_EQ(e.command(), "guest-set-vcpus");
	}
}

TEST_F(Guest_agent_test, exec_polls_until_exited)
{
	const std::string running = agent_reply("{\"exited\":false}");
	const std::string done = agent_reply("{\"exited\":true,\"exitcode\":3,\"out-data\":\""
			+ base64_encode("hello\n") + "\",\"err-data\":\"" + base64_encode("oops") + "\"}");
	EXPECT_CALL(*domain, agent_command(HasSubstr("guest-exec-status"), _))
		.WillOnce(Return(running))
		.WillOnce(Return(running))
		.WillOnce(Return(running))
		.WillOnce(Return(done));
	EXPECT_CALL(*domain, agent_command(AllOf(HasSubstr("\"guest-exec\""), HasSubstr(base64_encode("input"))), _))
		.WillOnce(Return(agent_reply("{\"pid\":42}")));

	Guest_agent agent(domain, 10);
	auto start = std::chrono::steady_clock::now();
	auto output = agent.exec("/bin/sh", {"-c", "cat"}, {}, std::string("input"), true, true, true);
	auto elapsed = std::chrono::steady_clock::now() - start;

	EXPECT_GE(elapsed, 3 * Guest_agent::poll_interval);
	EXPECT_TRUE(output.exited);
	ASSERT_TRUE(output.exitcode);
	EXPECT_EQ(*output.exitcode, 3);
	EXPECT_EQ(output.stdout_data, "hello\n");
	EXPECT_EQ(output.stderr_data, "oops");
	ASSERT_TRUE(agent.last_pid());
	EXPECT_EQ(*agent.last_pid(), 42);
}

TEST_F(Guest_agent_test, exec_without_poll_returns_first_status)
{
	EXPECT_CALL(*domain, agent_command(HasSubstr("guest-exec-status"), _))
		.WillOnce(Return(agent_reply("{\"exited\":false}")));
	Guest_agent agent(domain);
	auto output = agent.exec("/usr/bin/true");
	EXPECT_FALSE(output.exited);
	EXPECT_FALSE(output.exitcode);
}

TEST_F(Guest_agent_test, exec_timeout_reports_pid)
{
	ON_CALL(*domain, agent_command(HasSubstr("guest-exec-status"), _))
		.WillByDefault(Return(agent_reply("{\"exited\":false}")));
	Guest_agent agent(domain, 1);
	try {
		agent.exec("/bin/sleep", {"100"}, {}, boost::none, true, true, true);
		FAIL() << "expected a guest_agent_timeout error";
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::guest_agent_timeout);
		EXPECT_EQ(e.pid(), 42);
		EXPECT_DOUBLE_EQ(e.timeout(), 1);
		EXPECT_EQ(std::string(e.what()), "QEMU timeout (1 sec) exceeded");
	}
	ASSERT_TRUE(agent.last_pid());
	EXPECT_EQ(*agent.last_pid(), 42);
}
