/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "errors.hpp"
#include "logging.hpp"

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

using namespace compute;

TEST(Logging, parse_level)
{
	EXPECT_EQ(parse_log_level("trace"), Log_level::trace);
	EXPECT_EQ(parse_log_level("WARNING"), Log_level::warn);
	EXPECT_EQ(parse_log_level("Fatal"), Log_level::critical);
	EXPECT_EQ(to_string(Log_level::info), "info");
	EXPECT_THROW(parse_log_level("loud"), Compute_error);
}

TEST(Logging, level_filters_messages)
{
	auto previous = log_level();
	set_log_level(Log_level::info);
	EXPECT_FALSE(log_enabled(Log_level::debug));
	EXPECT_TRUE(log_enabled(Log_level::info));
	EXPECT_TRUE(log_enabled(Log_level::error));
	set_log_level(previous);
}

TEST(Logging, redirect_keeps_command_output)
{
	auto clog_buf = std::clog.rdbuf();
	auto cout_buf = std::cout.rdbuf();
	auto cerr_buf = std::cerr.rdbuf();
	std::ostringstream log;
	{
		Log_redirect redirect(log);
		std::clog << "to the log";
		EXPECT_EQ(std::cout.rdbuf(), cout_buf);
		EXPECT_EQ(std::cerr.rdbuf(), cerr_buf);
	}
	EXPECT_EQ(std::clog.rdbuf(), clog_buf);
	EXPECT_EQ(log.str(), "to the log");
}
