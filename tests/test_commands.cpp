/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "commands.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace compute::cli;

TEST(Commands, shell_join)
{
	EXPECT_EQ(shell_join({"ls", "-la", "/tmp"}), "ls -la /tmp");
	EXPECT_EQ(shell_join({"echo", "hello world"}), "echo 'hello world'");
	EXPECT_EQ(shell_join({"echo", "it's"}), "echo 'it'\"'\"'s'");
	EXPECT_EQ(shell_join({"printf", ""}), "printf ''");
	EXPECT_EQ(shell_join({"echo", "$HOME"}), "echo '$HOME'");
}

TEST(Commands, print_table)
{
	std::ostringstream os;
	print_table(os, {"NAME", "STATE"}, {{"vm1", "running"}, {"database", "shutoff"}});
	EXPECT_EQ(os.str(),
		"NAME      STATE\n"
		"vm1       running\n"
		"database  shutoff\n");
}

TEST(Commands, all_commands_registered)
{
	for (const auto &name : {"init", "ls", "lsdisks", "start", "shutdown", "reboot", "reset", "powrst",
			"pause", "resume", "status", "setvcpus", "setmem", "setpass", "setcdrom", "setcloudinit",
			"delete", "exec"})
		EXPECT_EQ(commands().count(name), 1u) << name;
	std::ostringstream os;
	print_commands(os);
	EXPECT_NE(os.str().find("setcloudinit"), std::string::npos);
}
