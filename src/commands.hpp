/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include "session.hpp"

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace compute {
namespace cli {

struct Command_args
{
	// Arguments following the command name.
	std::vector<std::string> args;
	// Arguments after "--", passed to the guest by exec.
	std::vector<std::string> guest_args;
};

struct Command
{
	std::string synopsis;
	std::string description;
	// Returns the process exit code.
	std::function<int(Session &, const Command_args &)> run;
};

const std::map<std::string, Command> & commands();

// Help text listing all commands.
void print_commands(std::ostream &os);

// Quote arguments for a POSIX shell and join them with spaces.
std::string shell_join(const std::vector<std::string> &args);

// Print rows as left aligned columns.
void print_table(std::ostream &os, const std::vector<std::string> &header,
		const std::vector<std::vector<std::string>> &rows);

} // namespace cli
} // namespace compute

#endif
