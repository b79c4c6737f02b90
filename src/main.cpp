/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "commands.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "session.hpp"

#include <boost/program_options.hpp>

#include <unistd.h>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

extern char **environ;

namespace {

void handle_interrupt(int)
{
	_exit(130);
}

void print_usage(std::ostream &os, const boost::program_options::options_description &desc)
{
	os << "Usage: compute [options] COMMAND [ARGS]" << std::endl << std::endl;
	os << desc << std::endl;
	compute::cli::print_commands(os);
}

} // namespace

int main(int argc, char *argv[])
{
	std::signal(SIGINT, handle_interrupt);

	// Everything after "--" belongs to the command run in the guest.
	std::vector<std::string> args;
	std::vector<std::string> guest_args;
	bool after_separator = false;
	for (int i = 1; i != argc; ++i) {
		std::string arg = argv[i];
		if (!after_separator && arg == "--")
			after_separator = true;
		else if (after_separator)
			guest_args.push_back(arg);
		else
			args.push_back(arg);
	}

	try {
		namespace po = boost::program_options;
		po::options_description desc("Options");
		desc.add_options()
			("help,h", "produce help message")
			("config,c", po::value<std::string>()->default_value(compute::Config::default_path), "path to config file")
			("connect", po::value<std::string>(), "libvirt connection uri")
			("log,l", po::value<std::string>(), "path to log file")
			("log-level", po::value<std::string>(), "log level: trace, debug, info, warn, error, critical");
		po::options_description hidden;
		hidden.add_options()
			("command", po::value<std::string>())
			("subargs", po::value<std::vector<std::string>>());
		po::options_description all;
		all.add(desc).add(hidden);
		po::positional_options_description positional;
		positional.add("command", 1).add("subargs", -1);

		// Options after the command name are left to the command.
		auto parsed = po::command_line_parser(args).options(all).positional(positional)
			.allow_unregistered().run();
		po::variables_map vm;
		po::store(parsed, vm);
		po::notify(vm);
		if (vm.count("help")) {
			print_usage(std::cout, desc);
			return EXIT_SUCCESS;
		}
		if (!vm.count("command")) {
			print_usage(std::cerr, desc);
			return EXIT_FAILURE;
		}
		auto command_name = vm["command"].as<std::string>();
		auto command = compute::cli::commands().find(command_name);
		if (command == compute::cli::commands().end()) {
			std::cerr << "error: unknown command " << command_name << std::endl;
			return EXIT_FAILURE;
		}
		compute::cli::Command_args command_args;
		command_args.args = po::collect_unrecognized(parsed.options, po::include_positional);
		command_args.args.erase(command_args.args.begin());
		command_args.guest_args = guest_args;

		auto config = compute::load_config(vm["config"].as<std::string>(), compute::environment_map(environ));
		if (vm.count("connect"))
			config.libvirt_uri = vm["connect"].as<std::string>();
		if (vm.count("log"))
			config.log_file = vm["log"].as<std::string>();
		if (vm.count("log-level"))
			config.log_level = compute::parse_log_level(vm["log-level"].as<std::string>());
		compute::set_log_level(config.log_level);
		std::ofstream log_file;
		std::unique_ptr<compute::Log_redirect> log_redirect;
		if (!config.log_file.empty()) {
			log_file.open(config.log_file, std::ios::app);
			if (!log_file) {
				std::cerr << "error: Cannot open " << config.log_file << " (" << strerror(errno) << ")." << std::endl;
				return EXIT_FAILURE;
			}
			log_redirect.reset(new compute::Log_redirect(log_file));
		}

		auto session = compute::Session::open(config);
		return command->second.run(session, command_args);
	} catch (const compute::Compute_error &e) {
		if (e.kind() == compute::Error_kind::validation) {
			for (const auto &error : e.field_errors())
				std::cerr << "validation error: " << error.path << ": " << error.message << std::endl;
		} else {
			std::cerr << "error: " << e.what() << std::endl;
		}
	} catch (const std::exception &e) {
		std::cerr << "error: " << e.what() << std::endl;
	}
	return EXIT_FAILURE;
}
