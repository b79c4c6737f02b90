/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "commands.hpp"

#include "cloud_init.hpp"
#include "descriptors.hpp"
#include "errors.hpp"
#include "guest_agent.hpp"
#include "ids.hpp"
#include "logging.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <regex>
#include <sstream>

FASTLIB_LOG_INIT(commands_log, "Commands")
FASTLIB_LOG_SET_LEVEL_GLOBAL(commands_log, trace);

namespace po = boost::program_options;

namespace compute {
namespace cli {

namespace {

po::variables_map parse(const std::vector<std::string> &args, const po::options_description &desc,
		const po::positional_options_description &positional)
{
	po::variables_map vm;
	po::store(po::command_line_parser(args).options(desc).positional(positional).run(), vm);
	po::notify(vm);
	return vm;
}

template<typename T = std::string>
T required(const po::variables_map &vm, const std::string &name)
{
	if (!vm.count(name))
		throw Compute_error(Error_kind::invalid_argument, "missing argument " + name);
	return vm[name].as<T>();
}

std::string read_file(const std::string &path)
{
	std::ifstream file(path);
	if (!file)
		throw Compute_error(Error_kind::invalid_argument, "Cannot read file " + path);
	return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string join_path(const std::string &dir, const std::string &name)
{
	if (!dir.empty() && dir.back() == '/')
		return dir + name;
	return dir + "/" + name;
}

bool confirm(const std::string &question)
{
	std::cout << question << " [y/N] " << std::flush;
	std::string answer;
	if (!std::getline(std::cin, answer))
		return false;
	boost::algorithm::trim(answer);
	return answer == "y" || answer == "Y" || answer == "yes";
}

std::vector<std::string> targets_of(const std::vector<Disk_config> &disks)
{
	std::vector<std::string> targets;
	for (const auto &disk : disks)
		targets.push_back(disk.target);
	return targets;
}

// Commands which take only the instance name and call one method on it.
Command instance_action(const std::string &description, void (Instance::*action)())
{
	return Command{"NAME", description, [action](Session &session, const Command_args &cmd) {
		po::options_description desc;
		desc.add_options()("name", po::value<std::string>());
		po::positional_options_description positional;
		positional.add("name", 1);
		auto vm = parse(cmd.args, desc, positional);
		auto instance = session.get_instance(required(vm, "name"));
		(instance.*action)();
		return EXIT_SUCCESS;
	}};
}

int init(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()
		("file", po::value<std::string>())
		("test", "print the completed instance description and exit")
		("start", "start the instance after creation");
	po::positional_options_description positional;
	positional.add("file", 1);
	auto vm = parse(cmd.args, desc, positional);

	auto file = required(vm, "file");
	Partial_instance_spec partial;
	try {
		partial.from_string(read_file(file));
	} catch (const YAML::Exception &e) {
		throw Compute_error(Error_kind::invalid_argument, "Cannot parse " + file + ": " + e.what());
	}

	if (vm.count("test")) {
		auto spec = build_instance_spec(partial, session.spec_defaults());
		std::cout << to_yaml(spec) << std::endl;
		return EXIT_SUCCESS;
	}
	auto instance = session.create_instance(partial);
	std::cout << "Initialised: " << instance.name() << std::endl;
	if (vm.count("start")) {
		instance.start();
		std::cout << "Started: " << instance.name() << std::endl;
	}
	return EXIT_SUCCESS;
}

int ls(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	po::positional_options_description positional;
	parse(cmd.args, desc, positional);

	std::vector<std::vector<std::string>> rows;
	for (auto &instance : session.list_instances()) {
		auto info = instance.info();
		rows.push_back({
			instance.name(),
			to_string(info.state),
			std::to_string(info.nr_virt_cpu),
			std::to_string(info.memory / 1024) + " MiB"
		});
	}
	print_table(std::cout, {"NAME", "STATE", "NVCPUS", "MEMORY"}, rows);
	return EXIT_SUCCESS;
}

int lsdisks(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()
		("name", po::value<std::string>())
		("persistent", "list the disks of the persistent configuration");
	po::positional_options_description positional;
	positional.add("name", 1);
	auto vm = parse(cmd.args, desc, positional);

	auto instance = session.get_instance(required(vm, "name"));
	std::vector<std::vector<std::string>> rows;
	for (const auto &disk : instance.list_disks(vm.count("persistent") != 0))
		rows.push_back({disk.target, disk.source});
	print_table(std::cout, {"TARGET", "SOURCE"}, rows);
	return EXIT_SUCCESS;
}

int shutdown(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()
		("name", po::value<std::string>())
		("soft", "use the guest agent, fall back to ACPI")
		("normal", "send an ACPI power button event (default)")
		("hard", "destroy the domain gracefully")
		("unsafe", "destroy the domain immediately");
	po::positional_options_description positional;
	positional.add("name", 1);
	auto vm = parse(cmd.args, desc, positional);

	std::string method = "normal";
	unsigned int selected = 0;
	for (const auto &candidate : {"soft", "normal", "hard", "unsafe"}) {
		if (vm.count(candidate)) {
			method = candidate;
			++selected;
		}
	}
	if (selected > 1)
		throw Compute_error(Error_kind::invalid_argument, "only one shutdown method may be given");
	auto instance = session.get_instance(required(vm, "name"));
	instance.shutdown(method);
	return EXIT_SUCCESS;
}

int status(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()("name", po::value<std::string>());
	po::positional_options_description positional;
	positional.add("name", 1);
	auto vm = parse(cmd.args, desc, positional);

	auto instance = session.get_instance(required(vm, "name"));
	std::cout << to_string(instance.status()) << std::endl;
	return EXIT_SUCCESS;
}

int setvcpus(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()
		("name", po::value<std::string>())
		("nvcpus", po::value<long long>());
	po::positional_options_description positional;
	positional.add("name", 1).add("nvcpus", 1);
	auto vm = parse(cmd.args, desc, positional);

	auto instance = session.get_instance(required(vm, "name"));
	instance.set_vcpus(required<long long>(vm, "nvcpus"), true);
	return EXIT_SUCCESS;
}

int setmem(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()
		("name", po::value<std::string>())
		("memory", po::value<long long>());
	po::positional_options_description positional;
	positional.add("name", 1).add("memory", 1);
	auto vm = parse(cmd.args, desc, positional);

	auto instance = session.get_instance(required(vm, "name"));
	instance.set_memory(required<long long>(vm, "memory"), true);
	return EXIT_SUCCESS;
}

int setpass(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()
		("name", po::value<std::string>())
		("user", po::value<std::string>())
		("password", po::value<std::string>())
		("encrypted", "the password is already encrypted");
	po::positional_options_description positional;
	positional.add("name", 1).add("user", 1).add("password", 1);
	auto vm = parse(cmd.args, desc, positional);

	auto instance = session.get_instance(required(vm, "name"));
	instance.set_user_password(required(vm, "user"), required(vm, "password"), vm.count("encrypted") != 0);
	return EXIT_SUCCESS;
}

int setcdrom(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()
		("name", po::value<std::string>())
		("source", po::value<std::string>())
		("detach", "detach the CDROM using source instead of attaching it");
	po::positional_options_description positional;
	positional.add("name", 1).add("source", 1);
	auto vm = parse(cmd.args, desc, positional);

	auto instance = session.get_instance(required(vm, "name"));
	auto source = required(vm, "source");
	auto disks = instance.list_disks(true);
	if (vm.count("detach")) {
		for (const auto &disk : disks) {
			if (disk.device != "cdrom" || disk.source != source)
				continue;
			instance.detach_disk(disk.target);
			std::cout << "disk '" << disk.target << "' detached, perform power reset to apply changes" << std::endl;
		}
		return EXIT_SUCCESS;
	}
	Disk_config cdrom;
	cdrom.device = "cdrom";
	cdrom.driver.type = "raw";
	cdrom.driver.cache = "writethrough";
	cdrom.source = source;
	cdrom.target = next_disk_target(targets_of(disks), "hd");
	cdrom.bus = "ide";
	cdrom.is_readonly = true;
	instance.attach_device(cdrom);
	std::cout << "CDROM attached as disk '" << cdrom.target << "', perform power reset to apply changes" << std::endl;
	return EXIT_SUCCESS;
}

int setcloudinit(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()
		("name", po::value<std::string>())
		("user-data", po::value<std::string>(), "file with user-data")
		("vendor-data", po::value<std::string>(), "file with vendor-data")
		("network-config", po::value<std::string>(), "file with network-config")
		("meta-data", po::value<std::string>(), "file with meta-data");
	po::positional_options_description positional;
	positional.add("name", 1);
	auto vm = parse(cmd.args, desc, positional);

	auto instance = session.get_instance(required(vm, "name"));
	Cloud_init_spec spec;
	if (vm.count("user-data"))
		spec.user_data = read_file(vm["user-data"].as<std::string>());
	if (vm.count("vendor-data"))
		spec.vendor_data = read_file(vm["vendor-data"].as<std::string>());
	if (vm.count("network-config"))
		spec.network_config = read_file(vm["network-config"].as<std::string>());
	if (vm.count("meta-data"))
		spec.meta_data = read_file(vm["meta-data"].as<std::string>());
	if (!spec.user_data && !spec.vendor_data && !spec.network_config && !spec.meta_data) {
		std::cout << "nothing to do" << std::endl;
		return EXIT_SUCCESS;
	}

	Cloud_init cloud_init(spec);
	auto disks = instance.list_disks();
	for (const auto &disk : disks) {
		if (boost::algorithm::ends_with(disk.source, "cloud-init.img")) {
			COMPUTE_LOG(commands_log, trace) << "Update cloud-init disk " << disk.source << ".";
			cloud_init.update_disk(disk.source);
			return EXIT_SUCCESS;
		}
	}
	auto pool = session.volumes_pool();
	auto path = join_path(pool.path(), Cloud_init::disk_name(instance.name()));
	COMPUTE_LOG(commands_log, trace) << "Create cloud-init disk " << path << ".";
	cloud_init.create_disk(path);
	pool.refresh();
	cloud_init.attach_disk(path, next_disk_target(targets_of(disks), "vd"), instance);
	return EXIT_SUCCESS;
}

int delete_instance(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()
		("name", po::value<std::string>())
		("yes,y", "do not ask for confirmation")
		("save-volumes", "keep the volumes of the instance");
	po::positional_options_description positional;
	positional.add("name", 1);
	auto vm = parse(cmd.args, desc, positional);

	auto instance = session.get_instance(required(vm, "name"));
	if (!vm.count("yes") && !confirm("this action is irreversible, continue?"))
		return EXIT_SUCCESS;
	instance.remove(!vm.count("save-volumes"));
	return EXIT_SUCCESS;
}

int exec(Session &session, const Command_args &cmd)
{
	po::options_description desc;
	desc.add_options()
		("name", po::value<std::string>())
		("executable,e", po::value<std::string>()->default_value("/bin/sh"), "executable in the guest")
		("env", po::value<std::vector<std::string>>(), "environment entry KEY=VALUE, may be repeated")
		("no-join-args", "pass the arguments to the executable as they are")
		("timeout,t", po::value<double>()->default_value(60), "seconds to wait for the command");
	po::positional_options_description positional;
	positional.add("name", 1);
	auto vm = parse(cmd.args, desc, positional);

	auto name = required(vm, "name");
	std::vector<std::string> env;
	if (vm.count("env"))
		env = vm["env"].as<std::vector<std::string>>();
	auto args = cmd.guest_args;
	if (!vm.count("no-join-args") && !args.empty())
		args = {"-c", shell_join(args)};
	boost::optional<std::string> input;
	if (!isatty(STDIN_FILENO))
		input = std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());

	Guest_agent agent(session.connection().lookup_domain(name), vm["timeout"].as<double>());
	Guest_exec_output output;
	try {
		output = agent.exec(vm["executable"].as<std::string>(), args, env, input, true, true, true);
	} catch (const Compute_error &e) {
		if (e.kind() != Error_kind::guest_agent_timeout)
			throw;
		std::cerr << "error: " << e.what() << ". NOTE: command may still running in guest, PID="
			<< e.pid() << std::endl;
		return EXIT_FAILURE;
	}
	if (!output.stderr_data.empty())
		std::cerr << boost::algorithm::trim_copy(output.stderr_data) << std::endl;
	if (!output.stdout_data.empty())
		std::cout << boost::algorithm::trim_copy(output.stdout_data) << std::endl;
	if (output.exitcode)
		return *output.exitcode;
	if (output.signal)
		return 128 + *output.signal;
	return EXIT_SUCCESS;
}

} // namespace

const std::map<std::string, Command> & commands()
{
	static const std::map<std::string, Command> table = {
		{"init", {"FILE [--test] [--start]", "create an instance from a YAML description", init}},
		{"ls", {"", "list instances", ls}},
		{"lsdisks", {"NAME [--persistent]", "list the disks of an instance", lsdisks}},
		{"start", instance_action("start an instance", &Instance::start)},
		{"shutdown", {"NAME [--soft|--normal|--hard|--unsafe]", "stop an instance", shutdown}},
		{"reboot", instance_action("reboot an instance", &Instance::reboot)},
		{"reset", instance_action("reset an instance", &Instance::reset)},
		{"powrst", instance_action("power off and start an instance", &Instance::power_reset)},
		{"pause", instance_action("pause a running instance", &Instance::pause)},
		{"resume", instance_action("resume a paused instance", &Instance::resume)},
		{"status", {"NAME", "print the state of an instance", status}},
		{"setvcpus", {"NAME NVCPUS", "change the number of vCPUs", setvcpus}},
		{"setmem", {"NAME MEMORY", "change the memory size in MiB", setmem}},
		{"setpass", {"NAME USER PASSWORD [--encrypted]", "set a password in the guest", setpass}},
		{"setcdrom", {"NAME SOURCE [--detach]", "attach or detach a CDROM", setcdrom}},
		{"setcloudinit", {"NAME [--user-data F] [--vendor-data F] [--network-config F] [--meta-data F]",
				"create or update the cloud-init disk", setcloudinit}},
		{"delete", {"NAME [--yes] [--save-volumes]", "delete an instance and its volumes", delete_instance}},
		{"exec", {"NAME [--executable PATH] [--env KEY=VALUE]... [--no-join-args] [--timeout S] -- ARGS",
				"run a command in the guest", exec}}
	};
	return table;
}

void print_commands(std::ostream &os)
{
	os << "Commands:" << std::endl;
	for (const auto &entry : commands()) {
		os << "  " << std::left << std::setw(14) << entry.first << entry.second.description << std::endl;
		if (!entry.second.synopsis.empty())
			os << "  " << std::setw(14) << "" << "compute " << entry.first << " " << entry.second.synopsis << std::endl;
	}
}

std::string shell_join(const std::vector<std::string> &args)
{
	static const std::regex safe("[A-Za-z0-9@%+=:,./_-]+");
	std::string joined;
	for (const auto &arg : args) {
		if (!joined.empty())
			joined += " ";
		if (std::regex_match(arg, safe)) {
			joined += arg;
			continue;
		}
		joined += "'";
		for (auto c : arg) {
			if (c == '\'')
				joined += "'\"'\"'";
			else
				joined += c;
		}
		joined += "'";
	}
	return joined;
}

void print_table(std::ostream &os, const std::vector<std::string> &header,
		const std::vector<std::vector<std::string>> &rows)
{
	std::vector<size_t> widths;
	for (const auto &title : header)
		widths.push_back(title.size());
	for (const auto &row : rows)
		for (size_t i = 0; i < row.size() && i < widths.size(); ++i)
			widths[i] = std::max(widths[i], row[i].size());

	auto print_row = [&](const std::vector<std::string> &row) {
		for (size_t i = 0; i < row.size(); ++i) {
			if (i + 1 == row.size())
				os << row[i];
			else
				os << std::left << std::setw(widths[i] + 2) << row[i];
		}
		os << std::endl;
	};
	print_row(header);
	for (const auto &row : rows)
		print_row(row);
}

} // namespace cli
} // namespace compute
