/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "guest_agent.hpp"

#include "encoding.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <cmath>
#include <sstream>
#include <thread>

FASTLIB_LOG_INIT(guest_agent_log, "Guest_agent")
FASTLIB_LOG_SET_LEVEL_GLOBAL(guest_agent_log, trace);

namespace compute {

constexpr std::chrono::milliseconds Guest_agent::poll_interval;

//
// Helper functions
//

namespace {

std::string write_json(const Json::Value &value)
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	return Json::writeString(builder, value);
}

Json::Value read_json(const std::string &str)
{
	Json::CharReaderBuilder builder;
	Json::Value value;
	std::string errs;
	std::istringstream ss(str);
	if (!Json::parseFromStream(builder, ss, &value, &errs))
		throw Compute_error(Error_kind::guest_agent, "Malformed guest agent reply: " + errs);
	return value;
}

Guest_exec_output to_exec_output(const Json::Value &status, bool decode_output)
{
	Guest_exec_output output;
	output.exited = status.get("exited", false).asBool();
	if (status.isMember("exitcode"))
		output.exitcode = status["exitcode"].asInt();
	if (status.isMember("signal"))
		output.signal = status["signal"].asInt();
	output.stdout_data = status.get("out-data", "").asString();
	output.stderr_data = status.get("err-data", "").asString();
	if (decode_output) {
		output.stdout_data = base64_decode(output.stdout_data);
		output.stderr_data = base64_decode(output.stderr_data);
	}
	return output;
}

} // namespace

//
// Guest_agent implementation
//

Guest_agent::Guest_agent(std::shared_ptr<Domain_handle> domain, double timeout) :
	domain(std::move(domain)),
	timeout_seconds(timeout)
{
}

double Guest_agent::timeout() const
{
	return timeout_seconds;
}

boost::optional<long long> Guest_agent::last_pid() const
{
	return pid;
}

Json::Value Guest_agent::execute(const std::string &command, const Json::Value &arguments)
{
	Json::Value request;
	request["execute"] = command;
	if (!arguments.isNull())
		request["arguments"] = arguments;
	auto request_str = write_json(request);
	COMPUTE_LOG(guest_agent_log, debug) << "Send to " << domain->name() << ": " << request_str;
	auto reply_str = domain->agent_command(request_str, static_cast<int>(std::ceil(timeout_seconds)));
	COMPUTE_LOG(guest_agent_log, debug) << "Reply from " << domain->name() << ": " << reply_str;
	auto reply = read_json(reply_str);
	if (reply.isMember("error")) {
		const auto &error = reply["error"];
		throw Compute_error(Error_kind::guest_agent, "Guest agent command '" + command + "' failed: "
				+ error.get("desc", error.get("class", "unknown error").asString()).asString());
	}
	return reply["return"];
}

bool Guest_agent::is_available()
{
	try {
		execute("guest-ping");
	} catch (const Compute_error &e) {
		if (!e.is_guest_agent_error())
			throw;
		COMPUTE_LOG(guest_agent_log, debug) << "Guest agent of " << domain->name() << " is not available: " << e.what();
		return false;
	}
	return true;
}

std::set<std::string> Guest_agent::supported_commands()
{
	auto info = execute("guest-info");
	std::set<std::string> commands;
	for (const auto &command : info["supported_commands"]) {
		if (command.get("enabled", false).asBool())
			commands.insert(command["name"].asString());
	}
	return commands;
}

void Guest_agent::ensure_supported(const std::vector<std::string> &commands)
{
	auto supported = supported_commands();
	for (const auto &command : commands) {
		if (supported.count(command) == 0)
			throw Compute_error::command_not_supported(command);
	}
}

Guest_exec_output Guest_agent::exec(const std::string &path,
		const std::vector<std::string> &args,
		const std::vector<std::string> &env,
		const boost::optional<std::string> &input,
		bool capture_output,
		bool decode_output,
		bool poll)
{
	ensure_supported({"guest-exec", "guest-exec-status"});
	Json::Value arguments;
	arguments["path"] = path;
	arguments["arg"] = Json::Value(Json::arrayValue);
	for (const auto &arg : args)
		arguments["arg"].append(arg);
	arguments["env"] = Json::Value(Json::arrayValue);
	for (const auto &var : env)
		arguments["env"].append(var);
	if (input)
		arguments["input-data"] = base64_encode(*input);
	arguments["capture-output"] = capture_output;
	auto reply = execute("guest-exec", arguments);
	if (!reply.isMember("pid"))
		throw Compute_error(Error_kind::guest_agent, "Guest agent did not report a pid for '" + path + "'.");
	pid = reply["pid"].asInt64();
	COMPUTE_LOG(guest_agent_log, trace) << "Started '" << path << "' in " << domain->name() << " with pid " << *pid << ".";
	return exec_status(*pid, decode_output, poll);
}

Guest_exec_output Guest_agent::exec_status(long long pid, bool decode_output, bool poll)
{
	Json::Value arguments;
	arguments["pid"] = static_cast<Json::Int64>(pid);
	auto start = std::chrono::steady_clock::now();
	const std::chrono::duration<double> timeout(timeout_seconds);
	while (true) {
		auto status = execute("guest-exec-status", arguments);
		if (!poll || status.get("exited", false).asBool())
			return to_exec_output(status, decode_output);
		if (std::chrono::steady_clock::now() - start > timeout)
			throw Compute_error::guest_agent_timeout(timeout_seconds, pid);
		std::this_thread::sleep_for(poll_interval);
	}
}

} // namespace compute
