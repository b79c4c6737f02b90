/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef GUEST_AGENT_HPP
#define GUEST_AGENT_HPP

#include "hypervisor.hpp"

#include <json/json.h>
#include <boost/optional.hpp>

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace compute {

struct Guest_exec_output
{
	bool exited = false;
	boost::optional<int> exitcode;
	boost::optional<int> signal;
	// Base64 encoded unless decoding was requested.
	std::string stdout_data;
	std::string stderr_data;
};

/**
 * \brief Client for the QEMU guest agent running inside a domain.
 *
 * Commands are sent through the hypervisor. Apart from the pid of the last
 * started guest process no state is kept between calls.
 */
class Guest_agent
{
public:
	static constexpr std::chrono::milliseconds poll_interval{300};

	/**
	 * \param domain The domain the agent runs in.
	 * \param timeout Seconds to wait for a reply and for polled processes to exit.
	 */
	explicit Guest_agent(std::shared_ptr<Domain_handle> domain, double timeout = 60);

	double timeout() const;
	// Pid of the last process started with exec(), if any.
	boost::optional<long long> last_pid() const;

	/**
	 * \brief Send a command and return the "return" member of the reply.
	 *
	 * Throws Compute_error (guest_agent_unavailable) if the agent does not respond
	 * and Compute_error (guest_agent) if the agent reports an error.
	 */
	Json::Value execute(const std::string &command, const Json::Value &arguments = Json::Value(Json::nullValue));

	// Ping the agent. Guest agent errors result in false instead of an exception.
	bool is_available();
	// Names of the enabled commands.
	std::set<std::string> supported_commands();
	// Throws Compute_error (command_not_supported) for the first missing command.
	void ensure_supported(const std::vector<std::string> &commands);

	/**
	 * \brief Start a process in the guest and query its status.
	 *
	 * The pid is remembered before the status is queried.
	 * \param path Executable inside the guest.
	 * \param args Arguments without argv[0].
	 * \param env Environment entries in the form KEY=VALUE.
	 * \param input Data written to the stdin of the process.
	 * \param capture_output Let the agent collect stdout and stderr.
	 * \param decode_output Decode stdout and stderr from base64.
	 * \param poll Wait until the process exited, see exec_status().
	 */
	Guest_exec_output exec(const std::string &path,
			const std::vector<std::string> &args = {},
			const std::vector<std::string> &env = {},
			const boost::optional<std::string> &input = boost::none,
			bool capture_output = false,
			bool decode_output = false,
			bool poll = false);
	/**
	 * \brief Query the status of a guest process.
	 *
	 * With poll the status is requested every poll_interval until the process
	 * exited. Throws Compute_error (guest_agent_timeout) carrying the pid once
	 * timeout() seconds have passed.
	 */
	Guest_exec_output exec_status(long long pid, bool decode_output = false, bool poll = false);
private:
	std::shared_ptr<Domain_handle> domain;
	double timeout_seconds;
	boost::optional<long long> pid;
};

} // namespace compute

#endif
