/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "errors.hpp"

#include <sstream>

namespace compute {

std::string to_string(Error_kind kind)
{
	switch (kind) {
	case Error_kind::config_load:
		return "config load error";
	case Error_kind::connection:
		return "connection error";
	case Error_kind::not_found:
		return "not found";
	case Error_kind::validation:
		return "validation error";
	case Error_kind::guest_agent:
		return "guest agent error";
	case Error_kind::guest_agent_unavailable:
		return "guest agent unavailable";
	case Error_kind::guest_agent_timeout:
		return "guest agent timeout";
	case Error_kind::command_not_supported:
		return "guest agent command not supported";
	case Error_kind::invalid_device_descriptor:
		return "invalid device descriptor";
	case Error_kind::invalid_unit:
		return "invalid unit";
	case Error_kind::invalid_argument:
		return "invalid argument";
	case Error_kind::instance:
		return "instance error";
	case Error_kind::storage:
		return "storage error";
	}
	return "unknown error";
}

bool Field_error::operator==(const Field_error &rhs) const
{
	return path == rhs.path && message == rhs.message;
}

Compute_error::Compute_error(Error_kind kind, const std::string &what_arg) :
	std::runtime_error(what_arg),
	error_kind(kind)
{
}

Compute_error Compute_error::not_found(const std::string &what, const std::string &name)
{
	Compute_error err(Error_kind::not_found, what + " '" + name + "' not found");
	err.resource_name = name;
	return err;
}

Compute_error Compute_error::validation(std::vector<Field_error> errors)
{
	std::ostringstream ss;
	ss << errors.size() << " validation error" << (errors.size() == 1 ? "" : "s");
	for (const auto &error : errors)
		ss << "; " << error.path << ": " << error.message;
	Compute_error err(Error_kind::validation, ss.str());
	err.errors = std::move(errors);
	return err;
}

Compute_error Compute_error::guest_agent_timeout(double seconds, long long pid)
{
	std::ostringstream ss;
	ss << "QEMU timeout (" << seconds << " sec) exceeded";
	Compute_error err(Error_kind::guest_agent_timeout, ss.str());
	err.timeout_seconds = seconds;
	err.last_pid = pid;
	return err;
}

Compute_error Compute_error::command_not_supported(const std::string &command)
{
	Compute_error err(Error_kind::command_not_supported,
			"guest agent command '" + command + "' is not supported or disabled on guest");
	err.command_name = command;
	return err;
}

Compute_error Compute_error::invalid_device_descriptor(const std::string &reason, const std::string &fragment)
{
	Compute_error err(Error_kind::invalid_device_descriptor, "invalid device descriptor: " + reason);
	err.descriptor_fragment = fragment;
	return err;
}

Error_kind Compute_error::kind() const noexcept
{
	return error_kind;
}

bool Compute_error::is_guest_agent_error() const noexcept
{
	return error_kind == Error_kind::guest_agent
		|| error_kind == Error_kind::guest_agent_unavailable
		|| error_kind == Error_kind::guest_agent_timeout
		|| error_kind == Error_kind::command_not_supported;
}

const std::vector<Field_error> & Compute_error::field_errors() const noexcept
{
	return errors;
}

double Compute_error::timeout() const noexcept
{
	return timeout_seconds;
}

long long Compute_error::pid() const noexcept
{
	return last_pid;
}

const std::string & Compute_error::command() const noexcept
{
	return command_name;
}

const std::string & Compute_error::fragment() const noexcept
{
	return descriptor_fragment;
}

const std::string & Compute_error::resource() const noexcept
{
	return resource_name;
}

} // namespace compute
