/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace compute {

/**
 * \brief Kinds of failures reported by the compute library.
 *
 * Callers dispatch on the kind instead of on exception subclasses.
 */
enum class Error_kind
{
	config_load,
	connection,
	not_found,
	validation,
	guest_agent,
	guest_agent_unavailable,
	guest_agent_timeout,
	command_not_supported,
	invalid_device_descriptor,
	invalid_unit,
	invalid_argument,
	instance,
	storage
};

std::string to_string(Error_kind kind);

// A single violation found while validating a declarative spec.
struct Field_error
{
	std::string path;
	std::string message;

	bool operator==(const Field_error &rhs) const;
};

/**
 * \brief Exception carrying a tagged error kind and its payload.
 *
 * Only the payload accessors matching kind() return meaningful values.
 */
class Compute_error :
	public std::runtime_error
{
public:
	Compute_error(Error_kind kind, const std::string &what_arg);

	static Compute_error not_found(const std::string &what, const std::string &name);
	static Compute_error validation(std::vector<Field_error> errors);
	static Compute_error guest_agent_timeout(double seconds, long long pid);
	static Compute_error command_not_supported(const std::string &command);
	static Compute_error invalid_device_descriptor(const std::string &reason, const std::string &fragment);

	Error_kind kind() const noexcept;
	// True for guest_agent and the more specific guest agent kinds.
	bool is_guest_agent_error() const noexcept;

	const std::vector<Field_error> & field_errors() const noexcept;
	double timeout() const noexcept;
	long long pid() const noexcept;
	const std::string & command() const noexcept;
	const std::string & fragment() const noexcept;
	const std::string & resource() const noexcept;
private:
	Error_kind error_kind;
	std::vector<Field_error> errors;
	double timeout_seconds = 0;
	long long last_pid = -1;
	std::string command_name;
	std::string descriptor_fragment;
	std::string resource_name;
};

} // namespace compute

#endif
