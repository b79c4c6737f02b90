/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <fast-lib/log.hpp>

#include <ostream>
#include <string>

namespace compute {

enum class Log_level
{
	trace,
	debug,
	info,
	warn,
	error,
	critical
};

std::string to_string(Log_level level);
/**
 * \brief Parse a level name, case insensitive.
 *
 * Accepts trace, debug, info, warn, warning, error, critical, fatal and notset.
 * Throws Compute_error (invalid_argument) otherwise.
 */
Log_level parse_log_level(const std::string &str);

// Messages below level are dropped. Default is warn.
void set_log_level(Log_level level);
Log_level log_level();
bool log_enabled(Log_level level);

/**
 * \brief Sends all log channels to a stream instead of the standard log stream.
 *
 * Command output on stdout and errors on stderr are not affected. The previous
 * destination is restored on destruction.
 */
class Log_redirect
{
public:
	explicit Log_redirect(std::ostream &os);
	~Log_redirect();

	Log_redirect(const Log_redirect &) = delete;
	Log_redirect & operator=(const Log_redirect &) = delete;
private:
	std::streambuf *previous;
};

} // namespace compute

/**
 * \def COMPUTE_LOG(LOGGER, SEVERITY)
 * Stream to the fast-lib channel \a LOGGER if \a SEVERITY passes the level set with set_log_level().
 * \example COMPUTE_LOG(instance_log, warn) << "Disk " << target << " is already attached.";
 */
#define COMPUTE_LOG(LOGGER, SEVERITY) \
	if (!::compute::log_enabled(::compute::Log_level::SEVERITY)) {} else FASTLIB_LOG(LOGGER, SEVERITY)

#endif
