/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "logging.hpp"

#include "errors.hpp"

#include <boost/algorithm/string/case_conv.hpp>

#include <atomic>
#include <iostream>

namespace compute {

namespace {

std::atomic<Log_level> current_level(Log_level::warn);

} // namespace

std::string to_string(Log_level level)
{
	switch (level) {
	case Log_level::trace:
		return "trace";
	case Log_level::debug:
		return "debug";
	case Log_level::info:
		return "info";
	case Log_level::warn:
		return "warn";
	case Log_level::error:
		return "error";
	case Log_level::critical:
		return "critical";
	}
	return "warn";
}

Log_level parse_log_level(const std::string &str)
{
	auto name = boost::algorithm::to_lower_copy(str);
	if (name == "trace" || name == "notset")
		return Log_level::trace;
	if (name == "debug")
		return Log_level::debug;
	if (name == "info")
		return Log_level::info;
	if (name == "warn" || name == "warning")
		return Log_level::warn;
	if (name == "error")
		return Log_level::error;
	if (name == "critical" || name == "fatal")
		return Log_level::critical;
	throw Compute_error(Error_kind::invalid_argument, "'" + str + "' is not a valid log level, valid levels are: "
			"trace, debug, info, warn, error, critical");
}

void set_log_level(Log_level level)
{
	current_level = level;
}

Log_level log_level()
{
	return current_level;
}

bool log_enabled(Log_level level)
{
	return static_cast<int>(level) >= static_cast<int>(current_level.load());
}

Log_redirect::Log_redirect(std::ostream &os) :
	previous(std::clog.rdbuf(os.rdbuf()))
{
}

Log_redirect::~Log_redirect()
{
	std::clog.flush();
	std::clog.rdbuf(previous);
}

} // namespace compute
