/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "hypervisor.hpp"

namespace compute {

std::string to_string(Domain_state state)
{
	switch (state) {
	case Domain_state::nostate:
		return "nostate";
	case Domain_state::running:
		return "running";
	case Domain_state::blocked:
		return "blocked";
	case Domain_state::paused:
		return "paused";
	case Domain_state::shutdown:
		return "shutdown";
	case Domain_state::shutoff:
		return "shutoff";
	case Domain_state::crashed:
		return "crashed";
	case Domain_state::pmsuspended:
		return "pmsuspended";
	}
	return "nostate";
}

} // namespace compute
