/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "utility.hpp"

#include <libvirt/virterror.h>

#include <cstdlib>

namespace compute {

std::string convert_and_free_cstr(char *cstr)
{
	std::string str;
	if (cstr) {
		str.assign(cstr);
		free(cstr);
	}
	return str;
}

std::string last_error_message()
{
	auto err = virGetLastError();
	if (!err || !err->message)
		return "unknown libvirt error";
	return err->message;
}

int last_error_code()
{
	auto err = virGetLastError();
	return err ? err->code : VIR_ERR_OK;
}

void silence_libvirt_errors()
{
	virSetErrorFunc(nullptr, [](void *, virErrorPtr) {});
}

} // namespace compute
