/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef UTILITY_HPP
#define UTILITY_HPP

#include <libvirt/libvirt.h>

#include <string>

namespace compute {

//
// Some deleter to be used with smart pointers.
//

struct Deleter_virConnect
{
	void operator()(virConnectPtr ptr) const
	{
		if (ptr)
			virConnectClose(ptr);
	}
};

struct Deleter_virDomain
{
	void operator()(virDomainPtr ptr) const
	{
		if (ptr)
			virDomainFree(ptr);
	}
};

struct Deleter_virStoragePool
{
	void operator()(virStoragePoolPtr ptr) const
	{
		if (ptr)
			virStoragePoolFree(ptr);
	}
};

struct Deleter_virStorageVol
{
	void operator()(virStorageVolPtr ptr) const
	{
		if (ptr)
			virStorageVolFree(ptr);
	}
};

// Libvirt sometimes returns a dynamically allocated cstring.
// As we prefer std::string this function converts and frees.
std::string convert_and_free_cstr(char *cstr);

// Message of the last libvirt error of this thread or a placeholder.
std::string last_error_message();

// Code of the last libvirt error of this thread or VIR_ERR_OK.
int last_error_code();

// Keep libvirt from printing errors to stderr, they are reported through exceptions.
void silence_libvirt_errors();

} // namespace compute

#endif
