/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "ids.hpp"

#include "errors.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cstdio>
#include <random>

namespace compute {

std::string random_mac()
{
	static std::random_device rd;
	std::uniform_int_distribution<unsigned int> byte(0x00, 0xff);
	char mac[18];
	std::snprintf(mac, sizeof(mac), "00:16:3e:%02x:%02x:%02x", byte(rd) & 0x7f, byte(rd), byte(rd));
	return mac;
}

std::string random_uuid()
{
	static boost::uuids::random_generator generator;
	return boost::uuids::to_string(generator());
}

std::string next_disk_target(const std::vector<std::string> &used, const std::string &prefix, bool from_end)
{
	std::string free_letters;
	for (char letter = 'a'; letter <= 'z'; ++letter) {
		auto name = prefix + letter;
		if (std::find(used.begin(), used.end(), name) == used.end())
			free_letters.push_back(letter);
	}
	if (free_letters.empty())
		throw Compute_error(Error_kind::invalid_argument, "No free disk target left with prefix '" + prefix + "'.");
	return prefix + (from_end ? free_letters.back() : free_letters.front());
}

} // namespace compute
