/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef IDS_HPP
#define IDS_HPP

#include <string>
#include <vector>

namespace compute {

// Random MAC address in the 00:16:3e (Xen OUI) locally used range, e.g. 00:16:3e:1a:7f:02.
std::string random_mac();

// Random UUID in canonical lowercase form.
std::string random_uuid();

/**
 * \brief Return the first free disk target name.
 *
 * next_disk_target({"vda", "vdc"}, "vd") returns "vdb".
 * \param used Target names already in use.
 * \param prefix Target prefix, e.g. "vd" or "hd".
 * \param from_end Pick the last free letter instead of the first one.
 */
std::string next_disk_target(const std::vector<std::string> &used, const std::string &prefix, bool from_end = false);

} // namespace compute

#endif
