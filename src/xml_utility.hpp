/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef XML_UTILITY_HPP
#define XML_UTILITY_HPP

#include <boost/property_tree/ptree.hpp>

#include <string>

namespace compute {

// Convert xml string to ptree.
boost::property_tree::ptree read_xml_from_string(const std::string &str);

// Convert ptree to xml string.
std::string write_xml_to_string(const boost::property_tree::ptree &ptree, bool pretty = true);

// Read an attribute of the node at path, empty if the node or attribute is missing.
std::string get_attribute(const boost::property_tree::ptree &pt, const std::string &path, const std::string &attribute);

} // namespace compute

#endif
