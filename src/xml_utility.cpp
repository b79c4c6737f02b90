/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "xml_utility.hpp"

#include <boost/property_tree/xml_parser.hpp>

#include <sstream>

namespace compute {

boost::property_tree::ptree read_xml_from_string(const std::string &str)
{
	boost::property_tree::ptree pt;
	std::stringstream ss(str);
	read_xml(ss, pt, boost::property_tree::xml_parser::trim_whitespace);
	return pt;
}

std::string write_xml_to_string(const boost::property_tree::ptree &ptree, bool pretty)
{
	std::stringstream ss;
	if (pretty) {
		boost::property_tree::xml_parser::xml_writer_settings<std::string> settings(' ', 2);
		write_xml(ss, ptree, settings);
	} else {
		write_xml(ss, ptree);
	}
	return ss.str();
}

std::string get_attribute(const boost::property_tree::ptree &pt, const std::string &path, const std::string &attribute)
{
	auto key = (path.empty() ? "" : path + ".") + "<xmlattr>." + attribute;
	auto value = pt.get_optional<std::string>(key);
	return value ? *value : "";
}

} // namespace compute
