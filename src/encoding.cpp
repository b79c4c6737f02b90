/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "encoding.hpp"

#include "errors.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <algorithm>
#include <cctype>

namespace compute {

std::string base64_encode(const std::string &data)
{
	using namespace boost::archive::iterators;
	using It = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;
	std::string encoded(It(data.begin()), It(data.end()));
	return encoded.append((3 - data.size() % 3) % 3, '=');
}

std::string base64_decode(const std::string &data)
{
	using namespace boost::archive::iterators;
	using It = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;
	std::string input;
	input.reserve(data.size());
	for (auto c : data) {
		if (!std::isspace(static_cast<unsigned char>(c)))
			input.push_back(c);
	}
	if (input.size() % 4 != 0)
		throw Compute_error(Error_kind::invalid_argument, "Invalid base64 input length.");
	size_t padding = 0;
	while (padding < 2 && padding < input.size() && input[input.size() - 1 - padding] == '=')
		++padding;
	// The decoder does not know padding, feed zero bits instead and cut them off afterwards.
	std::replace(input.end() - padding, input.end(), '=', 'A');
	std::string decoded;
	try {
		decoded.assign(It(input.begin()), It(input.end()));
	} catch (const dataflow_exception &e) {
		throw Compute_error(Error_kind::invalid_argument, std::string("Invalid base64 input: ") + e.what());
	}
	decoded.erase(decoded.end() - std::min(padding, decoded.size()), decoded.end());
	return decoded;
}

} // namespace compute
