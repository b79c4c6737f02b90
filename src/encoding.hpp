/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef ENCODING_HPP
#define ENCODING_HPP

#include <string>

namespace compute {

// Standard base64 with padding.
std::string base64_encode(const std::string &data);

// Whitespace is ignored. Throws Compute_error (invalid_argument) on malformed input.
std::string base64_decode(const std::string &data);

} // namespace compute

#endif
