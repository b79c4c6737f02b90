/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef UNITS_HPP
#define UNITS_HPP

#include <string>
#include <vector>

namespace compute {

/**
 * \brief Capacity units.
 *
 * Binary units (KiB, MiB, ...) are powers of 1024, decimal units (kB, MB, ...) powers of 1000.
 * Bit units (kbit, Mbit, ...) are decimal and eight of them make one byte.
 */
enum class Data_unit
{
	bytes,
	kib,
	mib,
	gib,
	tib,
	kb,
	mb,
	gb,
	tb,
	bits,
	kbit,
	mbit,
	gbit,
	tbit
};

std::string to_string(Data_unit unit);

// All unit names accepted by parse_data_unit().
std::vector<std::string> data_unit_names();

// Throws Compute_error (invalid_unit) listing the valid names.
Data_unit parse_data_unit(const std::string &name);

/**
 * \brief Convert a quantity to bytes.
 *
 * Exact integer arithmetic. Quantities in bit units are rounded down to whole bytes.
 * Throws Compute_error (invalid_argument) if the result does not fit.
 */
unsigned long long to_bytes(unsigned long long value, Data_unit unit = Data_unit::bytes);
unsigned long long to_bytes(unsigned long long value, const std::string &unit);

// Convert between two units using bytes as the common basis.
double convert(double value, Data_unit from, Data_unit to);
double convert(double value, const std::string &from, const std::string &to);

} // namespace compute

#endif
