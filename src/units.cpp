/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "units.hpp"

#include "errors.hpp"

#include <limits>
#include <utility>

namespace compute {

namespace {

struct Unit_entry
{
	Data_unit unit;
	const char *name;
	// Size of one unit expressed in bits, so that bit units stay integral.
	unsigned long long bits;
};

const Unit_entry unit_table[] = {
	{Data_unit::bytes, "bytes", 8ULL},
	{Data_unit::kib, "KiB", 8ULL << 10},
	{Data_unit::mib, "MiB", 8ULL << 20},
	{Data_unit::gib, "GiB", 8ULL << 30},
	{Data_unit::tib, "TiB", 8ULL << 40},
	{Data_unit::kb, "kB", 8ULL * 1000},
	{Data_unit::mb, "MB", 8ULL * 1000 * 1000},
	{Data_unit::gb, "GB", 8ULL * 1000 * 1000 * 1000},
	{Data_unit::tb, "TB", 8ULL * 1000 * 1000 * 1000 * 1000},
	{Data_unit::bits, "bits", 1ULL},
	{Data_unit::kbit, "kbit", 1000ULL},
	{Data_unit::mbit, "Mbit", 1000ULL * 1000},
	{Data_unit::gbit, "Gbit", 1000ULL * 1000 * 1000},
	{Data_unit::tbit, "Tbit", 1000ULL * 1000 * 1000 * 1000}
};

const Unit_entry & lookup(Data_unit unit)
{
	for (const auto &entry : unit_table) {
		if (entry.unit == unit)
			return entry;
	}
	throw Compute_error(Error_kind::invalid_unit, "Unknown data unit.");
}

unsigned long long checked_multiply(unsigned long long a, unsigned long long b)
{
	if (a != 0 && b > std::numeric_limits<unsigned long long>::max() / a)
		throw Compute_error(Error_kind::invalid_argument,
				"Capacity " + std::to_string(a) + " overflows when converted to bytes.");
	return a * b;
}

} // namespace

std::string to_string(Data_unit unit)
{
	return lookup(unit).name;
}

std::vector<std::string> data_unit_names()
{
	std::vector<std::string> names;
	for (const auto &entry : unit_table)
		names.emplace_back(entry.name);
	return names;
}

Data_unit parse_data_unit(const std::string &name)
{
	for (const auto &entry : unit_table) {
		if (name == entry.name)
			return entry.unit;
	}
	std::string valid;
	for (const auto &entry : unit_table)
		valid += (valid.empty() ? "" : ", ") + std::string(entry.name);
	throw Compute_error(Error_kind::invalid_unit,
			"'" + name + "' is not a valid data unit, valid units are: " + valid);
}

unsigned long long to_bytes(unsigned long long value, Data_unit unit)
{
	auto bits = lookup(unit).bits;
	if (bits % 8 == 0)
		return checked_multiply(value, bits / 8);
	return checked_multiply(value, bits) / 8;
}

unsigned long long to_bytes(unsigned long long value, const std::string &unit)
{
	return to_bytes(value, parse_data_unit(unit));
}

double convert(double value, Data_unit from, Data_unit to)
{
	long double from_bits = lookup(from).bits;
	long double to_bits = lookup(to).bits;
	return static_cast<double>(value * from_bits / to_bits);
}

double convert(double value, const std::string &from, const std::string &to)
{
	return convert(value, parse_data_unit(from), parse_data_unit(to));
}

} // namespace compute
