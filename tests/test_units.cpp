/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "errors.hpp"
#include "units.hpp"

#include <gtest/gtest.h>

using namespace compute;

TEST(Units, binary_units_are_powers_of_1024)
{
	EXPECT_EQ(to_bytes(1, Data_unit::kib), 1024ULL);
	EXPECT_EQ(to_bytes(20, Data_unit::gib), 21474836480ULL);
	EXPECT_EQ(to_bytes(2, "TiB"), 2ULL << 40);
}

TEST(Units, decimal_units_are_powers_of_1000)
{
	EXPECT_EQ(to_bytes(3, Data_unit::kb), 3000ULL);
	EXPECT_EQ(to_bytes(1, "GB"), 1000000000ULL);
}

TEST(Units, bit_units_round_down_to_bytes)
{
	EXPECT_EQ(to_bytes(8, Data_unit::bits), 1ULL);
	EXPECT_EQ(to_bytes(15, Data_unit::bits), 1ULL);
	EXPECT_EQ(to_bytes(1, Data_unit::kbit), 125ULL);
}

TEST(Units, names_round_trip)
{
	for (const auto &name : data_unit_names())
		EXPECT_EQ(to_string(parse_data_unit(name)), name);
}

TEST(Units, unknown_unit_lists_valid_names)
{
	try {
		parse_data_unit("GiBs");
		FAIL() << "expected an invalid_unit error";
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::invalid_unit);
		EXPECT_NE(std::string(e.what()).find("GiBs"), std::string::npos);
		EXPECT_NE(std::string(e.what()).find("MiB"), std::string::npos);
	}
}

TEST(Units, overflow_is_reported)
{
	try {
		to_bytes(1ULL << 40, Data_unit::tib);
		FAIL() << "expected an invalid_argument error";
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::invalid_argument);
	}
}

TEST(Units, convert_between_units)
{
	EXPECT_DOUBLE_EQ(convert(1, Data_unit::gib, Data_unit::mib), 1024.0);
	EXPECT_DOUBLE_EQ(convert(1, "MB", "kB"), 1000.0);
	EXPECT_DOUBLE_EQ(convert(1, "bytes", "bits"), 8.0);
}
