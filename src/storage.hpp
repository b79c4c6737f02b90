/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef STORAGE_HPP
#define STORAGE_HPP

#include "descriptors.hpp"
#include "hypervisor.hpp"
#include "units.hpp"

#include <memory>
#include <string>
#include <vector>

namespace compute {

// Pool usage in bytes.
struct Pool_usage
{
	unsigned long long capacity = 0;
	unsigned long long allocation = 0;
	unsigned long long available = 0;
};

class Volume
{
public:
	explicit Volume(std::unique_ptr<Volume_handle> handle);

	std::string name() const;
	std::string path() const;
	std::string pool_name() const;
	std::string dump_xml() const;
	// Copy this volume into a new volume of the same pool.
	Volume clone(const Volume_config &config);
	void resize(unsigned long long value, Data_unit unit = Data_unit::bytes);
	void remove();

	const Volume_handle & handle() const;
private:
	std::unique_ptr<Volume_handle> volume;
};

/**
 * \brief A named storage pool, e.g. the pool holding instance volumes.
 */
class Storage_pool
{
public:
	explicit Storage_pool(std::unique_ptr<Pool_handle> handle);

	std::string name() const;
	// Target directory of the pool.
	std::string path() const;
	Pool_usage usage() const;
	std::string dump_xml() const;
	void refresh();

	Volume create_volume(const Volume_config &config);
	// Create a volume in this pool from src, which may live in another pool.
	Volume clone_volume(const Volume &src, const Volume_config &config);
	// Throws Compute_error (not_found).
	Volume get_volume(const std::string &name);
	// Throws Compute_error (not_found).
	Volume get_volume_by_path(const std::string &path);
	std::vector<Volume> list_volumes();
private:
	std::unique_ptr<Pool_handle> pool;
};

} // namespace compute

#endif
