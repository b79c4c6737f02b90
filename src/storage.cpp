/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "storage.hpp"

#include "errors.hpp"
#include "logging.hpp"
#include "xml_utility.hpp"

FASTLIB_LOG_INIT(storage_log, "Storage")
FASTLIB_LOG_SET_LEVEL_GLOBAL(storage_log, trace);

namespace compute {

//
// Volume implementation
//

Volume::Volume(std::unique_ptr<Volume_handle> handle) :
	volume(std::move(handle))
{
}

std::string Volume::name() const
{
	return volume->name();
}

std::string Volume::path() const
{
	return volume->path();
}

std::string Volume::pool_name() const
{
	return volume->pool_name();
}

std::string Volume::dump_xml() const
{
	return volume->xml_desc();
}

Volume Volume::clone(const Volume_config &config)
{
	COMPUTE_LOG(storage_log, trace) << "Clone volume " << volume->name() << " to " << config.name() << ".";
	return Volume(volume->clone(config.render()));
}

void Volume::resize(unsigned long long value, Data_unit unit)
{
	auto capacity = to_bytes(value, unit);
	COMPUTE_LOG(storage_log, trace) << "Resize volume " << volume->name() << " to " << capacity << " bytes.";
	volume->resize(capacity);
}

void Volume::remove()
{
	COMPUTE_LOG(storage_log, trace) << "Delete volume " << volume->path() << ".";
	volume->remove();
}

const Volume_handle & Volume::handle() const
{
	return *volume;
}

//
// Storage_pool implementation
//

Storage_pool::Storage_pool(std::unique_ptr<Pool_handle> handle) :
	pool(std::move(handle))
{
}

std::string Storage_pool::name() const
{
	return pool->name();
}

std::string Storage_pool::path() const
{
	auto pt = read_xml_from_string(pool->xml_desc());
	auto path = pt.get_optional<std::string>("pool.target.path");
	if (!path)
		throw Compute_error(Error_kind::storage, "Storage pool " + pool->name() + " has no target path.");
	return *path;
}

Pool_usage Storage_pool::usage() const
{
	auto pt = read_xml_from_string(pool->xml_desc());
	Pool_usage usage;
	usage.capacity = pt.get<unsigned long long>("pool.capacity", 0);
	usage.allocation = pt.get<unsigned long long>("pool.allocation", 0);
	usage.available = pt.get<unsigned long long>("pool.available", 0);
	return usage;
}

std::string Storage_pool::dump_xml() const
{
	return pool->xml_desc();
}

void Storage_pool::refresh()
{
	COMPUTE_LOG(storage_log, trace) << "Refresh storage pool " << pool->name() << ".";
	pool->refresh();
}

Volume Storage_pool::create_volume(const Volume_config &config)
{
	COMPUTE_LOG(storage_log, trace) << "Create volume " << config.name() << " (" << config.capacity()
		<< " bytes) in pool " << pool->name() << ".";
	return Volume(pool->create_volume(config.render()));
}

Volume Storage_pool::clone_volume(const Volume &src, const Volume_config &config)
{
	COMPUTE_LOG(storage_log, trace) << "Clone volume " << src.name() << " to " << config.name()
		<< " in pool " << pool->name() << ".";
	return Volume(pool->clone_volume(config.render(), src.handle()));
}

Volume Storage_pool::get_volume(const std::string &name)
{
	return Volume(pool->lookup_volume(name));
}

Volume Storage_pool::get_volume_by_path(const std::string &path)
{
	for (auto &volume : pool->list_volumes()) {
		if (volume->path() == path)
			return Volume(std::move(volume));
	}
	throw Compute_error::not_found("Volume", path);
}

std::vector<Volume> Storage_pool::list_volumes()
{
	std::vector<Volume> volumes;
	for (auto &volume : pool->list_volumes())
		volumes.emplace_back(std::move(volume));
	return volumes;
}

} // namespace compute
