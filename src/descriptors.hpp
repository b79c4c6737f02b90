/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef DESCRIPTORS_HPP
#define DESCRIPTORS_HPP

#include "schema.hpp"

#include <boost/property_tree/ptree.hpp>

#include <ctime>
#include <string>

namespace compute {

/**
 * \brief Renders the libvirt domain descriptor of an instance.
 *
 * Disks are not part of the descriptor, they are attached after the domain is defined.
 */
class Instance_config
{
public:
	explicit Instance_config(Instance_spec spec);

	const Instance_spec & spec() const;
	std::string render() const;
private:
	Instance_spec instance_spec;
};

/**
 * \brief Renders the libvirt descriptor of a new qcow2 storage volume.
 */
class Volume_config
{
public:
	/**
	 * \param name Volume name inside the pool.
	 * \param path Absolute path of the volume file.
	 * \param capacity Capacity in bytes.
	 */
	Volume_config(std::string name, std::string path, unsigned long long capacity);

	const std::string & name() const;
	const std::string & path() const;
	unsigned long long capacity() const;

	// Uses the current time for the timestamps.
	std::string render() const;
	std::string render(std::time_t timestamp) const;
private:
	std::string volume_name;
	std::string volume_path;
	unsigned long long volume_capacity;
};

/**
 * \brief A disk device as attached to a domain.
 *
 * For network disks source has the form "protocol://name", for volume disks
 * "pool/volume". An empty source means no medium (e.g. an ejected cdrom).
 */
struct Disk_config
{
	std::string type = "file";
	std::string device = "disk";
	Disk_driver driver;
	std::string source;
	std::string target;
	std::string bus = "virtio";
	bool is_readonly = false;

	static Disk_config from_volume(const Volume_spec &volume, const std::string &source);
	/**
	 * \brief Parse a <disk> element.
	 *
	 * Throws Compute_error (invalid_device_descriptor) carrying the offending
	 * fragment if the disk type, device or target dev is missing.
	 */
	static Disk_config parse(const std::string &xml);
	// Parse the contents of a <disk> element, e.g. taken from a domain descriptor.
	static Disk_config parse(const boost::property_tree::ptree &disk);

	std::string render() const;
	bool operator==(const Disk_config &rhs) const;
};

} // namespace compute

#endif
