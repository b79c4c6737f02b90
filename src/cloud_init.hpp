/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef CLOUD_INIT_HPP
#define CLOUD_INIT_HPP

#include "descriptors.hpp"
#include "instance.hpp"
#include "schema.hpp"

#include <string>
#include <vector>

namespace compute {

/**
 * \brief Resolve a cloud-init value.
 *
 * "base64:<payload>" is decoded, a path to an existing regular file is
 * replaced by the file contents and anything else is returned as is.
 */
std::string resolve_cloud_init_payload(const std::string &value);
Cloud_init_spec resolve_cloud_init_payloads(const Cloud_init_spec &spec);

// Run an external program. Throws Compute_error (instance) if it fails. Returns its stdout.
std::string run_program(const std::vector<std::string> &args);

/**
 * \brief NoCloud datasource disk (vfat image labeled CIDATA).
 *
 * Requires mkfs.vfat and the mtools on the host.
 */
class Cloud_init
{
public:
	explicit Cloud_init(Cloud_init_spec spec);

	const Cloud_init_spec & spec() const;

	// File name of the cloud-init image of an instance.
	static std::string disk_name(const std::string &instance_name);

	/**
	 * \brief Create the image and write user-data, meta-data and the optional files.
	 *
	 * \param force Replace an existing image instead of failing.
	 */
	void create_disk(const std::string &path, bool force = false);
	// Replace the files present in the spec on an existing image.
	void update_disk(const std::string &path);
	// Attach the image read-only to the persistent config of instance.
	void attach_disk(const std::string &path, const std::string &target, Instance &instance);

	static Disk_config disk_config(const std::string &path, const std::string &target);
private:
	void write_file(const std::string &disk, const std::string &filename, const std::string &data, bool replace);

	Cloud_init_spec cloud_init_spec;
};

} // namespace compute

#endif
