/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef SESSION_HPP
#define SESSION_HPP

#include "config.hpp"
#include "hypervisor.hpp"
#include "instance.hpp"
#include "schema.hpp"
#include "storage.hpp"

#include <memory>
#include <string>
#include <vector>

namespace compute {

// Host capabilities as reported by the hypervisor.
struct Capabilities
{
	std::string arch;
	std::string virt;
	std::string emulator;
	std::string machine;
};

/**
 * \brief Entry point binding a hypervisor connection to instances and storage.
 *
 * The connection is closed when the session is destroyed.
 */
class Session
{
public:
	/**
	 * \param connection Open hypervisor connection.
	 * \param images_pool Pool holding the images system volumes are cloned from.
	 * \param volumes_pool Pool new volumes are created in.
	 */
	Session(std::unique_ptr<Connection_handle> connection, std::string images_pool = "images",
			std::string volumes_pool = "volumes");

	// Connect to libvirt using the settings of config. Throws Compute_error (connection).
	static Session open(const Config &config);

	Connection_handle & connection();
	Capabilities capabilities();
	Node_info node_info();
	// Defaults for instance specs derived from the host.
	Spec_defaults spec_defaults();

	/**
	 * \brief Create an instance from a declarative description.
	 *
	 * The spec is completed with spec_defaults() and validated before anything is
	 * defined, so an invalid description leaves the hypervisor untouched.
	 */
	Instance create_instance(const Partial_instance_spec &partial);
	/**
	 * \brief Define the domain, provision and attach its volumes and the cloud-init disk.
	 *
	 * The instance is not started.
	 */
	Instance create_instance(const Instance_spec &spec);
	// Throws Compute_error (not_found).
	Instance get_instance(const std::string &name);
	std::vector<Instance> list_instances();

	// Throws Compute_error (not_found).
	Storage_pool get_storage_pool(const std::string &name);
	std::vector<Storage_pool> list_storage_pools();
	Storage_pool images_pool();
	Storage_pool volumes_pool();
private:
	std::unique_ptr<Connection_handle> conn;
	std::string images_pool_name;
	std::string volumes_pool_name;
};

} // namespace compute

#endif
