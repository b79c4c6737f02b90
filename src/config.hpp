/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "logging.hpp"

#include <fast-lib/serialization/serializable.hpp>

#include <map>
#include <string>

namespace compute {

/**
 * \brief Settings of the compute tool.
 *
 * Constructed once in main and passed on explicitly.
 */
class Config :
	public fast::Serializable
{
public:
	static const std::string default_path;

	YAML::Node emit() const override;
	/**
	 * \brief Loads the settings present in node, others keep their values.
	 *
	 * Throws Compute_error (config_load) on unknown keys or ill-typed values.
	 */
	void load(const YAML::Node &node) override;
	/**
	 * \brief Apply CMP_LIBVIRT_URI, CMP_IMAGES_POOL, CMP_VOLUMES_POOL, CMP_LOG and CMP_LOG_FILE.
	 *
	 * Throws Compute_error (config_load) if CMP_LOG is not a log level.
	 */
	void apply_environment(const std::map<std::string, std::string> &env);

	std::string libvirt_uri = "qemu:///system";
	Log_level log_level = Log_level::warn;
	// Empty means the standard log stream (stderr).
	std::string log_file;
	std::string images_pool = "images";
	std::string volumes_pool = "volumes";
};

/**
 * \brief Load the config file and apply the environment overrides.
 *
 * A missing file yields the defaults. Throws Compute_error (config_load).
 */
Config load_config(const std::string &path, const std::map<std::string, std::string> &env);

// Environment as map, envp as passed to main or environ.
std::map<std::string, std::string> environment_map(char **envp);

} // namespace compute

#endif
