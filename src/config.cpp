/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "config.hpp"

#include "errors.hpp"

#include <yaml-cpp/yaml.h>

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <set>
#include <sstream>

namespace compute {

namespace {

void check_keys(const YAML::Node &node, const std::string &prefix, const std::set<std::string> &allowed)
{
	if (!node.IsMap())
		throw Compute_error(Error_kind::config_load, "Configuration section '" + prefix + "' must be a mapping.");
	for (const auto &kv : node) {
		auto key = kv.first.as<std::string>();
		if (allowed.count(key) == 0)
			throw Compute_error(Error_kind::config_load, "Unknown configuration key '"
					+ (prefix.empty() ? "" : prefix + ".") + key + "'.");
	}
}

void load_string(const YAML::Node &node, const std::string &key, const std::string &path, std::string &value)
{
	if (!node[key])
		return;
	try {
		value = node[key].as<std::string>();
	} catch (const YAML::Exception &) {
		throw Compute_error(Error_kind::config_load, "Configuration key '" + path + "' must be a string.");
	}
}

Log_level to_log_level(const std::string &value, const std::string &origin)
{
	try {
		return parse_log_level(value);
	} catch (const Compute_error &e) {
		throw Compute_error(Error_kind::config_load, origin + ": " + e.what());
	}
}

} // namespace

const std::string Config::default_path = "/etc/compute/computed.yaml";

YAML::Node Config::emit() const
{
	YAML::Node node;
	node["libvirt"]["uri"] = libvirt_uri;
	node["log"]["level"] = to_string(log_level);
	if (!log_file.empty())
		node["log"]["file"] = log_file;
	node["storage"]["images"] = images_pool;
	node["storage"]["volumes"] = volumes_pool;
	return node;
}

void Config::load(const YAML::Node &node)
{
	if (!node || node.IsNull())
		return;
	check_keys(node, "", {"libvirt", "log", "storage"});
	if (node["libvirt"]) {
		check_keys(node["libvirt"], "libvirt", {"uri"});
		load_string(node["libvirt"], "uri", "libvirt.uri", libvirt_uri);
	}
	if (node["log"]) {
		check_keys(node["log"], "log", {"level", "file"});
		std::string level;
		load_string(node["log"], "level", "log.level", level);
		if (!level.empty())
			log_level = to_log_level(level, "Configuration key 'log.level'");
		load_string(node["log"], "file", "log.file", log_file);
	}
	if (node["storage"]) {
		check_keys(node["storage"], "storage", {"images", "volumes"});
		load_string(node["storage"], "images", "storage.images", images_pool);
		load_string(node["storage"], "volumes", "storage.volumes", volumes_pool);
	}
}

void Config::apply_environment(const std::map<std::string, std::string> &env)
{
	const std::pair<const char *, std::string *> overrides[] = {
		{"CMP_LIBVIRT_URI", &libvirt_uri},
		{"CMP_IMAGES_POOL", &images_pool},
		{"CMP_VOLUMES_POOL", &volumes_pool},
		{"CMP_LOG_FILE", &log_file}
	};
	for (const auto &entry : overrides) {
		auto it = env.find(entry.first);
		if (it != env.end())
			*entry.second = it->second;
	}
	auto level = env.find("CMP_LOG");
	if (level != env.end() && !level->second.empty())
		log_level = to_log_level(level->second, "Environment variable CMP_LOG");
}

Config load_config(const std::string &path, const std::map<std::string, std::string> &env)
{
	Config config;
	struct stat st;
	if (::stat(path.c_str(), &st) == 0) {
		std::ifstream file(path);
		if (!file)
			throw Compute_error(Error_kind::config_load, "Cannot read configuration file " + path + ": " + std::strerror(errno));
		std::stringstream ss;
		ss << file.rdbuf();
		try {
			config.from_string(ss.str());
		} catch (const YAML::Exception &e) {
			throw Compute_error(Error_kind::config_load, "Cannot parse configuration file " + path + ": " + e.what());
		} catch (const Compute_error &e) {
			throw Compute_error(Error_kind::config_load, path + ": " + e.what());
		}
	} else if (errno != ENOENT) {
		throw Compute_error(Error_kind::config_load, "Cannot access configuration file " + path + ": " + std::strerror(errno));
	}
	config.apply_environment(env);
	return config;
}

std::map<std::string, std::string> environment_map(char **envp)
{
	std::map<std::string, std::string> env;
	for (; envp && *envp; ++envp) {
		std::string entry(*envp);
		auto pos = entry.find('=');
		if (pos != std::string::npos)
			env.emplace(entry.substr(0, pos), entry.substr(pos + 1));
	}
	return env;
}

} // namespace compute
