/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef SCHEMA_HPP
#define SCHEMA_HPP

#include "errors.hpp"
#include "units.hpp"

#include <fast-lib/serialization/serializable.hpp>
#include <boost/optional.hpp>

#include <functional>
#include <string>
#include <vector>

namespace compute {

enum class Cpu_emulation_mode
{
	host_passthrough,
	host_model,
	custom,
	maximum
};

std::string to_string(Cpu_emulation_mode mode);
// Throws Compute_error (invalid_argument).
Cpu_emulation_mode parse_cpu_emulation_mode(const std::string &str);

struct Cpu_topology
{
	unsigned int sockets = 1;
	unsigned int cores = 1;
	unsigned int threads = 1;
	unsigned int dies = 1;

	unsigned long long product() const;
};

struct Cpu_features
{
	std::vector<std::string> require;
	std::vector<std::string> disable;
};

struct Cpu_spec
{
	Cpu_emulation_mode emulation_mode = Cpu_emulation_mode::host_passthrough;
	std::string model;
	std::string vendor;
	boost::optional<Cpu_topology> topology;
	boost::optional<Cpu_features> features;
};

struct Disk_driver
{
	std::string name = "qemu";
	std::string type = "qcow2";
	std::string cache = "writethrough";

	bool operator==(const Disk_driver &rhs) const;
};

struct Volume_capacity
{
	unsigned long long value = 0;
	Data_unit unit = Data_unit::bytes;

	unsigned long long bytes() const;
};

struct Volume_spec
{
	// file or network
	std::string type = "file";
	std::string target;
	Disk_driver driver;
	// virtio, ide or sata
	std::string bus = "virtio";
	// disk or cdrom
	std::string device = "disk";
	boost::optional<Volume_capacity> capacity;
	boost::optional<std::string> source;
	bool is_readonly = false;
	bool is_system = false;
};

struct Network_interface
{
	// Name of the libvirt network.
	std::string source = "default";
	std::string mac;
	std::string model = "virtio";
};

struct Network_spec
{
	std::vector<Network_interface> interfaces;
};

struct Cloud_init_spec
{
	boost::optional<std::string> user_data;
	boost::optional<std::string> meta_data;
	boost::optional<std::string> vendor_data;
	boost::optional<std::string> network_config;
};

/**
 * \brief A validated compute instance description.
 *
 * Obtained from build_instance_spec(). Memory values are in MiB.
 */
struct Instance_spec
{
	std::string name;
	std::string title;
	std::string description;
	unsigned long long memory = 0;
	unsigned long long max_memory = 0;
	unsigned int vcpus = 0;
	unsigned int max_vcpus = 0;
	Cpu_spec cpu;
	std::string machine;
	std::string emulator;
	std::string arch;
	std::vector<std::string> boot_order;
	std::vector<Volume_spec> volumes;
	// Unset means networking is disabled.
	boost::optional<Network_spec> network;
	boost::optional<Cloud_init_spec> cloud_init;
	// Name of the image volume the system volume is cloned from.
	boost::optional<std::string> image;
};

//
// Partial specs as read from a declarative file. Every field is optional and
// type errors are collected instead of thrown.
//

struct Partial_cpu_topology
{
	boost::optional<long long> sockets;
	boost::optional<long long> cores;
	boost::optional<long long> threads;
	boost::optional<long long> dies;
};

struct Partial_cpu_spec
{
	boost::optional<std::string> emulation_mode;
	boost::optional<std::string> model;
	boost::optional<std::string> vendor;
	boost::optional<Partial_cpu_topology> topology;
	boost::optional<Cpu_features> features;
};

struct Partial_volume_spec
{
	boost::optional<std::string> type;
	boost::optional<std::string> target;
	boost::optional<std::string> driver_name;
	boost::optional<std::string> driver_type;
	boost::optional<std::string> driver_cache;
	boost::optional<std::string> bus;
	boost::optional<std::string> device;
	boost::optional<long long> capacity_value;
	boost::optional<std::string> capacity_unit;
	boost::optional<std::string> source;
	boost::optional<bool> is_readonly;
	boost::optional<bool> is_system;
};

enum class Network_setting
{
	unset,
	disabled,
	// The literal "network: true", a common misconfiguration.
	enabled_literal,
	interfaces
};

/**
 * \brief Instance description loaded from YAML.
 *
 * load() never throws on bad field values, it records them in errors() so that
 * build_instance_spec() can report them together with the validation errors.
 */
class Partial_instance_spec :
	public fast::Serializable
{
public:
	/**
	 * \brief Emits Partial_instance_spec to YAML::Node.
	 *
	 * Implements fast::Serializable::emit(). Only fields that are set are emitted.
	 */
	YAML::Node emit() const override;
	/**
	 * \brief Loads Partial_instance_spec from YAML::Node.
	 *
	 * Implements fast::Serializable::load().
	 */
	void load(const YAML::Node &node) override;

	const std::vector<Field_error> & errors() const;

	boost::optional<std::string> name;
	boost::optional<std::string> title;
	boost::optional<std::string> description;
	boost::optional<long long> memory;
	boost::optional<long long> max_memory;
	boost::optional<long long> vcpus;
	boost::optional<long long> max_vcpus;
	boost::optional<Partial_cpu_spec> cpu;
	boost::optional<std::string> machine;
	boost::optional<std::string> emulator;
	boost::optional<std::string> arch;
	boost::optional<std::vector<std::string>> boot_order;
	std::vector<Partial_volume_spec> volumes;
	Network_setting network_setting = Network_setting::unset;
	std::vector<Network_interface> network_interfaces;
	boost::optional<Cloud_init_spec> cloud_init;
	boost::optional<std::string> image;
private:
	std::vector<Field_error> load_errors;
};

/**
 * \brief Values used for fields the partial spec leaves unset.
 */
struct Spec_defaults
{
	std::string arch;
	std::string machine;
	std::string emulator;
	unsigned int host_cpus = 1;
	unsigned long long host_memory = 1024; // MiB
	unsigned long long memory = 1024; // MiB
	unsigned int vcpus = 1;
	std::function<std::string()> generate_name;
	std::function<std::string()> generate_mac;
};

/**
 * \brief Merge a partial spec into defaults and validate the result.
 *
 * Throws Compute_error (validation) listing every violation, including the
 * ones recorded while loading the partial spec.
 */
Instance_spec build_instance_spec(const Partial_instance_spec &partial, const Spec_defaults &defaults);

// Check all invariants of a complete spec. An empty result means valid.
std::vector<Field_error> validate(const Instance_spec &spec);

YAML::Node to_yaml(const Instance_spec &spec);

} // namespace compute

#endif
