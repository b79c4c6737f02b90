/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "schema.hpp"

#include "ids.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <regex>
#include <set>

namespace compute {

//
// Helper functions
//

namespace {

std::string dump(const YAML::Node &node)
{
	YAML::Emitter out;
	out << YAML::Flow << node;
	return out.c_str();
}

void check_keys(const YAML::Node &node, const std::string &prefix, const std::set<std::string> &allowed, std::vector<Field_error> &errors)
{
	for (const auto &kv : node) {
		auto key = kv.first.as<std::string>();
		if (allowed.count(key) == 0)
			errors.push_back({prefix + key, "unknown field"});
	}
}

// Returns false if the node is missing or null.
bool expect_map(const YAML::Node &node, const std::string &path, std::vector<Field_error> &errors)
{
	if (!node || node.IsNull())
		return false;
	if (!node.IsMap()) {
		errors.push_back({path, "must be a mapping, got '" + dump(node) + "'"});
		return false;
	}
	return true;
}

template<typename T>
void read_value(const YAML::Node &node, const std::string &key, const std::string &path, boost::optional<T> &out, std::vector<Field_error> &errors)
{
	const YAML::Node child = node[key];
	if (!child || child.IsNull())
		return;
	try {
		out = child.as<T>();
	} catch (const YAML::Exception &) {
		errors.push_back({path, "invalid value '" + dump(child) + "'"});
	}
}

template<typename T>
void put_value(YAML::Node node, const std::string &key, const boost::optional<T> &value)
{
	if (value)
		node[key] = *value;
}

// Text value or, for mappings and sequences, the YAML document they form.
boost::optional<std::string> read_payload(const YAML::Node &node, const std::string &key)
{
	const YAML::Node child = node[key];
	if (!child || child.IsNull())
		return boost::none;
	if (child.IsScalar())
		return child.as<std::string>();
	return YAML::Dump(child);
}

unsigned long long non_negative(const boost::optional<long long> &value, unsigned long long fallback)
{
	if (!value)
		return fallback;
	return *value > 0 ? static_cast<unsigned long long>(*value) : 0;
}

const std::set<std::string> volume_types = {"file", "network"};
const std::set<std::string> volume_devices = {"disk", "cdrom"};
const std::set<std::string> volume_buses = {"virtio", "ide", "sata"};
const std::set<std::string> boot_devices = {"hd", "cdrom", "network", "fd"};

std::string join(const std::set<std::string> &values)
{
	std::string str;
	for (const auto &value : values)
		str += (str.empty() ? "" : ", ") + value;
	return str;
}

} // namespace

//
// Cpu and volume types
//

std::string to_string(Cpu_emulation_mode mode)
{
	switch (mode) {
	case Cpu_emulation_mode::host_passthrough:
		return "host-passthrough";
	case Cpu_emulation_mode::host_model:
		return "host-model";
	case Cpu_emulation_mode::custom:
		return "custom";
	case Cpu_emulation_mode::maximum:
		return "maximum";
	}
	return "host-passthrough";
}

Cpu_emulation_mode parse_cpu_emulation_mode(const std::string &str)
{
	for (auto mode : {Cpu_emulation_mode::host_passthrough, Cpu_emulation_mode::host_model,
			Cpu_emulation_mode::custom, Cpu_emulation_mode::maximum}) {
		if (to_string(mode) == str)
			return mode;
	}
	throw Compute_error(Error_kind::invalid_argument,
			"'" + str + "' is not a valid CPU emulation mode, valid modes are: "
			"host-passthrough, host-model, custom, maximum");
}

unsigned long long Cpu_topology::product() const
{
	return static_cast<unsigned long long>(sockets) * dies * cores * threads;
}

bool Disk_driver::operator==(const Disk_driver &rhs) const
{
	return name == rhs.name && type == rhs.type && cache == rhs.cache;
}

unsigned long long Volume_capacity::bytes() const
{
	return to_bytes(value, unit);
}

//
// Partial_instance_spec implementation
//

YAML::Node Partial_instance_spec::emit() const
{
	YAML::Node node;
	put_value(node, "name", name);
	put_value(node, "title", title);
	put_value(node, "description", description);
	put_value(node, "memory", memory);
	put_value(node, "max_memory", max_memory);
	put_value(node, "vcpus", vcpus);
	put_value(node, "max_vcpus", max_vcpus);
	put_value(node, "machine", machine);
	put_value(node, "emulator", emulator);
	put_value(node, "arch", arch);
	put_value(node, "image", image);
	if (cpu) {
		YAML::Node cpu_node(YAML::NodeType::Map);
		put_value(cpu_node, "emulation_mode", cpu->emulation_mode);
		put_value(cpu_node, "model", cpu->model);
		put_value(cpu_node, "vendor", cpu->vendor);
		if (cpu->topology) {
			put_value(cpu_node["topology"], "sockets", cpu->topology->sockets);
			put_value(cpu_node["topology"], "dies", cpu->topology->dies);
			put_value(cpu_node["topology"], "cores", cpu->topology->cores);
			put_value(cpu_node["topology"], "threads", cpu->topology->threads);
		}
		if (cpu->features) {
			cpu_node["features"]["require"] = cpu->features->require;
			cpu_node["features"]["disable"] = cpu->features->disable;
		}
		node["cpu"] = cpu_node;
	}
	if (boot_order)
		node["boot"]["order"] = *boot_order;
	for (const auto &volume : volumes) {
		YAML::Node volume_node(YAML::NodeType::Map);
		put_value(volume_node, "type", volume.type);
		put_value(volume_node, "device", volume.device);
		put_value(volume_node, "bus", volume.bus);
		put_value(volume_node, "target", volume.target);
		put_value(volume_node, "source", volume.source);
		if (volume.driver_name || volume.driver_type || volume.driver_cache) {
			put_value(volume_node["driver"], "name", volume.driver_name);
			put_value(volume_node["driver"], "type", volume.driver_type);
			put_value(volume_node["driver"], "cache", volume.driver_cache);
		}
		if (volume.capacity_value) {
			volume_node["capacity"]["value"] = *volume.capacity_value;
			put_value(volume_node["capacity"], "unit", volume.capacity_unit);
		}
		put_value(volume_node, "is_readonly", volume.is_readonly);
		put_value(volume_node, "is_system", volume.is_system);
		node["volumes"].push_back(volume_node);
	}
	switch (network_setting) {
	case Network_setting::unset:
		break;
	case Network_setting::disabled:
		node["network"] = false;
		break;
	case Network_setting::enabled_literal:
		node["network"] = true;
		break;
	case Network_setting::interfaces:
		node["network"]["interfaces"] = YAML::Node(YAML::NodeType::Sequence);
		for (const auto &iface : network_interfaces) {
			YAML::Node iface_node;
			iface_node["source"] = iface.source;
			if (!iface.mac.empty())
				iface_node["mac"] = iface.mac;
			iface_node["model"] = iface.model;
			node["network"]["interfaces"].push_back(iface_node);
		}
		break;
	}
	if (cloud_init) {
		YAML::Node cloud_init_node(YAML::NodeType::Map);
		put_value(cloud_init_node, "user_data", cloud_init->user_data);
		put_value(cloud_init_node, "meta_data", cloud_init->meta_data);
		put_value(cloud_init_node, "vendor_data", cloud_init->vendor_data);
		put_value(cloud_init_node, "network_config", cloud_init->network_config);
		node["cloud_init"] = cloud_init_node;
	}
	return node;
}

void Partial_instance_spec::load(const YAML::Node &node)
{
	load_errors.clear();
	auto &errors = load_errors;
	if (!node.IsMap()) {
		errors.push_back({"", "instance description must be a mapping"});
		return;
	}
	check_keys(node, "", {"name", "title", "description", "memory", "max_memory", "vcpus", "max_vcpus",
			"cpu", "machine", "emulator", "arch", "boot", "volumes", "network", "cloud_init", "image"}, errors);
	read_value(node, "name", "name", name, errors);
	read_value(node, "title", "title", title, errors);
	read_value(node, "description", "description", description, errors);
	read_value(node, "memory", "memory", memory, errors);
	read_value(node, "max_memory", "max_memory", max_memory, errors);
	read_value(node, "vcpus", "vcpus", vcpus, errors);
	read_value(node, "max_vcpus", "max_vcpus", max_vcpus, errors);
	read_value(node, "machine", "machine", machine, errors);
	read_value(node, "emulator", "emulator", emulator, errors);
	read_value(node, "arch", "arch", arch, errors);
	read_value(node, "image", "image", image, errors);

	// CPU
	const YAML::Node cpu_node = node["cpu"];
	if (expect_map(cpu_node, "cpu", errors)) {
		check_keys(cpu_node, "cpu.", {"emulation_mode", "model", "vendor", "topology", "features"}, errors);
		Partial_cpu_spec cpu_spec;
		read_value(cpu_node, "emulation_mode", "cpu.emulation_mode", cpu_spec.emulation_mode, errors);
		read_value(cpu_node, "model", "cpu.model", cpu_spec.model, errors);
		read_value(cpu_node, "vendor", "cpu.vendor", cpu_spec.vendor, errors);
		const YAML::Node topology_node = cpu_node["topology"];
		if (expect_map(topology_node, "cpu.topology", errors)) {
			check_keys(topology_node, "cpu.topology.", {"sockets", "cores", "threads", "dies"}, errors);
			Partial_cpu_topology topology;
			read_value(topology_node, "sockets", "cpu.topology.sockets", topology.sockets, errors);
			read_value(topology_node, "cores", "cpu.topology.cores", topology.cores, errors);
			read_value(topology_node, "threads", "cpu.topology.threads", topology.threads, errors);
			read_value(topology_node, "dies", "cpu.topology.dies", topology.dies, errors);
			for (const auto &required : {"sockets", "cores", "threads"}) {
				if (!topology_node[required])
					errors.push_back({std::string("cpu.topology.") + required, "field required"});
			}
			cpu_spec.topology = topology;
		}
		const YAML::Node features_node = cpu_node["features"];
		if (expect_map(features_node, "cpu.features", errors)) {
			check_keys(features_node, "cpu.features.", {"require", "disable"}, errors);
			boost::optional<std::vector<std::string>> require;
			boost::optional<std::vector<std::string>> disable;
			read_value(features_node, "require", "cpu.features.require", require, errors);
			read_value(features_node, "disable", "cpu.features.disable", disable, errors);
			Cpu_features features;
			features.require = require.get_value_or({});
			features.disable = disable.get_value_or({});
			cpu_spec.features = features;
		}
		cpu = cpu_spec;
	}

	// Boot
	const YAML::Node boot_node = node["boot"];
	if (expect_map(boot_node, "boot", errors)) {
		check_keys(boot_node, "boot.", {"order"}, errors);
		read_value(boot_node, "order", "boot.order", boot_order, errors);
	}

	// Volumes
	volumes.clear();
	const YAML::Node volumes_node = node["volumes"];
	if (volumes_node && !volumes_node.IsNull()) {
		if (!volumes_node.IsSequence()) {
			errors.push_back({"volumes", "must be a list"});
		} else {
			for (size_t i = 0; i != volumes_node.size(); ++i) {
				const YAML::Node volume_node = volumes_node[i];
				const std::string path = "volumes." + std::to_string(i);
				Partial_volume_spec volume;
				if (!expect_map(volume_node, path, errors)) {
					if (!volume_node || volume_node.IsNull())
						errors.push_back({path, "must be a mapping"});
					continue;
				}
				check_keys(volume_node, path + ".", {"type", "target", "driver", "bus", "device", "capacity",
						"source", "is_readonly", "is_system"}, errors);
				read_value(volume_node, "type", path + ".type", volume.type, errors);
				read_value(volume_node, "target", path + ".target", volume.target, errors);
				read_value(volume_node, "bus", path + ".bus", volume.bus, errors);
				read_value(volume_node, "device", path + ".device", volume.device, errors);
				read_value(volume_node, "source", path + ".source", volume.source, errors);
				read_value(volume_node, "is_readonly", path + ".is_readonly", volume.is_readonly, errors);
				read_value(volume_node, "is_system", path + ".is_system", volume.is_system, errors);
				const YAML::Node driver_node = volume_node["driver"];
				if (expect_map(driver_node, path + ".driver", errors)) {
					check_keys(driver_node, path + ".driver.", {"name", "type", "cache"}, errors);
					read_value(driver_node, "name", path + ".driver.name", volume.driver_name, errors);
					read_value(driver_node, "type", path + ".driver.type", volume.driver_type, errors);
					read_value(driver_node, "cache", path + ".driver.cache", volume.driver_cache, errors);
				}
				const YAML::Node capacity_node = volume_node["capacity"];
				if (expect_map(capacity_node, path + ".capacity", errors)) {
					check_keys(capacity_node, path + ".capacity.", {"value", "unit"}, errors);
					read_value(capacity_node, "value", path + ".capacity.value", volume.capacity_value, errors);
					read_value(capacity_node, "unit", path + ".capacity.unit", volume.capacity_unit, errors);
					if (!capacity_node["value"])
						errors.push_back({path + ".capacity.value", "field required"});
				}
				volumes.push_back(volume);
			}
		}
	}

	// Network
	network_setting = Network_setting::unset;
	network_interfaces.clear();
	const YAML::Node network_node = node["network"];
	if (network_node) {
		YAML::Node interfaces_node;
		if (network_node.IsNull()) {
			network_setting = Network_setting::disabled;
		} else if (network_node.IsScalar()) {
			bool enabled = false;
			if (YAML::convert<bool>::decode(network_node, enabled)) {
				network_setting = enabled ? Network_setting::enabled_literal : Network_setting::disabled;
			} else {
				errors.push_back({"network", "must be a list of interfaces or false, got '" + dump(network_node) + "'"});
			}
		} else if (network_node.IsSequence()) {
			interfaces_node = network_node;
		} else if (network_node.IsMap()) {
			check_keys(network_node, "network.", {"interfaces"}, errors);
			interfaces_node = network_node["interfaces"];
			if (!interfaces_node || !interfaces_node.IsSequence())
				errors.push_back({"network.interfaces", "must be a list"});
		}
		if (interfaces_node && interfaces_node.IsSequence()) {
			network_setting = Network_setting::interfaces;
			for (size_t i = 0; i != interfaces_node.size(); ++i) {
				const YAML::Node iface_node = interfaces_node[i];
				const std::string path = "network.interfaces." + std::to_string(i);
				if (!expect_map(iface_node, path, errors))
					continue;
				check_keys(iface_node, path + ".", {"source", "mac", "model"}, errors);
				boost::optional<std::string> source;
				boost::optional<std::string> mac;
				boost::optional<std::string> model;
				read_value(iface_node, "source", path + ".source", source, errors);
				read_value(iface_node, "mac", path + ".mac", mac, errors);
				read_value(iface_node, "model", path + ".model", model, errors);
				Network_interface iface;
				if (source)
					iface.source = *source;
				if (mac)
					iface.mac = *mac;
				if (model)
					iface.model = *model;
				network_interfaces.push_back(iface);
			}
		}
	}

	// Cloud-init
	const YAML::Node cloud_init_node = node["cloud_init"];
	if (expect_map(cloud_init_node, "cloud_init", errors)) {
		check_keys(cloud_init_node, "cloud_init.", {"user_data", "meta_data", "vendor_data", "network_config"}, errors);
		Cloud_init_spec cloud_init_spec;
		cloud_init_spec.user_data = read_payload(cloud_init_node, "user_data");
		cloud_init_spec.meta_data = read_payload(cloud_init_node, "meta_data");
		cloud_init_spec.vendor_data = read_payload(cloud_init_node, "vendor_data");
		cloud_init_spec.network_config = read_payload(cloud_init_node, "network_config");
		cloud_init = cloud_init_spec;
	}
}

const std::vector<Field_error> & Partial_instance_spec::errors() const
{
	return load_errors;
}

//
// Building and validation
//

Instance_spec build_instance_spec(const Partial_instance_spec &partial, const Spec_defaults &defaults)
{
	auto errors = partial.errors();
	auto generate_mac = defaults.generate_mac ? defaults.generate_mac : std::function<std::string()>(random_mac);
	Instance_spec spec;
	if (partial.name)
		spec.name = *partial.name;
	else
		spec.name = defaults.generate_name ? defaults.generate_name() : random_uuid();
	spec.title = partial.title.get_value_or("");
	spec.description = partial.description.get_value_or("");
	spec.memory = non_negative(partial.memory, defaults.memory);
	spec.max_memory = non_negative(partial.max_memory, defaults.host_memory);
	spec.vcpus = non_negative(partial.vcpus, defaults.vcpus);
	spec.max_vcpus = non_negative(partial.max_vcpus, defaults.host_cpus);
	spec.machine = partial.machine.get_value_or(defaults.machine);
	spec.emulator = partial.emulator.get_value_or(defaults.emulator);
	spec.arch = partial.arch.get_value_or(defaults.arch);
	spec.image = partial.image;

	if (partial.cpu) {
		const auto &cpu = *partial.cpu;
		if (cpu.emulation_mode) {
			try {
				spec.cpu.emulation_mode = parse_cpu_emulation_mode(*cpu.emulation_mode);
			} catch (const Compute_error &e) {
				errors.push_back({"cpu.emulation_mode", e.what()});
			}
		}
		spec.cpu.model = cpu.model.get_value_or("");
		spec.cpu.vendor = cpu.vendor.get_value_or("");
		if (cpu.topology) {
			Cpu_topology topology;
			topology.sockets = non_negative(cpu.topology->sockets, 1);
			topology.cores = non_negative(cpu.topology->cores, 1);
			topology.threads = non_negative(cpu.topology->threads, 1);
			topology.dies = non_negative(cpu.topology->dies, 1);
			spec.cpu.topology = topology;
		}
		spec.cpu.features = cpu.features;
	}

	spec.boot_order = partial.boot_order ? *partial.boot_order : std::vector<std::string>{"cdrom", "hd"};

	// Explicit targets are reserved first so generated ones never collide with them.
	std::vector<std::string> used_targets;
	for (const auto &volume : partial.volumes) {
		if (volume.target)
			used_targets.push_back(*volume.target);
	}
	for (size_t i = 0; i != partial.volumes.size(); ++i) {
		const auto &partial_volume = partial.volumes[i];
		const std::string path = "volumes." + std::to_string(i);
		Volume_spec volume;
		volume.device = partial_volume.device.get_value_or("disk");
		const bool cdrom = volume.device == "cdrom";
		volume.type = partial_volume.type.get_value_or("file");
		volume.bus = partial_volume.bus.get_value_or(cdrom ? "ide" : "virtio");
		volume.is_readonly = partial_volume.is_readonly.get_value_or(cdrom);
		volume.is_system = partial_volume.is_system.get_value_or(false);
		volume.driver.name = partial_volume.driver_name.get_value_or("qemu");
		volume.driver.type = partial_volume.driver_type.get_value_or(cdrom ? "raw" : "qcow2");
		volume.driver.cache = partial_volume.driver_cache.get_value_or("writethrough");
		volume.source = partial_volume.source;
		if (partial_volume.target) {
			volume.target = *partial_volume.target;
		} else {
			try {
				volume.target = next_disk_target(used_targets, cdrom ? "hd" : "vd");
				used_targets.push_back(volume.target);
			} catch (const Compute_error &e) {
				errors.push_back({path + ".target", e.what()});
			}
		}
		if (partial_volume.capacity_value || partial_volume.capacity_unit) {
			Volume_capacity capacity;
			capacity.value = non_negative(partial_volume.capacity_value, 0);
			if (partial_volume.capacity_unit) {
				try {
					capacity.unit = parse_data_unit(*partial_volume.capacity_unit);
				} catch (const Compute_error &e) {
					errors.push_back({path + ".capacity.unit", e.what()});
				}
			}
			volume.capacity = capacity;
		}
		spec.volumes.push_back(volume);
	}

	switch (partial.network_setting) {
	case Network_setting::unset: {
		Network_interface iface;
		iface.mac = generate_mac();
		spec.network = Network_spec{{iface}};
		break;
	}
	case Network_setting::disabled:
		break;
	case Network_setting::enabled_literal:
		errors.push_back({"network", "must be a list of interfaces or false, not 'true'"});
		break;
	case Network_setting::interfaces: {
		Network_spec network;
		for (auto iface : partial.network_interfaces) {
			if (iface.mac.empty())
				iface.mac = generate_mac();
			network.interfaces.push_back(iface);
		}
		spec.network = network;
		break;
	}
	}

	spec.cloud_init = partial.cloud_init;

	auto violations = validate(spec);
	errors.insert(errors.end(), violations.begin(), violations.end());
	if (!errors.empty())
		throw Compute_error::validation(std::move(errors));
	return spec;
}

std::vector<Field_error> validate(const Instance_spec &spec)
{
	std::vector<Field_error> errors;
	static const std::regex name_regex("^[a-z0-9_-]+$");
	static const std::regex mac_regex("^([0-9a-fA-F]{2}:){5}[0-9a-fA-F]{2}$");

	if (!std::regex_match(spec.name, name_regex))
		errors.push_back({"name", "Name can contain only lowercase letters, numbers, minus sign and underscore."});

	// Memory and vCPUs
	if (spec.memory == 0)
		errors.push_back({"memory", "must be greater than zero"});
	if (spec.max_memory == 0)
		errors.push_back({"max_memory", "must be greater than zero"});
	if (spec.memory > spec.max_memory)
		errors.push_back({"memory", "memory (" + std::to_string(spec.memory) + " MiB) exceeds max_memory ("
				+ std::to_string(spec.max_memory) + " MiB)"});
	if (spec.vcpus == 0)
		errors.push_back({"vcpus", "must be greater than zero"});
	if (spec.max_vcpus == 0)
		errors.push_back({"max_vcpus", "must be greater than zero"});
	if (spec.vcpus > spec.max_vcpus)
		errors.push_back({"vcpus", "vcpus (" + std::to_string(spec.vcpus) + ") exceeds max_vcpus ("
				+ std::to_string(spec.max_vcpus) + ")"});

	// CPU
	if (spec.cpu.topology) {
		const auto &topology = *spec.cpu.topology;
		if (topology.sockets == 0 || topology.cores == 0 || topology.threads == 0 || topology.dies == 0) {
			errors.push_back({"cpu.topology", "sockets, dies, cores and threads must be greater than zero"});
		} else if (topology.product() != spec.max_vcpus) {
			errors.push_back({"cpu.topology", "CPU topology does not match vCPUs number: sockets*dies*cores*threads = "
					+ std::to_string(topology.product()) + ", max_vcpus = " + std::to_string(spec.max_vcpus)});
		}
	}

	// Platform
	if (spec.arch.empty())
		errors.push_back({"arch", "field required"});
	if (spec.machine.empty())
		errors.push_back({"machine", "field required"});
	if (spec.emulator.empty())
		errors.push_back({"emulator", "field required"});
	for (size_t i = 0; i != spec.boot_order.size(); ++i) {
		if (boot_devices.count(spec.boot_order[i]) == 0)
			errors.push_back({"boot.order." + std::to_string(i), "unknown boot device '" + spec.boot_order[i]
					+ "', valid devices are: " + join(boot_devices)});
	}

	// Volumes
	auto system_volumes = std::count_if(spec.volumes.begin(), spec.volumes.end(),
			[](const Volume_spec &v){return v.is_system;});
	if (system_volumes != 1)
		errors.push_back({"volumes", "Volumes list must contain exactly one system volume, found "
				+ std::to_string(system_volumes)});
	std::set<std::string> sources;
	std::set<std::string> targets;
	for (size_t i = 0; i != spec.volumes.size(); ++i) {
		const auto &volume = spec.volumes[i];
		const std::string path = "volumes." + std::to_string(i);
		if (volume_types.count(volume.type) == 0)
			errors.push_back({path + ".type", "must be one of: " + join(volume_types)});
		if (volume_devices.count(volume.device) == 0)
			errors.push_back({path + ".device", "must be one of: " + join(volume_devices)});
		if (volume_buses.count(volume.bus) == 0)
			errors.push_back({path + ".bus", "must be one of: " + join(volume_buses)});
		if (!volume.source && !volume.capacity)
			errors.push_back({path, "volume must have either 'source' or 'capacity'"});
		if (volume.type == "network" && !volume.source)
			errors.push_back({path + ".source", "network volumes require a source"});
		if (volume.capacity && volume.capacity->value == 0)
			errors.push_back({path + ".capacity.value", "must be greater than zero"});
		if (volume.is_system && volume.is_readonly)
			errors.push_back({path, "system volume must not be read-only"});
		if (volume.source && !sources.insert(*volume.source).second)
			errors.push_back({path + ".source", "duplicate volume source '" + *volume.source + "'"});
		if (volume.target.empty())
			errors.push_back({path + ".target", "field required"});
		else if (!targets.insert(volume.target).second)
			errors.push_back({path + ".target", "duplicate volume target '" + volume.target + "'"});
	}

	// Network
	if (spec.network) {
		for (size_t i = 0; i != spec.network->interfaces.size(); ++i) {
			const auto &iface = spec.network->interfaces[i];
			const std::string path = "network.interfaces." + std::to_string(i);
			if (iface.source.empty())
				errors.push_back({path + ".source", "field required"});
			if (!std::regex_match(iface.mac, mac_regex))
				errors.push_back({path + ".mac", "invalid MAC address '" + iface.mac + "'"});
		}
	}
	return errors;
}

YAML::Node to_yaml(const Instance_spec &spec)
{
	YAML::Node node;
	node["name"] = spec.name;
	node["title"] = spec.title;
	node["description"] = spec.description;
	node["memory"] = spec.memory;
	node["max_memory"] = spec.max_memory;
	node["vcpus"] = spec.vcpus;
	node["max_vcpus"] = spec.max_vcpus;
	node["cpu"]["emulation_mode"] = to_string(spec.cpu.emulation_mode);
	if (!spec.cpu.model.empty())
		node["cpu"]["model"] = spec.cpu.model;
	if (!spec.cpu.vendor.empty())
		node["cpu"]["vendor"] = spec.cpu.vendor;
	if (spec.cpu.topology) {
		node["cpu"]["topology"]["sockets"] = spec.cpu.topology->sockets;
		node["cpu"]["topology"]["dies"] = spec.cpu.topology->dies;
		node["cpu"]["topology"]["cores"] = spec.cpu.topology->cores;
		node["cpu"]["topology"]["threads"] = spec.cpu.topology->threads;
	}
	if (spec.cpu.features) {
		node["cpu"]["features"]["require"] = spec.cpu.features->require;
		node["cpu"]["features"]["disable"] = spec.cpu.features->disable;
	}
	node["machine"] = spec.machine;
	node["emulator"] = spec.emulator;
	node["arch"] = spec.arch;
	node["boot"]["order"] = spec.boot_order;
	for (const auto &volume : spec.volumes) {
		YAML::Node volume_node;
		volume_node["type"] = volume.type;
		volume_node["device"] = volume.device;
		volume_node["bus"] = volume.bus;
		volume_node["target"] = volume.target;
		volume_node["driver"]["name"] = volume.driver.name;
		volume_node["driver"]["type"] = volume.driver.type;
		volume_node["driver"]["cache"] = volume.driver.cache;
		if (volume.source)
			volume_node["source"] = *volume.source;
		if (volume.capacity) {
			volume_node["capacity"]["value"] = volume.capacity->value;
			volume_node["capacity"]["unit"] = to_string(volume.capacity->unit);
		}
		volume_node["is_readonly"] = volume.is_readonly;
		volume_node["is_system"] = volume.is_system;
		node["volumes"].push_back(volume_node);
	}
	if (spec.network) {
		for (const auto &iface : spec.network->interfaces) {
			YAML::Node iface_node;
			iface_node["source"] = iface.source;
			iface_node["mac"] = iface.mac;
			iface_node["model"] = iface.model;
			node["network"]["interfaces"].push_back(iface_node);
		}
	} else {
		node["network"] = false;
	}
	if (spec.image)
		node["image"] = *spec.image;
	if (spec.cloud_init) {
		const auto &cloud_init = *spec.cloud_init;
		node["cloud_init"]["user_data"] = cloud_init.user_data ? YAML::Node(*cloud_init.user_data) : YAML::Node();
		node["cloud_init"]["meta_data"] = cloud_init.meta_data ? YAML::Node(*cloud_init.meta_data) : YAML::Node();
		node["cloud_init"]["vendor_data"] = cloud_init.vendor_data ? YAML::Node(*cloud_init.vendor_data) : YAML::Node();
		node["cloud_init"]["network_config"] = cloud_init.network_config ? YAML::Node(*cloud_init.network_config) : YAML::Node();
	}
	return node;
}

} // namespace compute
