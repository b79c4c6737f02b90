/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "descriptors.hpp"

#include "xml_utility.hpp"

#include <boost/property_tree/xml_parser.hpp>

#include <stdexcept>

namespace compute {

namespace pt = boost::property_tree;

//
// Helper functions
//

namespace {

// Drops the xml declaration written by boost::property_tree.
std::string strip_declaration(const std::string &xml)
{
	auto pos = xml.find("?>");
	if (xml.compare(0, 5, "<?xml") != 0 || pos == std::string::npos)
		return xml;
	pos += 2;
	while (pos < xml.size() && (xml[pos] == '\n' || xml[pos] == '\r'))
		++pos;
	return xml.substr(pos);
}

std::string render_element(const std::string &name, const pt::ptree &element)
{
	pt::ptree root;
	root.add_child(name, element);
	return strip_declaration(write_xml_to_string(root));
}

pt::ptree make_attribute_node(const std::string &attribute, const std::string &value)
{
	pt::ptree node;
	node.put("<xmlattr>." + attribute, value);
	return node;
}

pt::ptree render_cpu(const Cpu_spec &cpu)
{
	pt::ptree node;
	node.put("<xmlattr>.mode", to_string(cpu.emulation_mode));
	if (cpu.emulation_mode == Cpu_emulation_mode::host_passthrough) {
		node.put("<xmlattr>.check", "none");
		node.put("<xmlattr>.migratable", "on");
	} else {
		node.put("<xmlattr>.match", "exact");
		node.put("<xmlattr>.check", "partial");
	}
	if (!cpu.model.empty()) {
		node.put("model", cpu.model);
		node.put("model.<xmlattr>.fallback", "forbid");
	}
	if (!cpu.vendor.empty())
		node.put("vendor", cpu.vendor);
	if (cpu.topology) {
		node.put("topology.<xmlattr>.sockets", cpu.topology->sockets);
		node.put("topology.<xmlattr>.dies", cpu.topology->dies);
		node.put("topology.<xmlattr>.cores", cpu.topology->cores);
		node.put("topology.<xmlattr>.threads", cpu.topology->threads);
	}
	if (cpu.features) {
		for (const auto &name : cpu.features->require) {
			auto feature = make_attribute_node("policy", "require");
			feature.put("<xmlattr>.name", name);
			node.add_child("feature", feature);
		}
		for (const auto &name : cpu.features->disable) {
			auto feature = make_attribute_node("policy", "disable");
			feature.put("<xmlattr>.name", name);
			node.add_child("feature", feature);
		}
	}
	return node;
}

pt::ptree render_devices(const Instance_spec &spec)
{
	pt::ptree devices;
	devices.put("emulator", spec.emulator);
	if (spec.network) {
		for (const auto &iface : spec.network->interfaces) {
			auto node = make_attribute_node("type", "network");
			node.put("source.<xmlattr>.network", iface.source);
			node.put("mac.<xmlattr>.address", iface.mac);
			node.put("model.<xmlattr>.type", iface.model);
			devices.add_child("interface", node);
		}
	}
	auto graphics = make_attribute_node("type", "vnc");
	graphics.put("<xmlattr>.port", "-1");
	graphics.put("<xmlattr>.autoport", "yes");
	devices.add_child("graphics", graphics);

	auto input = make_attribute_node("type", "tablet");
	input.put("<xmlattr>.bus", "usb");
	devices.add_child("input", input);

	// Guest agent channel
	auto channel = make_attribute_node("type", "unix");
	channel.put("source.<xmlattr>.mode", "bind");
	channel.put("target.<xmlattr>.type", "virtio");
	channel.put("target.<xmlattr>.name", "org.qemu.guest_agent.0");
	channel.put("address.<xmlattr>.type", "virtio-serial");
	channel.put("address.<xmlattr>.controller", "0");
	channel.put("address.<xmlattr>.bus", "0");
	channel.put("address.<xmlattr>.port", "1");
	devices.add_child("channel", channel);

	auto console = make_attribute_node("type", "pty");
	console.put("target.<xmlattr>.type", "serial");
	console.put("target.<xmlattr>.port", "0");
	devices.add_child("console", console);

	pt::ptree video;
	video.put("model.<xmlattr>.type", "vga");
	video.put("model.<xmlattr>.vram", "16384");
	video.put("model.<xmlattr>.heads", "1");
	video.put("model.<xmlattr>.primary", "yes");
	devices.add_child("video", video);
	return devices;
}

std::string required_attribute(const pt::ptree &disk, const std::string &path, const std::string &attribute, const std::string &fragment)
{
	auto value = get_attribute(disk, path, attribute);
	if (value.empty()) {
		auto name = path.empty() ? "disk" : path;
		throw Compute_error::invalid_device_descriptor("missing attribute '" + attribute + "' of <" + name + ">", fragment);
	}
	return value;
}

} // namespace

//
// Instance_config implementation
//

Instance_config::Instance_config(Instance_spec spec) :
	instance_spec(std::move(spec))
{
}

const Instance_spec & Instance_config::spec() const
{
	return instance_spec;
}

std::string Instance_config::render() const
{
	const auto &spec = instance_spec;
	pt::ptree domain;
	domain.put("<xmlattr>.type", "kvm");
	domain.put("name", spec.name);
	if (!spec.title.empty())
		domain.put("title", spec.title);
	if (!spec.description.empty())
		domain.put("description", spec.description);
	domain.put("metadata", "");
	domain.put("memory", to_bytes(spec.max_memory, Data_unit::mib) / 1024);
	domain.put("memory.<xmlattr>.unit", "KiB");
	domain.put("currentMemory", to_bytes(spec.memory, Data_unit::mib) / 1024);
	domain.put("currentMemory.<xmlattr>.unit", "KiB");
	domain.put("vcpu", spec.max_vcpus);
	domain.put("vcpu.<xmlattr>.placement", "static");
	domain.put("vcpu.<xmlattr>.current", spec.vcpus);
	domain.add_child("cpu", render_cpu(spec.cpu));

	pt::ptree os;
	os.put("type", "hvm");
	os.put("type.<xmlattr>.arch", spec.arch);
	os.put("type.<xmlattr>.machine", spec.machine);
	for (const auto &dev : spec.boot_order)
		os.add_child("boot", make_attribute_node("dev", dev));
	domain.add_child("os", os);

	domain.put("features.acpi", "");
	domain.put("features.apic", "");
	domain.put("on_poweroff", "destroy");
	domain.put("on_reboot", "restart");
	domain.put("on_crash", "restart");
	domain.put("pm.suspend-to-mem.<xmlattr>.enabled", "no");
	domain.put("pm.suspend-to-disk.<xmlattr>.enabled", "no");
	domain.add_child("devices", render_devices(spec));
	return render_element("domain", domain);
}

//
// Volume_config implementation
//

Volume_config::Volume_config(std::string name, std::string path, unsigned long long capacity) :
	volume_name(std::move(name)),
	volume_path(std::move(path)),
	volume_capacity(capacity)
{
}

const std::string & Volume_config::name() const
{
	return volume_name;
}

const std::string & Volume_config::path() const
{
	return volume_path;
}

unsigned long long Volume_config::capacity() const
{
	return volume_capacity;
}

std::string Volume_config::render() const
{
	return render(std::time(nullptr));
}

std::string Volume_config::render(std::time_t timestamp) const
{
	auto time_str = std::to_string(static_cast<long long>(timestamp)) + ".0";
	pt::ptree volume;
	volume.put("<xmlattr>.type", "file");
	volume.put("name", volume_name);
	volume.put("key", volume_path);
	volume.put("source", "");
	volume.put("capacity", volume_capacity);
	volume.put("capacity.<xmlattr>.unit", "bytes");
	volume.put("allocation", 0);
	volume.put("allocation.<xmlattr>.unit", "bytes");
	volume.put("target.path", volume_path);
	volume.put("target.format.<xmlattr>.type", "qcow2");
	volume.put("target.permissions.mode", "0644");
	volume.put("target.timestamps.atime", time_str);
	volume.put("target.timestamps.mtime", time_str);
	volume.put("target.timestamps.ctime", time_str);
	volume.put("target.compat", "1.1");
	volume.put("target.features.lazy_refcounts", "");
	return render_element("volume", volume);
}

//
// Disk_config implementation
//

Disk_config Disk_config::from_volume(const Volume_spec &volume, const std::string &source)
{
	Disk_config disk;
	disk.type = volume.type;
	disk.device = volume.device;
	disk.driver = volume.driver;
	disk.source = source;
	disk.target = volume.target;
	disk.bus = volume.bus;
	disk.is_readonly = volume.is_readonly;
	return disk;
}

Disk_config Disk_config::parse(const std::string &xml)
{
	pt::ptree root;
	try {
		root = read_xml_from_string(xml);
	} catch (const pt::xml_parser_error &e) {
		throw Compute_error::invalid_device_descriptor(std::string("malformed xml: ") + e.what(), xml);
	}
	auto disk = root.get_child_optional("disk");
	if (!disk)
		throw Compute_error::invalid_device_descriptor("no <disk> element", xml);
	return parse(*disk);
}

Disk_config Disk_config::parse(const pt::ptree &disk)
{
	const auto fragment = render_element("disk", disk);
	Disk_config config;
	config.type = required_attribute(disk, "", "type", fragment);
	config.device = required_attribute(disk, "", "device", fragment);
	config.driver.name = get_attribute(disk, "driver", "name");
	config.driver.type = get_attribute(disk, "driver", "type");
	config.driver.cache = get_attribute(disk, "driver", "cache");
	// An ejected cdrom or an externally edited disk may carry no <source>.
	if (config.type == "network") {
		auto name = get_attribute(disk, "source", "name");
		if (!name.empty())
			config.source = required_attribute(disk, "source", "protocol", fragment) + "://" + name;
	} else if (config.type == "volume") {
		auto volume = get_attribute(disk, "source", "volume");
		if (!volume.empty())
			config.source = required_attribute(disk, "source", "pool", fragment) + "/" + volume;
	} else if (config.type == "block") {
		config.source = get_attribute(disk, "source", "dev");
	} else {
		config.source = get_attribute(disk, "source", "file");
	}
	config.target = required_attribute(disk, "target", "dev", fragment);
	config.bus = get_attribute(disk, "target", "bus");
	config.is_readonly = static_cast<bool>(disk.get_child_optional("readonly"));
	return config;
}

std::string Disk_config::render() const
{
	pt::ptree disk;
	disk.put("<xmlattr>.type", type);
	disk.put("<xmlattr>.device", device);
	if (!driver.name.empty())
		disk.put("driver.<xmlattr>.name", driver.name);
	if (!driver.type.empty())
		disk.put("driver.<xmlattr>.type", driver.type);
	if (!driver.cache.empty())
		disk.put("driver.<xmlattr>.cache", driver.cache);
	if (type == "network" && !source.empty()) {
		auto pos = source.find("://");
		if (pos == std::string::npos)
			throw Compute_error(Error_kind::invalid_argument, "Network disk source '" + source + "' is not of the form protocol://name.");
		disk.put("source.<xmlattr>.protocol", source.substr(0, pos));
		disk.put("source.<xmlattr>.name", source.substr(pos + 3));
	} else if (type == "volume" && !source.empty()) {
		auto pos = source.find('/');
		if (pos == std::string::npos)
			throw Compute_error(Error_kind::invalid_argument, "Volume disk source '" + source + "' is not of the form pool/volume.");
		disk.put("source.<xmlattr>.pool", source.substr(0, pos));
		disk.put("source.<xmlattr>.volume", source.substr(pos + 1));
	} else if (type == "block" && !source.empty()) {
		disk.put("source.<xmlattr>.dev", source);
	} else if (!source.empty()) {
		disk.put("source.<xmlattr>.file", source);
	}
	disk.put("target.<xmlattr>.dev", target);
	if (!bus.empty())
		disk.put("target.<xmlattr>.bus", bus);
	if (is_readonly)
		disk.put("readonly", "");
	return render_element("disk", disk);
}

bool Disk_config::operator==(const Disk_config &rhs) const
{
	return type == rhs.type && device == rhs.device && driver == rhs.driver && source == rhs.source
		&& target == rhs.target && bus == rhs.bus && is_readonly == rhs.is_readonly;
}

} // namespace compute
