/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "errors.hpp"
#include "schema.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace compute;

namespace {

Spec_defaults test_defaults()
{
	Spec_defaults defaults;
	defaults.arch = "x86_64";
	defaults.machine = "pc-i440fx-6.2";
	defaults.emulator = "/usr/bin/qemu-system-x86_64";
	defaults.host_cpus = 4;
	defaults.host_memory = 8192;
	defaults.generate_name = []{return std::string("generated");};
	defaults.generate_mac = []{return std::string("00:16:3e:00:00:01");};
	return defaults;
}

Instance_spec build(const std::string &yaml)
{
	Partial_instance_spec partial;
	partial.from_string(yaml);
	return build_instance_spec(partial, test_defaults());
}

std::vector<Field_error> build_errors(const std::string &yaml)
{
	try {
		build(yaml);
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::validation);
		return e.field_errors();
	}
	ADD_FAILURE() << "expected a validation error for:\n" << yaml;
	return {};
}

bool has_error(const std::vector<Field_error> &errors, const std::string &path, const std::string &text = "")
{
	return std::any_of(errors.begin(), errors.end(), [&](const Field_error &error) {
		return error.path == path && error.message.find(text) != std::string::npos;
	});
}

const std::string system_volume =
	"volumes:\n"
	"  - is_system: true\n"
	"    capacity: {value: 20, unit: GiB}\n";

} // namespace

TEST(Schema, defaults_fill_missing_fields)
{
	auto spec = build("name: vm1\n" + system_volume);
	EXPECT_EQ(spec.name, "vm1");
	EXPECT_EQ(spec.memory, 1024u);
	EXPECT_EQ(spec.max_memory, 8192u);
	EXPECT_EQ(spec.vcpus, 1u);
	EXPECT_EQ(spec.max_vcpus, 4u);
	EXPECT_EQ(spec.arch, "x86_64");
	EXPECT_EQ(spec.cpu.emulation_mode, Cpu_emulation_mode::host_passthrough);
	EXPECT_EQ(spec.boot_order, (std::vector<std::string>{"cdrom", "hd"}));

	ASSERT_EQ(spec.volumes.size(), 1u);
	const auto &volume = spec.volumes[0];
	EXPECT_EQ(volume.target, "vda");
	EXPECT_EQ(volume.bus, "virtio");
	EXPECT_EQ(volume.driver.type, "qcow2");
	ASSERT_TRUE(volume.capacity);
	EXPECT_EQ(volume.capacity->bytes(), 21474836480ULL);

	ASSERT_TRUE(spec.network);
	ASSERT_EQ(spec.network->interfaces.size(), 1u);
	EXPECT_EQ(spec.network->interfaces[0].source, "default");
	EXPECT_EQ(spec.network->interfaces[0].mac, "00:16:3e:00:00:01");
}

TEST(Schema, missing_name_is_generated)
{
	auto spec = build(system_volume);
	EXPECT_EQ(spec.name, "generated");
}

TEST(Schema, capacity_without_unit_is_bytes)
{
	auto spec = build("name: vm1\nvolumes:\n  - is_system: true\n    capacity: {value: 4096}\n");
	EXPECT_EQ(spec.volumes[0].capacity->bytes(), 4096u);
}

TEST(Schema, topology_must_match_max_vcpus)
{
	auto errors = build_errors(
		"name: vm1\n"
		"max_vcpus: 4\n"
		"cpu:\n"
		"  topology: {sockets: 1, cores: 1, threads: 2}\n" + system_volume);
	EXPECT_TRUE(has_error(errors, "cpu.topology", "CPU topology does not match vCPUs number"));
}

TEST(Schema, topology_dies_count)
{
	auto spec = build(
		"name: vm1\n"
		"max_vcpus: 4\n"
		"cpu:\n"
		"  topology: {sockets: 1, dies: 2, cores: 2, threads: 1}\n" + system_volume);
	ASSERT_TRUE(spec.cpu.topology);
	EXPECT_EQ(spec.cpu.topology->product(), 4u);
}

TEST(Schema, exactly_one_system_volume)
{
	auto none = build_errors("name: vm1\nvolumes:\n  - capacity: {value: 1, unit: GiB}\n");
	EXPECT_TRUE(has_error(none, "volumes", "found 0"));

	auto two = build_errors(
		"name: vm1\n"
		"volumes:\n"
		"  - {is_system: true, capacity: {value: 1, unit: GiB}}\n"
		"  - {is_system: true, capacity: {value: 1, unit: GiB}}\n");
	EXPECT_TRUE(has_error(two, "volumes", "found 2"));
}

TEST(Schema, all_violations_are_reported_together)
{
	auto errors = build_errors(
		"name: Bad Name\n"
		"memory: lots\n"
		"vcpus: 8\n"
		"volumes:\n"
		"  - is_system: true\n"
		"    size: 10\n");
	EXPECT_TRUE(has_error(errors, "name"));
	EXPECT_TRUE(has_error(errors, "memory", "invalid value"));
	EXPECT_TRUE(has_error(errors, "vcpus", "exceeds max_vcpus"));
	EXPECT_TRUE(has_error(errors, "volumes.0.size", "unknown field"));
	EXPECT_TRUE(has_error(errors, "volumes.0", "either 'source' or 'capacity'"));
}

TEST(Schema, memory_bounded_by_max_memory)
{
	auto errors = build_errors("name: vm1\nmemory: 4096\nmax_memory: 2048\n" + system_volume);
	EXPECT_TRUE(has_error(errors, "memory", "exceeds max_memory"));
}

TEST(Schema, invalid_capacity_unit)
{
	auto errors = build_errors("name: vm1\nvolumes:\n  - is_system: true\n    capacity: {value: 1, unit: GiBs}\n");
	EXPECT_TRUE(has_error(errors, "volumes.0.capacity.unit", "GiBs"));
}

TEST(Schema, cdrom_defaults_and_targets)
{
	auto spec = build(
		"name: vm1\n"
		"volumes:\n"
		"  - {is_system: true, capacity: {value: 1, unit: GiB}}\n"
		"  - {device: cdrom, source: /var/lib/images/install.iso}\n"
		"  - {target: vda, source: /var/lib/volumes/data.qcow2}\n");
	ASSERT_EQ(spec.volumes.size(), 3u);
	EXPECT_EQ(spec.volumes[0].target, "vdb");
	const auto &cdrom = spec.volumes[1];
	EXPECT_EQ(cdrom.target, "hda");
	EXPECT_EQ(cdrom.bus, "ide");
	EXPECT_EQ(cdrom.driver.type, "raw");
	EXPECT_TRUE(cdrom.is_readonly);
	EXPECT_EQ(spec.volumes[2].target, "vda");
}

TEST(Schema, duplicate_targets_and_sources)
{
	auto errors = build_errors(
		"name: vm1\n"
		"volumes:\n"
		"  - {is_system: true, target: vda, capacity: {value: 1, unit: GiB}}\n"
		"  - {target: vda, source: /data.qcow2}\n"
		"  - {target: vdc, source: /data.qcow2}\n");
	EXPECT_TRUE(has_error(errors, "volumes.1.target", "duplicate"));
	EXPECT_TRUE(has_error(errors, "volumes.2.source", "duplicate"));
}

TEST(Schema, readonly_system_volume)
{
	auto errors = build_errors("name: vm1\nvolumes:\n  - {is_system: true, is_readonly: true, capacity: {value: 1}}\n");
	EXPECT_TRUE(has_error(errors, "volumes.0", "read-only"));
}

TEST(Schema, network_settings)
{
	auto disabled = build("name: vm1\nnetwork: false\n" + system_volume);
	EXPECT_FALSE(disabled.network);

	auto null_network = build("name: vm1\nnetwork: null\n" + system_volume);
	EXPECT_FALSE(null_network.network);

	auto enabled = build_errors("name: vm1\nnetwork: true\n" + system_volume);
	EXPECT_TRUE(has_error(enabled, "network"));

	auto list = build(
		"name: vm1\n"
		"network:\n"
		"  - {source: bridged, mac: '52:54:00:aa:bb:cc'}\n"
		"  - {model: e1000}\n" + system_volume);
	ASSERT_TRUE(list.network);
	ASSERT_EQ(list.network->interfaces.size(), 2u);
	EXPECT_EQ(list.network->interfaces[0].source, "bridged");
	EXPECT_EQ(list.network->interfaces[0].mac, "52:54:00:aa:bb:cc");
	EXPECT_EQ(list.network->interfaces[1].model, "e1000");
	EXPECT_EQ(list.network->interfaces[1].mac, "00:16:3e:00:00:01");

	auto bad_mac = build_errors("name: vm1\nnetwork:\n  interfaces:\n    - {mac: nope}\n" + system_volume);
	EXPECT_TRUE(has_error(bad_mac, "network.interfaces.0.mac"));
}

TEST(Schema, unknown_boot_device)
{
	auto errors = build_errors("name: vm1\nboot:\n  order: [hd, usb]\n" + system_volume);
	EXPECT_TRUE(has_error(errors, "boot.order.1", "usb"));
}

TEST(Schema, cloud_init_payloads)
{
	auto spec = build(
		"name: vm1\n"
		"cloud_init:\n"
		"  user_data: |\n"
		"    #cloud-config\n"
		"    hostname: vm1\n"
		"  meta_data:\n"
		"    instance-id: vm1\n" + system_volume);
	ASSERT_TRUE(spec.cloud_init);
	ASSERT_TRUE(spec.cloud_init->user_data);
	EXPECT_EQ(*spec.cloud_init->user_data, "#cloud-config\nhostname: vm1\n");
	ASSERT_TRUE(spec.cloud_init->meta_data);
	EXPECT_NE(spec.cloud_init->meta_data->find("instance-id: vm1"), std::string::npos);
	EXPECT_FALSE(spec.cloud_init->vendor_data);
}

TEST(Schema, yaml_of_built_spec)
{
	auto spec = build("name: vm1\nnetwork: false\n" + system_volume);
	auto node = to_yaml(spec);
	EXPECT_EQ(node["name"].as<std::string>(), "vm1");
	EXPECT_EQ(node["volumes"][0]["capacity"]["unit"].as<std::string>(), "GiB");
	EXPECT_FALSE(node["network"].as<bool>());
}

TEST(Schema, partial_spec_emit_and_load)
{
	Partial_instance_spec partial;
	partial.from_string(
		"name: vm1\n"
		"max_vcpus: 4\n"
		"cpu:\n"
		"  emulation_mode: custom\n"
		"  model: EPYC\n"
		"  topology: {sockets: 1, cores: 2, threads: 2}\n"
		"boot: {order: [hd]}\n"
		"network: [{source: br0, mac: '00:16:3e:00:00:02'}]\n"
		"cloud_init: {user_data: hello}\n"
		"volumes:\n"
		"  - is_system: true\n"
		"    driver: {cache: none}\n"
		"    capacity: {value: 20, unit: GiB}\n"
		"  - {device: cdrom, source: /srv/install.iso}\n");
	ASSERT_TRUE(partial.errors().empty());

	Partial_instance_spec reloaded;
	reloaded.from_string(partial.to_string());
	EXPECT_TRUE(reloaded.errors().empty());
	EXPECT_FALSE(reloaded.memory);
	EXPECT_FALSE(reloaded.emit()["memory"]);

	auto spec = build_instance_spec(reloaded, test_defaults());
	EXPECT_EQ(spec.name, "vm1");
	EXPECT_EQ(spec.cpu.model, "EPYC");
	ASSERT_TRUE(spec.cpu.topology);
	EXPECT_EQ(spec.cpu.topology->cores, 2u);
	EXPECT_EQ(spec.boot_order, std::vector<std::string>{"hd"});
	ASSERT_TRUE(spec.network);
	ASSERT_EQ(spec.network->interfaces.size(), 1u);
	EXPECT_EQ(spec.network->interfaces[0].source, "br0");
	EXPECT_EQ(spec.network->interfaces[0].mac, "00:16:3e:00:00:02");
	ASSERT_TRUE(spec.cloud_init);
	EXPECT_EQ(*spec.cloud_init->user_data, "hello");
	ASSERT_EQ(spec.volumes.size(), 2u);
	EXPECT_EQ(spec.volumes[0].driver.cache, "none");
	EXPECT_EQ(spec.volumes[0].capacity->bytes(), 21474836480ULL);
	EXPECT_EQ(*spec.volumes[1].source, "/srv/install.iso");
}

TEST(Schema, partial_spec_emits_network_setting)
{
	Partial_instance_spec partial;
	partial.from_string("network: false\n");
	EXPECT_FALSE(partial.emit()["network"].as<bool>());
	partial.from_string("network: true\n");
	EXPECT_TRUE(partial.emit()["network"].as<bool>());
	partial.from_string("name: vm1\n");
	EXPECT_FALSE(partial.emit()["network"]);
}
