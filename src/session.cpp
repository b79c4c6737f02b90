/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "session.hpp"

#include "cloud_init.hpp"
#include "descriptors.hpp"
#include "errors.hpp"
#include "ids.hpp"
#include "libvirt_hypervisor.hpp"
#include "logging.hpp"
#include "xml_utility.hpp"

FASTLIB_LOG_INIT(session_log, "Session")
FASTLIB_LOG_SET_LEVEL_GLOBAL(session_log, trace);

namespace compute {

namespace {

std::string join_path(const std::string &dir, const std::string &name)
{
	if (!dir.empty() && dir.back() == '/')
		return dir + name;
	return dir + "/" + name;
}

} // namespace

Session::Session(std::unique_ptr<Connection_handle> connection, std::string images_pool, std::string volumes_pool) :
	conn(std::move(connection)),
	images_pool_name(std::move(images_pool)),
	volumes_pool_name(std::move(volumes_pool))
{
}

Session Session::open(const Config &config)
{
	std::unique_ptr<Connection_handle> connection(new Libvirt_connection(config.libvirt_uri));
	return Session(std::move(connection), config.images_pool, config.volumes_pool);
}

Connection_handle & Session::connection()
{
	return *conn;
}

Capabilities Session::capabilities()
{
	auto pt = read_xml_from_string(conn->domain_capabilities());
	Capabilities caps;
	caps.arch = pt.get<std::string>("domainCapabilities.arch", "");
	caps.virt = pt.get<std::string>("domainCapabilities.domain", "");
	caps.emulator = pt.get<std::string>("domainCapabilities.path", "");
	caps.machine = pt.get<std::string>("domainCapabilities.machine", "");
	return caps;
}

Node_info Session::node_info()
{
	return conn->node_info();
}

Spec_defaults Session::spec_defaults()
{
	auto caps = capabilities();
	auto node = node_info();
	Spec_defaults defaults;
	defaults.arch = caps.arch;
	defaults.machine = caps.machine;
	defaults.emulator = caps.emulator;
	defaults.host_cpus = node.cpus;
	defaults.host_memory = node.memory / 1024;
	return defaults;
}

Instance Session::create_instance(const Partial_instance_spec &partial)
{
	return create_instance(build_instance_spec(partial, spec_defaults()));
}

Instance Session::create_instance(const Instance_spec &spec)
{
	Instance_config config(spec);
	COMPUTE_LOG(session_log, trace) << "Define instance " << spec.name << ".";
	Instance instance(conn->define_domain(config.render()), *conn);

	std::unique_ptr<Storage_pool> volumes;
	std::string volumes_path;
	auto get_volumes_pool = [&]() -> Storage_pool & {
		if (!volumes) {
			volumes.reset(new Storage_pool(volumes_pool()));
			volumes_path = volumes->path();
		}
		return *volumes;
	};

	std::vector<std::string> targets;
	for (const auto &volume : spec.volumes) {
		targets.push_back(volume.target);
		if (volume.source) {
			instance.attach_device(Disk_config::from_volume(volume, *volume.source));
			continue;
		}
		auto &pool = get_volumes_pool();
		auto capacity = volume.capacity->bytes();
		auto name = spec.name + "-" + volume.target + "-" + random_uuid() + ".qcow2";
		Volume_config volume_config(name, join_path(volumes_path, name), capacity);
		if (volume.is_system && spec.image) {
			COMPUTE_LOG(session_log, trace) << "Clone image " << *spec.image << " to " << name << ".";
			auto image = images_pool().get_volume(*spec.image);
			auto clone = pool.clone_volume(image, volume_config);
			clone.resize(capacity);
		} else {
			pool.create_volume(volume_config);
		}
		instance.attach_device(Disk_config::from_volume(volume, volume_config.path()));
	}

	if (spec.cloud_init) {
		auto &pool = get_volumes_pool();
		Cloud_init cloud_init(resolve_cloud_init_payloads(*spec.cloud_init));
		auto path = join_path(volumes_path, Cloud_init::disk_name(spec.name));
		COMPUTE_LOG(session_log, trace) << "Create cloud-init disk " << path << ".";
		cloud_init.create_disk(path);
		pool.refresh();
		cloud_init.attach_disk(path, next_disk_target(targets, "vd"), instance);
	}
	return instance;
}

Instance Session::get_instance(const std::string &name)
{
	return Instance(conn->lookup_domain(name), *conn);
}

std::vector<Instance> Session::list_instances()
{
	std::vector<Instance> instances;
	for (auto &domain : conn->list_domains())
		instances.emplace_back(std::move(domain), *conn);
	return instances;
}

Storage_pool Session::get_storage_pool(const std::string &name)
{
	return Storage_pool(conn->lookup_pool(name));
}

std::vector<Storage_pool> Session::list_storage_pools()
{
	std::vector<Storage_pool> pools;
	for (auto &pool : conn->list_pools())
		pools.emplace_back(std::move(pool));
	return pools;
}

Storage_pool Session::images_pool()
{
	return get_storage_pool(images_pool_name);
}

Storage_pool Session::volumes_pool()
{
	return get_storage_pool(volumes_pool_name);
}

} // namespace compute
