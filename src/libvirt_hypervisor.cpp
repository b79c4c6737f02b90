/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "libvirt_hypervisor.hpp"

#include "logging.hpp"
#include "utility.hpp"

#include <libvirt/libvirt.h>
#include <libvirt/libvirt-qemu.h>
#include <libvirt/virterror.h>

#include <cstdlib>
#include <stdexcept>
#include <memory>

FASTLIB_LOG_INIT(libvirt_hyp_log, "Libvirt_hypervisor")
FASTLIB_LOG_SET_LEVEL_GLOBAL(libvirt_hyp_log, trace);

namespace compute {

//
// Helper functions
//

namespace {

Domain_state to_domain_state(int state)
{
	switch (state) {
	case VIR_DOMAIN_RUNNING:
		return Domain_state::running;
	case VIR_DOMAIN_BLOCKED:
		return Domain_state::blocked;
	case VIR_DOMAIN_PAUSED:
		return Domain_state::paused;
	case VIR_DOMAIN_SHUTDOWN:
		return Domain_state::shutdown;
	case VIR_DOMAIN_SHUTOFF:
		return Domain_state::shutoff;
	case VIR_DOMAIN_CRASHED:
		return Domain_state::crashed;
	case VIR_DOMAIN_PMSUSPENDED:
		return Domain_state::pmsuspended;
	default:
		return Domain_state::nostate;
	}
}

// Translate Modification_flags to virDomainModificationImpact and friends.
unsigned int to_libvirt_flags(unsigned int flags)
{
	unsigned int ret = VIR_DOMAIN_AFFECT_CURRENT;
	if (flags & affect_live)
		ret |= VIR_DOMAIN_AFFECT_LIVE;
	if (flags & affect_config)
		ret |= VIR_DOMAIN_AFFECT_CONFIG;
	if (flags & vcpu_guest)
		ret |= VIR_DOMAIN_VCPU_GUEST;
	return ret;
}

std::shared_ptr<virStorageVol> wrap_volume(virStorageVolPtr volume)
{
	return std::shared_ptr<virStorageVol>(volume, Deleter_virStorageVol());
}

std::shared_ptr<virStoragePool> pool_of_volume(virStorageVolPtr volume)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get storage pool of volume.";
	std::shared_ptr<virStoragePool> pool(
			virStoragePoolLookupByVolume(volume),
			Deleter_virStoragePool()
	);
	if (!pool)
		throw Compute_error(Error_kind::storage, "Error getting storage pool of volume: " + last_error_message());
	return pool;
}

} // namespace

//
// Libvirt_volume implementation
//

Libvirt_volume::Libvirt_volume(std::shared_ptr<virConnect> conn, std::shared_ptr<virStorageVol> volume) :
	conn(std::move(conn)),
	volume(std::move(volume))
{
}

std::string Libvirt_volume::name() const
{
	auto ret = virStorageVolGetName(volume.get());
	if (!ret)
		throw Compute_error(Error_kind::storage, "Error getting name of volume: " + last_error_message());
	return ret;
}

std::string Libvirt_volume::path() const
{
	auto ret = virStorageVolGetPath(volume.get());
	if (!ret)
		throw Compute_error(Error_kind::storage, "Error getting path of volume: " + last_error_message());
	return convert_and_free_cstr(ret);
}

std::string Libvirt_volume::pool_name() const
{
	auto pool = pool_of_volume(volume.get());
	auto ret = virStoragePoolGetName(pool.get());
	if (!ret)
		throw Compute_error(Error_kind::storage, "Error getting name of storage pool: " + last_error_message());
	return ret;
}

std::string Libvirt_volume::xml_desc() const
{
	auto ret = virStorageVolGetXMLDesc(volume.get(), 0);
	if (!ret)
		throw Compute_error(Error_kind::storage, "Error getting xml of volume: " + last_error_message());
	return convert_and_free_cstr(ret);
}

std::unique_ptr<Volume_handle> Libvirt_volume::clone(const std::string &xml)
{
	auto pool = pool_of_volume(volume.get());
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Clone volume.";
	auto clone = wrap_volume(virStorageVolCreateXMLFrom(pool.get(), xml.c_str(), volume.get(),
			VIR_STORAGE_VOL_CREATE_PREALLOC_METADATA));
	if (!clone) {
		auto message = last_error_message();
		throw Compute_error(Error_kind::storage, "Error cloning volume " + name() + ": " + message);
	}
	return std::unique_ptr<Volume_handle>(new Libvirt_volume(conn, clone));
}

void Libvirt_volume::resize(unsigned long long capacity)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Resize volume to " << capacity << " bytes.";
	if (virStorageVolResize(volume.get(), capacity, 0) == -1) {
		auto message = last_error_message();
		throw Compute_error(Error_kind::storage, "Error resizing volume " + name() + ": " + message);
	}
}

void Libvirt_volume::remove()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Delete volume.";
	if (virStorageVolDelete(volume.get(), 0) == -1) {
		auto message = last_error_message();
		throw Compute_error(Error_kind::storage, "Error deleting volume " + name() + ": " + message);
	}
}

virStorageVolPtr Libvirt_volume::get() const
{
	return volume.get();
}

//
// Libvirt_pool implementation
//

Libvirt_pool::Libvirt_pool(std::shared_ptr<virConnect> conn, std::shared_ptr<virStoragePool> pool) :
	conn(std::move(conn)),
	pool(std::move(pool))
{
}

std::string Libvirt_pool::name() const
{
	auto ret = virStoragePoolGetName(pool.get());
	if (!ret)
		throw Compute_error(Error_kind::storage, "Error getting name of storage pool: " + last_error_message());
	return ret;
}

std::string Libvirt_pool::xml_desc() const
{
	auto ret = virStoragePoolGetXMLDesc(pool.get(), 0);
	if (!ret)
		throw Compute_error(Error_kind::storage, "Error getting xml of storage pool: " + last_error_message());
	return convert_and_free_cstr(ret);
}

void Libvirt_pool::refresh()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Refresh storage pool.";
	if (virStoragePoolRefresh(pool.get(), 0) == -1) {
		auto message = last_error_message();
		throw Compute_error(Error_kind::storage, "Error refreshing storage pool " + name() + ": " + message);
	}
}

std::unique_ptr<Volume_handle> Libvirt_pool::create_volume(const std::string &xml)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Create volume from xml.";
	auto volume = wrap_volume(virStorageVolCreateXML(pool.get(), xml.c_str(), VIR_STORAGE_VOL_CREATE_PREALLOC_METADATA));
	if (!volume) {
		auto message = last_error_message();
		throw Compute_error(Error_kind::storage, "Error creating volume in pool " + name() + ": " + message);
	}
	return std::unique_ptr<Volume_handle>(new Libvirt_volume(conn, volume));
}

std::unique_ptr<Volume_handle> Libvirt_pool::clone_volume(const std::string &xml, const Volume_handle &src)
{
	auto libvirt_src = dynamic_cast<const Libvirt_volume *>(&src);
	if (!libvirt_src)
		throw Compute_error(Error_kind::invalid_argument, "Source volume does not belong to a libvirt connection.");
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Create volume from " << src.name() << ".";
	auto volume = wrap_volume(virStorageVolCreateXMLFrom(pool.get(), xml.c_str(), libvirt_src->get(),
			VIR_STORAGE_VOL_CREATE_PREALLOC_METADATA));
	if (!volume) {
		auto message = last_error_message();
		throw Compute_error(Error_kind::storage, "Error cloning volume " + src.name() + " into pool " + name()
				+ ": " + message);
	}
	return std::unique_ptr<Volume_handle>(new Libvirt_volume(conn, volume));
}

std::unique_ptr<Volume_handle> Libvirt_pool::lookup_volume(const std::string &name)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get volume by name.";
	auto volume = wrap_volume(virStorageVolLookupByName(pool.get(), name.c_str()));
	if (!volume) {
		if (last_error_code() == VIR_ERR_NO_STORAGE_VOL)
			throw Compute_error::not_found("Volume", name);
		throw Compute_error(Error_kind::storage, "Error getting volume " + name + ": " + last_error_message());
	}
	return std::unique_ptr<Volume_handle>(new Libvirt_volume(conn, volume));
}

std::vector<std::unique_ptr<Volume_handle>> Libvirt_pool::list_volumes()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "List volumes.";
	virStorageVolPtr *volumes;
	auto num = virStoragePoolListAllVolumes(pool.get(), &volumes, 0);
	if (num < 0)
		throw Compute_error(Error_kind::storage, "Error getting list of volumes: " + last_error_message());
	// Take ownership of every volume first so nothing leaks if a constructor throws.
	std::vector<std::shared_ptr<virStorageVol>> owned;
	owned.reserve(num);
	for (int i = 0; i != num; ++i)
		owned.push_back(wrap_volume(volumes[i]));
	free(volumes);
	std::vector<std::unique_ptr<Volume_handle>> ret;
	for (auto &volume : owned)
		ret.emplace_back(new Libvirt_volume(conn, volume));
	return ret;
}

//
// Libvirt_domain implementation
//

Libvirt_domain::Libvirt_domain(std::shared_ptr<virConnect> conn, std::shared_ptr<virDomain> domain) :
	conn(std::move(conn)),
	domain(std::move(domain))
{
}

Compute_error Libvirt_domain::error(const std::string &action) const
{
	auto message = last_error_message();
	auto ret = virDomainGetName(domain.get());
	return Compute_error(Error_kind::instance, "Cannot " + action + " instance=" + (ret ? ret : "?") + ": " + message);
}

std::string Libvirt_domain::name() const
{
	auto ret = virDomainGetName(domain.get());
	if (!ret)
		throw Compute_error(Error_kind::instance, "Error getting name of domain: " + last_error_message());
	return ret;
}

std::string Libvirt_domain::uuid() const
{
	char buf[VIR_UUID_STRING_BUFLEN];
	if (virDomainGetUUIDString(domain.get(), buf) == -1)
		throw error("get UUID of");
	return buf;
}

Domain_info Libvirt_domain::info()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get domain info.";
	virDomainInfo domain_info;
	if (virDomainGetInfo(domain.get(), &domain_info) == -1)
		throw error("get info of");
	Domain_info info;
	info.state = to_domain_state(domain_info.state);
	info.max_memory = domain_info.maxMem;
	info.memory = domain_info.memory;
	info.nr_virt_cpu = domain_info.nrVirtCpu;
	info.cpu_time = domain_info.cpuTime;
	return info;
}

Domain_state Libvirt_domain::state()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get domain state.";
	int state;
	int reason;
	if (virDomainGetState(domain.get(), &state, &reason, 0) == -1)
		throw error("get state of");
	return to_domain_state(state);
}

bool Libvirt_domain::is_active()
{
	auto ret = virDomainIsActive(domain.get());
	if (ret == -1)
		throw error("check state of");
	return ret == 1;
}

void Libvirt_domain::create()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Create domain.";
	if (virDomainCreate(domain.get()) == -1)
		throw error("start");
}

void Libvirt_domain::shutdown(Shutdown_mode mode)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Shutdown domain.";
	auto flags = mode == Shutdown_mode::guest_agent ? VIR_DOMAIN_SHUTDOWN_GUEST_AGENT : VIR_DOMAIN_SHUTDOWN_DEFAULT;
	if (virDomainShutdownFlags(domain.get(), flags) == -1)
		throw error("shutdown");
}

void Libvirt_domain::destroy(Destroy_mode mode)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Destroy domain.";
	auto flags = mode == Destroy_mode::graceful ? VIR_DOMAIN_DESTROY_GRACEFUL : VIR_DOMAIN_DESTROY_DEFAULT;
	if (virDomainDestroyFlags(domain.get(), flags) == -1)
		throw error("destroy");
}

void Libvirt_domain::reboot()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Reboot domain.";
	if (virDomainReboot(domain.get(), 0) == -1)
		throw error("reboot");
}

void Libvirt_domain::reset()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Reset domain.";
	if (virDomainReset(domain.get(), 0) == -1)
		throw error("reset");
}

void Libvirt_domain::suspend()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Suspend domain.";
	if (virDomainSuspend(domain.get()) == -1)
		throw error("pause");
}

void Libvirt_domain::resume()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Resume domain.";
	if (virDomainResume(domain.get()) == -1)
		throw error("resume");
}

bool Libvirt_domain::autostart()
{
	int autostart = 0;
	if (virDomainGetAutostart(domain.get(), &autostart) == -1)
		throw error("get autostart flag of");
	return autostart != 0;
}

void Libvirt_domain::set_autostart(bool enabled)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Set autostart.";
	if (virDomainSetAutostart(domain.get(), enabled ? 1 : 0) == -1)
		throw error("set autostart flag of");
}

unsigned int Libvirt_domain::max_vcpus()
{
	auto ret = virDomainGetVcpusFlags(domain.get(), VIR_DOMAIN_VCPU_MAXIMUM);
	if (ret == -1)
		throw error("get maximum vCPUs of");
	return static_cast<unsigned int>(ret);
}

unsigned long long Libvirt_domain::max_memory()
{
	auto ret = virDomainGetMaxMemory(domain.get());
	if (ret == 0)
		throw error("get maximum memory of");
	return ret;
}

void Libvirt_domain::set_vcpus(unsigned int vcpus, unsigned int flags)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Set VCPUs.";
	if (virDomainSetVcpusFlags(domain.get(), vcpus, to_libvirt_flags(flags)) == -1)
		throw error("set " + std::to_string(vcpus) + " vCPUs for");
}

void Libvirt_domain::set_memory(unsigned long long memory, unsigned int flags)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Set memory.";
	if (virDomainSetMemoryFlags(domain.get(), memory, to_libvirt_flags(flags)) == -1)
		throw error("set " + std::to_string(memory) + " KiB of memory for");
}

void Libvirt_domain::attach_device(const std::string &xml, unsigned int flags)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Attach device.";
	if (virDomainAttachDeviceFlags(domain.get(), xml.c_str(), to_libvirt_flags(flags)) == -1)
		throw error("attach device to");
}

void Libvirt_domain::detach_device(const std::string &xml, unsigned int flags)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Detach device.";
	if (virDomainDetachDeviceFlags(domain.get(), xml.c_str(), to_libvirt_flags(flags)) == -1)
		throw error("detach device from");
}

void Libvirt_domain::block_resize(const std::string &disk, unsigned long long size)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Resize block device " << disk << ".";
	if (virDomainBlockResize(domain.get(), disk.c_str(), size, VIR_DOMAIN_BLOCK_RESIZE_BYTES) == -1)
		throw error("resize disk " + disk + " of");
}

void Libvirt_domain::set_user_password(const std::string &user, const std::string &password, bool encrypted)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Set user password.";
	if (virDomainSetUserPassword(domain.get(), user.c_str(), password.c_str(),
			encrypted ? VIR_DOMAIN_PASSWORD_ENCRYPTED : 0) == -1)
		throw error("set password of user " + user + " on");
}

std::vector<std::string> Libvirt_domain::get_authorized_ssh_keys(const std::string &user)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get authorized SSH keys.";
	char **keys = nullptr;
	auto num = virDomainAuthorizedSSHKeysGet(domain.get(), user.c_str(), &keys, 0);
	if (num < 0)
		throw error("get SSH keys of user " + user + " on");
	std::vector<std::string> ret;
	ret.reserve(num);
	for (int i = 0; i != num; ++i)
		ret.push_back(convert_and_free_cstr(keys[i]));
	free(keys);
	return ret;
}

void Libvirt_domain::set_authorized_ssh_keys(const std::string &user, const std::vector<std::string> &keys, bool append, bool remove)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Set authorized SSH keys.";
	std::vector<const char *> cstrs;
	for (const auto &key : keys)
		cstrs.push_back(key.c_str());
	unsigned int flags = 0;
	if (append)
		flags |= VIR_DOMAIN_AUTHORIZED_SSH_KEYS_SET_APPEND;
	if (remove)
		flags |= VIR_DOMAIN_AUTHORIZED_SSH_KEYS_SET_REMOVE;
	if (virDomainAuthorizedSSHKeysSet(domain.get(), user.c_str(), cstrs.data(), cstrs.size(), flags) == -1)
		throw error("set SSH keys of user " + user + " on");
}

std::string Libvirt_domain::xml_desc(bool inactive)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get xml description of domain.";
	auto ret = virDomainGetXMLDesc(domain.get(), inactive ? VIR_DOMAIN_XML_INACTIVE : 0);
	if (!ret)
		throw error("get xml description of");
	return convert_and_free_cstr(ret);
}

void Libvirt_domain::undefine()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Undefine domain.";
	if (virDomainUndefine(domain.get()) == -1)
		throw error("undefine");
}

std::string Libvirt_domain::agent_command(const std::string &command, int timeout)
{
	auto ret = virDomainQemuAgentCommand(domain.get(), command.c_str(), timeout, 0);
	if (!ret) {
		auto code = last_error_code();
		auto message = last_error_message();
		// Not running, no agent channel configured or agent not responding.
		if (code == VIR_ERR_AGENT_UNRESPONSIVE || code == VIR_ERR_OPERATION_INVALID
				|| code == VIR_ERR_ARGUMENT_UNSUPPORTED)
			throw Compute_error(Error_kind::guest_agent_unavailable, "Guest agent is not available: " + message);
		throw Compute_error(Error_kind::guest_agent, "Guest agent command failed: " + message);
	}
	return convert_and_free_cstr(ret);
}

//
// Libvirt_connection implementation
//

Libvirt_connection::Libvirt_connection(const std::string &uri) :
	connection_uri(uri)
{
	silence_libvirt_errors();
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Connect to " + uri;
	conn.reset(virConnectOpen(uri.c_str()), Deleter_virConnect());
	if (!conn)
		throw Compute_error(Error_kind::connection, "Failed to connect to libvirt with uri: " + uri + ": " + last_error_message());
}

std::string Libvirt_connection::uri() const
{
	return connection_uri;
}

std::shared_ptr<Domain_handle> Libvirt_connection::lookup_domain(const std::string &name)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get domain by name.";
	std::shared_ptr<virDomain> domain(
		virDomainLookupByName(conn.get(), name.c_str()),
		Deleter_virDomain()
	);
	if (!domain) {
		if (last_error_code() == VIR_ERR_NO_DOMAIN)
			throw Compute_error::not_found("Instance", name);
		throw Compute_error(Error_kind::instance, "Error getting instance " + name + ": " + last_error_message());
	}
	return std::make_shared<Libvirt_domain>(conn, domain);
}

std::vector<std::shared_ptr<Domain_handle>> Libvirt_connection::list_domains()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "List domains.";
	virDomainPtr *domains;
	auto num = virConnectListAllDomains(conn.get(), &domains, 0);
	if (num < 0)
		throw Compute_error(Error_kind::instance, "Error getting list of domains: " + last_error_message());
	std::vector<std::shared_ptr<Domain_handle>> ret;
	ret.reserve(num);
	for (int i = 0; i != num; ++i) {
		std::shared_ptr<virDomain> domain(domains[i], Deleter_virDomain());
		ret.push_back(std::make_shared<Libvirt_domain>(conn, domain));
	}
	free(domains);
	return ret;
}

std::shared_ptr<Domain_handle> Libvirt_connection::define_domain(const std::string &xml)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Define persistent domain from xml";
	std::shared_ptr<virDomain> domain(
			virDomainDefineXML(conn.get(), xml.c_str()),
			Deleter_virDomain()
	);
	if (!domain)
		throw Compute_error(Error_kind::instance, "Error defining domain from xml: " + last_error_message());
	return std::make_shared<Libvirt_domain>(conn, domain);
}

std::string Libvirt_connection::domain_capabilities()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get domain capabilities.";
	auto ret = virConnectGetDomainCapabilities(conn.get(), nullptr, nullptr, nullptr, nullptr, 0);
	if (!ret)
		throw Compute_error(Error_kind::connection, "Error getting domain capabilities: " + last_error_message());
	return convert_and_free_cstr(ret);
}

Node_info Libvirt_connection::node_info()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get node info.";
	virNodeInfo info;
	if (virNodeGetInfo(conn.get(), &info) == -1)
		throw Compute_error(Error_kind::connection, "Error getting node info: " + last_error_message());
	Node_info ret;
	ret.cpus = info.cpus;
	ret.memory = info.memory;
	return ret;
}

std::unique_ptr<Pool_handle> Libvirt_connection::lookup_pool(const std::string &name)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get storage pool by name.";
	std::shared_ptr<virStoragePool> pool(
		virStoragePoolLookupByName(conn.get(), name.c_str()),
		Deleter_virStoragePool()
	);
	if (!pool) {
		if (last_error_code() == VIR_ERR_NO_STORAGE_POOL)
			throw Compute_error::not_found("Storage pool", name);
		throw Compute_error(Error_kind::storage, "Error getting storage pool " + name + ": " + last_error_message());
	}
	return std::unique_ptr<Pool_handle>(new Libvirt_pool(conn, pool));
}

std::vector<std::unique_ptr<Pool_handle>> Libvirt_connection::list_pools()
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "List storage pools.";
	virStoragePoolPtr *pools;
	auto num = virConnectListAllStoragePools(conn.get(), &pools, 0);
	if (num < 0)
		throw Compute_error(Error_kind::storage, "Error getting list of storage pools: " + last_error_message());
	std::vector<std::shared_ptr<virStoragePool>> owned;
	owned.reserve(num);
	for (int i = 0; i != num; ++i)
		owned.emplace_back(pools[i], Deleter_virStoragePool());
	free(pools);
	std::vector<std::unique_ptr<Pool_handle>> ret;
	for (auto &pool : owned)
		ret.emplace_back(new Libvirt_pool(conn, pool));
	return ret;
}

std::unique_ptr<Volume_handle> Libvirt_connection::lookup_volume_by_path(const std::string &path)
{
	COMPUTE_LOG(libvirt_hyp_log, trace) << "Get volume by path.";
	auto volume = wrap_volume(virStorageVolLookupByPath(conn.get(), path.c_str()));
	if (!volume) {
		if (last_error_code() == VIR_ERR_NO_STORAGE_VOL)
			throw Compute_error::not_found("Volume", path);
		throw Compute_error(Error_kind::storage, "Error getting volume " + path + ": " + last_error_message());
	}
	return std::unique_ptr<Volume_handle>(new Libvirt_volume(conn, volume));
}

} // namespace compute
