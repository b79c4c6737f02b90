/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef HYPERVISOR_HPP
#define HYPERVISOR_HPP

#include <memory>
#include <string>
#include <vector>

namespace compute {

/**
 * \brief Domain states as reported by the hypervisor.
 */
enum class Domain_state
{
	nostate,
	running,
	blocked,
	paused,
	shutdown,
	shutoff,
	crashed,
	pmsuspended
};

std::string to_string(Domain_state state);

struct Domain_info
{
	Domain_state state = Domain_state::nostate;
	// Memory values in KiB.
	unsigned long long max_memory = 0;
	unsigned long long memory = 0;
	unsigned int nr_virt_cpu = 0;
	// CPU time in nanoseconds.
	unsigned long long cpu_time = 0;
};

struct Node_info
{
	unsigned int cpus = 0;
	// Memory in KiB.
	unsigned long long memory = 0;
};

/**
 * \brief Flags selecting which domain definition a modification affects.
 *
 * affect_live changes the running domain, affect_config the persistent descriptor.
 * vcpu_guest is only meaningful for vCPU changes and asks the guest agent to (un)plug the CPUs.
 */
enum Modification_flags : unsigned int
{
	affect_current = 0,
	affect_live = 1u << 0,
	affect_config = 1u << 1,
	vcpu_guest = 1u << 2
};

enum class Shutdown_mode
{
	// Let the hypervisor choose, usually an ACPI power button event.
	acpi,
	guest_agent
};

enum class Destroy_mode
{
	// SIGTERM, then wait for the process to exit.
	graceful,
	// SIGKILL without waiting.
	forced
};

/**
 * \brief A storage volume inside a hypervisor storage pool.
 */
class Volume_handle
{
public:
	virtual ~Volume_handle() = default;

	virtual std::string name() const = 0;
	virtual std::string path() const = 0;
	virtual std::string pool_name() const = 0;
	virtual std::string xml_desc() const = 0;
	/**
	 * \brief Create a copy of this volume in the same pool.
	 *
	 * \param xml Volume descriptor of the new volume.
	 */
	virtual std::unique_ptr<Volume_handle> clone(const std::string &xml) = 0;
	// New capacity in bytes.
	virtual void resize(unsigned long long capacity) = 0;
	virtual void remove() = 0;
};

/**
 * \brief A named hypervisor storage pool.
 */
class Pool_handle
{
public:
	virtual ~Pool_handle() = default;

	virtual std::string name() const = 0;
	virtual std::string xml_desc() const = 0;
	virtual void refresh() = 0;
	virtual std::unique_ptr<Volume_handle> create_volume(const std::string &xml) = 0;
	/**
	 * \brief Create a volume in this pool using the contents of src.
	 *
	 * src may belong to a different pool.
	 */
	virtual std::unique_ptr<Volume_handle> clone_volume(const std::string &xml, const Volume_handle &src) = 0;
	// Throws Compute_error (not_found) if there is no such volume.
	virtual std::unique_ptr<Volume_handle> lookup_volume(const std::string &name) = 0;
	virtual std::vector<std::unique_ptr<Volume_handle>> list_volumes() = 0;
};

/**
 * \brief A domain known to the hypervisor.
 *
 * Every call goes to the hypervisor. Nothing is cached.
 */
class Domain_handle
{
public:
	virtual ~Domain_handle() = default;

	virtual std::string name() const = 0;
	virtual std::string uuid() const = 0;

	virtual Domain_info info() = 0;
	virtual Domain_state state() = 0;
	virtual bool is_active() = 0;

	virtual void create() = 0;
	virtual void shutdown(Shutdown_mode mode) = 0;
	virtual void destroy(Destroy_mode mode) = 0;
	virtual void reboot() = 0;
	virtual void reset() = 0;
	virtual void suspend() = 0;
	virtual void resume() = 0;

	virtual bool autostart() = 0;
	virtual void set_autostart(bool enabled) = 0;

	virtual unsigned int max_vcpus() = 0;
	// Maximum memory in KiB.
	virtual unsigned long long max_memory() = 0;
	// flags is a combination of Modification_flags.
	virtual void set_vcpus(unsigned int vcpus, unsigned int flags) = 0;
	// Memory in KiB, flags is a combination of Modification_flags.
	virtual void set_memory(unsigned long long memory, unsigned int flags) = 0;

	virtual void attach_device(const std::string &xml, unsigned int flags) = 0;
	virtual void detach_device(const std::string &xml, unsigned int flags) = 0;
	// New size in bytes.
	virtual void block_resize(const std::string &disk, unsigned long long size) = 0;

	virtual void set_user_password(const std::string &user, const std::string &password, bool encrypted) = 0;
	virtual std::vector<std::string> get_authorized_ssh_keys(const std::string &user) = 0;
	/**
	 * \brief Modify the authorized keys file of a guest user.
	 *
	 * Without append or remove the file is replaced by keys.
	 */
	virtual void set_authorized_ssh_keys(const std::string &user, const std::vector<std::string> &keys, bool append, bool remove) = 0;

	virtual std::string xml_desc(bool inactive) = 0;
	virtual void undefine() = 0;

	/**
	 * \brief Send a JSON encoded command to the guest agent and return the JSON reply.
	 *
	 * Throws Compute_error (guest_agent_unavailable) if the agent does not respond
	 * and Compute_error (guest_agent) for any other failure.
	 */
	virtual std::string agent_command(const std::string &command, int timeout) = 0;
};

/**
 * \brief An open connection to the hypervisor.
 */
class Connection_handle
{
public:
	virtual ~Connection_handle() = default;

	virtual std::string uri() const = 0;
	// Throws Compute_error (not_found) if there is no such domain.
	virtual std::shared_ptr<Domain_handle> lookup_domain(const std::string &name) = 0;
	virtual std::vector<std::shared_ptr<Domain_handle>> list_domains() = 0;
	virtual std::shared_ptr<Domain_handle> define_domain(const std::string &xml) = 0;
	virtual std::string domain_capabilities() = 0;
	virtual Node_info node_info() = 0;
	// Throws Compute_error (not_found) if there is no such pool.
	virtual std::unique_ptr<Pool_handle> lookup_pool(const std::string &name) = 0;
	virtual std::vector<std::unique_ptr<Pool_handle>> list_pools() = 0;
	// Throws Compute_error (not_found) if no volume is stored at path.
	virtual std::unique_ptr<Volume_handle> lookup_volume_by_path(const std::string &path) = 0;
};

} // namespace compute

#endif
