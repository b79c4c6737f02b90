/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef LIBVIRT_HYPERVISOR_HPP
#define LIBVIRT_HYPERVISOR_HPP

#include "errors.hpp"
#include "hypervisor.hpp"

#include <libvirt/libvirt.h>

#include <memory>
#include <vector>
#include <string>

namespace compute {

/**
 * \brief Implementation of the Volume_handle interface using libvirt API.
 */
class Libvirt_volume :
	public Volume_handle
{
public:
	Libvirt_volume(std::shared_ptr<virConnect> conn, std::shared_ptr<virStorageVol> volume);

	std::string name() const override;
	std::string path() const override;
	std::string pool_name() const override;
	std::string xml_desc() const override;
	std::unique_ptr<Volume_handle> clone(const std::string &xml) override;
	void resize(unsigned long long capacity) override;
	void remove() override;

	virStorageVolPtr get() const;
private:
	std::shared_ptr<virConnect> conn;
	std::shared_ptr<virStorageVol> volume;
};

/**
 * \brief Implementation of the Pool_handle interface using libvirt API.
 */
class Libvirt_pool :
	public Pool_handle
{
public:
	Libvirt_pool(std::shared_ptr<virConnect> conn, std::shared_ptr<virStoragePool> pool);

	std::string name() const override;
	std::string xml_desc() const override;
	void refresh() override;
	std::unique_ptr<Volume_handle> create_volume(const std::string &xml) override;
	std::unique_ptr<Volume_handle> clone_volume(const std::string &xml, const Volume_handle &src) override;
	std::unique_ptr<Volume_handle> lookup_volume(const std::string &name) override;
	std::vector<std::unique_ptr<Volume_handle>> list_volumes() override;
private:
	std::shared_ptr<virConnect> conn;
	std::shared_ptr<virStoragePool> pool;
};

/**
 * \brief Implementation of the Domain_handle interface using libvirt API.
 *
 * Failing calls throw Compute_error (instance) naming the instance and the
 * attempted action together with the libvirt error message.
 */
class Libvirt_domain :
	public Domain_handle
{
public:
	Libvirt_domain(std::shared_ptr<virConnect> conn, std::shared_ptr<virDomain> domain);

	std::string name() const override;
	std::string uuid() const override;

	Domain_info info() override;
	Domain_state state() override;
	bool is_active() override;

	void create() override;
	void shutdown(Shutdown_mode mode) override;
	void destroy(Destroy_mode mode) override;
	void reboot() override;
	void reset() override;
	void suspend() override;
	void resume() override;

	bool autostart() override;
	void set_autostart(bool enabled) override;

	unsigned int max_vcpus() override;
	unsigned long long max_memory() override;
	void set_vcpus(unsigned int vcpus, unsigned int flags) override;
	void set_memory(unsigned long long memory, unsigned int flags) override;

	void attach_device(const std::string &xml, unsigned int flags) override;
	void detach_device(const std::string &xml, unsigned int flags) override;
	void block_resize(const std::string &disk, unsigned long long size) override;

	void set_user_password(const std::string &user, const std::string &password, bool encrypted) override;
	std::vector<std::string> get_authorized_ssh_keys(const std::string &user) override;
	void set_authorized_ssh_keys(const std::string &user, const std::vector<std::string> &keys, bool append, bool remove) override;

	std::string xml_desc(bool inactive) override;
	void undefine() override;

	std::string agent_command(const std::string &command, int timeout) override;
private:
	// Error for a failed libvirt call, e.g. "Cannot start instance=vm1: <libvirt message>".
	Compute_error error(const std::string &action) const;

	std::shared_ptr<virConnect> conn;
	std::shared_ptr<virDomain> domain;
};

/**
 * \brief Implementation of the Connection_handle interface using libvirt API.
 *
 * The connection is closed when the last handle derived from it is destroyed.
 */
class Libvirt_connection :
	public Connection_handle
{
public:
	/**
	 * \brief Connect to libvirt.
	 *
	 * Throws Compute_error (connection) if the hypervisor cannot be reached.
	 * \param uri The libvirt connection uri (e.g., qemu:///system).
	 */
	explicit Libvirt_connection(const std::string &uri);

	std::string uri() const override;
	std::shared_ptr<Domain_handle> lookup_domain(const std::string &name) override;
	std::vector<std::shared_ptr<Domain_handle>> list_domains() override;
	std::shared_ptr<Domain_handle> define_domain(const std::string &xml) override;
	std::string domain_capabilities() override;
	Node_info node_info() override;
	std::unique_ptr<Pool_handle> lookup_pool(const std::string &name) override;
	std::vector<std::unique_ptr<Pool_handle>> list_pools() override;
	std::unique_ptr<Volume_handle> lookup_volume_by_path(const std::string &path) override;
private:
	std::string connection_uri;
	std::shared_ptr<virConnect> conn;
};

} // namespace compute

#endif
