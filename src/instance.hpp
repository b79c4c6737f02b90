/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef INSTANCE_HPP
#define INSTANCE_HPP

#include "descriptors.hpp"
#include "guest_agent.hpp"
#include "hypervisor.hpp"
#include "units.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace compute {

/**
 * \brief Ways to stop an instance, ordered by increasing severity.
 */
enum class Shutdown_method
{
	// Shut down the guest OS through the guest agent, falls back to normal.
	soft,
	// ACPI power button, the guest OS may ignore it.
	normal,
	// Terminate the emulator process and wait for it to exit.
	hard,
	// Kill the emulator process immediately. May corrupt guest data.
	unsafe
};

std::string to_string(Shutdown_method method);
// Accepts "destroy" as alias of "unsafe". Throws Compute_error (invalid_argument).
Shutdown_method parse_shutdown_method(const std::string &str);

/**
 * \brief Handle of a defined domain.
 *
 * Runtime facts are never cached, every decision re-queries the hypervisor.
 * The connection must outlive the instance.
 */
class Instance
{
public:
	/**
	 * \param domain The domain to manage.
	 * \param connection Connection used to look up the volumes of the domain.
	 * \param stop_timeout Time power_reset() waits for the domain to stop.
	 * \param agent_timeout Timeout of the guest agent in seconds.
	 */
	Instance(std::shared_ptr<Domain_handle> domain, Connection_handle &connection,
			std::chrono::duration<double> stop_timeout = std::chrono::seconds(60),
			double agent_timeout = 60);

	std::string name() const;
	std::string uuid() const;

	Domain_info info();
	Domain_state status();
	bool is_running();
	bool is_autostart();
	void set_autostart(bool enabled);
	unsigned int max_vcpus();
	// In KiB.
	unsigned long long max_memory();
	std::string dump_xml(bool inactive = false);

	Guest_agent & guest_agent();

	void start();
	// Does nothing if the instance is not running.
	void shutdown(Shutdown_method method = Shutdown_method::normal);
	void shutdown(const std::string &method);
	void reboot();
	void reset();
	/**
	 * \brief Stop the instance and start it again.
	 *
	 * Escalates to a hard shutdown if the instance did not stop within the stop timeout.
	 */
	void power_reset();
	void pause();
	void resume();

	void set_vcpus(long long vcpus, bool live = false);
	// Memory in MiB.
	void set_memory(long long memory, bool live = false);

	std::vector<Disk_config> list_disks(bool persistent = false);
	// Does nothing if a disk with the same target is attached already.
	void attach_device(const Disk_config &disk, bool live = false);
	// Does nothing if no disk with this target is attached.
	void detach_device(const Disk_config &disk, bool live = false);
	void detach_disk(const std::string &target, bool live = false);
	void resize_disk(const std::string &target, unsigned long long value, Data_unit unit = Data_unit::bytes);

	void set_user_password(const std::string &user, const std::string &password, bool encrypted = false);
	std::vector<std::string> get_ssh_keys(const std::string &user);
	void set_ssh_keys(const std::string &user, const std::vector<std::string> &keys, bool append = false);
	void delete_ssh_keys(const std::string &user, const std::vector<std::string> &keys);

	/**
	 * \brief Destroy and undefine the instance.
	 *
	 * With with_volumes the volumes of all file backed disks except cdroms are
	 * deleted. Missing volumes are skipped. The domain is undefined last.
	 */
	void remove(bool with_volumes = true);
private:
	bool wait_for_shutoff(std::chrono::duration<double> timeout);
	std::vector<std::string> disk_targets(bool persistent);
	unsigned int modification_flags(bool live);
	void require_guest_agent(const std::vector<std::string> &commands);

	std::shared_ptr<Domain_handle> domain;
	Connection_handle *connection;
	std::chrono::duration<double> stop_timeout;
	double agent_timeout;
	std::unique_ptr<Guest_agent> agent;
};

} // namespace compute

#endif
