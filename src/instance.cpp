/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "instance.hpp"

#include "errors.hpp"
#include "logging.hpp"
#include "xml_utility.hpp"

#include <algorithm>
#include <thread>

FASTLIB_LOG_INIT(instance_log, "Instance")
FASTLIB_LOG_SET_LEVEL_GLOBAL(instance_log, trace);

namespace compute {

std::string to_string(Shutdown_method method)
{
	switch (method) {
	case Shutdown_method::soft:
		return "soft";
	case Shutdown_method::normal:
		return "normal";
	case Shutdown_method::hard:
		return "hard";
	case Shutdown_method::unsafe:
		return "unsafe";
	}
	return "normal";
}

Shutdown_method parse_shutdown_method(const std::string &str)
{
	if (str == "soft")
		return Shutdown_method::soft;
	if (str == "normal")
		return Shutdown_method::normal;
	if (str == "hard")
		return Shutdown_method::hard;
	if (str == "unsafe" || str == "destroy")
		return Shutdown_method::unsafe;
	throw Compute_error(Error_kind::invalid_argument,
			"Unknown shutdown method '" + str + "', valid methods are: soft, normal, hard, unsafe");
}

Instance::Instance(std::shared_ptr<Domain_handle> domain, Connection_handle &connection,
		std::chrono::duration<double> stop_timeout, double agent_timeout) :
	domain(std::move(domain)),
	connection(&connection),
	stop_timeout(stop_timeout),
	agent_timeout(agent_timeout)
{
}

std::string Instance::name() const
{
	return domain->name();
}

std::string Instance::uuid() const
{
	return domain->uuid();
}

Domain_info Instance::info()
{
	return domain->info();
}

Domain_state Instance::status()
{
	return domain->state();
}

bool Instance::is_running()
{
	return domain->is_active();
}

bool Instance::is_autostart()
{
	return domain->autostart();
}

void Instance::set_autostart(bool enabled)
{
	domain->set_autostart(enabled);
}

unsigned int Instance::max_vcpus()
{
	return domain->max_vcpus();
}

unsigned long long Instance::max_memory()
{
	return domain->max_memory();
}

std::string Instance::dump_xml(bool inactive)
{
	return domain->xml_desc(inactive);
}

Guest_agent & Instance::guest_agent()
{
	if (!agent)
		agent.reset(new Guest_agent(domain, agent_timeout));
	return *agent;
}

//
// Power state
//

void Instance::start()
{
	if (is_running()) {
		COMPUTE_LOG(instance_log, warn) << "Instance " << name() << " is already running.";
		return;
	}
	COMPUTE_LOG(instance_log, trace) << "Start instance " << name() << ".";
	domain->create();
}

void Instance::shutdown(Shutdown_method method)
{
	if (!is_running()) {
		COMPUTE_LOG(instance_log, warn) << "Instance " << name() << " is already shut off.";
		return;
	}
	if (method == Shutdown_method::soft) {
		if (guest_agent().is_available()) {
			COMPUTE_LOG(instance_log, trace) << "Shut down instance " << name() << " through the guest agent.";
			domain->shutdown(Shutdown_mode::guest_agent);
			return;
		}
		COMPUTE_LOG(instance_log, warn) << "Guest agent of " << name() << " is unavailable, fall back to normal shutdown.";
		method = Shutdown_method::normal;
	}
	COMPUTE_LOG(instance_log, trace) << "Shut down instance " << name() << " (" << to_string(method) << ").";
	switch (method) {
	case Shutdown_method::normal:
		domain->shutdown(Shutdown_mode::acpi);
		break;
	case Shutdown_method::hard:
		domain->destroy(Destroy_mode::graceful);
		break;
	case Shutdown_method::unsafe:
		domain->destroy(Destroy_mode::forced);
		break;
	case Shutdown_method::soft:
		break;
	}
}

void Instance::shutdown(const std::string &method)
{
	shutdown(parse_shutdown_method(method));
}

void Instance::reboot()
{
	COMPUTE_LOG(instance_log, trace) << "Reboot instance " << name() << ".";
	domain->reboot();
}

void Instance::reset()
{
	COMPUTE_LOG(instance_log, trace) << "Reset instance " << name() << ".";
	domain->reset();
}

bool Instance::wait_for_shutoff(std::chrono::duration<double> timeout)
{
	auto start = std::chrono::steady_clock::now();
	const std::chrono::duration<double> interval = std::min(timeout, std::chrono::duration<double>(1));
	while (domain->state() != Domain_state::shutoff) {
		if (std::chrono::steady_clock::now() - start > timeout)
			return false;
		std::this_thread::sleep_for(interval);
	}
	return true;
}

void Instance::power_reset()
{
	COMPUTE_LOG(instance_log, trace) << "Power reset instance " << name() << ".";
	shutdown(Shutdown_method::normal);
	if (!wait_for_shutoff(stop_timeout)) {
		COMPUTE_LOG(instance_log, warn) << "Instance " << name() << " did not stop within "
			<< stop_timeout.count() << " sec, shut down hard.";
		shutdown(Shutdown_method::hard);
		if (!wait_for_shutoff(stop_timeout))
			throw Compute_error(Error_kind::instance, "Cannot power reset instance=" + name() + ": instance did not stop.");
	}
	start();
}

void Instance::pause()
{
	if (status() != Domain_state::running)
		throw Compute_error(Error_kind::instance, "Cannot pause inactive instance=" + name() + ".");
	COMPUTE_LOG(instance_log, trace) << "Pause instance " << name() << ".";
	domain->suspend();
}

void Instance::resume()
{
	COMPUTE_LOG(instance_log, trace) << "Resume instance " << name() << ".";
	domain->resume();
}

//
// Resources
//

void Instance::set_vcpus(long long vcpus, bool live)
{
	if (vcpus <= 0)
		throw Compute_error(Error_kind::invalid_argument, "vCPUs count must be greater than zero.");
	auto max = max_vcpus();
	if (static_cast<unsigned long long>(vcpus) > max)
		throw Compute_error(Error_kind::invalid_argument, "vCPUs count is greater than max_vcpus="
				+ std::to_string(max) + ".");
	auto count = static_cast<unsigned int>(vcpus);
	if (info().nr_virt_cpu == count) {
		COMPUTE_LOG(instance_log, warn) << "Instance " << name() << " already has " << count << " vCPUs.";
		return;
	}
	COMPUTE_LOG(instance_log, trace) << "Set " << count << " vCPUs for instance " << name() << ".";
	domain->set_vcpus(count, affect_config);
	if (!live || !is_running())
		return;
	domain->set_vcpus(count, affect_live);
	try {
		auto &agent = guest_agent();
		if (agent.is_available() && agent.supported_commands().count("guest-set-vcpus") != 0) {
			domain->set_vcpus(count, affect_live | vcpu_guest);
			return;
		}
	} catch (const Compute_error &e) {
		if (!e.is_guest_agent_error())
			throw;
	}
	COMPUTE_LOG(instance_log, warn) << "Cannot set vCPUs in guest of " << name()
		<< ", the guest agent is unavailable or does not support guest-set-vcpus.";
}

void Instance::set_memory(long long memory, bool live)
{
	if (memory <= 0)
		throw Compute_error(Error_kind::invalid_argument, "Memory value must be greater than zero.");
	auto max = max_memory() / 1024;
	if (static_cast<unsigned long long>(memory) > max)
		throw Compute_error(Error_kind::invalid_argument, "Memory value is greater than max_memory="
				+ std::to_string(max) + " MiB.");
	auto kib = static_cast<unsigned long long>(memory) * 1024;
	if (info().memory == kib) {
		COMPUTE_LOG(instance_log, warn) << "Instance " << name() << " already has " << memory << " MiB of memory.";
		return;
	}
	COMPUTE_LOG(instance_log, trace) << "Set " << memory << " MiB of memory for instance " << name() << ".";
	domain->set_memory(kib, affect_config);
	if (live && is_running())
		domain->set_memory(kib, affect_live);
}

//
// Devices
//

unsigned int Instance::modification_flags(bool live)
{
	if (live && is_running())
		return affect_live | affect_config;
	return affect_config;
}

std::vector<std::string> Instance::disk_targets(bool persistent)
{
	auto pt = read_xml_from_string(domain->xml_desc(persistent));
	std::vector<std::string> targets;
	auto devices = pt.get_child_optional("domain.devices");
	if (!devices)
		return targets;
	for (const auto &child : *devices) {
		if (child.first != "disk")
			continue;
		auto target = get_attribute(child.second, "target", "dev");
		if (!target.empty())
			targets.push_back(target);
	}
	return targets;
}

std::vector<Disk_config> Instance::list_disks(bool persistent)
{
	auto pt = read_xml_from_string(domain->xml_desc(persistent));
	std::vector<Disk_config> disks;
	auto devices = pt.get_child_optional("domain.devices");
	if (!devices)
		return disks;
	for (const auto &child : *devices) {
		if (child.first == "disk")
			disks.push_back(Disk_config::parse(child.second));
	}
	return disks;
}

void Instance::attach_device(const Disk_config &disk, bool live)
{
	auto flags = modification_flags(live);
	auto targets = disk_targets((flags & affect_live) == 0);
	if (std::find(targets.begin(), targets.end(), disk.target) != targets.end()) {
		COMPUTE_LOG(instance_log, warn) << "Disk " << disk.target << " is already attached to " << name() << ".";
		return;
	}
	COMPUTE_LOG(instance_log, trace) << "Attach disk " << disk.target << " (" << disk.source << ") to " << name() << ".";
	domain->attach_device(disk.render(), flags);
}

void Instance::detach_device(const Disk_config &disk, bool live)
{
	auto flags = modification_flags(live);
	auto targets = disk_targets((flags & affect_live) == 0);
	if (std::find(targets.begin(), targets.end(), disk.target) == targets.end()) {
		COMPUTE_LOG(instance_log, warn) << "Disk " << disk.target << " is already detached from " << name() << ".";
		return;
	}
	COMPUTE_LOG(instance_log, trace) << "Detach disk " << disk.target << " from " << name() << ".";
	domain->detach_device(disk.render(), flags);
}

void Instance::detach_disk(const std::string &target, bool live)
{
	auto persistent = (modification_flags(live) & affect_live) == 0;
	for (const auto &disk : list_disks(persistent)) {
		if (disk.target == target) {
			detach_device(disk, live);
			return;
		}
	}
	COMPUTE_LOG(instance_log, warn) << "Disk " << target << " is already detached from " << name() << ".";
}

void Instance::resize_disk(const std::string &target, unsigned long long value, Data_unit unit)
{
	auto size = to_bytes(value, unit);
	if (is_running()) {
		COMPUTE_LOG(instance_log, trace) << "Resize disk " << target << " of " << name() << " to " << size << " bytes.";
		domain->block_resize(target, size);
		return;
	}
	for (const auto &disk : list_disks(true)) {
		if (disk.target != target)
			continue;
		if (disk.type != "file")
			throw Compute_error(Error_kind::instance, "Cannot resize disk " + target + " of instance="
					+ name() + ": only file backed disks can be resized offline.");
		if (disk.source.empty())
			throw Compute_error(Error_kind::instance, "Cannot resize disk " + target + " of instance="
					+ name() + ": disk has no medium.");
		COMPUTE_LOG(instance_log, trace) << "Resize volume " << disk.source << " to " << size << " bytes.";
		connection->lookup_volume_by_path(disk.source)->resize(size);
		return;
	}
	throw Compute_error::not_found("Disk", target);
}

//
// Guest helpers
//

void Instance::require_guest_agent(const std::vector<std::string> &commands)
{
	auto &agent = guest_agent();
	if (!agent.is_available())
		throw Compute_error(Error_kind::guest_agent_unavailable, "Guest agent of instance=" + name() + " is not available.");
	agent.ensure_supported(commands);
}

void Instance::set_user_password(const std::string &user, const std::string &password, bool encrypted)
{
	require_guest_agent({"guest-set-user-password"});
	COMPUTE_LOG(instance_log, trace) << "Set password of user " << user << " on " << name() << ".";
	domain->set_user_password(user, password, encrypted);
}

std::vector<std::string> Instance::get_ssh_keys(const std::string &user)
{
	require_guest_agent({"guest-ssh-get-authorized-keys"});
	return domain->get_authorized_ssh_keys(user);
}

void Instance::set_ssh_keys(const std::string &user, const std::vector<std::string> &keys, bool append)
{
	require_guest_agent({"guest-ssh-add-authorized-keys"});
	COMPUTE_LOG(instance_log, trace) << (append ? "Add " : "Set ") << keys.size() << " SSH keys of user " << user << " on " << name() << ".";
	domain->set_authorized_ssh_keys(user, keys, append, false);
}

void Instance::delete_ssh_keys(const std::string &user, const std::vector<std::string> &keys)
{
	require_guest_agent({"guest-ssh-remove-authorized-keys"});
	COMPUTE_LOG(instance_log, trace) << "Remove " << keys.size() << " SSH keys of user " << user << " on " << name() << ".";
	domain->set_authorized_ssh_keys(user, keys, false, true);
}

//
// Removal
//

void Instance::remove(bool with_volumes)
{
	auto instance_name = name();
	shutdown(Shutdown_method::hard);
	auto disks = list_disks(true);
	if (with_volumes) {
		for (const auto &disk : disks) {
			if (disk.type != "file" || disk.device == "cdrom" || disk.source.empty())
				continue;
			try {
				auto volume = connection->lookup_volume_by_path(disk.source);
				COMPUTE_LOG(instance_log, trace) << "Delete volume " << disk.source << ".";
				volume->remove();
			} catch (const Compute_error &e) {
				if (e.kind() != Error_kind::not_found)
					throw;
				COMPUTE_LOG(instance_log, warn) << "Volume " << disk.source << " of " << instance_name
					<< " does not exist, skipping.";
			}
		}
	}
	COMPUTE_LOG(instance_log, trace) << "Undefine instance " << instance_name << ".";
	domain->undefine();
}

} // namespace compute
