/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef MOCK_HYPERVISOR_HPP
#define MOCK_HYPERVISOR_HPP

#include "hypervisor.hpp"

#include <gmock/gmock.h>

#include <memory>
#include <string>
#include <vector>

namespace compute {
namespace test {

class Mock_volume :
	public Volume_handle
{
public:
	MOCK_METHOD(std::string, name, (), (const, override));
	MOCK_METHOD(std::string, path, (), (const, override));
	MOCK_METHOD(std::string, pool_name, (), (const, override));
	MOCK_METHOD(std::string, xml_desc, (), (const, override));
	MOCK_METHOD(std::unique_ptr<Volume_handle>, clone, (const std::string &), (override));
	MOCK_METHOD(void, resize, (unsigned long long), (override));
	MOCK_METHOD(void, remove, (), (override));
};

class Mock_pool :
	public Pool_handle
{
public:
	MOCK_METHOD(std::string, name, (), (const, override));
	MOCK_METHOD(std::string, xml_desc, (), (const, override));
	MOCK_METHOD(void, refresh, (), (override));
	MOCK_METHOD(std::unique_ptr<Volume_handle>, create_volume, (const std::string &), (override));
	MOCK_METHOD(std::unique_ptr<Volume_handle>, clone_volume, (const std::string &, const Volume_handle &), (override));
	MOCK_METHOD(std::unique_ptr<Volume_handle>, lookup_volume, (const std::string &), (override));
	MOCK_METHOD(std::vector<std::unique_ptr<Volume_handle>>, list_volumes, (), (override));
};

class Mock_domain :
	public Domain_handle
{
public:
	MOCK_METHOD(std::string, name, (), (const, override));
	MOCK_METHOD(std::string, uuid, (), (const, override));
	MOCK_METHOD(Domain_info, info, (), (override));
	MOCK_METHOD(Domain_state, state, (), (override));
	MOCK_METHOD(bool, is_active, (), (override));
	MOCK_METHOD(void, create, (), (override));
	MOCK_METHOD(void, shutdown, (Shutdown_mode), (override));
	MOCK_METHOD(void, destroy, (Destroy_mode), (override));
	MOCK_METHOD(void, reboot, (), (override));
	MOCK_METHOD(void, reset, (), (override));
	MOCK_METHOD(void, suspend, (), (override));
	MOCK_METHOD(void, resume, (), (override));
	MOCK_METHOD(bool, autostart, (), (override));
	MOCK_METHOD(void, set_autostart, (bool), (override));
	MOCK_METHOD(unsigned int, max_vcpus, (), (override));
	MOCK_METHOD(unsigned long long, max_memory, (), (override));
	MOCK_METHOD(void, set_vcpus, (unsigned int, unsigned int), (override));
	MOCK_METHOD(void, set_memory, (unsigned long long, unsigned int), (override));
	MOCK_METHOD(void, attach_device, (const std::string &, unsigned int), (override));
	MOCK_METHOD(void, detach_device, (const std::string &, unsigned int), (override));
	MOCK_METHOD(void, block_resize, (const std::string &, unsigned long long), (override));
	MOCK_METHOD(void, set_user_password, (const std::string &, const std::string &, bool), (override));
	MOCK_METHOD(std::vector<std::string>, get_authorized_ssh_keys, (const std::string &), (override));
	MOCK_METHOD(void, set_authorized_ssh_keys, (const std::string &, const std::vector<std::string> &, bool, bool), (override));
	MOCK_METHOD(std::string, xml_desc, (bool), (override));
	MOCK_METHOD(void, undefine, (), (override));
	MOCK_METHOD(std::string, agent_command, (const std::string &, int), (override));
};

class Mock_connection :
	public Connection_handle
{
public:
	MOCK_METHOD(std::string, uri, (), (const, override));
	MOCK_METHOD(std::shared_ptr<Domain_handle>, lookup_domain, (const std::string &), (override));
	MOCK_METHOD(std::vector<std::shared_ptr<Domain_handle>>, list_domains, (), (override));
	MOCK_METHOD(std::shared_ptr<Domain_handle>, define_domain, (const std::string &), (override));
	MOCK_METHOD(std::string, domain_capabilities, (), (override));
	MOCK_METHOD(Node_info, node_info, (), (override));
	MOCK_METHOD(std::unique_ptr<Pool_handle>, lookup_pool, (const std::string &), (override));
	MOCK_METHOD(std::vector<std::unique_ptr<Pool_handle>>, list_pools, (), (override));
	MOCK_METHOD(std::unique_ptr<Volume_handle>, lookup_volume_by_path, (const std::string &), (override));
};

// Reply of the guest agent for a successful command.
inline std::string agent_reply(const std::string &json_return)
{
	return "{\"return\":" + json_return + "}";
}

} // namespace test
} // namespace compute

#endif
