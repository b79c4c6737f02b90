/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "errors.hpp"
#include "mock_hypervisor.hpp"
#include "session.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace compute;
using namespace compute::test;
using ::testing::_;
using ::testing::AllOf;
using ::testing::ByMove;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Not;
using ::testing::Return;

namespace {

const std::string capabilities_xml =
	"<domainCapabilities>"
	"<path>/usr/bin/qemu-system-x86_64</path>"
	"<domain>kvm</domain>"
	"<machine>pc-q35-6.2</machine>"
	"<arch>x86_64</arch>"
	"</domainCapabilities>";

const std::string volumes_pool_xml =
	"<pool type='dir'><name>volumes</name><target><path>/var/lib/compute/volumes</path></target></pool>";

Partial_instance_spec parse(const std::string &yaml)
{
	Partial_instance_spec partial;
	partial.from_string(yaml);
	return partial;
}

std::unique_ptr<Volume_handle> new_volume()
{
	return std::unique_ptr<Volume_handle>(new NiceMock<Mock_volume>);
}

class Session_test :
	public ::testing::Test
{
protected:
	Session_test() :
		connection(new NiceMock<Mock_connection>),
		session(std::unique_ptr<Connection_handle>(connection)),
		domain(std::make_shared<NiceMock<Mock_domain>>())
	{
		ON_CALL(*connection, domain_capabilities()).WillByDefault(Return(capabilities_xml));
		Node_info node;
		node.cpus = 4;
		node.memory = 8388608;
		ON_CALL(*connection, node_info()).WillByDefault(Return(node));
		ON_CALL(*domain, name()).WillByDefault(Return("vm1"));
		ON_CALL(*domain, is_active()).WillByDefault(Return(false));
		ON_CALL(*domain, xml_desc(_)).WillByDefault(Return("<domain><name>vm1</name><devices/></domain>"));
	}

	// Owned by session.
	NiceMock<Mock_connection> *connection;
	Session session;
	std::shared_ptr<NiceMock<Mock_domain>> domain;
};

} // namespace

TEST_F(Session_test, capabilities_and_defaults)
{
	auto caps = session.capabilities();
	EXPECT_EQ(caps.arch, "x86_64");
	EXPECT_EQ(caps.virt, "kvm");
	EXPECT_EQ(caps.machine, "pc-q35-6.2");

	auto defaults = session.spec_defaults();
	EXPECT_EQ(defaults.emulator, "/usr/bin/qemu-system-x86_64");
	EXPECT_EQ(defaults.host_cpus, 4u);
	EXPECT_EQ(defaults.host_memory, 8192u);
}

TEST_F(Session_test, create_instance_with_new_system_volume)
{
	auto pool = new NiceMock<Mock_pool>;
	ON_CALL(*pool, xml_desc()).WillByDefault(Return(volumes_pool_xml));
	EXPECT_CALL(*pool, create_volume(AllOf(HasSubstr("21474836480"), HasSubstr("/var/lib/compute/volumes/vm1-vda-"))))
		.WillOnce(Invoke([](const std::string &) {return new_volume();}));
	EXPECT_CALL(*connection, lookup_pool("volumes")).WillOnce(Return(ByMove(std::unique_ptr<Pool_handle>(pool))));
	EXPECT_CALL(*connection, define_domain(AllOf(HasSubstr("<name>vm1</name>"), Not(HasSubstr("<interface")))))
		.WillOnce(Return(domain));
	EXPECT_CALL(*domain, attach_device(HasSubstr("vda"), static_cast<unsigned int>(affect_config))).Times(1);
	EXPECT_CALL(*domain, create()).Times(0);

	auto instance = session.create_instance(parse(
		"name: vm1\n"
		"network: false\n"
		"volumes:\n"
		"  - is_system: true\n"
		"    capacity: {value: 20, unit: GiB}\n"));
	EXPECT_EQ(instance.name(), "vm1");
}

TEST_F(Session_test, system_volume_is_cloned_from_image)
{
	auto image = new NiceMock<Mock_volume>;
	ON_CALL(*image, name()).WillByDefault(Return("ubuntu-22.04.qcow2"));
	auto images = new NiceMock<Mock_pool>;
	EXPECT_CALL(*images, lookup_volume("ubuntu-22.04.qcow2"))
		.WillOnce(Return(ByMove(std::unique_ptr<Volume_handle>(image))));

	auto clone = new NiceMock<Mock_volume>;
	EXPECT_CALL(*clone, resize(10737418240ULL)).Times(1);
	auto volumes = new NiceMock<Mock_pool>;
	ON_CALL(*volumes, xml_desc()).WillByDefault(Return(volumes_pool_xml));
	EXPECT_CALL(*volumes, create_volume(_)).Times(0);
	EXPECT_CALL(*volumes, clone_volume(HasSubstr("10737418240"), _))
		.WillOnce(Return(ByMove(std::unique_ptr<Volume_handle>(clone))));

	EXPECT_CALL(*connection, lookup_pool("images")).WillOnce(Return(ByMove(std::unique_ptr<Pool_handle>(images))));
	EXPECT_CALL(*connection, lookup_pool("volumes")).WillOnce(Return(ByMove(std::unique_ptr<Pool_handle>(volumes))));
	EXPECT_CALL(*connection, define_domain(_)).WillOnce(Return(domain));
	EXPECT_CALL(*domain, attach_device(_, _)).Times(1);

	session.create_instance(parse(
		"name: vm1\n"
		"image: ubuntu-22.04.qcow2\n"
		"volumes:\n"
		"  - is_system: true\n"
		"    capacity: {value: 10, unit: GiB}\n"));
}

TEST_F(Session_test, existing_volumes_are_attached_without_pools)
{
	EXPECT_CALL(*connection, lookup_pool(_)).Times(0);
	EXPECT_CALL(*connection, define_domain(_)).WillOnce(Return(domain));
	EXPECT_CALL(*domain, attach_device(HasSubstr("/srv/vm1.qcow2"), _)).Times(1);
	EXPECT_CALL(*domain, attach_device(HasSubstr("/srv/install.iso"), _)).Times(1);

	session.create_instance(parse(
		"name: vm1\n"
		"volumes:\n"
		"  - {is_system: true, source: /srv/vm1.qcow2}\n"
		"  - {device: cdrom, source: /srv/install.iso}\n"));
}

TEST_F(Session_test, invalid_description_leaves_hypervisor_untouched)
{
	EXPECT_CALL(*connection, define_domain(_)).Times(0);
	EXPECT_CALL(*connection, lookup_pool(_)).Times(0);
	EXPECT_CALL(*domain, attach_device(_, _)).Times(0);
	try {
		session.create_instance(parse(
			"name: vm1\n"
			"max_vcpus: 4\n"
			"cpu:\n"
			"  topology: {sockets: 1, cores: 1, threads: 2}\n"
			"volumes:\n"
			"  - is_system: true\n"
			"    capacity: {value: 20, unit: GiB}\n"));
		FAIL() << "expected a validation error";
	} catch (const Compute_error &e) {
		ASSERT_EQ(e.kind(), Error_kind::validation);
		ASSERT_EQ(e.field_errors().size(), 1u);
		EXPECT_EQ(e.field_errors()[0].path, "cpu.topology");
	}
}

TEST_F(Session_test, list_instances)
{
	auto other = std::make_shared<NiceMock<Mock_domain>>();
	ON_CALL(*other, name()).WillByDefault(Return("vm2"));
	EXPECT_CALL(*connection, list_domains())
		.WillOnce(Return(std::vector<std::shared_ptr<Domain_handle>>{domain, other}));
	auto instances = session.list_instances();
	ASSERT_EQ(instances.size(), 2u);
	EXPECT_EQ(instances[0].name(), "vm1");
	EXPECT_EQ(instances[1].name(), "vm2");
}

TEST_F(Session_test, unknown_instance)
{
	EXPECT_CALL(*connection, lookup_domain("nope")).WillOnce(::testing::Throw(Compute_error::not_found("Instance", "nope")));
	try {
		session.get_instance("nope");
		FAIL() << "expected a not_found error";
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::not_found);
		EXPECT_EQ(e.resource(), "nope");
	}
}
