/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "cloud_init.hpp"
#include "encoding.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <string>

using namespace compute;

TEST(Cloud_init, literal_payload)
{
	EXPECT_EQ(resolve_cloud_init_payload("#cloud-config\nhostname: vm1\n"), "#cloud-config\nhostname: vm1\n");
	EXPECT_EQ(resolve_cloud_init_payload("/nonexistent/user-data"), "/nonexistent/user-data");
}

TEST(Cloud_init, base64_payload)
{
	EXPECT_EQ(resolve_cloud_init_payload("base64:" + base64_encode("#cloud-config\n")), "#cloud-config\n");
}

TEST(Cloud_init, file_payload)
{
	char name[] = "/tmp/compute-user-data-XXXXXX";
	int fd = ::mkstemp(name);
	ASSERT_NE(fd, -1);
	::close(fd);
	{
		std::ofstream file(name);
		file << "#cloud-config\npackages: [htop]\n";
	}
	Cloud_init_spec spec;
	spec.user_data = std::string(name);
	spec.meta_data = std::string("instance-id: vm1");
	auto resolved = resolve_cloud_init_payloads(spec);
	::unlink(name);
	EXPECT_EQ(*resolved.user_data, "#cloud-config\npackages: [htop]\n");
	EXPECT_EQ(*resolved.meta_data, "instance-id: vm1");
	EXPECT_FALSE(resolved.vendor_data);
}

TEST(Cloud_init, disk_name_and_config)
{
	EXPECT_EQ(Cloud_init::disk_name("vm1"), "vm1-cloud-init.img");
	auto disk = Cloud_init::disk_config("/var/lib/volumes/vm1-cloud-init.img", "vdb");
	EXPECT_EQ(disk.driver.type, "raw");
	EXPECT_EQ(disk.target, "vdb");
	EXPECT_TRUE(disk.is_readonly);
}

TEST(Cloud_init, existing_disk_is_not_overwritten)
{
	char name[] = "/tmp/compute-cloud-init-test-XXXXXX";
	int fd = ::mkstemp(name);
	ASSERT_NE(fd, -1);
	::close(fd);
	Cloud_init cloud_init(Cloud_init_spec{});
	EXPECT_THROW(cloud_init.create_disk(name), Compute_error);
	::unlink(name);
	EXPECT_THROW(cloud_init.update_disk(name), Compute_error);
}

TEST(Run_program, captures_stdout)
{
	EXPECT_EQ(run_program({"echo", "hello"}), "hello\n");
}

TEST(Run_program, large_stderr_does_not_block)
{
	auto out = run_program({"sh", "-c", "head -c 262144 /dev/zero >&2; echo done"});
	EXPECT_EQ(out, "done\n");
}

TEST(Run_program, failure_is_reported)
{
	try {
		run_program({"sh", "-c", "echo broken >&2; exit 3"});
		FAIL() << "expected an instance error";
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::instance);
		EXPECT_NE(std::string(e.what()).find("exit code 3"), std::string::npos);
		EXPECT_NE(std::string(e.what()).find("broken"), std::string::npos);
	}
	EXPECT_THROW(run_program({"/nonexistent/program"}), Compute_error);
	EXPECT_THROW(run_program({}), Compute_error);
}
