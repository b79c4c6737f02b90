/*
 * This file is part of compute.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "config.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <map>
#include <string>

using namespace compute;

namespace {

class Config_file :
	public ::testing::Test
{
protected:
	void TearDown() override
	{
		if (!path.empty())
			::unlink(path.c_str());
	}

	void write(const std::string &contents)
	{
		char name[] = "/tmp/compute-config-test-XXXXXX";
		int fd = ::mkstemp(name);
		ASSERT_NE(fd, -1);
		::close(fd);
		path = name;
		std::ofstream file(path);
		file << contents;
	}

	std::string path;
};

} // namespace

TEST_F(Config_file, missing_file_yields_defaults)
{
	auto config = load_config("/nonexistent/compute/computed.yaml", {});
	EXPECT_EQ(config.libvirt_uri, "qemu:///system");
	EXPECT_EQ(config.images_pool, "images");
	EXPECT_EQ(config.volumes_pool, "volumes");
	EXPECT_TRUE(config.log_file.empty());
	EXPECT_EQ(config.log_level, Log_level::warn);
}

TEST_F(Config_file, file_values)
{
	write(
		"libvirt:\n"
		"  uri: qemu+ssh://host/system\n"
		"log:\n"
		"  file: /var/log/compute.log\n"
		"storage:\n"
		"  images: golden\n");
	auto config = load_config(path, {});
	EXPECT_EQ(config.libvirt_uri, "qemu+ssh://host/system");
	EXPECT_EQ(config.log_file, "/var/log/compute.log");
	EXPECT_EQ(config.images_pool, "golden");
	EXPECT_EQ(config.volumes_pool, "volumes");
}

TEST_F(Config_file, environment_overrides_file)
{
	write("libvirt:\n  uri: qemu:///session\nstorage:\n  volumes: fast\n");
	std::map<std::string, std::string> env = {
		{"CMP_LIBVIRT_URI", "test:///default"},
		{"HOME", "/root"}
	};
	auto config = load_config(path, env);
	EXPECT_EQ(config.libvirt_uri, "test:///default");
	EXPECT_EQ(config.volumes_pool, "fast");
}

TEST_F(Config_file, log_level_from_file_and_environment)
{
	write("log:\n  level: DEBUG\n");
	EXPECT_EQ(load_config(path, {}).log_level, Log_level::debug);
	EXPECT_EQ(load_config(path, {{"CMP_LOG", "error"}}).log_level, Log_level::error);
	EXPECT_EQ(load_config(path, {{"CMP_LOG", ""}}).log_level, Log_level::debug);
}

TEST_F(Config_file, invalid_log_level)
{
	write("log:\n  level: loud\n");
	try {
		load_config(path, {});
		FAIL() << "expected a config_load error";
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::config_load);
		EXPECT_NE(std::string(e.what()).find("log.level"), std::string::npos);
	}
	try {
		load_config("/nonexistent/compute/computed.yaml", {{"CMP_LOG", "verbose"}});
		FAIL() << "expected a config_load error";
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::config_load);
		EXPECT_NE(std::string(e.what()).find("CMP_LOG"), std::string::npos);
	}
}

TEST_F(Config_file, unknown_key)
{
	write("libvirt:\n  url: qemu:///system\n");
	try {
		load_config(path, {});
		FAIL() << "expected a config_load error";
	} catch (const Compute_error &e) {
		EXPECT_EQ(e.kind(), Error_kind::config_load);
		EXPECT_NE(std::string(e.what()).find("libvirt.url"), std::string::npos);
	}
}

TEST_F(Config_file, malformed_yaml)
{
	write("libvirt: [unterminated\n");
	EXPECT_THROW(load_config(path, {}), Compute_error);
}

TEST(Config, emit_and_load)
{
	Config config;
	config.libvirt_uri = "qemu:///session";
	config.log_file = "/tmp/compute.log";
	config.log_level = Log_level::trace;
	Config loaded;
	loaded.from_string(config.to_string());
	EXPECT_EQ(loaded.libvirt_uri, "qemu:///session");
	EXPECT_EQ(loaded.log_level, Log_level::trace);
	EXPECT_EQ(loaded.log_file, "/tmp/compute.log");
}

TEST(Config, environment_map)
{
	char first[] = "CMP_IMAGES_POOL=base";
	char second[] = "EMPTY=";
	char third[] = "NO_SEPARATOR";
	char *envp[] = {first, second, third, nullptr};
	auto env = environment_map(envp);
	EXPECT_EQ(env.size(), 2u);
	EXPECT_EQ(env["CMP_IMAGES_POOL"], "base");
	EXPECT_EQ(env["EMPTY"], "");
}
