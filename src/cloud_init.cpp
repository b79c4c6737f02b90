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
#include "logging.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

FASTLIB_LOG_INIT(cloud_init_log, "Cloud_init")
FASTLIB_LOG_SET_LEVEL_GLOBAL(cloud_init_log, trace);

namespace compute {

//
// Helper functions
//

namespace {

const std::string base64_prefix = "base64:";

bool is_regular_file(const std::string &path)
{
	struct stat st;
	return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool exists(const std::string &path)
{
	struct stat st;
	return ::stat(path.c_str(), &st) == 0;
}

// Read stdout and stderr of a child together so neither pipe can fill up.
void read_outputs(int out_fd, int err_fd, std::string &out, std::string &err)
{
	struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
	std::string *data[2] = {&out, &err};
	int open_fds = 2;
	char buf[4096];
	while (open_fds > 0) {
		if (::poll(fds, 2, -1) == -1) {
			if (errno == EINTR)
				continue;
			throw Compute_error(Error_kind::instance, std::string("Cannot poll output: ") + std::strerror(errno));
		}
		for (int i = 0; i != 2; ++i) {
			if (fds[i].fd == -1 || fds[i].revents == 0)
				continue;
			auto n = ::read(fds[i].fd, buf, sizeof(buf));
			if (n > 0) {
				data[i]->append(buf, n);
			} else if (n == 0 || errno != EINTR) {
				// Negative fds are ignored by poll.
				fds[i].fd = -1;
				--open_fds;
			}
		}
	}
}

/**
 * \brief Temporary file removed on destruction.
 */
class Temp_file
{
public:
	explicit Temp_file(const std::string &data)
	{
		char name[] = "/tmp/compute-cloud-init-XXXXXX";
		int fd = ::mkstemp(name);
		if (fd == -1)
			throw Compute_error(Error_kind::instance, std::string("Cannot create temporary file: ") + std::strerror(errno));
		file_path = name;
		size_t written = 0;
		while (written != data.size()) {
			auto n = ::write(fd, data.data() + written, data.size() - written);
			if (n == -1 && errno == EINTR)
				continue;
			if (n == -1) {
				auto err = errno;
				::close(fd);
				::unlink(name);
				throw Compute_error(Error_kind::instance, "Cannot write temporary file " + file_path + ": " + std::strerror(err));
			}
			written += n;
		}
		::close(fd);
	}
	~Temp_file()
	{
		::unlink(file_path.c_str());
	}
	Temp_file(const Temp_file &) = delete;
	Temp_file & operator=(const Temp_file &) = delete;

	const std::string & path() const
	{
		return file_path;
	}
private:
	std::string file_path;
};

} // namespace

std::string run_program(const std::vector<std::string> &args)
{
	if (args.empty())
		throw Compute_error(Error_kind::invalid_argument, "No program to run.");
	std::string cmdline;
	for (const auto &arg : args)
		cmdline += (cmdline.empty() ? "" : " ") + arg;
	COMPUTE_LOG(cloud_init_log, trace) << "Run " << cmdline;
	int out_pipe[2];
	int err_pipe[2];
	if (::pipe(out_pipe) == -1)
		throw Compute_error(Error_kind::instance, std::string("Cannot create pipe: ") + std::strerror(errno));
	if (::pipe(err_pipe) == -1) {
		auto err = errno;
		::close(out_pipe[0]);
		::close(out_pipe[1]);
		throw Compute_error(Error_kind::instance, std::string("Cannot create pipe: ") + std::strerror(err));
	}
	std::vector<char *> argv;
	for (const auto &arg : args)
		argv.push_back(const_cast<char *>(arg.c_str()));
	argv.push_back(nullptr);
	auto pid = ::fork();
	if (pid == -1) {
		auto err = errno;
		for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
			::close(fd);
		throw Compute_error(Error_kind::instance, std::string("Cannot fork: ") + std::strerror(err));
	}
	if (pid == 0) {
		::dup2(out_pipe[1], STDOUT_FILENO);
		::dup2(err_pipe[1], STDERR_FILENO);
		for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
			::close(fd);
		::execvp(argv[0], argv.data());
		_exit(127);
	}
	::close(out_pipe[1]);
	::close(err_pipe[1]);
	std::string out;
	std::string err;
	try {
		read_outputs(out_pipe[0], err_pipe[0], out, err);
	} catch (const Compute_error &) {
		::close(out_pipe[0]);
		::close(err_pipe[0]);
		::kill(pid, SIGKILL);
		::waitpid(pid, nullptr, 0);
		throw;
	}
	::close(out_pipe[0]);
	::close(err_pipe[0]);
	int status = 0;
	while (::waitpid(pid, &status, 0) == -1) {
		if (errno != EINTR)
			throw Compute_error(Error_kind::instance, "Cannot wait for " + args[0] + ": " + std::strerror(errno));
	}
	if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
		auto code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
		throw Compute_error(Error_kind::instance, "Command '" + cmdline + "' failed with exit code "
				+ std::to_string(code) + (err.empty() ? "" : ": " + err));
	}
	return out;
}

std::string resolve_cloud_init_payload(const std::string &value)
{
	if (value.compare(0, base64_prefix.size(), base64_prefix) == 0)
		return base64_decode(value.substr(base64_prefix.size()));
	if (value.find('\n') == std::string::npos && is_regular_file(value)) {
		std::ifstream file(value, std::ios::binary);
		if (!file)
			throw Compute_error(Error_kind::instance, "Cannot read cloud-init file " + value + ".");
		std::stringstream ss;
		ss << file.rdbuf();
		return ss.str();
	}
	return value;
}

Cloud_init_spec resolve_cloud_init_payloads(const Cloud_init_spec &spec)
{
	Cloud_init_spec resolved;
	if (spec.user_data)
		resolved.user_data = resolve_cloud_init_payload(*spec.user_data);
	if (spec.meta_data)
		resolved.meta_data = resolve_cloud_init_payload(*spec.meta_data);
	if (spec.vendor_data)
		resolved.vendor_data = resolve_cloud_init_payload(*spec.vendor_data);
	if (spec.network_config)
		resolved.network_config = resolve_cloud_init_payload(*spec.network_config);
	return resolved;
}

//
// Cloud_init implementation
//

Cloud_init::Cloud_init(Cloud_init_spec spec) :
	cloud_init_spec(std::move(spec))
{
}

const Cloud_init_spec & Cloud_init::spec() const
{
	return cloud_init_spec;
}

std::string Cloud_init::disk_name(const std::string &instance_name)
{
	return instance_name + "-cloud-init.img";
}

void Cloud_init::write_file(const std::string &disk, const std::string &filename, const std::string &data, bool replace)
{
	if (replace) {
		std::istringstream listing(run_program({"mdir", "-i", disk, "-b"}));
		std::string line;
		while (std::getline(listing, line)) {
			if (line == "::/" + filename) {
				COMPUTE_LOG(cloud_init_log, trace) << "Remove " << filename << " from " << disk << ".";
				run_program({"mdel", "-i", disk, "::" + filename});
				break;
			}
		}
	}
	COMPUTE_LOG(cloud_init_log, trace) << "Write " << filename << " to " << disk << ".";
	Temp_file file(data);
	run_program({"mcopy", "-i", disk, file.path(), "::" + filename});
}

void Cloud_init::create_disk(const std::string &path, bool force)
{
	if (exists(path)) {
		if (!is_regular_file(path))
			throw Compute_error(Error_kind::instance, "Cloud-init disk " + path + " must be a regular file.");
		if (!force)
			throw Compute_error(Error_kind::instance, "Cloud-init disk " + path + " already exists.");
		if (::unlink(path.c_str()) == -1)
			throw Compute_error(Error_kind::instance, "Cannot remove " + path + ": " + std::strerror(errno));
	}
	run_program({"mkfs.vfat", "-n", "CIDATA", "-C", path, "1024"});
	const auto &spec = cloud_init_spec;
	write_file(path, "user-data", spec.user_data && !spec.user_data->empty() ? *spec.user_data : "#cloud-config", false);
	if (spec.vendor_data)
		write_file(path, "vendor-data", *spec.vendor_data, false);
	if (spec.network_config)
		write_file(path, "network-config", *spec.network_config, false);
	write_file(path, "meta-data", spec.meta_data.get_value_or(""), false);
}

void Cloud_init::update_disk(const std::string &path)
{
	if (!exists(path))
		throw Compute_error(Error_kind::instance, "Cloud-init disk " + path + " does not exist.");
	const auto &spec = cloud_init_spec;
	if (spec.user_data)
		write_file(path, "user-data", *spec.user_data, true);
	if (spec.vendor_data)
		write_file(path, "vendor-data", *spec.vendor_data, true);
	if (spec.network_config)
		write_file(path, "network-config", *spec.network_config, true);
	if (spec.meta_data)
		write_file(path, "meta-data", *spec.meta_data, true);
}

Disk_config Cloud_init::disk_config(const std::string &path, const std::string &target)
{
	Disk_config disk;
	disk.type = "file";
	disk.device = "disk";
	disk.driver.name = "qemu";
	disk.driver.type = "raw";
	disk.driver.cache = "writethrough";
	disk.source = path;
	disk.target = target;
	disk.bus = "virtio";
	disk.is_readonly = true;
	return disk;
}

void Cloud_init::attach_disk(const std::string &path, const std::string &target, Instance &instance)
{
	instance.attach_device(disk_config(path, target));
}

} // namespace compute
