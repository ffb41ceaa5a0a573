/*
 * CgroupScope.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#include "CgroupScope.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <thread>

#include <unistd.h>
#include <sys/stat.h>

#include <boost/filesystem/operations.hpp>

#include "logger.hpp"
#include "global_shared_variable.hpp"

CgroupScope::CgroupScope(const boost::filesystem::path & root, const std::string & name, const Limits & limits) :
		dir(root / name)
{
	using namespace kerbal::utility;

	if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
		throw CgroupException("can not create cgroup [" + dir.string() + "]", errno);
	}

	try {
		if (limits.max_memory.has_value()) {
			this->write_control_file("memory.max", std::to_string(storage_cast<Byte>(limits.max_memory.value()).count()));
			this->write_control_file("memory.swap.max", "0");
		}
		if (limits.max_process_number.has_value()) {
			this->write_control_file("pids.max", std::to_string(limits.max_process_number.value()));
		}
	} catch (...) {
		::rmdir(dir.c_str());
		throw;
	}
}

CgroupScope::~CgroupScope() noexcept
{
	this->kill_all();
	// 进程退出后内核还需要一点时间才允许删除目录
	for (int i = 0; i < 50; ++i) {
		if (::rmdir(dir.c_str()) == 0 || errno == ENOENT) {
			return;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	LOG_WARNING(Stage::SUPERVISOR, "-", log_fp, "can not remove cgroup [", dir, "], errno: ", errno);
}

void CgroupScope::write_control_file(const char * file_name, const std::string & value) const
{
	std::ofstream control_file((dir / file_name).string());
	if (!control_file) {
		throw CgroupException("can not open [" + (dir / file_name).string() + "]", errno);
	}
	control_file << value;
	control_file.flush();
	if (!control_file) {
		throw CgroupException("can not write [" + value + "] to [" + (dir / file_name).string() + "]", errno);
	}
}

std::size_t CgroupScope::oom_kill_count() const noexcept
{
	std::ifstream events((dir / "memory.events").string());
	std::string key;
	std::size_t value = 0;
	while (events >> key >> value) {
		if (key == "oom_kill") {
			return value;
		}
	}
	return 0;
}

kerbal::data_struct::optional<kerbal::utility::KB> CgroupScope::memory_peak() const noexcept
{
	std::ifstream peak_file((dir / "memory.peak").string());
	long long bytes = 0;
	if (!(peak_file >> bytes)) {
		return kerbal::data_struct::optional<kerbal::utility::KB>();
	}
	return kerbal::utility::KB(bytes / 1024);
}

bool CgroupScope::kill_all() const noexcept
{
	std::ofstream kill_file((dir / "cgroup.kill").string());
	if (!kill_file) {
		return false;
	}
	kill_file << "1";
	kill_file.flush();
	return static_cast<bool>(kill_file);
}
