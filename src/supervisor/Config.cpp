/*
 * Config.cpp
 *
 *  Created on: 2018年7月1日
 *      Author: peter
 */

#include "Config.hpp"

#include <cstdlib>

#include <unistd.h>

#include <kerbal/compatibility/chrono_suffix.hpp>

#include "supervisor_settings.hpp"
#include "../rules/seccomp_rules.hpp"

Config::Config() :
		merge_stderr(false),
		seccomp_rule_name(Seccomp_rule::none),
		isolate_network(false),
		chroot(false),
		uid(-1), gid(-1),
		kill_grace_period(200),
		reap_timeout(5000),
		stage(Stage::SUPERVISOR)
{
	static const std::string PATH_EQUAL = "PATH=";
	const char * path = getenv("PATH");
	this->env = {PATH_EQUAL + (path != nullptr ? path : "/usr/local/bin:/usr/bin:/bin")};
}

void Config::apply_sandbox_settings(const Settings & settings)
{
	this->uid = settings.sandbox.judger_uid;
	this->gid = settings.sandbox.judger_gid;
	this->cgroup_root = settings.sandbox.cgroup_root;
	this->kill_grace_period = settings.sandbox.kill_grace_period;
	this->reap_timeout = settings.sandbox.reap_timeout;
}

CompileConfig::CompileConfig(const Settings & settings, const boost::filesystem::path & work_dir,
								const std::string & source, const std::string & binary, const Limits & limits) :
		Config()
{
	using namespace kerbal::utility;

	// g++ -O2 -std=gnu++17 -static solution.cpp -o solution
	this->apply_sandbox_settings(settings);
	this->stage = Stage::BUILD;
	this->exe_path = settings.build.compiler.string();
	this->args = {settings.build.compiler.string()};
	this->args.append(settings.build.flags.begin(), settings.build.flags.end());
	this->args.push_back(source).push_back("-o").push_back(binary);
	this->work_dir = work_dir;
	this->input_path = "";
	this->merge_stderr = true;
	this->limits = limits;
	this->max_file_size = Byte(128 * 1024 * 1024);

	// 编译器只在工作目录中读写, 无需沙箱化文件系统, 但同样不应访问网络
	this->seccomp_rule_name = settings.sandbox.isolate_network ? Seccomp_rule::deny_network : Seccomp_rule::none;
	this->isolate_network = settings.sandbox.isolate_network;
	this->chroot = false;
}

RunningConfig::RunningConfig(const Settings & settings, const boost::filesystem::path & run_dir,
								const std::string & binary, const boost::filesystem::path & input_path, const Limits & limits) :
		Config()
{
	this->apply_sandbox_settings(settings);
	this->stage = Stage::EXECUTE;
	this->chroot = settings.sandbox.chroot && geteuid() == 0;
	if (this->chroot) {
		this->exe_path = "/" + binary;
	} else {
		this->exe_path = (run_dir / binary).string();
	}
	this->args = {this->exe_path};
	this->work_dir = run_dir;
	this->input_path = input_path;
	this->merge_stderr = false;
	this->limits = limits;
	if (!this->limits.max_stack.has_value() && this->limits.max_memory.has_value()) {
		this->limits.set_max_stack(this->limits.max_memory.value());
	}
	if (limits.max_output_size.has_value()) {
		this->max_file_size = limits.max_output_size.value();
	}
	this->seccomp_rule_name = settings.sandbox.isolate_network ? Seccomp_rule::deny_network : Seccomp_rule::none;
	this->isolate_network = settings.sandbox.isolate_network;
}

bool Config::check_is_valid_config() const
{
	using namespace kerbal::compatibility::chrono_suffix;

	if (exe_path.empty() || args.empty() || work_dir.empty()) {
		return false;
	}

	if (!limits.check_is_valid() ||

	(max_file_size.has_value() && max_file_size.value().count() < 1) ||

	(kill_grace_period < 0_ms) || (reap_timeout < 1_ms)) {
		return false;
	}
	return true;
}

RunnerError Config::load_seccomp_rules() const
{
	switch (seccomp_rule_name) {
		case Seccomp_rule::none:
			return RunnerError::SUCCESS;
		case Seccomp_rule::deny_network:
			return deny_network_seccomp_rules(*this);
	}
	// rule does not exist
	return RunnerError::LOAD_SECCOMP_FAILED;
}
