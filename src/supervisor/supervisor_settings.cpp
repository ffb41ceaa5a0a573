/*
 * supervisor_settings.cpp
 *
 *  Created on: 2019年3月9日
 *      Author: peter
 */

#include "supervisor_settings.hpp"

#include <kerbal/compatibility/chrono_suffix.hpp>

namespace
{
	nlohmann::json load_json_file(const boost::filesystem::path & file)
	{
		std::ifstream file_stream {file.string()};
		if (!file_stream) {
			throw SettingsException("can not open [" + file.string() + "]");
		}
		nlohmann::json json_obj;
		try {
			file_stream >> json_obj;
		} catch (const nlohmann::json::exception & e) {
			throw SettingsException("[" + file.string() + "] is not valid json: " + e.what());
		}
		return json_obj;
	}

	long long integer_of(const nlohmann::json & node, const char * key)
	{
		const auto & value = node.at(key);
		if (!value.is_number_integer()) {
			throw SettingsException(std::string(key) + " must be an integer");
		}
		return value.get<long long>();
	}
}

Limits parse_limits(const nlohmann::json & limits_node)
{
	using namespace std::chrono;

	if (!limits_node.is_object()) {
		throw SettingsException("limits must be a json object");
	}

	Limits limits;
	if (limits_node.find("cpuTimeMs") != limits_node.end()) {
		limits.set_max_cpu_time(milliseconds(integer_of(limits_node, "cpuTimeMs")));
	}
	if (limits_node.find("wallClockMs") != limits_node.end()) {
		limits.set_max_real_time(milliseconds(integer_of(limits_node, "wallClockMs")));
	}
	if (limits_node.find("memoryKb") != limits_node.end()) {
		limits.set_max_memory(kerbal::utility::KB(integer_of(limits_node, "memoryKb")));
	}
	if (limits_node.find("maxOutputBytes") != limits_node.end()) {
		limits.set_max_output_size(kerbal::utility::Byte(integer_of(limits_node, "maxOutputBytes")));
	}
	return limits;
}

Settings::Settings()
{
	using namespace std::chrono;
	using namespace kerbal::compatibility::chrono_suffix;

	runtime.log_file_path = "/var/log/judgebox/judgebox.log";
	runtime.workspace_root = "/tmp/judgebox";
	runtime.keep_workspace = false;

	// nobody:nogroup. uid 切换, chroot 与网络隔离都只在以 root 启动时生效
	sandbox.judger_uid = 65534;
	sandbox.judger_gid = 65534;
	sandbox.isolate_network = true;
	sandbox.chroot = true;
	sandbox.kill_grace_period = 200_ms;
	sandbox.reap_timeout = 5_s;

	// g++ -O2 -std=gnu++17 -static solution.cpp -o solution
	build.compiler = "/usr/bin/g++";
	build.flags = {"-O2", "-std=gnu++17", "-static"};
	build.source_name = "solution.cpp";
	build.binary_name = "solution";
	build.limits.set_max_cpu_time(10_s)
				.set_max_real_time(20_s)
				.set_max_memory(kerbal::utility::KB(1024 * 1024))
				.set_max_output_size(kerbal::utility::Byte(64 * 1024));

	run.limits.set_max_cpu_time(1_s)
				.set_max_real_time(2_s)
				.set_max_memory(kerbal::utility::KB(256 * 1024))
				.set_max_output_size(kerbal::utility::Byte(32 * 1024 * 1024));
	run.repeats = 1;
}

void Settings::parse(const boost::filesystem::path & config_file)
{
	this->parse(load_json_file(config_file));
}

void Settings::parse(const nlohmann::json & json_obj) try
{
	using namespace std::chrono;

	if (json_obj.find("runtime") != json_obj.end()) {
		const auto & runtime_node = json_obj.at("runtime");
		runtime.log_file_path = runtime_node.value("log_file_path", runtime.log_file_path.string());
		runtime.workspace_root = runtime_node.value("workspace_root", runtime.workspace_root.string());
		runtime.keep_workspace = runtime_node.value("keep_workspace", runtime.keep_workspace);
	}

	if (json_obj.find("sandbox") != json_obj.end()) {
		const auto & sandbox_node = json_obj.at("sandbox");
		sandbox.judger_uid = sandbox_node.value("judger_uid", sandbox.judger_uid);
		sandbox.judger_gid = sandbox_node.value("judger_gid", sandbox.judger_gid);
		sandbox.isolate_network = sandbox_node.value("isolate_network", sandbox.isolate_network);
		sandbox.chroot = sandbox_node.value("chroot", sandbox.chroot);
		sandbox.cgroup_root = sandbox_node.value("cgroup_root", sandbox.cgroup_root.string());
		sandbox.kill_grace_period = milliseconds(sandbox_node.value("kill_grace_period_ms", sandbox.kill_grace_period.count()));
		sandbox.reap_timeout = milliseconds(sandbox_node.value("reap_timeout_ms", sandbox.reap_timeout.count()));
	}

	if (json_obj.find("build") != json_obj.end()) {
		const auto & build_node = json_obj.at("build");
		build.compiler = build_node.value("compiler", build.compiler.string());
		build.flags = build_node.value("flags", build.flags);
		build.source_name = build_node.value("source_name", build.source_name);
		build.binary_name = build_node.value("binary_name", build.binary_name);
		if (build_node.find("limits") != build_node.end()) {
			build.limits.merge(parse_limits(build_node.at("limits")));
		}
	}

	if (json_obj.find("run") != json_obj.end()) {
		const auto & run_node = json_obj.at("run");
		if (run_node.find("limits") != run_node.end()) {
			run.limits.merge(parse_limits(run_node.at("limits")));
		}
		if (run_node.find("stack_kb") != run_node.end()) {
			run.limits.set_max_stack(kerbal::utility::KB(integer_of(run_node, "stack_kb")));
		}
		if (run_node.find("max_processes") != run_node.end()) {
			run.limits.set_max_process_number(static_cast<int>(integer_of(run_node, "max_processes")));
		}
		run.repeats = run_node.value("repeats", run.repeats);
	}

	if (run.repeats < 1) {
		throw SettingsException("run.repeats must be at least 1");
	}
	if (build.source_name.empty() || build.binary_name.empty()) {
		throw SettingsException("build.source_name and build.binary_name must not be empty");
	}
} catch (const nlohmann::json::exception & e) {
	throw SettingsException(std::string("invalid settings: ") + e.what());
}

void Settings::override_limits(const boost::filesystem::path & limits_file)
{
	this->override_limits(load_json_file(limits_file));
}

void Settings::override_limits(const nlohmann::json & limits_obj) try
{
	if (limits_obj.find("build") != limits_obj.end()) {
		build.limits.merge(parse_limits(limits_obj.at("build")));
	}
	if (limits_obj.find("run") != limits_obj.end()) {
		run.limits.merge(parse_limits(limits_obj.at("run")));
	}
} catch (const nlohmann::json::exception & e) {
	throw SettingsException(std::string("invalid limits: ") + e.what());
}
