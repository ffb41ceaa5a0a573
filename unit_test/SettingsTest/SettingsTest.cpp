/*
 * SettingsTest.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#define BOOST_TEST_MODULE SettingsTest

#include <fstream>

#include <boost/test/unit_test.hpp>
#include <boost/filesystem.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

#include "supervisor_settings.hpp"

std::ofstream log_fp("/dev/null");

using namespace kerbal::compatibility::chrono_suffix;

BOOST_AUTO_TEST_CASE(defaults)
{
	Settings settings;
	BOOST_CHECK_EQUAL(settings.build.compiler.string(), "/usr/bin/g++");
	BOOST_CHECK_EQUAL(settings.build.source_name, "solution.cpp");
	BOOST_CHECK_EQUAL(settings.build.binary_name, "solution");
	BOOST_CHECK(settings.build.limits.max_cpu_time.value() == 10_s);
	BOOST_CHECK(settings.run.limits.max_cpu_time.value() == 1_s);
	BOOST_CHECK(settings.run.limits.max_real_time.value() == 2_s);
	BOOST_CHECK_EQUAL(settings.run.limits.max_memory.value().count(), 256 * 1024);
	BOOST_CHECK(!settings.run.limits.max_stack.has_value());
	BOOST_CHECK_EQUAL(settings.run.repeats, 1);
	BOOST_CHECK(settings.sandbox.cgroup_root.empty());
	BOOST_CHECK(settings.build.limits.check_is_valid());
	BOOST_CHECK(settings.run.limits.check_is_valid());
}

BOOST_AUTO_TEST_CASE(defaults_isolate_the_program)
{
	// 没有配置文件时同样隔离文件系统与网络, 并切换到 nobody
	Settings settings;
	BOOST_CHECK(settings.sandbox.chroot);
	BOOST_CHECK(settings.sandbox.isolate_network);
	BOOST_CHECK_EQUAL(settings.sandbox.judger_uid, 65534);
	BOOST_CHECK_EQUAL(settings.sandbox.judger_gid, 65534);

	settings.parse(nlohmann::json::parse(R"({"runtime": {"keep_workspace": true}})"));
	BOOST_CHECK(settings.sandbox.chroot);
	BOOST_CHECK_EQUAL(settings.sandbox.judger_uid, 65534);
}

BOOST_AUTO_TEST_CASE(parse_overrides_only_given_keys)
{
	Settings settings;
	settings.parse(nlohmann::json::parse(R"({
		"runtime": {"workspace_root": "/var/tmp/jb", "keep_workspace": true},
		"sandbox": {"judger_uid": 65534, "kill_grace_period_ms": 50},
		"build": {"flags": ["-O0"], "limits": {"cpuTimeMs": 3000}},
		"run": {"limits": {"memoryKb": 1024, "maxOutputBytes": 10}, "stack_kb": 512, "max_processes": 4, "repeats": 5}
	})"));

	BOOST_CHECK_EQUAL(settings.runtime.workspace_root.string(), "/var/tmp/jb");
	BOOST_CHECK(settings.runtime.keep_workspace);
	BOOST_CHECK_EQUAL(settings.sandbox.judger_uid, 65534);
	BOOST_CHECK_EQUAL(settings.sandbox.judger_gid, 65534);
	BOOST_CHECK(settings.sandbox.kill_grace_period == 50_ms);
	BOOST_REQUIRE_EQUAL(settings.build.flags.size(), 1u);
	BOOST_CHECK_EQUAL(settings.build.flags[0], "-O0");
	BOOST_CHECK(settings.build.limits.max_cpu_time.value() == 3_s);
	BOOST_CHECK(settings.build.limits.max_real_time.value() == 20_s);
	BOOST_CHECK_EQUAL(settings.run.limits.max_memory.value().count(), 1024);
	BOOST_CHECK_EQUAL(settings.run.limits.max_output_size.value().count(), 10);
	BOOST_CHECK(settings.run.limits.max_cpu_time.value() == 1_s);
	BOOST_CHECK_EQUAL(settings.run.limits.max_stack.value().count(), 512);
	BOOST_CHECK_EQUAL(settings.run.limits.max_process_number.value(), 4);
	BOOST_CHECK_EQUAL(settings.run.repeats, 5);
}

BOOST_AUTO_TEST_CASE(override_limits_per_phase)
{
	Settings settings;
	settings.override_limits(nlohmann::json::parse(R"({"run": {"cpuTimeMs": 250, "wallClockMs": 900}})"));
	BOOST_CHECK(settings.run.limits.max_cpu_time.value() == 250_ms);
	BOOST_CHECK(settings.run.limits.max_real_time.value() == 900_ms);
	BOOST_CHECK(settings.build.limits.max_cpu_time.value() == 10_s);
}

BOOST_AUTO_TEST_CASE(parse_limits_rejects_bad_values)
{
	BOOST_CHECK_THROW(parse_limits(nlohmann::json::parse(R"({"cpuTimeMs": "fast"})")), SettingsException);
	BOOST_CHECK_THROW(parse_limits(nlohmann::json::parse(R"({"memoryKb": 1.5})")), SettingsException);
	BOOST_CHECK_THROW(parse_limits(nlohmann::json::parse("[1, 2]")), SettingsException);

	Limits limits = parse_limits(nlohmann::json::parse(R"({"cpuTimeMs": 0})"));
	BOOST_CHECK(!limits.check_is_valid());
}

BOOST_AUTO_TEST_CASE(parse_rejects_invalid_settings)
{
	Settings settings;
	BOOST_CHECK_THROW(settings.parse(nlohmann::json::parse(R"({"run": {"repeats": 0}})")), SettingsException);
	BOOST_CHECK_THROW(settings.parse(nlohmann::json::parse(R"({"build": {"binary_name": ""}})")), SettingsException);
	BOOST_CHECK_THROW(settings.parse(nlohmann::json::parse(R"({"sandbox": {"judger_uid": "root"}})")), SettingsException);
}

BOOST_AUTO_TEST_CASE(parse_from_file)
{
	const boost::filesystem::path file = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("judgebox-conf-%%%%%%%%.json");
	{
		std::ofstream fout(file.string());
		fout << R"({"build": {"compiler": "/usr/bin/clang++"}})";
	}
	Settings settings;
	settings.parse(file);
	BOOST_CHECK_EQUAL(settings.build.compiler.string(), "/usr/bin/clang++");

	{
		std::ofstream fout(file.string());
		fout << "{ not json";
	}
	BOOST_CHECK_THROW(settings.parse(file), SettingsException);
	boost::filesystem::remove(file);

	BOOST_CHECK_THROW(settings.parse(boost::filesystem::path("/nonexistent/judgebox.json")), SettingsException);
}
