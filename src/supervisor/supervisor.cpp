/*
 * supervisor.cpp
 *
 *  Created on: 2018年5月29日
 *      Author: peter
 */

#include "logger.hpp"
#include "Submission.hpp"
#include "Supervision.hpp"
#include "Workspace.hpp"
#include "supervisor_settings.hpp"

#include <iostream>
#include <fstream>
#include <string>

#include <unistd.h>

#include <cmdline.h>

#include <boost/filesystem.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

std::ofstream log_fp;

namespace
{
	const char default_conf[] = "/etc/judgebox/judgebox.json";

	/**
	 * @brief 加载配置. 默认路径下没有配置文件时使用内置的默认值
	 * @exception SettingsException
	 */
	void load_config(Settings & settings, const std::string & conf, const std::string & limits)
	{
		if (conf != default_conf || boost::filesystem::exists(conf)) {
			settings.parse(boost::filesystem::path(conf));
		}
		if (!limits.empty()) {
			if (limits.front() == '{') {
				nlohmann::json limits_obj = nlohmann::json::parse(limits, nullptr, false);
				if (limits_obj.is_discarded()) {
					throw SettingsException("limits is not valid json");
				}
				settings.override_limits(limits_obj);
			} else {
				settings.override_limits(boost::filesystem::path(limits));
			}
		}
	}

	Limits submission_limits(const cmdline::parser & parser)
	{
		using namespace kerbal::compatibility::chrono_suffix;

		Limits limits;
		const int time_limit = parser.get<int>("time-limit");
		if (time_limit > 0) {
			limits.set_max_cpu_time(std::chrono::milliseconds(time_limit));
			limits.set_max_real_time(std::chrono::milliseconds(time_limit) + 1_s);
		}
		const int memory_limit = parser.get<int>("memory-limit");
		if (memory_limit > 0) {
			limits.set_max_memory(kerbal::utility::KB(memory_limit));
		}
		const long output_limit = parser.get<long>("output-limit");
		if (output_limit > 0) {
			limits.set_max_output_size(kerbal::utility::Byte(output_limit));
		}
		return limits;
	}
}

/**
 * @brief supervisor 主程序
 * 加载配置; 以 Reaper 的身份 fork 出流水线进程完成编译, 执行与判定; 回收全部后代进程后输出唯一的结果
 */
int main(int argc, char * argv[]) try
{
	cmdline::parser parser;
	parser.add<std::string>("source", 's', "Specify the source file of the submission.", true);
	parser.add<std::string>("stdin", 'i', "Specify the file forwarded to the standard input of the program.", false, "");
	parser.add<std::string>("conf", 'c', "Specify configure description file path.", false, default_conf);
	parser.add<std::string>("limits", 'L', "Build and run limits as a json object or a json file path.", false, "");
	parser.add<int>("time-limit", 't', "CPU time limit of the program in milliseconds.", false, 0);
	parser.add<int>("memory-limit", 'm', "Memory limit of the program in KiB.", false, 0);
	parser.add<long>("output-limit", 'o', "Output limit of the program in bytes.", false, 0);
	parser.add<std::string>("id", '\0', "Submission id shown in logs.", false, "");
	parser.add<std::string>("log", 'l', "Specify log file path.", false, "");
	parser.add("version", 'v', "Display the version information.");

	if (argc > 1 && (std::string(argv[1]) == "-v" || std::string(argv[1]) == "--version")) {
		std::cout << "judgebox compiled at: " __DATE__ " " __TIME__ << std::endl;
		return 0;
	}

	parser.parse_check(argc, argv);

	std::string submission_id = parser.get<std::string>("id");
	if (submission_id.empty()) {
		submission_id = std::to_string(getpid());
	}

	using namespace kerbal::utility::costream;
	const auto & cwarn = costream<std::cerr>(YELLOW);

	Settings settings;
	try {
		load_config(settings, parser.get<std::string>("conf"), parser.get<std::string>("limits"));
	} catch (const SettingsException & e) {
		EXCEPT_FATAL(Stage::SUPERVISOR, submission_id, log_fp, "Load configuration failed.", e);
		return emit_internal_error(submission_id, std::string("invalid configuration: ") + e.what(), std::cout);
	}

	const std::string log_path = parser.exist("log") ? parser.get<std::string>("log") : settings.runtime.log_file_path.string();
	{
		boost::system::error_code ec;
		boost::filesystem::create_directories(boost::filesystem::path(log_path).parent_path(), ec);
	}
	log_fp.open(log_path, std::ios::app);
	if (!log_fp) {
		cwarn << "log file open failed: " << log_path << std::endl;
	}
	LOG_INFO(Stage::SUPERVISOR, submission_id, log_fp, "Configuration load finished!");

	std::string source;
	std::string stdin_data;
	try {
		source = read_file(parser.get<std::string>("source"));
		if (!parser.get<std::string>("stdin").empty()) {
			stdin_data = read_file(parser.get<std::string>("stdin"));
		}
	} catch (const WorkspaceException & e) {
		EXCEPT_FATAL(Stage::SUPERVISOR, submission_id, log_fp, "Read submission failed.", e);
		return emit_internal_error(submission_id, e.what(), std::cout);
	}

	const Submission submission(submission_id, source, stdin_data, submission_limits(parser));

	return supervise(settings, submission, std::cout);

} catch (const std::exception & e) {
	EXCEPT_FATAL(Stage::SUPERVISOR, "", log_fp, "An uncaught exception caught by main.", e);
	return emit_internal_error("", std::string("uncaught exception: ") + e.what(), std::cout);
}
