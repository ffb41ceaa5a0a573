/*
 * supervisor_settings.hpp
 *
 *  Created on: 2019年3月9日
 *      Author: peter
 */

#ifndef SRC_SUPERVISOR_SUPERVISOR_SETTINGS_HPP_
#define SRC_SUPERVISOR_SUPERVISOR_SETTINGS_HPP_

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <nlohmann/json.hpp>

#include "Limits.hpp"

class SettingsException: public std::runtime_error
{
	public:
		explicit SettingsException(const std::string & reason) :
				std::runtime_error(reason)
		{
		}
};

/**
 * @brief 从 json 中读取一组 Limits. 可识别的键为 cpuTimeMs, wallClockMs, memoryKb, maxOutputBytes
 * @exception SettingsException 键的值不是整数
 */
Limits parse_limits(const nlohmann::json & limits_node);

class Settings
{
	public:

		struct
		{
				boost::filesystem::path log_file_path;
				boost::filesystem::path workspace_root;
				bool keep_workspace;
		} runtime;

		struct
		{
				int judger_uid; ///< 以 root 启动时评测进程切换到的 user id, 默认 65534, -1 表示不切换
				int judger_gid;
				bool isolate_network;
				bool chroot; ///< 以 root 启动时把运行阶段限制在各自的目录之内
				boost::filesystem::path cgroup_root; ///< cgroup v2 目录, 为空则不使用 cgroup
				std::chrono::milliseconds kill_grace_period;
				std::chrono::milliseconds reap_timeout;
		} sandbox;

		struct
		{
				boost::filesystem::path compiler;
				std::vector<std::string> flags;
				std::string source_name;
				std::string binary_name;
				Limits limits;
		} build;

		struct
		{
				Limits limits;
				int repeats;
		} run;

		/**
		 * @brief 以内置默认值初始化
		 */
		Settings();

		/**
		 * @brief 读取 json 配置文件, 文件中出现的项覆盖当前值
		 * @exception SettingsException 文件无法打开或内容不合法
		 */
		void parse(const boost::filesystem::path & config_file);

		void parse(const nlohmann::json & json_obj);

		/**
		 * @brief 读取形如 {"build": {...}, "run": {...}} 的限制文件, 按阶段覆盖 limits
		 * @exception SettingsException 文件无法打开或内容不合法
		 */
		void override_limits(const boost::filesystem::path & limits_file);

		void override_limits(const nlohmann::json & limits_obj);
};

#endif /* SRC_SUPERVISOR_SUPERVISOR_SETTINGS_HPP_ */
