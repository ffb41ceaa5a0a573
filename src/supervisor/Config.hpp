/*
 * Config.hpp
 *
 *  Created on: 2018年7月1日
 *      Author: peter
 */

#ifndef SRC_SUPERVISOR_CONFIG_HPP_
#define SRC_SUPERVISOR_CONFIG_HPP_

#include <chrono>
#include <string>

#include <boost/filesystem/path.hpp>
#include <kerbal/utility/storage.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "ExecuteArgs.hpp"
#include "Limits.hpp"
#include "united_resource.hpp"

class Settings;

/**
 * @brief 枚举类，用于标识程序运行时禁止的系统调用类型
 */
enum class Seccomp_rule
{
		none,
		deny_network
};

/**
 * @brief 运行配置类，根据具体运行需求提供所需的子进程运行限制条件与子进程运行环境 \n
 * 例如：运行时间限制，运行空间限制，子进程调用系统函数的权限等
 * @warning 对于时间空间等限制与子进程运行环境，此类仅仅提供了限制条件的具体值，但并未应用，即并未真正对进程做出限制。真正做出限制由 ResourceLimiter 完成。 \n
 * 但子进程调用系统函数的权限限制，本类提供了接口函数直接使其生效。
 */
class Config
{
	public:
		/** 新执行程序的路径名 (若 chroot 为真, 则是 chroot 之后的路径) */
		std::string exe_path;
		/** 新执行程序的参数表 */
		ExecuteArgs args;
		/** 新执行程序的环境表 */
		ExecuteArgs env;
		/** 子进程的工作目录 */
		boost::filesystem::path work_dir;
		/** 标准输入流路径, 为空时使用 /dev/null */
		boost::filesystem::path input_path;
		/** 是否把标准错误流并入标准输出流 */
		bool merge_stderr;
		/** 资源上限 */
		Limits limits;
		/** 可创建的文件的最大字节长度 */
		kerbal::data_struct::optional<kerbal::utility::Byte> max_file_size;
		/** 枚举变量，程序运行时禁止的系统调用类型 */
		Seccomp_rule seccomp_rule_name;
		/** 以 root 运行时, 是否把子进程放入新的 network namespace */
		bool isolate_network;
		/** 以 root 运行时, 是否以 work_dir 为根目录 */
		bool chroot;
		/** 以 root 运行时子进程切换到的 user id, -1 表示不切换 */
		int uid;
		/** 以 root 运行时子进程切换到的 group id, -1 表示不切换 */
		int gid;
		/** cgroup v2 目录, 为空则不使用 cgroup */
		boost::filesystem::path cgroup_root;
		/** 墙上时间超时后, 从 SIGTERM 到 SIGKILL 的间隔 */
		std::chrono::milliseconds kill_grace_period;
		/** 主进程结束后, 等待其余进程被回收及输出被读尽的最长时间 */
		std::chrono::milliseconds reap_timeout;
		/** 日志中标注的阶段 */
		Stage stage;

		Config();

		bool check_is_valid_config() const;

		/**
		 * @brief 使 seccomp_rule_name 对应的规则在当前进程生效
		 * @warning 只应在 fork 出的子进程中 execve 之前调用
		 */
		RunnerError load_seccomp_rules() const;

	protected:
		void apply_sandbox_settings(const Settings & settings);
};

class CompileConfig : public Config
{
	public:
		/**
		 * @param work_dir 编译的工作目录
		 * @param source 源文件名, 相对 work_dir
		 * @param binary 目标文件名, 相对 work_dir
		 * @param limits 编译的资源上限
		 */
		CompileConfig(const Settings & settings, const boost::filesystem::path & work_dir,
						const std::string & source, const std::string & binary, const Limits & limits);
};

class RunningConfig : public Config
{
	public:
		/**
		 * @param run_dir 本次运行独占的目录, 可执行文件已被复制到其中
		 * @param binary 可执行文件名, 相对 run_dir
		 * @param input_path 标准输入文件, 位于 run_dir 之外
		 * @param limits 运行的资源上限
		 */
		RunningConfig(const Settings & settings, const boost::filesystem::path & run_dir,
						const std::string & binary, const boost::filesystem::path & input_path, const Limits & limits);
};


#endif /* SRC_SUPERVISOR_CONFIG_HPP_ */
