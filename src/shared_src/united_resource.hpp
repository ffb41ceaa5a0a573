/*
 * united_resource.hpp
 *
 *  Created on: 2018年6月11日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_UNITED_RESOURCE_HPP_
#define SRC_SHARED_SRC_UNITED_RESOURCE_HPP_

#include <iostream>
#include <string>

/**
 * @brief 枚举类，标识日志所属的阶段
 */
enum class Stage
{
	SUPERVISOR = 0, REAPER = 1, BUILD = 2, EXECUTE = 3, REPORT = 4
};

/*
 * 分享一个这里出现的处理技巧: 对于枚举中未定义的量不应在 switch 语句的 default 分支处理, 而应在函数末尾处理
 * 如果未来加了新定义的枚举值而忘了加上描述, 这样在编译期编译器便会给出警告
 */
inline const char* getStageName(Stage stage)
{
	switch (stage) {
		case Stage::SUPERVISOR:
			return "supervisor";
		case Stage::REAPER:
			return "reaper";
		case Stage::BUILD:
			return "build";
		case Stage::EXECUTE:
			return "execute";
		case Stage::REPORT:
			return "report";
	}
	return "unknown";
}

/**
 * @brief 枚举类，标识受限子进程停止的具体原因
 */
enum class TerminationReason
{
	COMPLETED = 0, ///< 正常退出, 未越过任何限制
	CPU_LIMIT_EXCEEDED = 1, ///< CPU 时间超时
	WALL_LIMIT_EXCEEDED = 2, ///< 墙上时间超时
	MEMORY_LIMIT_EXCEEDED = 3, ///< 超内存
	OUTPUT_LIMIT_EXCEEDED = 4, ///< 输出字节数超过允许值
	SIGNALED = 5, ///< 被未捕获的信号终止
	SYSTEM_ERROR = 6, ///< 环境错误, 子进程未能被公平地运行
};

inline const char* getTerminationReasonName(TerminationReason reason)
{
	switch (reason) {
		case TerminationReason::COMPLETED:
			return "Completed";
		case TerminationReason::CPU_LIMIT_EXCEEDED:
			return "CpuLimitExceeded";
		case TerminationReason::WALL_LIMIT_EXCEEDED:
			return "WallLimitExceeded";
		case TerminationReason::MEMORY_LIMIT_EXCEEDED:
			return "MemoryLimitExceeded";
		case TerminationReason::OUTPUT_LIMIT_EXCEEDED:
			return "OutputLimitExceeded";
		case TerminationReason::SIGNALED:
			return "Signaled";
		case TerminationReason::SYSTEM_ERROR:
			return "SystemError";
	}
	return "Unknown";
}

inline std::ostream& operator<<(std::ostream& out, TerminationReason reason)
{
	return out << getTerminationReasonName(reason);
}

/**
 * @brief 枚举类，标识一次提交的最终评测结果
 */
enum class Verdict
{
	ACCEPTED = 0, ///< 提交通过
	COMPILE_ERROR = 1, ///< 编译错误
	RUNTIME_ERROR = 2, ///< 运行时错误
	TIME_LIMIT_EXCEEDED = 3, ///< 超时
	MEMORY_LIMIT_EXCEEDED = 4, ///< 超内存
	OUTPUT_LIMIT_EXCEEDED = 5, ///< 输出超限
	INTERNAL_ERROR = 6, ///< 系统错误
};

/**
 * @brief 根据传入的 Verdict，返回其对应含义的类型说明。
 * @param verdict Verdict 类型
 * @return verdict 对应含义的类型说明。
 */
inline const char * getVerdictName(Verdict verdict)
{
	switch (verdict) {
		case Verdict::ACCEPTED:
			return "Accepted";
		case Verdict::COMPILE_ERROR:
			return "CompileError";
		case Verdict::RUNTIME_ERROR:
			return "RuntimeError";
		case Verdict::TIME_LIMIT_EXCEEDED:
			return "TimeLimitExceeded";
		case Verdict::MEMORY_LIMIT_EXCEEDED:
			return "MemoryLimitExceeded";
		case Verdict::OUTPUT_LIMIT_EXCEEDED:
			return "OutputLimitExceeded";
		case Verdict::INTERNAL_ERROR:
			return "InternalError";
	}
	return "UnknownVerdict";
}

/**
 * @brief 重载 Verdict 类的 << 运算符，输出其对应含义的类型说明
 */
inline std::ostream& operator<<(std::ostream& out, Verdict verdict)
{
	return out << getVerdictName(verdict);
}

/**
 * @brief 枚举类，标识受限子进程启动或监控过程中的系统错误
 */
enum class RunnerError
{
	SUCCESS = 0,
	INVALID_CONFIG = -1,
	FORK_FAILED = -2,
	PTHREAD_FAILED = -3,
	WAIT_FAILED = -4,
	PIPE_FAILED = -5,
	LOAD_SECCOMP_FAILED = -6,
	SETRLIMIT_FAILED = -7,
	DUP2_FAILED = -8,
	SETUID_FAILED = -9,
	EXECVE_FAILED = -10,
	UNSHARE_FAILED = -11,
	CHDIR_ERROR = -12,
	CGROUP_FAILED = -13,
	WORKSPACE_FAILED = -14,
	REAP_TIMEOUT = -15,
	CANCELLED = -16,
};

/**
 * @brief 根据传入的 RunnerError，返回其对应含义的类型说明。
 * @param err RunnerError 类型
 * @return err 对应含义的类型说明。
 */
inline const char* getRunnerErrorName(RunnerError err)
{
	switch (err) {
		case RunnerError::SUCCESS:
			return "SUCCESS";
		case RunnerError::INVALID_CONFIG:
			return "INVALID_CONFIG";
		case RunnerError::FORK_FAILED:
			return "FORK_FAILED";
		case RunnerError::PTHREAD_FAILED:
			return "PTHREAD_FAILED";
		case RunnerError::WAIT_FAILED:
			return "WAIT_FAILED";
		case RunnerError::PIPE_FAILED:
			return "PIPE_FAILED";
		case RunnerError::LOAD_SECCOMP_FAILED:
			return "LOAD_SECCOMP_FAILED";
		case RunnerError::SETRLIMIT_FAILED:
			return "SETRLIMIT_FAILED";
		case RunnerError::DUP2_FAILED:
			return "DUP2_FAILED";
		case RunnerError::SETUID_FAILED:
			return "SETUID_FAILED";
		case RunnerError::EXECVE_FAILED:
			return "EXECVE_FAILED";
		case RunnerError::UNSHARE_FAILED:
			return "UNSHARE_FAILED";
		case RunnerError::CHDIR_ERROR:
			return "CHDIR_ERROR";
		case RunnerError::CGROUP_FAILED:
			return "CGROUP_FAILED";
		case RunnerError::WORKSPACE_FAILED:
			return "WORKSPACE_FAILED";
		case RunnerError::REAP_TIMEOUT:
			return "REAP_TIMEOUT";
		case RunnerError::CANCELLED:
			return "CANCELLED";
	}
	return "UNKNOWN ERROR";
}

/**
 * @brief 重载 RunnerError 类的 << 运算符，输出其对应含义的类型说明
 */
inline std::ostream& operator<<(std::ostream& out, RunnerError err)
{
	return out << getRunnerErrorName(err);
}

#endif /* SRC_SHARED_SRC_UNITED_RESOURCE_HPP_ */
