/*
 * ResourceLimiter.hpp
 *
 *  Created on: 2018年12月7日
 *      Author: peter
 */

#ifndef SRC_SUPERVISOR_RESOURCELIMITER_HPP_
#define SRC_SUPERVISOR_RESOURCELIMITER_HPP_

#include <string>

#include <kerbal/utility/noncopyable.hpp>

#include "Config.hpp"
#include "Result.hpp"

/**
 * @brief 在资源上限之内启动并监视一个子进程, 度量它实际消耗的资源
 */
class ResourceLimiter : virtual kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		virtual ~ResourceLimiter() noexcept = default;

		/**
		 * @brief 按 config 启动子进程并阻塞直到得出终止原因
		 * @return 返回时子进程及其留下的全部后代进程均已被回收, 输出也已读尽
		 */
		virtual Result run_limited(const Config & config) noexcept = 0;
};

/**
 * @brief 以 setrlimit, 墙上时间看门狗, 输出管道计数和可选的 cgroup v2 实现的 ResourceLimiter
 * @warning 调用进程应当是 child subreaper, 否则逃出进程组的孤儿进程无法被回收
 */
class RlimitResourceLimiter : public ResourceLimiter
{
	private:
		std::string submission_id;
		unsigned int invocation_count;

	public:
		explicit RlimitResourceLimiter(const std::string & submission_id);

		virtual Result run_limited(const Config & config) noexcept override;
};

/**
 * @brief 请求取消当前及之后的全部受限运行, 并立即杀死正在运行的进程组
 * @note async-signal-safe, 可在信号处理函数中调用
 */
void request_cancellation() noexcept;

bool cancellation_requested() noexcept;

void reset_cancellation() noexcept;

#endif /* SRC_SUPERVISOR_RESOURCELIMITER_HPP_ */
