/*
 * Reaper.hpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#ifndef SRC_SUPERVISOR_REAPER_HPP_
#define SRC_SUPERVISOR_REAPER_HPP_

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/types.h>

#include <kerbal/utility/noncopyable.hpp>

#include "ProcessTable.hpp"

class ReaperException: public std::runtime_error
{
	public:
		explicit ReaperException(const std::string & reason) :
				std::runtime_error(reason)
		{
		}
};

/**
 * @brief 充当容器内 1 号进程的回收者. 负责收集所有后代进程的退出状态, 使其不会成为僵尸进程
 */
class Reaper : virtual kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		ProcessTable table;
		std::chrono::milliseconds reap_timeout;
		std::string submission_id;

	public:
		/**
		 * @param reap_timeout 主子进程结束后清理剩余后代进程的时间上限
		 * @param submission_id 仅用于日志
		 */
		Reaper(std::chrono::milliseconds reap_timeout, const std::string & submission_id);

		/**
		 * @brief fork 一个子进程执行 main_task, 其返回值作为子进程的退出代码. \n
		 * 在该子进程结束之前, 回收任何一个结束的后代进程, 并把 SIGTERM, SIGINT, SIGHUP, SIGQUIT 转发给子进程所在的进程组; \n
		 * 子进程结束之后, 杀死并回收剩余的后代进程.
		 * @return 子进程的退出代码, 若子进程被信号终止则为 128 + 信号值
		 * @exception ReaperException 无法 fork 出子进程
		 */
		int run(const std::function<int()> & main_task);

		/**
		 * @brief 杀死并回收当前进程的全部子进程, 直到没有子进程或超过 reap_timeout
		 * @return 全部回收返回 true
		 */
		bool drain();

		const ProcessTable & process_table() const noexcept
		{
			return this->table;
		}

		/**
		 * @brief 将当前进程设为 child subreaper, 使孤儿后代进程被过继给当前进程
		 */
		static bool become_subreaper() noexcept;

		/**
		 * @brief 扫描 /proc, 列出父进程为 parent 的全部进程
		 */
		static std::vector<pid_t> list_children(pid_t parent);

		static int decode_wait_status(int status) noexcept;
};

#endif /* SRC_SUPERVISOR_REAPER_HPP_ */
