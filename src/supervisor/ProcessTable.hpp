/*
 * ProcessTable.hpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#ifndef SRC_SUPERVISOR_PROCESSTABLE_HPP_
#define SRC_SUPERVISOR_PROCESSTABLE_HPP_

#include <cstddef>
#include <iostream>
#include <vector>

#include <sys/types.h>

/**
 * @brief 进程在 reaper 视角下的生命周期
 */
enum class ProcessState
{
	SPAWNED = 0, RUNNING = 1, EXITED = 2, SIGNALED = 3, REAPED = 4
};

const char * getProcessStateName(ProcessState state);

std::ostream& operator<<(std::ostream& out, ProcessState state);

struct ProcessRecord
{
		pid_t pid;
		pid_t ppid; ///< 登记时的父进程, 未知时为 0
		ProcessState state;
		int exit_code;
		int signal;

		ProcessRecord(pid_t pid, pid_t ppid) :
				pid(pid), ppid(ppid), state(ProcessState::SPAWNED), exit_code(0), signal(0)
		{
		}

		friend std::ostream& operator<<(std::ostream& out, const ProcessRecord & src);
};

/**
 * @brief reaper 所见进程的登记表. 同一个 pid 可能在回收后被内核复用, 因此只按最近一条未回收的记录匹配
 */
class ProcessTable
{
	private:
		std::vector<ProcessRecord> records;

		ProcessRecord * find_alive(pid_t pid) noexcept;

	public:
		/**
		 * @brief 登记一个新发现的进程. 若该 pid 已有未回收的记录, 直接返回那条记录
		 */
		ProcessRecord & spawned(pid_t pid, pid_t ppid);

		void running(pid_t pid);

		/**
		 * @brief 登记 wait 族函数收集到的状态. 记录先进入 EXITED 或 SIGNALED, 随即因状态已被收集而进入 REAPED
		 * @param status wait 族函数给出的状态值
		 */
		ProcessRecord & collected(pid_t pid, int status);

		bool all_reaped() const noexcept;

		std::vector<ProcessRecord> unreaped() const;

		std::size_t reaped_count() const noexcept;

		const std::vector<ProcessRecord> & get_records() const noexcept
		{
			return this->records;
		}
};

#endif /* SRC_SUPERVISOR_PROCESSTABLE_HPP_ */
