/*
 * process.hpp
 *
 *  Created on: 2018年6月15日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_PROCESS_HPP_
#define SRC_SHARED_SRC_PROCESS_HPP_

#include <utility>
#include <system_error>
#include <cerrno>

#include <signal.h>
#include <unistd.h>
#include <wait.h>
#include <sys/resource.h>

#include <kerbal/utility/noncopyable.hpp>

/**
 * @brief fork 出的子进程的句柄
 * @note 子进程执行完 func 后以 _exit 结束, 不会执行父进程注册的 atexit 函数, 也不会冲刷继承来的 stdio 缓冲区
 */
class process : virtual kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		typedef pid_t pid_type;

	protected:
		pid_type father_id;
		pid_type child_id;

		enum
		{
			none, joined, detached
		} status;

	public:
		process() noexcept :
				father_id(0), child_id(0), status(none)
		{
		}

		/**
		 * @brief fork 一个子进程, 子进程中执行 func(args...)
		 * @exception std::system_error fork 失败
		 */
		template <typename Callable, typename ... Args>
		explicit process(Callable && func, Args && ... args) :
				father_id(getpid()), child_id(-1), status(joined)
		{
			child_id = fork();
			if (child_id == -1) {
				status = none;
				throw std::system_error(errno, std::system_category(), "fork failed");
			} else if (child_id == 0) {
				{
					func(std::forward<Args>(args)...);
				}
				_exit(0);
			}
		}

		~process() noexcept
		{
			if (getpid() == father_id) {
				switch (status) {
					case none:
						break;
					case joined:
						this->kill(SIGKILL);
						::waitpid(child_id, nullptr, 0);
						break;
					case detached:
						break;
				}
			}
		}

		pid_type get_father_id() const noexcept
		{
			return this->father_id;
		}

		pid_type get_child_id() const noexcept
		{
			return this->child_id;
		}

		process(process && src) noexcept :
				father_id(src.father_id), child_id(src.child_id), status(src.status)
		{
			src.father_id = 0;
			src.child_id = 0;
			src.status = none;
		}

		void swap(process & with) noexcept
		{
			std::swap(this->father_id, with.father_id);
			std::swap(this->child_id, with.child_id);
			std::swap(this->status, with.status);
		}

		process& operator=(process&& src) noexcept
		{
			process tmp(std::move(src));
			this->swap(tmp);
			return *this;
		}

		bool joinable() const noexcept
		{
			return status == joined;
		}

		/**
		 * @brief Wait for the process to change state. Put the status in *status_loc
		 * @param status_loc The location where the process status will be put.
		 * @param options If the WNOHANG bit is set in OPTIONS, and that child is not already dead, return (pid_t) 0.
		 * @param usage If not nil, store information about the child's resource usage there.
		 * @return For errors return (pid_type) (-1); otherwise return the process ID.
		 * @note 只有在子进程确已被回收时才会放弃对它的所有权
		 */
		pid_type join(int * status_loc, int options, struct rusage * usage) noexcept
		{
			if (status == none) {
				return 0;
			}
			pid_type res;
			do {
				res = ::wait4(child_id, status_loc, options, usage);
			} while (res == -1 && errno == EINTR);

			if (res == child_id && status_loc != nullptr && (WIFEXITED(*status_loc) || WIFSIGNALED(*status_loc))) {
				this->status = none;
			}
			return res;
		}

		void detach() noexcept
		{
			status = detached;
		}

		/**
		 * @brief Send signal SIG to the process.
		 * @param sig signal send to child process.
		 * @return If success return 0, For errors, return other value.
		 */
		int kill(int sig) noexcept
		{
			if (status == none) {
				return 0;
			}
			return ::kill(child_id, sig);
		}

		/**
		 * @brief 向以子进程为组长的整个进程组发送信号
		 */
		int kill_group(int sig) noexcept
		{
			if (status == none) {
				return 0;
			}
			return ::kill(-child_id, sig);
		}

};

#endif /* SRC_SHARED_SRC_PROCESS_HPP_ */
