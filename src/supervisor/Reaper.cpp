/*
 * Reaper.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#include "Reaper.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h>
#include <wait.h>
#include <sys/prctl.h>

#include <boost/filesystem/operations.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

#include "process.hpp"
#include "logger.hpp"
#include "global_shared_variable.hpp"

namespace
{
	const int forwarded_signals[] = { SIGTERM, SIGINT, SIGHUP, SIGQUIT };
	constexpr std::size_t forwarded_signals_num = sizeof(forwarded_signals) / sizeof(forwarded_signals[0]);

	std::atomic<pid_t> forward_pgid(0);

	extern "C" void forward_signal(int sig)
	{
		int saved_errno = errno;
		pid_t pgid = forward_pgid.load();
		if (pgid > 0) {
			::kill(-pgid, sig);
		}
		errno = saved_errno;
	}

	/**
	 * @brief 一个辅助类, 在作用域内安装信号转发函数, 离开作用域时恢复原先的处理方式
	 */
	struct signal_forward_guard
	{
			struct sigaction old_actions[forwarded_signals_num];

			signal_forward_guard() noexcept
			{
				struct sigaction action;
				action.sa_handler = forward_signal;
				sigemptyset(&action.sa_mask);
				action.sa_flags = 0;
				for (std::size_t i = 0; i < forwarded_signals_num; ++i) {
					sigaction(forwarded_signals[i], &action, &old_actions[i]);
				}
			}

			void restore() const noexcept
			{
				for (std::size_t i = 0; i < forwarded_signals_num; ++i) {
					sigaction(forwarded_signals[i], &old_actions[i], nullptr);
				}
			}

			~signal_forward_guard() noexcept
			{
				forward_pgid = 0;
				this->restore();
			}
	};
}

Reaper::Reaper(std::chrono::milliseconds reap_timeout, const std::string & submission_id) :
		reap_timeout(reap_timeout), submission_id(submission_id)
{
}

bool Reaper::become_subreaper() noexcept
{
	return prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) == 0;
}

std::vector<pid_t> Reaper::list_children(pid_t parent)
{
	namespace fs = boost::filesystem;

	std::vector<pid_t> children;
	boost::system::error_code ec;
	for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
		const std::string name = it->path().filename().string();
		if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
			continue;
		}
		std::ifstream stat_file((it->path() / "stat").string());
		std::string stat;
		if (!std::getline(stat_file, stat)) {
			// 进程已经消失
			continue;
		}
		// pid (comm) state ppid ..., comm 中可能含有空格与括号
		std::string::size_type comm_end = stat.rfind(')');
		if (comm_end == std::string::npos) {
			continue;
		}
		char state = 0;
		pid_t ppid = 0;
		std::istringstream fields(stat.substr(comm_end + 1));
		if (fields >> state >> ppid && ppid == parent) {
			children.push_back(static_cast<pid_t>(std::stol(name)));
		}
	}
	return children;
}

int Reaper::decode_wait_status(int status) noexcept
{
	if (WIFSIGNALED(status)) {
		return 128 + WTERMSIG(status);
	}
	return WEXITSTATUS(status);
}

int Reaper::run(const std::function<int()> & main_task)
{
	if (getpid() != 1 && !become_subreaper()) {
		LOG_WARNING(Stage::REAPER, submission_id, log_fp, "Can not become child subreaper, orphans will not be collected. errno: ", errno);
	}

	sigset_t forwarded_set, old_mask;
	sigemptyset(&forwarded_set);
	for (int sig : forwarded_signals) {
		sigaddset(&forwarded_set, sig);
	}
	// 在子进程建立自己的进程组之前, 暂缓处理需要转发的信号
	sigprocmask(SIG_BLOCK, &forwarded_set, &old_mask);

	signal_forward_guard guard;

	pid_t main_pid = -1;
	try {
		process main_child([this, &main_task, &guard, &old_mask]() noexcept {
			guard.restore();
			setpgid(0, 0);
			sigprocmask(SIG_SETMASK, &old_mask, nullptr);

			int exit_code = EXIT_FAILURE;
			try {
				exit_code = main_task();
			} catch (const std::exception & e) {
				EXCEPT_FATAL(Stage::REAPER, submission_id, log_fp, "Main task failed.", e);
			} catch (...) {
				UNKNOWN_EXCEPT_FATAL(Stage::REAPER, submission_id, log_fp, "Main task failed.");
			}
			log_fp.flush();
			_exit(exit_code);
		});
		main_pid = main_child.get_child_id();
		main_child.detach();
	} catch (const std::system_error & e) {
		sigprocmask(SIG_SETMASK, &old_mask, nullptr);
		EXCEPT_FATAL(Stage::REAPER, submission_id, log_fp, "Fork main task failed.", e);
		throw ReaperException(std::string("fork main task failed: ") + e.what());
	}

	// 父子进程都设置一次, 避免竞争
	setpgid(main_pid, main_pid);
	table.spawned(main_pid, getpid());
	table.running(main_pid);
	forward_pgid = main_pid;
	sigprocmask(SIG_SETMASK, &old_mask, nullptr);

	LOG_DEBUG(Stage::REAPER, submission_id, log_fp, "Main task started, pid: ", main_pid);

	int main_status = W_EXITCODE(EXIT_FAILURE, 0);
	bool main_collected = false;
	while (!main_collected) {
		int status = 0;
		pid_t pid = ::wait(&status);
		if (pid == -1) {
			if (errno == EINTR) {
				continue;
			}
			LOG_FATAL(Stage::REAPER, submission_id, log_fp, "Wait failed before main task terminated. errno: ", errno);
			break;
		}
		const ProcessRecord & record = table.collected(pid, status);
		if (pid == main_pid) {
			main_status = status;
			main_collected = true;
		} else {
			LOG_DEBUG(Stage::REAPER, submission_id, log_fp, "Orphan reaped. ", record);
		}
	}

	if (!this->drain()) {
		for (const ProcessRecord & record : table.unreaped()) {
			LOG_FATAL(Stage::REAPER, submission_id, log_fp, "Process left unreaped. ", record);
		}
	}

	LOG_INFO(Stage::REAPER, submission_id, log_fp, "Main task terminated, status: ", decode_wait_status(main_status),
				", processes reaped: ", table.reaped_count());
	return decode_wait_status(main_status);
}

bool Reaper::drain()
{
	using namespace std::chrono;
	using namespace kerbal::compatibility::chrono_suffix;

	const auto deadline = steady_clock::now() + reap_timeout;
	const pid_t self = getpid();
	while (true) {
		int status = 0;
		pid_t pid;
		while ((pid = ::waitpid(-1, &status, WNOHANG)) > 0) {
			table.collected(pid, status);
		}
		if (pid == -1 && errno == ECHILD) {
			return true;
		}

		for (pid_t child : list_children(self)) {
			table.spawned(child, self);
			if (::kill(child, SIGKILL) != 0 && errno != ESRCH) {
				LOG_WARNING(Stage::REAPER, submission_id, log_fp, "Kill remaining process ", child, " failed. errno: ", errno);
			}
		}

		if (steady_clock::now() >= deadline) {
			LOG_FATAL(Stage::REAPER, submission_id, log_fp, "Remaining processes were not reaped within ", reap_timeout.count(), " ms");
			return false;
		}
		std::this_thread::sleep_for(10_ms);
	}
}
