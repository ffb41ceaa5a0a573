/*
 * ResourceLimiter.cpp
 *
 *  Created on: 2018年12月7日
 *      Author: peter
 */

#include "ResourceLimiter.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <limits>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <sched.h>
#include <unistd.h>
#include <wait.h>
#include <sys/resource.h>

#include <boost/filesystem/operations.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

#include "CgroupScope.hpp"
#include "Reaper.hpp"
#include "process.hpp"
#include "logger.hpp"
#include "global_shared_variable.hpp"

namespace
{
	volatile std::sig_atomic_t cancellation_flag = 0;
	std::atomic<pid_t> active_pgid(0);

	std::chrono::milliseconds timevalToChrono(const timeval & val)
	{
		using namespace std::chrono;
		return duration_cast<milliseconds>(seconds(val.tv_sec) + microseconds(val.tv_usec));
	}

	/**
	 * @brief 一个辅助类, 用于确保将打开的管道关闭
	 */
	struct pipe_guard
	{
			int read_fd;
			int write_fd;

			pipe_guard() noexcept :
					read_fd(-1), write_fd(-1)
			{
			}

			bool open() noexcept
			{
				int fd[2];
				if (pipe2(fd, O_CLOEXEC) != 0) {
					return false;
				}
				read_fd = fd[0];
				write_fd = fd[1];
				return true;
			}

			void close_read() noexcept
			{
				if (read_fd != -1) {
					::close(read_fd);
					read_fd = -1;
				}
			}

			void close_write() noexcept
			{
				if (write_fd != -1) {
					::close(write_fd);
					write_fd = -1;
				}
			}

			~pipe_guard() noexcept
			{
				close_read();
				close_write();
			}
	};

	/**
	 * @brief 墙上时间看门狗. 超时后向整个进程组发送 SIGTERM, 再过 grace 之后发送 SIGKILL
	 */
	class wall_clock_watchdog
	{
		private:
			std::mutex mtx;
			std::condition_variable cond;
			bool finished;
			std::atomic<bool> fired_flag;
			std::thread thread;

		public:
			wall_clock_watchdog() :
					finished(false), fired_flag(false)
			{
			}

			/**
			 * @exception std::system_error 线程创建失败
			 */
			void start(pid_t pgid, std::chrono::milliseconds timeout, std::chrono::milliseconds grace)
			{
				thread = std::thread([this, pgid, timeout, grace]() {
					std::unique_lock<std::mutex> lock(mtx);
					if (cond.wait_for(lock, timeout, [this] { return finished; })) {
						return;
					}
					fired_flag = true;
					::kill(-pgid, SIGTERM);
					if (cond.wait_for(lock, grace, [this] { return finished; })) {
						return;
					}
					::kill(-pgid, SIGKILL);
				});
			}

			/**
			 * @brief 主进程已被回收后调用. 此后看门狗不会再发送任何信号
			 */
			void stop() noexcept
			{
				{
					std::lock_guard<std::mutex> lock(mtx);
					finished = true;
				}
				cond.notify_all();
				if (thread.joinable()) {
					thread.join();
				}
			}

			bool fired() const noexcept
			{
				return fired_flag;
			}

			~wall_clock_watchdog() noexcept
			{
				stop();
			}
	};

	/**
	 * @brief 合计 stdout 与 stderr 的字节数, 只保存上限之内的部分
	 */
	struct output_collector
	{
			std::size_t cap;
			std::string data[2];
			std::size_t bytes[2];
			bool exceeded;

			explicit output_collector(std::size_t cap) :
					cap(cap), bytes {0, 0}, exceeded(false)
			{
			}

			/**
			 * @return 本次写入使输出首次超出上限时返回 true
			 */
			bool consume(int index, const char * buf, std::size_t n)
			{
				bytes[index] += n;
				std::size_t stored = data[0].size() + data[1].size();
				if (stored < cap) {
					data[index].append(buf, std::min(n, cap - stored));
				}
				if (!exceeded && bytes[0] + bytes[1] > cap) {
					exceeded = true;
					return true;
				}
				return false;
			}
	};

	/**
	 * @brief fork 之前准备好的全部数据, 子进程中不再分配内存
	 */
	struct child_context
	{
			const Config & config;
			char * const * argv;
			char * const * envp;
			const char * input_path;
			const char * cgroup_procs; ///< 为空指针时不加入 cgroup
			const std::vector<int> & inherited_fds;
			int stdout_fd;
			int stderr_fd;
			int status_fd;
			bool root;
	};

	[[noreturn]] void child_fail(int status_fd, RunnerError err, int error_number) noexcept
	{
		int payload[2] = { static_cast<int>(err), error_number };
		// 父进程读不到完整的 payload 时同样视为失败, 此处无需检查
		ssize_t written = write(status_fd, payload, sizeof(payload));
		(void) written;
		_exit(127);
	}

	bool set_rlimit(int resource, rlim_t soft, rlim_t hard) noexcept
	{
		struct rlimit limit;
		limit.rlim_cur = soft;
		limit.rlim_max = hard;
		return setrlimit(resource, &limit) == 0;
	}

	[[noreturn]] void exec_sandboxed(const child_context & ctx) noexcept
	{
		using namespace kerbal::utility;

		const Config & config = ctx.config;
		const Limits & limits = config.limits;

		if (setpgid(0, 0) != 0) {
			child_fail(ctx.status_fd, RunnerError::FORK_FAILED, errno);
		}

		if (ctx.cgroup_procs != nullptr) {
			int procs_fd = open(ctx.cgroup_procs, O_WRONLY | O_CLOEXEC);
			if (procs_fd == -1 || write(procs_fd, "0", 1) != 1) {
				child_fail(ctx.status_fd, RunnerError::CGROUP_FAILED, errno);
			}
			close(procs_fd);
		}

		if (limits.max_stack.has_value()) {
			rlim_t rlim = static_cast<rlim_t>(storage_cast<Byte>(limits.max_stack.value()).count());
			if (!set_rlimit(RLIMIT_STACK, rlim, rlim)) {
				child_fail(ctx.status_fd, RunnerError::SETRLIMIT_FAILED, errno);
			}
		}

		// set memory limit
		if (limits.max_memory.has_value()) {
			rlim_t rlim = static_cast<rlim_t>(storage_cast<Byte>(limits.max_memory.value()).count() * 2);
			if (!set_rlimit(RLIMIT_AS, rlim, rlim)) {
				child_fail(ctx.status_fd, RunnerError::SETRLIMIT_FAILED, errno);
			}
		}

		// set cpu time limit (in seconds). 软上限到达时内核发送 SIGXCPU, 硬上限到达时发送 SIGKILL
		if (limits.max_cpu_time.has_value()) {
			rlim_t rlim = static_cast<rlim_t>((limits.max_cpu_time.value().count() + 1000) / 1000);
			if (!set_rlimit(RLIMIT_CPU, rlim, rlim + 1)) {
				child_fail(ctx.status_fd, RunnerError::SETRLIMIT_FAILED, errno);
			}
		}

		// set max process number limit
		if (limits.max_process_number.has_value()) {
			rlim_t rlim = static_cast<rlim_t>(limits.max_process_number.value());
			if (!set_rlimit(RLIMIT_NPROC, rlim, rlim)) {
				child_fail(ctx.status_fd, RunnerError::SETRLIMIT_FAILED, errno);
			}
		}

		// set max output size limit
		if (config.max_file_size.has_value()) {
			rlim_t rlim = static_cast<rlim_t>(config.max_file_size.value().count());
			if (!set_rlimit(RLIMIT_FSIZE, rlim, rlim)) {
				child_fail(ctx.status_fd, RunnerError::SETRLIMIT_FAILED, errno);
			}
		}

		if (!set_rlimit(RLIMIT_CORE, 0, 0)) {
			child_fail(ctx.status_fd, RunnerError::SETRLIMIT_FAILED, errno);
		}

		// 输入文件在 chroot 之前打开, 它不必位于工作目录之内
		int input_fd = open(ctx.input_path, O_RDONLY);
		if (input_fd == -1) {
			child_fail(ctx.status_fd, RunnerError::DUP2_FAILED, errno);
		}
		if (input_fd != STDIN_FILENO) {
			if (dup2(input_fd, STDIN_FILENO) == -1) {
				child_fail(ctx.status_fd, RunnerError::DUP2_FAILED, errno);
			}
			close(input_fd);
		}

		if (dup2(ctx.stdout_fd, STDOUT_FILENO) == -1) {
			child_fail(ctx.status_fd, RunnerError::DUP2_FAILED, errno);
		}
		if (dup2(config.merge_stderr ? ctx.stdout_fd : ctx.stderr_fd, STDERR_FILENO) == -1) {
			child_fail(ctx.status_fd, RunnerError::DUP2_FAILED, errno);
		}

		// 日志文件等从父进程继承来的描述符不应进入被评测的程序
		for (int fd : ctx.inherited_fds) {
			if (fd > STDERR_FILENO) {
				fcntl(fd, F_SETFD, FD_CLOEXEC);
			}
		}

		if (ctx.root && config.isolate_network) {
			if (unshare(CLONE_NEWNET) != 0) {
				child_fail(ctx.status_fd, RunnerError::UNSHARE_FAILED, errno);
			}
		}

		if (config.chroot) {
			if (::chroot(config.work_dir.c_str()) != 0 || chdir("/") != 0) {
				child_fail(ctx.status_fd, RunnerError::CHDIR_ERROR, errno);
			}
		} else {
			if (chdir(config.work_dir.c_str()) != 0) {
				child_fail(ctx.status_fd, RunnerError::CHDIR_ERROR, errno);
			}
		}

		if (ctx.root && config.gid >= 0) {
			gid_t group_list[] = { static_cast<gid_t>(config.gid) };
			if (setgroups(sizeof(group_list) / sizeof(gid_t), group_list) == -1 || setgid(config.gid) == -1) {
				child_fail(ctx.status_fd, RunnerError::SETUID_FAILED, errno);
			}
		}
		if (ctx.root && config.uid >= 0) {
			if (setuid(config.uid) == -1) {
				child_fail(ctx.status_fd, RunnerError::SETUID_FAILED, errno);
			}
		}

		// load seccomp
		if (config.load_seccomp_rules() != RunnerError::SUCCESS) {
			child_fail(ctx.status_fd, RunnerError::LOAD_SECCOMP_FAILED, errno);
		}

		execve(config.exe_path.c_str(), ctx.argv, ctx.envp);
		child_fail(ctx.status_fd, RunnerError::EXECVE_FAILED, errno);
	}

	std::vector<int> list_open_fds()
	{
		namespace fs = boost::filesystem;

		std::vector<int> fds;
		boost::system::error_code ec;
		for (fs::directory_iterator it("/proc/self/fd", ec), end; !ec && it != end; it.increment(ec)) {
			const std::string name = it->path().filename().string();
			if (!name.empty() && name.find_first_not_of("0123456789") == std::string::npos) {
				fds.push_back(std::stoi(name));
			}
		}
		return fds;
	}

	ssize_t read_full(int fd, void * buf, std::size_t count) noexcept
	{
		std::size_t total = 0;
		while (total < count) {
			ssize_t n = read(fd, static_cast<char*>(buf) + total, count - total);
			if (n == 0) {
				break;
			}
			if (n < 0) {
				if (errno == EINTR) {
					continue;
				}
				return -1;
			}
			total += n;
		}
		return total;
	}

	/**
	 * @brief 回收已结束的子进程, 并杀死仍然存活的子进程 (包括被过继过来的孤儿)
	 * @return 当前进程已没有任何子进程时返回 true
	 */
	bool reap_leftovers() noexcept
	{
		int status;
		pid_t pid;
		while ((pid = waitpid(-1, &status, WNOHANG)) > 0) {
		}
		if (pid == -1 && errno == ECHILD) {
			return true;
		}
		try {
			for (pid_t child : Reaper::list_children(getpid())) {
				::kill(child, SIGKILL);
			}
		} catch (const std::exception & e) {
			EXCEPT_WARNING(Stage::SUPERVISOR, "-", log_fp, "Scan remaining processes failed.", e);
		}
		return false;
	}

	TerminationReason classify(const Config & config, const Result & result, bool wall_fired, bool output_exceeded, std::size_t oom_kills)
	{
		const Limits & limits = config.limits;
		const int sig = result.signal;

		if (wall_fired) {
			return TerminationReason::WALL_LIMIT_EXCEEDED;
		}

		if (sig == SIGXCPU) {
			return TerminationReason::CPU_LIMIT_EXCEEDED;
		}
		if (limits.max_cpu_time.has_value()) {
			const auto & max_cpu_time = limits.max_cpu_time.value();
			if (result.usage.cpu_time > max_cpu_time || (sig == SIGKILL && result.usage.cpu_time >= max_cpu_time)) {
				return TerminationReason::CPU_LIMIT_EXCEEDED;
			}
		}

		if (oom_kills > 0) {
			return TerminationReason::MEMORY_LIMIT_EXCEEDED;
		}
		if (limits.max_memory.has_value()) {
			if (result.usage.memory.count() > limits.max_memory.value().count()) {
				return TerminationReason::MEMORY_LIMIT_EXCEEDED;
			}
			// 地址空间上限以分配失败的形式出现
			if ((sig == SIGABRT || sig == SIGSEGV) &&
					(result.stderr_data.find("std::bad_alloc") != std::string::npos ||
					(config.merge_stderr && result.stdout_data.find("std::bad_alloc") != std::string::npos))) {
				return TerminationReason::MEMORY_LIMIT_EXCEEDED;
			}
		}

		if (output_exceeded || sig == SIGXFSZ) {
			return TerminationReason::OUTPUT_LIMIT_EXCEEDED;
		}

		if (sig != 0) {
			return TerminationReason::SIGNALED;
		}
		return TerminationReason::COMPLETED;
	}

} /* namespace */

void request_cancellation() noexcept
{
	cancellation_flag = 1;
	pid_t pgid = active_pgid.load();
	if (pgid > 0) {
		::kill(-pgid, SIGKILL);
	}
}

bool cancellation_requested() noexcept
{
	return cancellation_flag != 0;
}

void reset_cancellation() noexcept
{
	cancellation_flag = 0;
}

RlimitResourceLimiter::RlimitResourceLimiter(const std::string & submission_id) :
		submission_id(submission_id), invocation_count(0)
{
}

Result RlimitResourceLimiter::run_limited(const Config & config) noexcept try
{
	using namespace std::chrono;
	using namespace kerbal::compatibility::chrono_suffix;

	const Stage stage = config.stage;
	Result result;

	// check args
	if (config.check_is_valid_config() == false) {
		LOG_FATAL(stage, submission_id, log_fp, "INVALID_CONFIG ", config.limits);
		result.setErrorCode(RunnerError::INVALID_CONFIG);
		return result;
	}

	if (cancellation_requested()) {
		result.setErrorCode(RunnerError::CANCELLED);
		return result;
	}

	++invocation_count;
	LOG_DEBUG(stage, submission_id, log_fp, "run_limited: ", config.args, " limits: ", config.limits);

	std::unique_ptr<CgroupScope> cgroup;
	if (!config.cgroup_root.empty()) {
		try {
			const std::string name = "judgebox-" + std::to_string(getpid()) + "-" + std::to_string(invocation_count);
			cgroup.reset(new CgroupScope(config.cgroup_root, name, config.limits));
		} catch (const CgroupException & e) {
			EXCEPT_FATAL(stage, submission_id, log_fp, "Create cgroup failed.", e);
			result.setErrorCode(RunnerError::CGROUP_FAILED, e.error_number);
			return result;
		}
	}
	const std::string cgroup_procs = cgroup ? cgroup->procs_file().string() : std::string();

	pipe_guard stdout_pipe, stderr_pipe, status_pipe;
	if (!stdout_pipe.open() || !stderr_pipe.open() || !status_pipe.open()) {
		LOG_FATAL(stage, submission_id, log_fp, "PIPE_FAILED, errno: ", errno);
		result.setErrorCode(RunnerError::PIPE_FAILED, errno);
		return result;
	}

	const std::vector<int> inherited_fds = list_open_fds();
	const std::string input_path = config.input_path.empty() ? std::string("/dev/null") : config.input_path.string();
	auto argv = config.args.getArgs();
	auto envp = config.env.getArgs();
	/*
	 * 以上两行不可以并入 child_context 的构造
	 * 临时的 unique_ptr 析构后会留下野指针
	 */
	const child_context ctx = {
		config, argv.get(), envp.get(), input_path.c_str(),
		cgroup ? cgroup_procs.c_str() : nullptr,
		inherited_fds,
		stdout_pipe.write_fd, stderr_pipe.write_fd, status_pipe.write_fd,
		geteuid() == 0
	};

	process child_process;

	// 此处分离了一个运行子进程，该进程内自我完成工作配置，然后替换为需要受限运行的程序
	try {
		child_process = process([&ctx]() noexcept {
			exec_sandboxed(ctx);
		});
	} catch (const std::system_error & e) {
		EXCEPT_FATAL(stage, submission_id, log_fp, "Fork failed.", e);
		result.setErrorCode(RunnerError::FORK_FAILED, e.code().value());
		return result;
	}

	const pid_t pgid = child_process.get_child_id();
	// 父子进程都设置一次, 避免竞争
	setpgid(pgid, pgid);
	active_pgid = pgid;

	// record current time
	const auto start = steady_clock::now();

	stdout_pipe.close_write();
	stderr_pipe.close_write();
	status_pipe.close_write();

	{
		// 管道在 execve 成功时随 O_CLOEXEC 关闭, 读到数据说明子进程在 execve 之前失败
		int payload[2];
		if (read_full(status_pipe.read_fd, payload, sizeof(payload)) == static_cast<ssize_t>(sizeof(payload))) {
			int status;
			child_process.join(&status, 0, nullptr);
			active_pgid = 0;
			const RunnerError err = static_cast<RunnerError>(payload[0]);
			LOG_FATAL(stage, submission_id, log_fp, "Child failed before execve: ", err, ", errno: ", payload[1], ", exe: ", config.exe_path);
			result.setErrorCode(err, payload[1]);
			return result;
		}
		status_pipe.close_read();
	}

	wall_clock_watchdog watchdog;
	if (config.limits.max_real_time.has_value()) {
		try {
			watchdog.start(pgid, config.limits.max_real_time.value(), config.kill_grace_period);
		} catch (const std::system_error & e) {
			child_process.kill_group(SIGKILL);
			EXCEPT_FATAL(stage, submission_id, log_fp, "Thread construct failed.", e, " , error code: ", e.code().value());
			result.setErrorCode(RunnerError::PTHREAD_FAILED, e.code().value());
			// 进程组已被杀死, 其余部分照常回收
		}
	}

	const std::size_t cap = config.limits.max_output_size.has_value() ?
			static_cast<std::size_t>(config.limits.max_output_size.value().count()) : std::numeric_limits<std::size_t>::max();
	output_collector collector(cap);

	struct pollfd fds[2] = {
		{ stdout_pipe.read_fd, POLLIN, 0 },
		{ stderr_pipe.read_fd, POLLIN, 0 },
	};

	int status = 0;
	struct rusage resource_usage = {};
	bool main_reaped = false;
	bool cancelled = false;
	steady_clock::time_point end = start;
	steady_clock::time_point reap_deadline = start;
	char buffer[65536];

	while (true) {
		int ready = poll(fds, 2, 20);
		if (ready < 0 && errno != EINTR) {
			LOG_FATAL(stage, submission_id, log_fp, "poll failed, errno: ", errno);
			child_process.kill_group(SIGKILL);
			result.setErrorCode(RunnerError::WAIT_FAILED, errno);
			break;
		}
		for (int i = 0; ready > 0 && i < 2; ++i) {
			if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
				continue;
			}
			ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
			if (n > 0) {
				if (collector.consume(i, buffer, n)) {
					child_process.kill_group(SIGKILL);
					if (cgroup) {
						cgroup->kill_all();
					}
				}
			} else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
				if (i == 0) {
					stdout_pipe.close_read();
				} else {
					stderr_pipe.close_read();
				}
				fds[i].fd = -1;
			}
		}

		if (!cancelled && cancellation_requested()) {
			cancelled = true;
			child_process.kill_group(SIGKILL);
		}

		if (!main_reaped) {
			pid_t res = child_process.join(&status, WNOHANG, &resource_usage);
			if (res == pgid) {
				main_reaped = true;
				end = steady_clock::now();
				watchdog.stop();
				child_process.kill_group(SIGKILL);
				if (cgroup) {
					cgroup->kill_all();
				}
				reap_deadline = end + config.reap_timeout;
			} else if (res == -1) {
				LOG_FATAL(stage, submission_id, log_fp, "WAIT_FAILED, errno: ", errno);
				// 主进程已被回收, child_process 不再持有进程组
				::kill(-pgid, SIGKILL);
				result.setErrorCode(RunnerError::WAIT_FAILED, errno);
				break;
			}
		}

		if (main_reaped) {
			const bool tree_gone = reap_leftovers();
			if (tree_gone && fds[0].fd < 0 && fds[1].fd < 0) {
				break;
			}
			if (steady_clock::now() >= reap_deadline) {
				LOG_FATAL(stage, submission_id, log_fp, "REAP_TIMEOUT, output or processes still alive ", config.reap_timeout.count(), " ms after main process exited");
				result.setErrorCode(RunnerError::REAP_TIMEOUT);
				break;
			}
		}
	}
	active_pgid = 0;
	watchdog.stop();

	result.usage.real_time = duration_cast<milliseconds>(end - start);
	result.usage.cpu_time = timevalToChrono(resource_usage.ru_utime) + timevalToChrono(resource_usage.ru_stime);
	result.usage.memory = kerbal::utility::KB(resource_usage.ru_maxrss);
	std::size_t oom_kills = 0;
	if (cgroup) {
		auto peak = cgroup->memory_peak();
		if (peak.has_value() && peak.value().count() > result.usage.memory.count()) {
			result.usage.memory = peak.value();
		}
		oom_kills = cgroup->oom_kill_count();
	}
	result.usage.stdout_bytes = collector.bytes[0];
	result.usage.stderr_bytes = collector.bytes[1];
	result.stdout_data = std::move(collector.data[0]);
	result.stderr_data = std::move(collector.data[1]);

	if (main_reaped) {
		if (WIFSIGNALED(status)) {
			result.signal = WTERMSIG(status);
		} else {
			result.exit_code = WEXITSTATUS(status);
		}
	}

	if (result.error != RunnerError::SUCCESS) {
		return result;
	}
	if (cancelled) {
		LOG_WARNING(stage, submission_id, log_fp, "Run cancelled.");
		result.setErrorCode(RunnerError::CANCELLED);
		return result;
	}

	result.termination_reason = classify(config, result, watchdog.fired(), collector.exceeded, oom_kills);
	LOG_INFO(stage, submission_id, log_fp, "Run finished. ", result);
	return result;
} catch (const std::exception & e) {
	active_pgid = 0;
	EXCEPT_FATAL(config.stage, submission_id, log_fp, "run_limited failed.", e);
	Result result;
	result.setErrorCode(RunnerError::WAIT_FAILED);
	return result;
}
