/*
 * ReaperTest.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#define BOOST_TEST_MODULE ReaperTest

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fstream>
#include <stdexcept>
#include <thread>

#include <unistd.h>
#include <wait.h>

#include <boost/test/unit_test.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

#include "Reaper.hpp"
#include "ProcessTable.hpp"

std::ofstream log_fp("/dev/null");

using namespace kerbal::compatibility::chrono_suffix;

BOOST_AUTO_TEST_SUITE(process_table)

BOOST_AUTO_TEST_CASE(lifecycle_ends_in_reaped)
{
	ProcessTable table;
	table.spawned(100, 1);
	BOOST_CHECK(table.get_records().back().state == ProcessState::SPAWNED);
	table.running(100);
	BOOST_CHECK(table.get_records().back().state == ProcessState::RUNNING);
	BOOST_CHECK(!table.all_reaped());
	BOOST_CHECK_EQUAL(table.unreaped().size(), 1u);

	const ProcessRecord & record = table.collected(100, W_EXITCODE(3, 0));
	BOOST_CHECK(record.state == ProcessState::REAPED);
	BOOST_CHECK_EQUAL(record.exit_code, 3);
	BOOST_CHECK_EQUAL(record.signal, 0);
	BOOST_CHECK(table.all_reaped());
}

BOOST_AUTO_TEST_CASE(signaled_process_records_signal)
{
	ProcessTable table;
	table.spawned(200, 1);
	const ProcessRecord & record = table.collected(200, SIGSEGV);
	BOOST_CHECK(record.state == ProcessState::REAPED);
	BOOST_CHECK_EQUAL(record.signal, SIGSEGV);
}

BOOST_AUTO_TEST_CASE(unknown_orphan_is_recorded)
{
	ProcessTable table;
	const ProcessRecord & record = table.collected(300, W_EXITCODE(0, 0));
	BOOST_CHECK_EQUAL(record.pid, 300);
	BOOST_CHECK_EQUAL(record.ppid, 0);
	BOOST_CHECK_EQUAL(table.reaped_count(), 1u);
}

BOOST_AUTO_TEST_CASE(reused_pid_gets_a_new_record)
{
	ProcessTable table;
	table.spawned(400, 1);
	table.collected(400, W_EXITCODE(0, 0));
	table.spawned(400, 1);
	BOOST_CHECK_EQUAL(table.get_records().size(), 2u);
	BOOST_CHECK(!table.all_reaped());
	table.spawned(400, 1);
	BOOST_CHECK_EQUAL(table.get_records().size(), 2u);
	table.collected(400, W_EXITCODE(1, 0));
	BOOST_CHECK(table.all_reaped());
	BOOST_CHECK_EQUAL(table.reaped_count(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(reaper)

BOOST_AUTO_TEST_CASE(decode_wait_status)
{
	BOOST_CHECK_EQUAL(Reaper::decode_wait_status(W_EXITCODE(5, 0)), 5);
	BOOST_CHECK_EQUAL(Reaper::decode_wait_status(SIGKILL), 128 + SIGKILL);
}

BOOST_AUTO_TEST_CASE(list_children_finds_child)
{
	pid_t child = fork();
	BOOST_REQUIRE(child >= 0);
	if (child == 0) {
		pause();
		_exit(0);
	}
	std::vector<pid_t> children = Reaper::list_children(getpid());
	BOOST_CHECK(std::find(children.begin(), children.end(), child) != children.end());
	::kill(child, SIGKILL);
	::waitpid(child, nullptr, 0);
}

BOOST_AUTO_TEST_CASE(returns_exit_code_of_main_task)
{
	Reaper reaper(2_s, "test");
	BOOST_CHECK_EQUAL(reaper.run([]() {
		return 7;
	}), 7);
	BOOST_CHECK(reaper.process_table().all_reaped());
}

BOOST_AUTO_TEST_CASE(main_task_killed_by_signal)
{
	Reaper reaper(2_s, "test");
	BOOST_CHECK_EQUAL(reaper.run([]() {
		::kill(getpid(), SIGKILL);
		pause();
		return 0;
	}), 128 + SIGKILL);
}

BOOST_AUTO_TEST_CASE(throwing_main_task_fails)
{
	Reaper reaper(2_s, "test");
	BOOST_CHECK_EQUAL(reaper.run([]() -> int {
		throw std::runtime_error("main task failure");
	}), EXIT_FAILURE);
}

BOOST_AUTO_TEST_CASE(orphaned_descendants_are_reaped)
{
	Reaper reaper(2_s, "test");
	int code = reaper.run([]() {
		pid_t child = fork();
		if (child == 0) {
			if (fork() == 0) {
				// 孙进程比它的父进程与主任务都活得更久
				sleep(30);
				_exit(0);
			}
			_exit(0);
		}
		return 0;
	});
	BOOST_CHECK_EQUAL(code, 0);
	BOOST_CHECK(reaper.process_table().all_reaped());
	BOOST_CHECK(reaper.process_table().reaped_count() >= 3u);
	BOOST_CHECK(::waitpid(-1, nullptr, WNOHANG) == -1 && errno == ECHILD);
}

BOOST_AUTO_TEST_CASE(termination_signal_is_forwarded)
{
	Reaper reaper(2_s, "test");
	std::thread stopper([]() {
		std::this_thread::sleep_for(300_ms);
		::kill(getpid(), SIGTERM);
	});
	int code = reaper.run([]() {
		sleep(30);
		return 0;
	});
	stopper.join();
	BOOST_CHECK_EQUAL(code, 128 + SIGTERM);
	BOOST_CHECK(reaper.process_table().all_reaped());
}

BOOST_AUTO_TEST_SUITE_END()
