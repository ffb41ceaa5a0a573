/*
 * ProcessTable.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#include "ProcessTable.hpp"

#include <algorithm>
#include <iterator>

#include <wait.h>

const char * getProcessStateName(ProcessState state)
{
	switch (state) {
		case ProcessState::SPAWNED:
			return "spawned";
		case ProcessState::RUNNING:
			return "running";
		case ProcessState::EXITED:
			return "exited";
		case ProcessState::SIGNALED:
			return "signaled";
		case ProcessState::REAPED:
			return "reaped";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& out, ProcessState state)
{
	return out << getProcessStateName(state);
}

std::ostream& operator<<(std::ostream& out, const ProcessRecord & src)
{
	return out << "pid: " << src.pid << " ppid: " << src.ppid << " state: " << src.state
			<< " exit_code: " << src.exit_code << " signal: " << src.signal;
}

ProcessRecord * ProcessTable::find_alive(pid_t pid) noexcept
{
	auto it = std::find_if(records.rbegin(), records.rend(), [pid](const ProcessRecord & record) {
		return record.pid == pid && record.state != ProcessState::REAPED;
	});
	return it == records.rend() ? nullptr : &*it;
}

ProcessRecord & ProcessTable::spawned(pid_t pid, pid_t ppid)
{
	ProcessRecord * record = this->find_alive(pid);
	if (record != nullptr) {
		return *record;
	}
	records.emplace_back(pid, ppid);
	return records.back();
}

void ProcessTable::running(pid_t pid)
{
	ProcessRecord * record = this->find_alive(pid);
	if (record != nullptr && record->state == ProcessState::SPAWNED) {
		record->state = ProcessState::RUNNING;
	}
}

ProcessRecord & ProcessTable::collected(pid_t pid, int status)
{
	ProcessRecord * record = this->find_alive(pid);
	if (record == nullptr) {
		// 从未被登记过的孤儿进程
		records.emplace_back(pid, 0);
		record = &records.back();
	}
	if (WIFSIGNALED(status)) {
		record->state = ProcessState::SIGNALED;
		record->signal = WTERMSIG(status);
	} else {
		record->state = ProcessState::EXITED;
		record->exit_code = WEXITSTATUS(status);
	}
	record->state = ProcessState::REAPED;
	return *record;
}

bool ProcessTable::all_reaped() const noexcept
{
	return std::all_of(records.begin(), records.end(), [](const ProcessRecord & record) {
		return record.state == ProcessState::REAPED;
	});
}

std::vector<ProcessRecord> ProcessTable::unreaped() const
{
	std::vector<ProcessRecord> res;
	std::copy_if(records.begin(), records.end(), std::back_inserter(res), [](const ProcessRecord & record) {
		return record.state != ProcessState::REAPED;
	});
	return res;
}

std::size_t ProcessTable::reaped_count() const noexcept
{
	return std::count_if(records.begin(), records.end(), [](const ProcessRecord & record) {
		return record.state == ProcessState::REAPED;
	});
}
