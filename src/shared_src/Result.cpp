/*
 * Result.cpp
 *
 *  Created on: 2018年7月3日
 *      Author: peter
 */

#include "Result.hpp"

#include <cstring>

ResourceUsage::ResourceUsage() :
		cpu_time(0),
		real_time(0),
		memory(0),
		stdout_bytes(0),
		stderr_bytes(0)
{
}

std::ostream& operator<<(std::ostream& out, const ResourceUsage & src)
{
	return out << "cpu_time: " << src.cpu_time.count() << " ms"

			<< " real_time: " << src.real_time.count() << " ms"

			<< " memory: " << src.memory.count() << " KB"

			<< " stdout: " << src.stdout_bytes << " Byte"

			<< " stderr: " << src.stderr_bytes << " Byte";
}

Result::Result() :
		termination_reason(TerminationReason::COMPLETED),
		usage(),
		error(RunnerError::SUCCESS),
		error_number(0),
		signal(0), exit_code(0)
{
}

void Result::setErrorCode(RunnerError err, int error_number)
{
	this->error = err;
	this->error_number = error_number;
	this->termination_reason = TerminationReason::SYSTEM_ERROR;
}

std::ostream& operator<<(std::ostream& out, const Result & src)
{
	out << "reason: " << src.termination_reason

			<< " " << src.usage

			<< " error: " << src.error;

	if (src.error_number != 0) {
		out << " (" << std::strerror(src.error_number) << ")";
	}

	return out << " signal: " << src.signal

			<< " exit_code: " << src.exit_code;
}
