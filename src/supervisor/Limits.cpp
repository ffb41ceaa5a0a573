/*
 * Limits.cpp
 *
 *  Created on: 2018年12月7日
 *      Author: peter
 */

#include "Limits.hpp"

#include <sstream>

#include <kerbal/compatibility/chrono_suffix.hpp>

Limits& Limits::merge(const Limits & other)
{
	if (other.max_cpu_time.has_value()) {
		this->max_cpu_time = other.max_cpu_time;
	}
	if (other.max_real_time.has_value()) {
		this->max_real_time = other.max_real_time;
	}
	if (other.max_memory.has_value()) {
		this->max_memory = other.max_memory;
	}
	if (other.max_output_size.has_value()) {
		this->max_output_size = other.max_output_size;
	}
	if (other.max_stack.has_value()) {
		this->max_stack = other.max_stack;
	}
	if (other.max_process_number.has_value()) {
		this->max_process_number = other.max_process_number;
	}
	return *this;
}

bool Limits::check_is_valid() const
{
	using namespace kerbal::compatibility::chrono_suffix;

	if ((max_cpu_time.has_value() && max_cpu_time.value() < 1_ms) ||

	(max_real_time.has_value() && max_real_time.value() < 1_ms) ||

	(max_memory.has_value() && max_memory.value().count() < 1) ||

	(max_output_size.has_value() && max_output_size.value().count() < 1) ||

	(max_stack.has_value() && max_stack.value().count() < 1) ||

	(max_process_number.has_value() && max_process_number.value() < 1)) {
		return false;
	}
	return true;
}

std::ostream& operator<<(std::ostream& out, const Limits & src)
{
	out << "{";
	if (src.max_cpu_time.has_value()) {
		out << " cpu_time: " << src.max_cpu_time.value().count() << " ms";
	}
	if (src.max_real_time.has_value()) {
		out << " wall_clock: " << src.max_real_time.value().count() << " ms";
	}
	if (src.max_memory.has_value()) {
		out << " memory: " << src.max_memory.value().count() << " KB";
	}
	if (src.max_output_size.has_value()) {
		out << " output: " << src.max_output_size.value().count() << " Byte";
	}
	if (src.max_stack.has_value()) {
		out << " stack: " << src.max_stack.value().count() << " KB";
	}
	if (src.max_process_number.has_value()) {
		out << " processes: " << src.max_process_number.value();
	}
	return out << " }";
}

std::string describe_limit(TerminationReason reason, const Limits & limits)
{
	std::ostringstream out;
	out << getTerminationReasonName(reason);
	switch (reason) {
		case TerminationReason::CPU_LIMIT_EXCEEDED:
			if (limits.max_cpu_time.has_value()) {
				out << " (cpu time limit " << limits.max_cpu_time.value().count() << " ms)";
			}
			break;
		case TerminationReason::WALL_LIMIT_EXCEEDED:
			if (limits.max_real_time.has_value()) {
				out << " (wall clock limit " << limits.max_real_time.value().count() << " ms)";
			}
			break;
		case TerminationReason::MEMORY_LIMIT_EXCEEDED:
			if (limits.max_memory.has_value()) {
				out << " (memory limit " << limits.max_memory.value().count() << " KB)";
			}
			break;
		case TerminationReason::OUTPUT_LIMIT_EXCEEDED:
			if (limits.max_output_size.has_value()) {
				out << " (output limit " << limits.max_output_size.value().count() << " bytes)";
			}
			break;
		case TerminationReason::COMPLETED:
		case TerminationReason::SIGNALED:
		case TerminationReason::SYSTEM_ERROR:
			break;
	}
	return out.str();
}
