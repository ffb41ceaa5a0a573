/*
 * VerdictReporter.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#include "VerdictReporter.hpp"

#include <cstring>
#include <stdexcept>

#include "logger.hpp"
#include "global_shared_variable.hpp"

VerdictReport::VerdictReport() :
		verdict(Verdict::INTERNAL_ERROR),
		exit_code(0),
		signal(0),
		termination_reason(TerminationReason::SYSTEM_ERROR)
{
}

std::ostream& operator<<(std::ostream& out, const VerdictReport & src)
{
	return out << src.verdict << " (" << src.detail << ") " << src.usage;
}

int getVerdictExitCode(Verdict verdict)
{
	switch (verdict) {
		case Verdict::ACCEPTED:
			return 0;
		case Verdict::COMPILE_ERROR:
			return 10;
		case Verdict::RUNTIME_ERROR:
			return 11;
		case Verdict::TIME_LIMIT_EXCEEDED:
			return 12;
		case Verdict::MEMORY_LIMIT_EXCEEDED:
			return 13;
		case Verdict::OUTPUT_LIMIT_EXCEEDED:
			return 14;
		case Verdict::INTERNAL_ERROR:
			return 15;
	}
	return 15;
}

Verdict getVerdictByName(const std::string & name)
{
	static const Verdict verdicts[] = {
		Verdict::ACCEPTED, Verdict::COMPILE_ERROR, Verdict::RUNTIME_ERROR, Verdict::TIME_LIMIT_EXCEEDED,
		Verdict::MEMORY_LIMIT_EXCEEDED, Verdict::OUTPUT_LIMIT_EXCEEDED, Verdict::INTERNAL_ERROR
	};
	for (Verdict verdict : verdicts) {
		if (name == getVerdictName(verdict)) {
			return verdict;
		}
	}
	throw std::invalid_argument("unknown verdict: " + name);
}

VerdictReporter::VerdictReporter(const std::string & submission_id) :
		submission_id(submission_id)
{
}

VerdictReport VerdictReporter::internal_error(const std::string & detail) const
{
	VerdictReport report;
	report.verdict = Verdict::INTERNAL_ERROR;
	report.termination_reason = TerminationReason::SYSTEM_ERROR;
	report.detail = detail;
	LOG_FATAL(Stage::REPORT, submission_id, log_fp, "InternalError: ", detail);
	return report;
}

VerdictReport VerdictReporter::report(const BuildResult & build, const ExecutionOutcome * execution) const
{
	// 环境错误说明提交从未被公平地评测, 优先于其他一切情况
	if (build.status == BuildResult::Status::INTERNAL_ERROR) {
		if (build.error == RunnerError::CANCELLED) {
			return this->internal_error("cancelled");
		}
		return this->internal_error(build.detail.empty() ? std::string(getRunnerErrorName(build.error)) : build.detail);
	}
	if (build.status == BuildResult::Status::SUCCESS && execution == nullptr) {
		return this->internal_error("build succeeded but the binary was never executed");
	}
	if (build.status == BuildResult::Status::SUCCESS && execution->termination_reason == TerminationReason::SYSTEM_ERROR) {
		if (execution->error == RunnerError::CANCELLED) {
			return this->internal_error("cancelled");
		}
		std::string detail = std::string("execution failed: ") + getRunnerErrorName(execution->error);
		if (execution->error_number != 0) {
			detail += std::string(" (") + std::strerror(execution->error_number) + ")";
		}
		return this->internal_error(detail);
	}

	VerdictReport report;

	if (build.status == BuildResult::Status::COMPILE_FAILURE) {
		// 编译阶段越过资源上限同样视为编译错误, 上限的信息保留在 detail 中
		const CompileFailure & failure = build.failure.value();
		report.verdict = Verdict::COMPILE_ERROR;
		report.termination_reason = failure.termination_reason;
		report.exit_code = failure.exit_code;
		report.signal = failure.signal;
		report.detail = failure.reason;
		report.usage = failure.usage;
		report.compiler_output = failure.diagnostics;
		LOG_INFO(Stage::REPORT, submission_id, log_fp, "Verdict: ", report);
		return report;
	}

	const BuildArtifact & artifact = build.artifact.value();
	const ExecutionOutcome & outcome = *execution;

	report.termination_reason = outcome.termination_reason;
	report.exit_code = outcome.exit_code;
	report.signal = outcome.signal;
	report.usage = outcome.usage;
	report.stdout_data = outcome.stdout_data;
	report.stderr_data = outcome.stderr_data;
	report.compiler_output = artifact.diagnostics;
	report.timing = outcome.timing;

	switch (outcome.termination_reason) {
		case TerminationReason::WALL_LIMIT_EXCEEDED:
		case TerminationReason::CPU_LIMIT_EXCEEDED:
			report.verdict = Verdict::TIME_LIMIT_EXCEEDED;
			report.detail = describe_limit(outcome.termination_reason, outcome.limits);
			break;
		case TerminationReason::MEMORY_LIMIT_EXCEEDED:
			report.verdict = Verdict::MEMORY_LIMIT_EXCEEDED;
			report.detail = describe_limit(outcome.termination_reason, outcome.limits);
			break;
		case TerminationReason::OUTPUT_LIMIT_EXCEEDED:
			report.verdict = Verdict::OUTPUT_LIMIT_EXCEEDED;
			report.detail = describe_limit(outcome.termination_reason, outcome.limits);
			break;
		case TerminationReason::SIGNALED:
		case TerminationReason::COMPLETED:
		case TerminationReason::SYSTEM_ERROR:
			if (outcome.signal != 0) {
				report.verdict = Verdict::RUNTIME_ERROR;
				report.detail = "terminated by signal " + std::to_string(outcome.signal) + " (" + strsignal(outcome.signal) + ")";
			} else if (outcome.exit_code != 0) {
				report.verdict = Verdict::RUNTIME_ERROR;
				report.detail = "exited with code " + std::to_string(outcome.exit_code);
			} else {
				report.verdict = Verdict::ACCEPTED;
				report.detail = "exited with code 0";
			}
			break;
	}

	LOG_INFO(Stage::REPORT, submission_id, log_fp, "Verdict: ", report);
	return report;
}

nlohmann::json VerdictReporter::to_json(const VerdictReport & report)
{
	nlohmann::json json_obj = {
		{"verdict", getVerdictName(report.verdict)},
		{"exit_code", report.exit_code},
		{"signal", report.signal},
		{"termination_reason", getTerminationReasonName(report.termination_reason)},
		{"detail", report.detail},
		{"usage", {
			{"cpu_time_ms", report.usage.cpu_time.count()},
			{"wall_time_ms", report.usage.real_time.count()},
			{"memory_kb", report.usage.memory.count()},
			{"stdout_bytes", report.usage.stdout_bytes},
			{"stderr_bytes", report.usage.stderr_bytes},
		}},
		{"stdout", report.stdout_data},
		{"stderr", report.stderr_data},
		{"compiler_output", report.compiler_output},
	};

	if (report.timing.has_value()) {
		const TimingStatistics & timing = report.timing.value();
		nlohmann::json counts = nlohmann::json::object();
		for (const auto & ele : timing.counts) {
			counts[getTerminationReasonName(ele.first)] = ele.second;
		}
		nlohmann::json timing_obj = {
			{"runs", timing.samples},
			{"status", getTimingStabilityName(timing.stability)},
			{"counts", counts},
		};
		if (timing.stability == TimingStability::NO_SUCCESS) {
			timing_obj["median"] = nullptr;
			timing_obj["p10"] = nullptr;
			timing_obj["p90"] = nullptr;
			timing_obj["iqr"] = nullptr;
		} else {
			timing_obj["median"] = timing.median;
			timing_obj["p10"] = timing.p10;
			timing_obj["p90"] = timing.p90;
			timing_obj["iqr"] = timing.iqr;
		}
		json_obj["timing"] = timing_obj;
	}
	return json_obj;
}

std::string VerdictReporter::serialize(const VerdictReport & report)
{
	return to_json(report).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Verdict VerdictReporter::parse_verdict(const std::string & serialized)
{
	nlohmann::json json_obj = nlohmann::json::parse(serialized, nullptr, false);
	if (json_obj.is_discarded() || !json_obj.is_object()) {
		throw std::invalid_argument("verdict is not a json object");
	}
	auto it = json_obj.find("verdict");
	if (it == json_obj.end() || !it->is_string()) {
		throw std::invalid_argument("verdict field missing");
	}
	return getVerdictByName(it->get<std::string>());
}
