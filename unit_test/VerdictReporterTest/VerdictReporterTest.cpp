/*
 * VerdictReporterTest.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#define BOOST_TEST_MODULE VerdictReporterTest

#include <fstream>
#include <set>

#include <csignal>

#include <boost/test/unit_test.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

#include "VerdictReporter.hpp"

std::ofstream log_fp("/dev/null");

using namespace kerbal::compatibility::chrono_suffix;

namespace
{
	BuildResult successful_build()
	{
		BuildArtifact artifact;
		artifact.binary_path = "/tmp/solution";
		artifact.exit_code = 0;
		artifact.duration = 100_ms;

		BuildResult build;
		build.status = BuildResult::Status::SUCCESS;
		build.artifact = artifact;
		return build;
	}

	ExecutionOutcome outcome_of(TerminationReason reason, int exit_code = 0, int signal = 0)
	{
		ExecutionOutcome outcome;
		outcome.termination_reason = reason;
		outcome.exit_code = exit_code;
		outcome.signal = signal;
		outcome.limits.set_max_cpu_time(1_s)
					.set_max_real_time(2_s)
					.set_max_memory(kerbal::utility::KB(65536))
					.set_max_output_size(kerbal::utility::Byte(1024));
		return outcome;
	}
}

BOOST_AUTO_TEST_CASE(internal_error_of_build_takes_precedence)
{
	BuildResult build;
	build.status = BuildResult::Status::INTERNAL_ERROR;
	build.error = RunnerError::EXECVE_FAILED;
	build.detail = "compiler /usr/bin/g++ could not be run: EXECVE_FAILED";

	VerdictReporter reporter("test");
	const ExecutionOutcome outcome = outcome_of(TerminationReason::COMPLETED);
	VerdictReport report = reporter.report(build, &outcome);
	BOOST_CHECK(report.verdict == Verdict::INTERNAL_ERROR);
	BOOST_CHECK_EQUAL(report.detail, build.detail);
	BOOST_CHECK_EQUAL(getVerdictExitCode(report.verdict), 15);
}

BOOST_AUTO_TEST_CASE(cancelled_build_is_internal_error)
{
	BuildResult build;
	build.status = BuildResult::Status::INTERNAL_ERROR;
	build.error = RunnerError::CANCELLED;

	VerdictReport report = VerdictReporter("test").report(build, nullptr);
	BOOST_CHECK(report.verdict == Verdict::INTERNAL_ERROR);
	BOOST_CHECK_EQUAL(report.detail, "cancelled");
}

BOOST_AUTO_TEST_CASE(system_error_during_execution_is_internal_error)
{
	ExecutionOutcome outcome = outcome_of(TerminationReason::SYSTEM_ERROR, 0, 0);
	outcome.error = RunnerError::FORK_FAILED;
	VerdictReport report = VerdictReporter("test").report(successful_build(), &outcome);
	BOOST_CHECK(report.verdict == Verdict::INTERNAL_ERROR);
	BOOST_CHECK(report.detail.find("FORK_FAILED") != std::string::npos);

	outcome.error = RunnerError::CANCELLED;
	report = VerdictReporter("test").report(successful_build(), &outcome);
	BOOST_CHECK(report.verdict == Verdict::INTERNAL_ERROR);
	BOOST_CHECK_EQUAL(report.detail, "cancelled");
}

BOOST_AUTO_TEST_CASE(build_without_execution_is_internal_error)
{
	VerdictReport report = VerdictReporter("test").report(successful_build(), nullptr);
	BOOST_CHECK(report.verdict == Verdict::INTERNAL_ERROR);
}

BOOST_AUTO_TEST_CASE(compile_limit_is_compile_error_with_limit_detail)
{
	CompileFailure failure;
	failure.termination_reason = TerminationReason::CPU_LIMIT_EXCEEDED;
	failure.exit_code = 0;
	failure.signal = SIGKILL;
	failure.reason = "compiler stopped: CpuLimitExceeded (cpu time limit 10000 ms)";
	failure.diagnostics = "";

	BuildResult build;
	build.status = BuildResult::Status::COMPILE_FAILURE;
	build.failure = failure;

	VerdictReport report = VerdictReporter("test").report(build, nullptr);
	BOOST_CHECK(report.verdict == Verdict::COMPILE_ERROR);
	BOOST_CHECK(report.termination_reason == TerminationReason::CPU_LIMIT_EXCEEDED);
	BOOST_CHECK(report.detail.find("cpu time limit 10000 ms") != std::string::npos);
	BOOST_CHECK_EQUAL(getVerdictExitCode(report.verdict), 10);
}

BOOST_AUTO_TEST_CASE(compile_failure_keeps_diagnostics)
{
	CompileFailure failure;
	failure.termination_reason = TerminationReason::COMPLETED;
	failure.exit_code = 1;
	failure.signal = 0;
	failure.reason = "compiler exited with code 1";
	failure.diagnostics = "solution.cpp:1:1: error: expected unqualified-id";

	BuildResult build;
	build.status = BuildResult::Status::COMPILE_FAILURE;
	build.failure = failure;

	VerdictReport report = VerdictReporter("test").report(build, nullptr);
	BOOST_CHECK(report.verdict == Verdict::COMPILE_ERROR);
	BOOST_CHECK_EQUAL(report.compiler_output, failure.diagnostics);
	BOOST_CHECK_EQUAL(report.exit_code, 1);
}

BOOST_AUTO_TEST_CASE(time_limits_map_to_time_limit_exceeded)
{
	const BuildResult build = successful_build();
	VerdictReporter reporter("test");

	ExecutionOutcome wall = outcome_of(TerminationReason::WALL_LIMIT_EXCEEDED, 0, SIGKILL);
	VerdictReport report = reporter.report(build, &wall);
	BOOST_CHECK(report.verdict == Verdict::TIME_LIMIT_EXCEEDED);
	BOOST_CHECK(report.detail.find("wall clock limit 2000 ms") != std::string::npos);

	ExecutionOutcome cpu = outcome_of(TerminationReason::CPU_LIMIT_EXCEEDED, 0, SIGXCPU);
	report = reporter.report(build, &cpu);
	BOOST_CHECK(report.verdict == Verdict::TIME_LIMIT_EXCEEDED);
	BOOST_CHECK(report.detail.find("cpu time limit 1000 ms") != std::string::npos);
	BOOST_CHECK_EQUAL(getVerdictExitCode(report.verdict), 12);
}

BOOST_AUTO_TEST_CASE(memory_takes_precedence_over_crash)
{
	ExecutionOutcome outcome = outcome_of(TerminationReason::MEMORY_LIMIT_EXCEEDED, 0, SIGSEGV);
	VerdictReport report = VerdictReporter("test").report(successful_build(), &outcome);
	BOOST_CHECK(report.verdict == Verdict::MEMORY_LIMIT_EXCEEDED);
	BOOST_CHECK(report.detail.find("memory limit 65536 KB") != std::string::npos);
	BOOST_CHECK_EQUAL(getVerdictExitCode(report.verdict), 13);
}

BOOST_AUTO_TEST_CASE(output_limit_maps_to_output_limit_exceeded)
{
	ExecutionOutcome outcome = outcome_of(TerminationReason::OUTPUT_LIMIT_EXCEEDED, 0, SIGKILL);
	VerdictReport report = VerdictReporter("test").report(successful_build(), &outcome);
	BOOST_CHECK(report.verdict == Verdict::OUTPUT_LIMIT_EXCEEDED);
	BOOST_CHECK_EQUAL(getVerdictExitCode(report.verdict), 14);
}

BOOST_AUTO_TEST_CASE(crash_and_nonzero_exit_are_runtime_errors)
{
	VerdictReporter reporter("test");

	ExecutionOutcome crash = outcome_of(TerminationReason::SIGNALED, 0, SIGSEGV);
	VerdictReport report = reporter.report(successful_build(), &crash);
	BOOST_CHECK(report.verdict == Verdict::RUNTIME_ERROR);
	BOOST_CHECK_EQUAL(report.signal, SIGSEGV);
	BOOST_CHECK(report.detail.find("signal 11") != std::string::npos);

	ExecutionOutcome exit_one = outcome_of(TerminationReason::COMPLETED, 1, 0);
	report = reporter.report(successful_build(), &exit_one);
	BOOST_CHECK(report.verdict == Verdict::RUNTIME_ERROR);
	BOOST_CHECK_EQUAL(report.detail, "exited with code 1");
	BOOST_CHECK_EQUAL(getVerdictExitCode(report.verdict), 11);
}

BOOST_AUTO_TEST_CASE(clean_exit_is_accepted)
{
	ExecutionOutcome outcome = outcome_of(TerminationReason::COMPLETED, 0, 0);
	outcome.stdout_data = "Hello";
	VerdictReport report = VerdictReporter("test").report(successful_build(), &outcome);
	BOOST_CHECK(report.verdict == Verdict::ACCEPTED);
	BOOST_CHECK_EQUAL(report.stdout_data, "Hello");
	BOOST_CHECK_EQUAL(getVerdictExitCode(report.verdict), 0);
}

BOOST_AUTO_TEST_CASE(exit_codes_are_distinct)
{
	const Verdict verdicts[] = {
		Verdict::ACCEPTED, Verdict::COMPILE_ERROR, Verdict::RUNTIME_ERROR, Verdict::TIME_LIMIT_EXCEEDED,
		Verdict::MEMORY_LIMIT_EXCEEDED, Verdict::OUTPUT_LIMIT_EXCEEDED, Verdict::INTERNAL_ERROR
	};
	std::set<int> codes;
	for (Verdict verdict : verdicts) {
		codes.insert(getVerdictExitCode(verdict));
		BOOST_CHECK(getVerdictByName(getVerdictName(verdict)) == verdict);
	}
	BOOST_CHECK_EQUAL(codes.size(), 7u);
	BOOST_CHECK_THROW(getVerdictByName("Similar"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(serialized_verdict_is_one_json_line)
{
	ExecutionOutcome outcome = outcome_of(TerminationReason::COMPLETED, 0, 0);
	outcome.stdout_data = "line one\nline two\n";
	outcome.stderr_data = "bad \xff\xfe bytes";
	outcome.usage.stdout_bytes = outcome.stdout_data.size();
	VerdictReport report = VerdictReporter("test").report(successful_build(), &outcome);

	std::string serialized;
	BOOST_REQUIRE_NO_THROW(serialized = VerdictReporter::serialize(report));
	BOOST_CHECK(serialized.find('\n') == std::string::npos);

	nlohmann::json json_obj = nlohmann::json::parse(serialized);
	BOOST_CHECK_EQUAL(json_obj.at("verdict").get<std::string>(), "Accepted");
	BOOST_CHECK_EQUAL(json_obj.at("termination_reason").get<std::string>(), "Completed");
	BOOST_CHECK_EQUAL(json_obj.at("stdout").get<std::string>(), outcome.stdout_data);
	BOOST_CHECK_EQUAL(json_obj.at("usage").at("stdout_bytes").get<std::size_t>(), outcome.stdout_data.size());
	BOOST_CHECK(json_obj.find("timing") == json_obj.end());

	BOOST_CHECK(VerdictReporter::parse_verdict(serialized) == Verdict::ACCEPTED);
	BOOST_CHECK_THROW(VerdictReporter::parse_verdict("not json"), std::invalid_argument);
	BOOST_CHECK_THROW(VerdictReporter::parse_verdict("{\"verdict\": 3}"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(timing_is_serialized_when_measured)
{
	TimingStatistics timing;
	for (int ms : { 100, 101, 100, 102, 100 }) {
		timing.add_run(TerminationReason::COMPLETED, 0, std::chrono::milliseconds(ms));
	}
	timing.compute();

	ExecutionOutcome outcome = outcome_of(TerminationReason::COMPLETED, 0, 0);
	outcome.timing = timing;
	VerdictReport report = VerdictReporter("test").report(successful_build(), &outcome);

	nlohmann::json json_obj = VerdictReporter::to_json(report);
	BOOST_REQUIRE(json_obj.find("timing") != json_obj.end());
	BOOST_CHECK_EQUAL(json_obj["timing"]["runs"].size(), 5u);
	BOOST_CHECK_EQUAL(json_obj["timing"]["status"].get<std::string>(), "stable");
	BOOST_CHECK_EQUAL(json_obj["timing"]["counts"]["Completed"].get<int>(), 5);
	BOOST_CHECK_CLOSE(json_obj["timing"]["median"].get<double>(), 100.0, 1e-9);
}
