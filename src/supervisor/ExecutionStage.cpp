/*
 * ExecutionStage.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#include "ExecutionStage.hpp"

#include <boost/filesystem/operations.hpp>

#include "Config.hpp"
#include "Workspace.hpp"
#include "logger.hpp"
#include "global_shared_variable.hpp"

ExecutionOutcome::ExecutionOutcome() :
		exit_code(0),
		signal(0),
		termination_reason(TerminationReason::COMPLETED),
		error(RunnerError::SUCCESS),
		error_number(0)
{
}

std::ostream& operator<<(std::ostream& out, const ExecutionOutcome & src)
{
	out << "reason: " << src.termination_reason << " exit_code: " << src.exit_code
			<< " signal: " << src.signal << " " << src.usage;
	if (src.error != RunnerError::SUCCESS) {
		out << " error: " << src.error;
	}
	if (src.timing.has_value()) {
		out << " timing: " << src.timing.value();
	}
	return out;
}

ExecutionStage::ExecutionStage(const Settings & settings, ResourceLimiter & limiter, const boost::filesystem::path & work_dir, const std::string & submission_id) :
		settings(settings), limiter(limiter), work_dir(work_dir), submission_id(submission_id), invocation_count(0)
{
}

ExecutionOutcome ExecutionStage::execute(const BuildArtifact & artifact, const Limits & run_limits, const std::string & stdin_data)
{
	// 标准输入文件放在各次执行的目录之外, 由子进程在 chroot 之前打开
	const boost::filesystem::path input_file = work_dir / "stdin.txt";
	try {
		prepare_directory(work_dir);
		write_file(input_file, stdin_data);
	} catch (const WorkspaceException & e) {
		EXCEPT_FATAL(Stage::EXECUTE, submission_id, log_fp, "Store standard input failed.", e);
		ExecutionOutcome outcome;
		outcome.limits = run_limits;
		outcome.termination_reason = TerminationReason::SYSTEM_ERROR;
		outcome.error = RunnerError::WORKSPACE_FAILED;
		return outcome;
	}

	if (settings.run.repeats <= 1) {
		return this->run_once(artifact, run_limits, input_file);
	}

	ExecutionOutcome outcome = this->run_once(artifact, run_limits, input_file);
	if (!outcome.completed_cleanly()) {
		LOG_INFO(Stage::EXECUTE, submission_id, log_fp, "Warm-up run did not complete cleanly, skip measurement");
		return outcome;
	}

	TimingStatistics timing;
	for (int i = 0; i < settings.run.repeats; ++i) {
		outcome = this->run_once(artifact, run_limits, input_file);
		timing.add_run(outcome.termination_reason, outcome.exit_code, outcome.usage.real_time);
		if (!outcome.completed_cleanly()) {
			break;
		}
	}
	timing.compute();
	LOG_INFO(Stage::EXECUTE, submission_id, log_fp, "Timing: ", timing);
	outcome.timing = std::move(timing);
	return outcome;
}

ExecutionOutcome ExecutionStage::run_once(const BuildArtifact & artifact, const Limits & run_limits, const boost::filesystem::path & input_file)
{
	ExecutionOutcome outcome;
	outcome.limits = run_limits;

	++invocation_count;
	const boost::filesystem::path run_dir = work_dir / ("run-" + std::to_string(invocation_count));
	const boost::filesystem::path binary_path = run_dir / settings.build.binary_name;

	try {
		prepare_directory(run_dir, settings.sandbox.judger_uid, settings.sandbox.judger_gid);
		boost::system::error_code ec;
		boost::filesystem::copy_file(artifact.binary_path, binary_path, ec);
		if (ec) {
			throw WorkspaceException("copy [" + artifact.binary_path.string() + "] failed: " + ec.message());
		}
		boost::filesystem::permissions(binary_path,
				boost::filesystem::owner_all | boost::filesystem::group_read | boost::filesystem::group_exe |
				boost::filesystem::others_read | boost::filesystem::others_exe, ec);
		if (ec) {
			throw WorkspaceException("chmod [" + binary_path.string() + "] failed: " + ec.message());
		}
	} catch (const WorkspaceException & e) {
		EXCEPT_FATAL(Stage::EXECUTE, submission_id, log_fp, "Prepare run directory failed.", e);
		remove_directory(run_dir);
		outcome.termination_reason = TerminationReason::SYSTEM_ERROR;
		outcome.error = RunnerError::WORKSPACE_FAILED;
		return outcome;
	}

	const RunningConfig config(settings, run_dir, settings.build.binary_name, input_file, run_limits);
	Result result = limiter.run_limited(config);

	if (!remove_directory(run_dir)) {
		LOG_WARNING(Stage::EXECUTE, submission_id, log_fp, "Can not remove run directory: ", run_dir);
	}

	outcome.exit_code = result.exit_code;
	outcome.signal = result.signal;
	outcome.stdout_data = std::move(result.stdout_data);
	outcome.stderr_data = std::move(result.stderr_data);
	outcome.usage = result.usage;
	outcome.termination_reason = result.termination_reason;
	outcome.error = result.error;
	outcome.error_number = result.error_number;
	LOG_DEBUG(Stage::EXECUTE, submission_id, log_fp, "Run ", invocation_count, ": ", outcome);
	return outcome;
}
