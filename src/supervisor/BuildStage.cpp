/*
 * BuildStage.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#include "BuildStage.hpp"

#include <cstring>
#include <sstream>

#include <boost/filesystem/operations.hpp>

#include "Config.hpp"
#include "Workspace.hpp"
#include "logger.hpp"
#include "global_shared_variable.hpp"

BuildStage::BuildStage(const Settings & settings, ResourceLimiter & limiter, const boost::filesystem::path & work_dir, const std::string & submission_id) :
		settings(settings), limiter(limiter), work_dir(work_dir), submission_id(submission_id)
{
}

BuildResult BuildStage::build(const std::string & source, const Limits & compile_limits)
{
	BuildResult build_result;

	try {
		prepare_directory(work_dir, settings.sandbox.judger_uid, settings.sandbox.judger_gid);
		write_file(work_dir / settings.build.source_name, source);
	} catch (const WorkspaceException & e) {
		EXCEPT_FATAL(Stage::BUILD, submission_id, log_fp, "Prepare build directory failed.", e);
		build_result.status = BuildResult::Status::INTERNAL_ERROR;
		build_result.error = RunnerError::WORKSPACE_FAILED;
		build_result.detail = e.what();
		return build_result;
	}

	LOG_DEBUG(Stage::BUILD, submission_id, log_fp, "store source code finished");

	const CompileConfig config(settings, work_dir, settings.build.source_name, settings.build.binary_name, compile_limits);
	Result result = limiter.run_limited(config);

	if (result.termination_reason == TerminationReason::SYSTEM_ERROR) {
		// 编译器无法启动说明环境损坏, 与代码无关
		LOG_FATAL(Stage::BUILD, submission_id, log_fp, "System error occurred while compiling. Execute result: ", result);
		build_result.status = BuildResult::Status::INTERNAL_ERROR;
		build_result.error = result.error;
		std::ostringstream detail;
		detail << "compiler " << config.exe_path << " could not be run: " << getRunnerErrorName(result.error);
		if (result.error_number != 0) {
			detail << " (" << std::strerror(result.error_number) << ")";
		}
		build_result.detail = detail.str();
		return build_result;
	}

	const boost::filesystem::path binary_path = work_dir / settings.build.binary_name;
	boost::system::error_code ec;
	const bool binary_exists = boost::filesystem::is_regular_file(binary_path, ec);

	if (result.termination_reason == TerminationReason::COMPLETED && result.exit_code == 0 && binary_exists) {
		BuildArtifact artifact;
		artifact.binary_path = binary_path;
		artifact.exit_code = result.exit_code;
		artifact.diagnostics = std::move(result.stdout_data);
		artifact.duration = result.usage.real_time;
		artifact.usage = result.usage;
		build_result.status = BuildResult::Status::SUCCESS;
		build_result.artifact = std::move(artifact);
		LOG_INFO(Stage::BUILD, submission_id, log_fp, "Compile succeeded, ", result.usage);
		return build_result;
	}

	CompileFailure failure;
	failure.termination_reason = result.termination_reason;
	failure.exit_code = result.exit_code;
	failure.signal = result.signal;
	failure.diagnostics = std::move(result.stdout_data);
	failure.usage = result.usage;
	if (result.termination_reason == TerminationReason::COMPLETED) {
		if (result.exit_code != 0) {
			failure.reason = "compiler exited with code " + std::to_string(result.exit_code);
		} else {
			failure.reason = "compiler produced no binary";
		}
	} else if (result.termination_reason == TerminationReason::SIGNALED) {
		failure.reason = "compiler terminated by signal " + std::to_string(result.signal);
	} else {
		failure.reason = "compiler stopped: " + describe_limit(result.termination_reason, compile_limits);
	}
	LOG_INFO(Stage::BUILD, submission_id, log_fp, "Compile failed, ", failure.reason);

	build_result.status = BuildResult::Status::COMPILE_FAILURE;
	build_result.failure = std::move(failure);
	return build_result;
}
