/*
 * Supervision.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#include "Supervision.hpp"

#include <csignal>

#include <unistd.h>

#include <boost/filesystem/operations.hpp>

#include "Reaper.hpp"
#include "ResourceLimiter.hpp"
#include "SubmissionJob.hpp"
#include "Workspace.hpp"
#include "logger.hpp"
#include "global_shared_variable.hpp"

namespace
{
	/**
	 * @brief 流水线进程收到终止信号时取消正在进行的受限运行
	 */
	extern "C" void cancel_on_signal(int) noexcept
	{
		request_cancellation();
	}

	void regist_cancellation_handler() noexcept
	{
		struct sigaction action;
		action.sa_handler = cancel_on_signal;
		sigemptyset(&action.sa_mask);
		action.sa_flags = SA_RESTART;
		for (int sig : { SIGTERM, SIGINT, SIGHUP, SIGQUIT }) {
			sigaction(sig, &action, nullptr);
		}
	}

	int emit(const std::string & serialized, Verdict verdict, std::ostream & out)
	{
		out << serialized << std::endl;
		return getVerdictExitCode(verdict);
	}
}

int emit_internal_error(const std::string & submission_id, const std::string & detail, std::ostream & out)
{
	const VerdictReport report = VerdictReporter(submission_id).internal_error(detail);
	return emit(VerdictReporter::serialize(report), report.verdict, out);
}

int supervise(const Settings & settings, const Submission & submission, std::ostream & out)
{
	return supervise(settings, submission, out, [&settings, &submission](const boost::filesystem::path & workspace) {
		SubmissionJob job(settings, submission, workspace);
		return job.handle();
	});
}

int supervise(const Settings & settings, const Submission & submission, std::ostream & out, const PipelineTask & pipeline)
{
	const std::string & submission_id = submission.id;
	const boost::filesystem::path workspace = settings.runtime.workspace_root / ("job-" + std::to_string(getpid()));
	try {
		prepare_directory(workspace);
	} catch (const WorkspaceException & e) {
		EXCEPT_FATAL(Stage::SUPERVISOR, submission_id, log_fp, "Make workspace dir failed.", e);
		return emit_internal_error(submission_id, e.what(), out);
	}

	const boost::filesystem::path verdict_file = workspace / "verdict.json";

	int status = 0;
	try {
		Reaper reaper(settings.sandbox.reap_timeout, submission_id);
		status = reaper.run([&]() -> int {
			// 流水线进程同样是 subreaper, 受限运行遗留的后代进程在给出结果之前便被回收
			Reaper::become_subreaper();
			regist_cancellation_handler();

			const VerdictReport report = pipeline(workspace);

			const boost::filesystem::path tmp_file = workspace / "verdict.json.tmp";
			write_file(tmp_file, VerdictReporter::serialize(report));
			boost::filesystem::rename(tmp_file, verdict_file);
			LOG_INFO(Stage::SUPERVISOR, submission_id, log_fp, ">>>>>>>>>>>>>>>>>>>>>>>>>>>>>>");
			return getVerdictExitCode(report.verdict);
		});
	} catch (const ReaperException & e) {
		EXCEPT_FATAL(Stage::SUPERVISOR, submission_id, log_fp, "Start pipeline failed.", e);
		if (!settings.runtime.keep_workspace) {
			remove_directory(workspace);
		}
		return emit_internal_error(submission_id, e.what(), out);
	}

	std::string serialized;
	Verdict verdict = Verdict::INTERNAL_ERROR;
	try {
		serialized = read_file(verdict_file);
		verdict = VerdictReporter::parse_verdict(serialized);
	} catch (const std::exception & e) {
		EXCEPT_FATAL(Stage::SUPERVISOR, submission_id, log_fp, "Pipeline produced no verdict.", e, " status: ", status);
		serialized.clear();
	}

	if (!settings.runtime.keep_workspace && !remove_directory(workspace)) {
		LOG_WARNING(Stage::SUPERVISOR, submission_id, log_fp, "Can not remove workspace: ", workspace);
	}

	if (serialized.empty()) {
		return emit_internal_error(submission_id, "pipeline terminated without a verdict, status: " + std::to_string(status), out);
	}
	return emit(serialized, verdict, out);
}
