/*
 * SubmissionJob.cpp
 *
 *  Created on: 2018年6月15日
 *      Author: peter
 */

#include "SubmissionJob.hpp"

#include "BuildStage.hpp"
#include "ExecutionStage.hpp"
#include "logger.hpp"
#include "global_shared_variable.hpp"

SubmissionJob::SubmissionJob(const Settings & settings, const Submission & submission, const boost::filesystem::path & work_dir) :
		settings(settings), submission(submission), dir(work_dir), limiter(submission.id)
{
}

Limits SubmissionJob::run_limits() const
{
	Limits limits = settings.run.limits;
	limits.merge(submission.limits);
	return limits;
}

VerdictReport SubmissionJob::handle() noexcept
{
	const VerdictReporter reporter(submission.id);
	try {
		LOG_INFO(Stage::SUPERVISOR, submission.id, log_fp, "<<<<<<<<<<<<<<<<<<<<<<<<<<<<<<");
		LOG_DEBUG(Stage::SUPERVISOR, submission.id, log_fp, "SubmissionJob::handle");

		const Limits limits = this->run_limits();
		if (!limits.check_is_valid()) {
			return reporter.internal_error("invalid run limits");
		}

		// compile
		LOG_DEBUG(Stage::BUILD, submission.id, log_fp, "compile start");
		BuildStage build_stage(settings, limiter, dir / "build", submission.id);
		const BuildResult build_result = build_stage.build(submission.source, settings.build.limits);
		LOG_DEBUG(Stage::BUILD, submission.id, log_fp, "compile finished");

		if (build_result.status != BuildResult::Status::SUCCESS) {
			return reporter.report(build_result, nullptr);
		}

		// 编译成功则 run
		LOG_DEBUG(Stage::EXECUTE, submission.id, log_fp, "run start");
		ExecutionStage execution_stage(settings, limiter, dir / "execute", submission.id);
		const ExecutionOutcome outcome = execution_stage.execute(build_result.artifact.value(), limits, submission.stdin_data);
		LOG_DEBUG(Stage::EXECUTE, submission.id, log_fp, "run finished: ", outcome);

		return reporter.report(build_result, &outcome);
	} catch (const std::exception & e) {
		EXCEPT_FATAL(Stage::SUPERVISOR, submission.id, log_fp, "Job handle failed.", e);
		return reporter.internal_error(std::string("job handle failed: ") + e.what());
	} catch (...) {
		UNKNOWN_EXCEPT_FATAL(Stage::SUPERVISOR, submission.id, log_fp, "Job handle failed.");
		return reporter.internal_error("job handle failed");
	}
}
