/*
 * ExecutionStage.hpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#ifndef SRC_SUPERVISOR_EXECUTIONSTAGE_HPP_
#define SRC_SUPERVISOR_EXECUTIONSTAGE_HPP_

#include <iostream>
#include <string>

#include <boost/filesystem/path.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "BuildStage.hpp"
#include "Limits.hpp"
#include "Result.hpp"
#include "ResourceLimiter.hpp"
#include "TimingStatistics.hpp"
#include "supervisor_settings.hpp"

/**
 * @brief 一次执行的结果. 正常但非零的退出与被信号终止分别记录在 exit_code 与 signal 中
 */
struct ExecutionOutcome
{
		int exit_code;
		int signal;
		std::string stdout_data; ///< 截断到输出上限之内
		std::string stderr_data;
		ResourceUsage usage;
		TerminationReason termination_reason;
		RunnerError error;
		int error_number;
		Limits limits; ///< 本次执行实际使用的上限
		kerbal::data_struct::optional<TimingStatistics> timing; ///< 仅在多次测量时存在

		ExecutionOutcome();

		/**
		 * @brief 正常结束且退出代码为 0
		 */
		bool completed_cleanly() const
		{
			return termination_reason == TerminationReason::COMPLETED && exit_code == 0;
		}

		friend std::ostream& operator<<(std::ostream& out, const ExecutionOutcome & src);
};

class ExecutionStage
{
	private:
		const Settings & settings;
		ResourceLimiter & limiter;
		boost::filesystem::path work_dir;
		std::string submission_id;
		unsigned int invocation_count;

		ExecutionOutcome run_once(const BuildArtifact & artifact, const Limits & run_limits, const boost::filesystem::path & input_file);

	public:
		/**
		 * @param work_dir 各次执行的独占目录与标准输入文件都建在其中
		 */
		ExecutionStage(const Settings & settings, ResourceLimiter & limiter, const boost::filesystem::path & work_dir, const std::string & submission_id);

		/**
		 * @brief 在 run_limits 之内运行 artifact, 以 stdin_data 为标准输入. \n
		 * settings.run.repeats 大于 1 时, 先运行一次不计入结果的预热, 再测量 repeats 次; \n
		 * 第一次未能干净结束的运行决定结果, 否则以最后一次为准
		 */
		ExecutionOutcome execute(const BuildArtifact & artifact, const Limits & run_limits, const std::string & stdin_data);
};

#endif /* SRC_SUPERVISOR_EXECUTIONSTAGE_HPP_ */
