/*
 * SubmissionJob.hpp
 *
 *  Created on: 2018年6月8日
 *      Author: peter
 */

#ifndef SRC_SUPERVISOR_SUBMISSIONJOB_HPP_
#define SRC_SUPERVISOR_SUBMISSIONJOB_HPP_

#include <stdexcept>
#include <string>

#include <boost/filesystem/path.hpp>
#include <kerbal/utility/noncopyable.hpp>

#include "Submission.hpp"
#include "ResourceLimiter.hpp"
#include "VerdictReporter.hpp"
#include "supervisor_settings.hpp"

class JobHandleException: public std::runtime_error
{
	public:
		explicit JobHandleException(const std::string & reason) :
				std::runtime_error(reason)
		{
		}
};

/**
 * @brief 一份提交的完整处理流程: 编译, 执行, 给出结果
 */
class SubmissionJob : virtual kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	protected:
		const Settings & settings;
		const Submission & submission;

		/** 本 job 临时工作路径 */
		const boost::filesystem::path dir;

		RlimitResourceLimiter limiter;

	public:
		/**
		 * @param work_dir 本 job 独占的工作路径, 由调用者负责最终清理
		 */
		SubmissionJob(const Settings & settings, const Submission & submission, const boost::filesystem::path & work_dir);

		/**
		 * @brief 运行时上限: 配置文件中的 run.limits 被提交自身声明的上限覆盖
		 */
		Limits run_limits() const;

		/**
		 * @brief 本 Job 的处理函数. 编译成功才会执行, 并且恰好给出一个结果
		 * @exception 该函数保证不抛出任何异常
		 */
		VerdictReport handle() noexcept;
};

#endif /* SRC_SUPERVISOR_SUBMISSIONJOB_HPP_ */
