/*
 * BuildStage.hpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#ifndef SRC_SUPERVISOR_BUILDSTAGE_HPP_
#define SRC_SUPERVISOR_BUILDSTAGE_HPP_

#include <chrono>
#include <string>

#include <boost/filesystem/path.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "Limits.hpp"
#include "Result.hpp"
#include "ResourceLimiter.hpp"
#include "supervisor_settings.hpp"

/**
 * @brief 编译成功的产物. 只由 BuildStage 创建, ExecutionStage 只读地使用
 */
struct BuildArtifact
{
		boost::filesystem::path binary_path;
		int exit_code; ///< 编译器的退出代码
		std::string diagnostics; ///< 编译器输出, 截断到输出上限之内
		std::chrono::milliseconds duration;
		ResourceUsage usage;
};

/**
 * @brief 提交的代码未能编译
 */
struct CompileFailure
{
		TerminationReason termination_reason;
		int exit_code;
		int signal;
		std::string reason; ///< 失败原因的简短描述, 包括越过的限制
		std::string diagnostics;
		ResourceUsage usage;
};

struct BuildResult
{
		enum class Status
		{
			SUCCESS, COMPILE_FAILURE, INTERNAL_ERROR
		};

		Status status;
		kerbal::data_struct::optional<BuildArtifact> artifact; ///< 仅当 status 为 SUCCESS
		kerbal::data_struct::optional<CompileFailure> failure; ///< 仅当 status 为 COMPILE_FAILURE
		RunnerError error; ///< 仅当 status 为 INTERNAL_ERROR
		std::string detail;

		BuildResult() :
				status(Status::INTERNAL_ERROR), error(RunnerError::SUCCESS)
		{
		}
};

class BuildStage
{
	private:
		const Settings & settings;
		ResourceLimiter & limiter;
		boost::filesystem::path work_dir;
		std::string submission_id;

	public:
		/**
		 * @param work_dir 编译使用的目录, 源文件与产物都放在其中
		 */
		BuildStage(const Settings & settings, ResourceLimiter & limiter, const boost::filesystem::path & work_dir, const std::string & submission_id);

		/**
		 * @brief 把 source 写入 work_dir 下的源文件, 在 compile_limits 之内调用编译器. \n
		 * 编译器退出代码为 0 且产物存在时成功; 其余情况为 CompileFailure; 编译器根本无法启动时为 INTERNAL_ERROR
		 */
		BuildResult build(const std::string & source, const Limits & compile_limits);
};

#endif /* SRC_SUPERVISOR_BUILDSTAGE_HPP_ */
