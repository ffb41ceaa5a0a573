/*
 * VerdictReporter.hpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#ifndef SRC_SUPERVISOR_VERDICTREPORTER_HPP_
#define SRC_SUPERVISOR_VERDICTREPORTER_HPP_

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "BuildStage.hpp"
#include "ExecutionStage.hpp"
#include "Result.hpp"
#include "TimingStatistics.hpp"
#include "united_resource.hpp"

/**
 * @brief 一次提交唯一的最终结果
 */
struct VerdictReport
{
		Verdict verdict;
		int exit_code; ///< 被评测程序的退出代码
		int signal;
		TerminationReason termination_reason; ///< 决定结果的那一阶段的终止原因
		std::string detail; ///< 不查看日志也足以解释结果的说明
		ResourceUsage usage;
		std::string stdout_data;
		std::string stderr_data;
		std::string compiler_output;
		kerbal::data_struct::optional<TimingStatistics> timing;

		VerdictReport();

		friend std::ostream& operator<<(std::ostream& out, const VerdictReport & src);
};

/**
 * @brief supervisor 以此作为自身的退出代码. Accepted 为 0, 其余结果各不相同且不与命令行错误的 1 冲突
 */
int getVerdictExitCode(Verdict verdict);

/**
 * @exception std::invalid_argument name 不是任何一种结果的名称
 */
Verdict getVerdictByName(const std::string & name);

class VerdictReporter
{
	private:
		std::string submission_id;

	public:
		explicit VerdictReporter(const std::string & submission_id);

		/**
		 * @brief 按固定的优先顺序把编译与执行的结果映射为唯一的结果. \n
		 * 任一阶段的系统错误最先判定为 InternalError; 之后依次为 CompileError, TimeLimitExceeded, \n
		 * MemoryLimitExceeded, OutputLimitExceeded, RuntimeError, Accepted
		 * @param execution 未执行时为空指针
		 */
		VerdictReport report(const BuildResult & build, const ExecutionOutcome * execution) const;

		VerdictReport internal_error(const std::string & detail) const;

		static nlohmann::json to_json(const VerdictReport & report);

		/**
		 * @brief 单行 JSON. 捕获文本中的非法 UTF-8 会被替换而不会导致失败
		 */
		static std::string serialize(const VerdictReport & report);

		/**
		 * @brief 从 serialize 的结果中取出 verdict
		 * @exception std::invalid_argument 内容不是合法的结果
		 */
		static Verdict parse_verdict(const std::string & serialized);
};

#endif /* SRC_SUPERVISOR_VERDICTREPORTER_HPP_ */
