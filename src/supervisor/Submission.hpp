/*
 * Submission.hpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#ifndef SRC_SUPERVISOR_SUBMISSION_HPP_
#define SRC_SUPERVISOR_SUBMISSION_HPP_

#include <string>

#include "Limits.hpp"

/**
 * @brief 一份待评测的提交, 接受之后不再改变
 */
struct Submission
{
		const std::string id; ///< 仅用于日志
		const std::string source;
		const std::string stdin_data;
		const Limits limits; ///< 提交自身声明的运行上限, 覆盖配置文件中 run.limits 的对应项

		Submission(const std::string & id, const std::string & source, const std::string & stdin_data, const Limits & limits) :
				id(id), source(source), stdin_data(stdin_data), limits(limits)
		{
		}
};

#endif /* SRC_SUPERVISOR_SUBMISSION_HPP_ */
