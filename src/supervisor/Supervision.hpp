/*
 * Supervision.hpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#ifndef SRC_SUPERVISOR_SUPERVISION_HPP_
#define SRC_SUPERVISOR_SUPERVISION_HPP_

#include <functional>
#include <iostream>
#include <string>

#include <boost/filesystem/path.hpp>

#include "Submission.hpp"
#include "VerdictReporter.hpp"
#include "supervisor_settings.hpp"

/**
 * @brief 在流水线进程中执行, 给出提交的结果
 * @param workspace 本次提交独占的工作目录
 */
using PipelineTask = std::function<VerdictReport(const boost::filesystem::path & workspace)>;

/**
 * @brief 编译, 执行并判定 submission
 * @see supervise(const Settings &, const Submission &, std::ostream &, const PipelineTask &)
 */
int supervise(const Settings & settings, const Submission & submission, std::ostream & out);

/**
 * @brief 以 Reaper 的身份 fork 出流水线进程执行 pipeline, 流水线把结果写入工作目录中的 verdict.json. \n
 * 全部后代进程被回收之后, 在 out 上输出恰好一行结果. 流水线没有留下结果时输出 InternalError. \n
 * 除非 settings.runtime.keep_workspace, 返回前删除工作目录
 * @return supervisor 的退出代码, 由结果决定
 */
int supervise(const Settings & settings, const Submission & submission, std::ostream & out, const PipelineTask & pipeline);

/**
 * @brief 在 out 上输出一行 InternalError 结果
 * @return InternalError 对应的退出代码
 */
int emit_internal_error(const std::string & submission_id, const std::string & detail, std::ostream & out);

#endif /* SRC_SUPERVISOR_SUPERVISION_HPP_ */
