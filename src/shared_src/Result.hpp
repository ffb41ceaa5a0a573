/*
 * Result.hpp
 *
 *  Created on: 2018年6月11日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_RESULT_HPP_
#define SRC_SHARED_SRC_RESULT_HPP_

#include <kerbal/utility/storage.hpp>

#include "united_resource.hpp"

#include <iostream>
#include <chrono>
#include <cstddef>
#include <string>

/**
 * @brief 一次受限运行所消耗的资源, 创建之后不再改变
 */
struct ResourceUsage
{
		std::chrono::milliseconds cpu_time;
		std::chrono::milliseconds real_time;
		kerbal::utility::KB memory; ///< 峰值常驻内存
		std::size_t stdout_bytes; ///< 子进程写出的 stdout 字节数, 包括超限后被丢弃的部分
		std::size_t stderr_bytes;

		ResourceUsage();

		friend std::ostream& operator<<(std::ostream& out, const ResourceUsage & src);
};

/**
 * @brief ResourceLimiter 的一次运行结果
 */
struct Result
{
		TerminationReason termination_reason;
		ResourceUsage usage;
		RunnerError error;
		int error_number; ///< 与 error 对应的 errno
		int signal;
		int exit_code;
		std::string stdout_data; ///< 截断到输出上限之内的 stdout
		std::string stderr_data;

		/**
		 * @brief Result 构造函数，结果设定为 COMPLETED，资源用量、信号、退出代码置为 0
		 */
		Result();

		/**
		 * @brief 将本结构体的 RunnerError 置为 err， 并将终止原因标为 TerminationReason::SYSTEM_ERROR
		 * @param err 表示 RunnerError 的类型
		 * @param error_number 出错时的 errno, 没有则为 0
		 */
		void setErrorCode(RunnerError err, int error_number = 0);

		bool terminated_by_signal() const
		{
			return this->signal != 0;
		}

		friend std::ostream& operator<<(std::ostream& out, const Result & src);
};

#endif /* SRC_SHARED_SRC_RESULT_HPP_ */
