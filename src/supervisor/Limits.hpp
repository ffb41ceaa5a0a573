/*
 * Limits.hpp
 *
 *  Created on: 2018年12月7日
 *      Author: peter
 */

#ifndef SRC_SUPERVISOR_LIMITS_HPP_
#define SRC_SUPERVISOR_LIMITS_HPP_

#include <chrono>
#include <iostream>
#include <string>

#include <kerbal/utility/storage.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "united_resource.hpp"

/**
 * @brief 单个受限子进程的资源上限。未设置的项表示不加限制
 */
class Limits
{
	public:

		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		using raw_max_cpu_time_type = std::chrono::milliseconds;
		using max_cpu_time_type = optional<raw_max_cpu_time_type>;
		max_cpu_time_type max_cpu_time; ///< 最大 CPU 时间限制

		using raw_max_real_time_type = std::chrono::milliseconds;
		using max_real_time_type = optional<raw_max_real_time_type>;
		max_real_time_type max_real_time; ///< 最大墙上时间

		using raw_max_memory_type = kerbal::utility::KB;
		using max_memory_type = optional<raw_max_memory_type>;
		max_memory_type max_memory; ///< 常驻内存上限

		using raw_max_output_size_type = kerbal::utility::Byte;
		using max_output_size_type = optional<raw_max_output_size_type>;
		max_output_size_type max_output_size; ///< 从 stdout 与 stderr 复制出的字节总数上限, 同时也是可创建文件的最大字节长度

		using raw_max_stack_type = kerbal::utility::KB;
		using max_stack_type = optional<raw_max_stack_type>;
		max_stack_type max_stack; ///< 栈的最大长度

		using raw_max_process_number_type = int;
		using max_process_number_type = optional<raw_max_process_number_type>;
		max_process_number_type max_process_number; ///< 程序最大子进程数

		Limits& set_max_cpu_time(const raw_max_cpu_time_type & max_cpu_time)
		{
			this->max_cpu_time = max_cpu_time;
			return *this;
		}

		Limits& set_max_real_time(const raw_max_real_time_type & max_real_time)
		{
			this->max_real_time = max_real_time;
			return *this;
		}

		Limits& set_max_memory(const raw_max_memory_type & max_memory)
		{
			this->max_memory = max_memory;
			return *this;
		}

		Limits& set_max_output_size(const raw_max_output_size_type & max_output_size)
		{
			this->max_output_size = max_output_size;
			return *this;
		}

		Limits& set_max_stack(const raw_max_stack_type & max_stack)
		{
			this->max_stack = max_stack;
			return *this;
		}

		Limits& set_max_process_number(const raw_max_process_number_type & max_process_number)
		{
			this->max_process_number = max_process_number;
			return *this;
		}

		/**
		 * @brief 用 other 中已设置的项覆盖本对象的对应项
		 */
		Limits& merge(const Limits & other);

		/**
		 * @brief 检查各项上限是否合法。已设置的时间上限不得小于 1 ms, 空间上限不得小于 1 KB, 输出上限不得小于 1 Byte
		 */
		bool check_is_valid() const;

		friend std::ostream& operator<<(std::ostream& out, const Limits & src);
};

/**
 * @brief 描述终止原因, 若该原因对应一项已设置的上限, 附上该上限的值
 */
std::string describe_limit(TerminationReason reason, const Limits & limits);

#endif /* SRC_SUPERVISOR_LIMITS_HPP_ */
