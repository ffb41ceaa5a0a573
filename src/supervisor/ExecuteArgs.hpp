/*
 * ExecuteArgs.hpp
 *
 *  Created on: 2018年7月1日
 *      Author: peter
 */

#ifndef SRC_SUPERVISOR_EXECUTEARGS_HPP_
#define SRC_SUPERVISOR_EXECUTEARGS_HPP_

#include <vector>
#include <string>
#include <memory>
#include <initializer_list>
#include <iostream>

/**
 * @brief 执行 exec 族的命令行参数。在原本的 Unix 要求中，exec 族函数的命令行参数末尾必须以一个空指针结尾，
 * 这显然十分丑陋不够优雅，也晦涩难读。基于此目的，本处使用了一个类将它封装了起来。
 */
class ExecuteArgs
{
	private:
		std::vector<std::string> args;

	public:
		ExecuteArgs();

		template<typename ForwardIterator>
		ExecuteArgs(ForwardIterator begin, ForwardIterator end) :
				args(begin, end)
		{
		}

		ExecuteArgs(std::initializer_list<std::string> list);

		ExecuteArgs& operator=(std::initializer_list<std::string> list);

		ExecuteArgs& push_back(const std::string & arg);

		template<typename ForwardIterator>
		ExecuteArgs& append(ForwardIterator begin, ForwardIterator end)
		{
			args.insert(args.end(), begin, end);
			return *this;
		}

		bool empty() const noexcept
		{
			return args.empty();
		}

		std::size_t size() const noexcept
		{
			return args.size();
		}

		const std::string & operator[](std::size_t i) const
		{
			return args[i];
		}

		/**
		 * @brief 返回命令行参数列表
		 * @return 指向 char * 数组的指针，符合 Unix 的 exec 族函数的参数规范
		 * @warning 返回的指针指向本对象内部的字符串, 本对象被修改或析构后失效
		 */
		std::unique_ptr<char*[]> getArgs() const;

		friend std::ostream& operator<<(std::ostream& out, const ExecuteArgs & src);
};

#endif /* SRC_SUPERVISOR_EXECUTEARGS_HPP_ */
