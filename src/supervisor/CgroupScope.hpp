/*
 * CgroupScope.hpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#ifndef SRC_SUPERVISOR_CGROUPSCOPE_HPP_
#define SRC_SUPERVISOR_CGROUPSCOPE_HPP_

#include <cstddef>
#include <stdexcept>
#include <string>

#include <boost/filesystem/path.hpp>
#include <kerbal/utility/noncopyable.hpp>
#include <kerbal/utility/storage.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "Limits.hpp"

class CgroupException: public std::runtime_error
{
	public:
		const int error_number;

		CgroupException(const std::string & reason, int error_number) :
				std::runtime_error(reason), error_number(error_number)
		{
		}
};

/**
 * @brief 为一次受限运行创建的 cgroup v2 子目录, 析构时杀死其中剩余进程并删除该目录
 */
class CgroupScope : virtual kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		boost::filesystem::path dir;

		void write_control_file(const char * file_name, const std::string & value) const;

	public:
		/**
		 * @brief 在 root 下创建名为 name 的子 cgroup, 并写入 memory.max, memory.swap.max, pids.max
		 * @exception CgroupException 创建目录或写入控制文件失败
		 */
		CgroupScope(const boost::filesystem::path & root, const std::string & name, const Limits & limits);

		~CgroupScope() noexcept;

		/**
		 * @brief 子进程加入本 cgroup 时应写入的文件
		 */
		boost::filesystem::path procs_file() const
		{
			return this->dir / "cgroup.procs";
		}

		/**
		 * @brief 读取 memory.events 中的 oom_kill 计数, 读取失败视为 0
		 */
		std::size_t oom_kill_count() const noexcept;

		/**
		 * @brief 读取 memory.peak. 内核版本过低时该文件不存在, 返回空
		 */
		kerbal::data_struct::optional<kerbal::utility::KB> memory_peak() const noexcept;

		/**
		 * @brief 通过 cgroup.kill 杀死本 cgroup 中的全部进程
		 * @return 写入成功返回 true
		 */
		bool kill_all() const noexcept;
};

#endif /* SRC_SUPERVISOR_CGROUPSCOPE_HPP_ */
