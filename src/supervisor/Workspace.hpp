/*
 * Workspace.hpp
 *
 *  Created on: 2018年11月7日
 *      Author: peter
 */

#ifndef SRC_SUPERVISOR_WORKSPACE_HPP_
#define SRC_SUPERVISOR_WORKSPACE_HPP_

#include <stdexcept>
#include <string>

#include <boost/filesystem/path.hpp>

class WorkspaceException: public std::runtime_error
{
	public:
		explicit WorkspaceException(const std::string & reason) :
				std::runtime_error(reason)
		{
		}
};

/**
 * @brief 创建目录 (包括不存在的父目录). 以 root 运行且 uid, gid 非负时, 把目录的所有者改为 uid, gid
 * @exception WorkspaceException 创建目录或修改所有者失败
 */
void prepare_directory(const boost::filesystem::path & dir, int uid = -1, int gid = -1);

/**
 * @brief 以 content 覆盖写入 file
 * @exception WorkspaceException 打开或写入失败
 */
void write_file(const boost::filesystem::path & file, const std::string & content);

/**
 * @brief 读取整个文件
 * @exception WorkspaceException 打开或读取失败
 */
std::string read_file(const boost::filesystem::path & file);

/**
 * @brief 递归删除目录, 失败时只返回 false
 */
bool remove_directory(const boost::filesystem::path & dir) noexcept;

#endif /* SRC_SUPERVISOR_WORKSPACE_HPP_ */
