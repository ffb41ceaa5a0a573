/*
 * Workspace.cpp
 *
 *  Created on: 2018年11月7日
 *      Author: peter
 */

#include "Workspace.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <unistd.h>

#include <boost/filesystem/operations.hpp>

void prepare_directory(const boost::filesystem::path & dir, int uid, int gid)
{
	boost::system::error_code ec;
	boost::filesystem::create_directories(dir, ec);
	if (ec) {
		throw WorkspaceException("can not create [" + dir.string() + "]: " + ec.message());
	}
	if (geteuid() == 0 && uid >= 0 && gid >= 0) {
		if (chown(dir.c_str(), uid, gid) != 0) {
			throw WorkspaceException("can not chown [" + dir.string() + "]: " + std::strerror(errno));
		}
	}
}

void write_file(const boost::filesystem::path & file, const std::string & content)
{
	std::ofstream fout(file.string(), std::ios::out | std::ios::binary | std::ios::trunc);
	if (!fout) {
		throw WorkspaceException("can not open [" + file.string() + "]");
	}
	fout << content;
	fout.flush();
	if (fout.bad()) {
		throw WorkspaceException("write [" + file.string() + "] failed");
	}
}

std::string read_file(const boost::filesystem::path & file)
{
	std::ifstream fin(file.string(), std::ios::in | std::ios::binary);
	if (!fin) {
		throw WorkspaceException("can not open [" + file.string() + "]");
	}
	std::string content((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
	if (fin.bad()) {
		throw WorkspaceException("read [" + file.string() + "] failed");
	}
	return content;
}

bool remove_directory(const boost::filesystem::path & dir) noexcept
{
	boost::system::error_code ec;
	boost::filesystem::remove_all(dir, ec);
	return !ec;
}
