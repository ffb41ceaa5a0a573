/*
 * global_shared_variable.hpp
 *
 *  Created on: 2018年6月15日
 *      Author: peter
 */

#ifndef SRC_SUPERVISOR_GLOBAL_SHARED_VARIABLE_HPP_
#define SRC_SUPERVISOR_GLOBAL_SHARED_VARIABLE_HPP_

#include <fstream>

extern std::ofstream log_fp; ///< 日志文件的文件流, 由可执行文件 (或测试) 定义

#endif /* SRC_SUPERVISOR_GLOBAL_SHARED_VARIABLE_HPP_ */
