/*
 * TimingStatistics.hpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#ifndef SRC_SUPERVISOR_TIMINGSTATISTICS_HPP_
#define SRC_SUPERVISOR_TIMINGSTATISTICS_HPP_

#include <chrono>
#include <iostream>
#include <map>
#include <vector>

#include "united_resource.hpp"

enum class TimingStability
{
	STABLE, UNSTABLE, NO_SUCCESS
};

const char * getTimingStabilityName(TimingStability stability);

std::ostream& operator<<(std::ostream& out, TimingStability stability);

/**
 * @brief 线性插值的百分位数
 * @param sorted_samples 已升序排列的样本, 不得为空
 * @param p 百分比, [0, 100]
 */
double percentile(const std::vector<double> & sorted_samples, double p);

/**
 * @brief 多次测量同一程序得到的墙上时间统计. 只有干净结束 (Completed 且退出代码为 0) 的运行计入样本
 */
class TimingStatistics
{
	public:
		std::vector<double> samples; ///< 单位为 ms
		std::map<TerminationReason, int> counts; ///< 每种终止原因出现的次数
		double median;
		double p10;
		double p90;
		double iqr;
		TimingStability stability;

		TimingStatistics();

		void add_run(TerminationReason reason, int exit_code, std::chrono::milliseconds real_time);

		/**
		 * @brief 根据已加入的样本计算中位数, p10, p90, IQR 与稳定性. IQR 不超过中位数的 5% 视为稳定
		 */
		void compute();

		friend std::ostream& operator<<(std::ostream& out, const TimingStatistics & src);
};

#endif /* SRC_SUPERVISOR_TIMINGSTATISTICS_HPP_ */
