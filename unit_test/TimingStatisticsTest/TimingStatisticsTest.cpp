/*
 * TimingStatisticsTest.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#define BOOST_TEST_MODULE TimingStatisticsTest

#include <fstream>

#include <boost/test/unit_test.hpp>

#include "TimingStatistics.hpp"

std::ofstream log_fp("/dev/null");

BOOST_AUTO_TEST_CASE(percentile_interpolates_linearly)
{
	const std::vector<double> sorted = { 10, 20, 30, 40, 50 };
	BOOST_CHECK_CLOSE(percentile(sorted, 50), 30.0, 1e-9);
	BOOST_CHECK_CLOSE(percentile(sorted, 10), 14.0, 1e-9);
	BOOST_CHECK_CLOSE(percentile(sorted, 90), 46.0, 1e-9);
	BOOST_CHECK_CLOSE(percentile(sorted, 0), 10.0, 1e-9);
	BOOST_CHECK_CLOSE(percentile(sorted, 100), 50.0, 1e-9);
	BOOST_CHECK_CLOSE(percentile({ 7 }, 90), 7.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(spread_samples_are_unstable)
{
	TimingStatistics timing;
	for (int ms : { 50, 10, 40, 20, 30 }) {
		timing.add_run(TerminationReason::COMPLETED, 0, std::chrono::milliseconds(ms));
	}
	timing.compute();
	BOOST_CHECK_CLOSE(timing.median, 30.0, 1e-9);
	BOOST_CHECK_CLOSE(timing.iqr, 20.0, 1e-9);
	BOOST_CHECK(timing.stability == TimingStability::UNSTABLE);
	BOOST_CHECK_EQUAL(timing.counts[TerminationReason::COMPLETED], 5);
}

BOOST_AUTO_TEST_CASE(close_samples_are_stable)
{
	TimingStatistics timing;
	for (int ms : { 100, 100, 101, 100, 102 }) {
		timing.add_run(TerminationReason::COMPLETED, 0, std::chrono::milliseconds(ms));
	}
	timing.compute();
	BOOST_CHECK_CLOSE(timing.median, 100.0, 1e-9);
	BOOST_CHECK_CLOSE(timing.iqr, 1.0, 1e-9);
	BOOST_CHECK(timing.stability == TimingStability::STABLE);
}

BOOST_AUTO_TEST_CASE(failed_runs_are_counted_but_not_sampled)
{
	TimingStatistics timing;
	timing.add_run(TerminationReason::CPU_LIMIT_EXCEEDED, 0, std::chrono::milliseconds(1500));
	timing.add_run(TerminationReason::COMPLETED, 1, std::chrono::milliseconds(10));
	timing.compute();
	BOOST_CHECK(timing.samples.empty());
	BOOST_CHECK(timing.stability == TimingStability::NO_SUCCESS);
	BOOST_CHECK_EQUAL(timing.counts[TerminationReason::CPU_LIMIT_EXCEEDED], 1);
	BOOST_CHECK_EQUAL(timing.counts[TerminationReason::COMPLETED], 1);
	BOOST_CHECK_EQUAL(getTimingStabilityName(timing.stability), "no_success");
}
