/*
 * TimingStatistics.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#include "TimingStatistics.hpp"

#include <algorithm>
#include <cstddef>

const char * getTimingStabilityName(TimingStability stability)
{
	switch (stability) {
		case TimingStability::STABLE:
			return "stable";
		case TimingStability::UNSTABLE:
			return "unstable";
		case TimingStability::NO_SUCCESS:
			return "no_success";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& out, TimingStability stability)
{
	return out << getTimingStabilityName(stability);
}

double percentile(const std::vector<double> & sorted_samples, double p)
{
	if (sorted_samples.size() == 1) {
		return sorted_samples.front();
	}
	const double k = (sorted_samples.size() - 1) * (p / 100.0);
	const std::size_t f = static_cast<std::size_t>(k);
	const std::size_t c = std::min(f + 1, sorted_samples.size() - 1);
	if (f == c) {
		return sorted_samples[f];
	}
	return sorted_samples[f] * (c - k) + sorted_samples[c] * (k - f);
}

TimingStatistics::TimingStatistics() :
		median(0), p10(0), p90(0), iqr(0), stability(TimingStability::NO_SUCCESS)
{
}

void TimingStatistics::add_run(TerminationReason reason, int exit_code, std::chrono::milliseconds real_time)
{
	++counts[reason];
	if (reason == TerminationReason::COMPLETED && exit_code == 0) {
		samples.push_back(static_cast<double>(real_time.count()));
	}
}

void TimingStatistics::compute()
{
	if (samples.empty()) {
		median = p10 = p90 = iqr = 0;
		stability = TimingStability::NO_SUCCESS;
		return;
	}
	std::vector<double> sorted(samples);
	std::sort(sorted.begin(), sorted.end());
	median = percentile(sorted, 50);
	p10 = percentile(sorted, 10);
	p90 = percentile(sorted, 90);
	iqr = percentile(sorted, 75) - percentile(sorted, 25);
	stability = iqr <= 0.05 * median ? TimingStability::STABLE : TimingStability::UNSTABLE;
}

std::ostream& operator<<(std::ostream& out, const TimingStatistics & src)
{
	return out << "runs: " << src.samples.size() << " median: " << src.median << " ms"
			<< " p10: " << src.p10 << " p90: " << src.p90 << " iqr: " << src.iqr
			<< " " << src.stability;
}
