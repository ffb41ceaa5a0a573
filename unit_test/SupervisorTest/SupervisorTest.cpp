/*
 * SupervisorTest.cpp
 *
 *  Created on: 2026年10月18日
 *      Author: judgebox
 */

#define BOOST_TEST_MODULE SupervisorTest

#include <algorithm>
#include <chrono>
#include <csignal>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h>

#include <boost/test/unit_test.hpp>
#include <boost/filesystem.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>
#include <nlohmann/json.hpp>

#include "Reaper.hpp"
#include "ResourceLimiter.hpp"
#include "Supervision.hpp"
#include "Workspace.hpp"

std::ofstream log_fp("/dev/null");

using namespace kerbal::compatibility::chrono_suffix;
using kerbal::utility::Byte;
using kerbal::utility::KB;

namespace
{
	struct SubreaperFixture
	{
			SubreaperFixture()
			{
				Reaper::become_subreaper();
			}
	};

	struct SupervisorFixture
	{
			Settings settings;
			boost::filesystem::path dir;
			std::ostringstream out;

			SupervisorFixture() :
					dir(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("judgebox-test-%%%%%%%%"))
			{
				settings.build.flags = {"-O2", "-std=gnu++17"};
				settings.sandbox.isolate_network = false;
				settings.sandbox.chroot = false;
				settings.sandbox.judger_uid = -1;
				settings.sandbox.judger_gid = -1;
				settings.runtime.workspace_root = dir;
				settings.run.limits.set_max_cpu_time(1_s)
									.set_max_real_time(3_s)
									.set_max_memory(KB(256 * 1024))
									.set_max_output_size(Byte(1024 * 1024));
			}

			~SupervisorFixture()
			{
				remove_directory(dir);
			}

			Submission submission(const std::string & source, const Limits & limits = Limits()) const
			{
				return Submission("test", source, "", limits);
			}

			/**
			 * @brief 输出必须恰好是一行 json
			 */
			nlohmann::json emitted() const
			{
				const std::string text = out.str();
				BOOST_REQUIRE(!text.empty());
				BOOST_REQUIRE_EQUAL(std::count(text.begin(), text.end(), '\n'), 1);
				BOOST_REQUIRE_EQUAL(text.back(), '\n');
				nlohmann::json json_obj = nlohmann::json::parse(text, nullptr, false);
				BOOST_REQUIRE(!json_obj.is_discarded());
				return json_obj;
			}

			bool workspace_removed() const
			{
				return !boost::filesystem::exists(dir / ("job-" + std::to_string(getpid())));
			}
	};
}

BOOST_GLOBAL_FIXTURE(SubreaperFixture);

BOOST_FIXTURE_TEST_SUITE(supervisor, SupervisorFixture)

BOOST_AUTO_TEST_CASE(accepted_emits_one_line)
{
	int ret = supervise(settings, submission(R"(
#include <cstdio>
int main()
{
	std::printf("Hello");
	return 0;
}
)"), out);
	BOOST_CHECK_EQUAL(ret, 0);
	nlohmann::json json_obj = emitted();
	BOOST_CHECK_EQUAL(json_obj["verdict"].get<std::string>(), "Accepted");
	BOOST_CHECK_EQUAL(json_obj["stdout"].get<std::string>(), "Hello");
	BOOST_CHECK(VerdictReporter::parse_verdict(out.str()) == Verdict::ACCEPTED);
	BOOST_CHECK(workspace_removed());
}

BOOST_AUTO_TEST_CASE(compile_error_exits_with_ten)
{
	int ret = supervise(settings, submission("int main() { return }"), out);
	BOOST_CHECK_EQUAL(ret, 10);
	nlohmann::json json_obj = emitted();
	BOOST_CHECK_EQUAL(json_obj["verdict"].get<std::string>(), "CompileError");
	BOOST_CHECK(!json_obj["compiler_output"].get<std::string>().empty());
	BOOST_CHECK(workspace_removed());
}

BOOST_AUTO_TEST_CASE(pipeline_without_verdict_is_internal_error)
{
	int ret = supervise(settings, submission("int main() {}"), out, [](const boost::filesystem::path &) -> VerdictReport {
		_exit(3);
	});
	BOOST_CHECK_EQUAL(ret, 15);
	nlohmann::json json_obj = emitted();
	BOOST_CHECK_EQUAL(json_obj["verdict"].get<std::string>(), "InternalError");
	BOOST_CHECK_NE(json_obj["detail"].get<std::string>().find("status: 3"), std::string::npos);
	BOOST_CHECK(workspace_removed());
}

BOOST_AUTO_TEST_CASE(keep_workspace_leaves_verdict_file)
{
	settings.runtime.keep_workspace = true;
	int ret = supervise(settings, submission("int main() { return 0; }"), out);
	BOOST_CHECK_EQUAL(ret, 0);
	emitted();
	BOOST_CHECK(boost::filesystem::exists(dir / ("job-" + std::to_string(getpid())) / "verdict.json"));
}

BOOST_AUTO_TEST_CASE(termination_signal_cancels_the_run)
{
	Limits limits;
	limits.set_max_cpu_time(10_s).set_max_real_time(20_s);

	std::thread killer([]() {
		std::this_thread::sleep_for(1500_ms);
		::kill(getpid(), SIGTERM);
	});

	auto start = std::chrono::steady_clock::now();
	int ret = supervise(settings, submission(R"(
#include <unistd.h>
int main()
{
	sleep(30);
	return 0;
}
)", limits), out);
	auto elapsed = std::chrono::steady_clock::now() - start;
	killer.join();

	BOOST_CHECK_EQUAL(ret, 15);
	nlohmann::json json_obj = emitted();
	BOOST_CHECK_EQUAL(json_obj["verdict"].get<std::string>(), "InternalError");
	BOOST_CHECK_EQUAL(json_obj["detail"].get<std::string>(), "cancelled");
	BOOST_CHECK(elapsed < std::chrono::seconds(15));
	BOOST_CHECK(workspace_removed());
}

BOOST_AUTO_TEST_SUITE_END()
