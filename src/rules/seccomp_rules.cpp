#include <seccomp.h>
#include <sys/types.h>
#include <sys/socket.h>

#include "seccomp_rules.hpp"

RunnerError deny_network_seccomp_rules(const Config & _config)
{
	(void) _config;

	scmp_filter_ctx ctx = NULL;
	// load seccomp rules
	ctx = seccomp_init(SCMP_ACT_ALLOW);
	if (!ctx) {
		return RunnerError::LOAD_SECCOMP_FAILED;
	}
	// 只保留 AF_UNIX, 其余地址族的 socket 一律禁止. fork 不受限制, 由 RLIMIT_NPROC 与 reaper 约束
	if (seccomp_rule_add(ctx, SCMP_ACT_KILL, SCMP_SYS(socket), 1, SCMP_A0(SCMP_CMP_NE, AF_UNIX)) != 0) {
		seccomp_release(ctx);
		return RunnerError::LOAD_SECCOMP_FAILED;
	}
	if (seccomp_load(ctx) != 0) {
		seccomp_release(ctx);
		return RunnerError::LOAD_SECCOMP_FAILED;
	}
	seccomp_release(ctx);
	return RunnerError::SUCCESS;
}
