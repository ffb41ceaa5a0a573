#ifndef JUDGEBOX_SECCOMP_RULES_H
#define JUDGEBOX_SECCOMP_RULES_H

#include "../supervisor/Config.hpp"
#include "../shared_src/united_resource.hpp"

RunnerError deny_network_seccomp_rules(const Config & _config);

#endif //JUDGEBOX_SECCOMP_RULES_H
