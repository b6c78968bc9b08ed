#pragma once

#include <expected>
#include <map>
#include <string>
#include <sys/types.h>
#include <vector>

// Replaces every "{name}" in each argument with vars[name]. Unknown
// placeholders are left untouched.
std::vector<std::string> expand_placeholders(const std::vector<std::string>& argv,
                                             const std::map<std::string, std::string>& vars);

// Starts argv[0] (PATH lookup) as a detached grandchild so it is never our
// zombie. Returns the grandchild's pid once exec has succeeded.
std::expected<pid_t, std::string> spawn_detached(const std::vector<std::string>& argv);
