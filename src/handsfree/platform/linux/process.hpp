#pragma once

#include "error.hpp"

#include <expected>
#include <string>
#include <vector>

// fork/exec argv[0] from PATH and wait for it. A non-zero exit status or a
// missing binary fails with InjectionFailure.
std::expected<void, Error> run_process(const std::vector<std::string>& argv);
