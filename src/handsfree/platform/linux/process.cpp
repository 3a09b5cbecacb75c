#include "platform/linux/process.hpp"

#include <cerrno>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

std::expected<void, Error> run_process(const std::vector<std::string>& argv) {
    if (argv.empty()) return fail(ErrorKind::InjectionFailure, "empty command line");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return fail(ErrorKind::InjectionFailure, std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return fail(ErrorKind::InjectionFailure, std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return fail(ErrorKind::InjectionFailure, argv[0] + " not found");
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return fail(ErrorKind::InjectionFailure,
                    argv[0] + " exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status)) {
        return fail(ErrorKind::InjectionFailure,
                    argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return {};
}
