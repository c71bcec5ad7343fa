#include "native.h"

#include <cerrno>
#include <clocale>
#include <cstring>
#include <format>
#include <stdexcept>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace avr::native
{
    bool configureTerminal()
    {
        if(std::setlocale(LC_ALL, "") != nullptr)
        {
            return true;
        }
        return std::setlocale(LC_ALL, "C.UTF-8") != nullptr;
    }

    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args)
    {
        int pipe_fds[2];
        if(pipe(pipe_fds) != 0)
        {
            throw std::runtime_error(std::format("pipe failed: {}", std::strerror(errno)));
        }

        std::vector<char *> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char *>(command.c_str()));
        for(std::string & arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        const pid_t pid = fork();
        if(pid < 0)
        {
            close(pipe_fds[0]);
            close(pipe_fds[1]);
            throw std::runtime_error(std::format("fork failed: {}", std::strerror(errno)));
        }

        if(pid == 0)
        {
            dup2(pipe_fds[1], STDOUT_FILENO);
            close(pipe_fds[0]);
            close(pipe_fds[1]);
            execvp(command.c_str(), argv.data());
            _exit(127);
        }

        close(pipe_fds[1]);

        std::string output;
        char buffer[4096];
        while(true)
        {
            const ssize_t count = read(pipe_fds[0], buffer, sizeof(buffer));
            if(count > 0)
            {
                output.append(buffer, static_cast<std::size_t>(count));
                continue;
            }
            if(count < 0 && errno == EINTR)
            {
                continue;
            }
            break;
        }
        close(pipe_fds[0]);

        int status = 0;
        while(waitpid(pid, &status, 0) < 0)
        {
            if(errno != EINTR)
            {
                throw std::runtime_error(std::format("waitpid failed: {}", std::strerror(errno)));
            }
        }

        const int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return {exit_code, std::move(output)};
    }
}
