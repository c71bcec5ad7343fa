#pragma once

#if !defined(__unix__) && !defined(__APPLE__)
#   error "Error, unsupported platform"
#endif

#include <string>
#include <utility>
#include <vector>

namespace avr::native
{
    /**
     * Configures terminal settings for the current platform.
     * This is primarily used to ensure UTF-8 compatible console output,
     * ancillary questions are frequently non-ASCII.
     *
     * @return true if terminal configuration succeeded or was not required.
     * @return false if terminal configuration failed.
     */
    bool configureTerminal();

    /**
     * Spawns a new process and waits for it to finish.
     * The command is looked up in PATH, no shell is involved.
     *
     * @param command The command to execute in the new process
     * @param args The arguments to pass to the command
     * @return exit code and the captured standard output
     * @throws std::runtime_error when the process cannot be spawned
     */
    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args = {});
}
