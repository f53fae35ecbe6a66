#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mediaframes {

// A running external process whose stdout is read by the caller.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    // Reads up to size bytes from stdout. Returns 0 at end of stream.
    virtual size_t read(uint8_t* buffer, size_t size) = 0;

    // Exit status, or nullopt if the process is still running after timeout.
    virtual std::optional<int> wait_for(std::chrono::milliseconds timeout) = 0;

    // Everything the process wrote to stderr so far.
    virtual std::string error_output() = 0;

    // Kills the process if it is still running and reaps it.
    virtual void terminate() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    virtual std::unique_ptr<ChildProcess> launch(const std::vector<std::string>& args,
                                                 int stdin_fd) = 0;
};

// fork/exec based launcher. stdout is a pipe, stderr is captured to an
// unlinked temporary file.
class PosixProcessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ChildProcess> launch(const std::vector<std::string>& args,
                                         int stdin_fd) override;
};

} // namespace mediaframes
