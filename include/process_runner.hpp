#pragma once

#include <string>
#include <vector>

namespace dictate {

struct ProcessResult {
    bool launched = false;      // false if fork/exec itself failed
    int exit_status = -1;       // exit code, or 128 + signal
    std::string output;         // stdout and stderr, interleaved
    std::string error;
};

// Runs a program to completion
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const std::string& executable, const std::vector<std::string>& arguments) = 0;
};

// fork/execv with one pipe shared by stdout and stderr
class SystemProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::string& executable, const std::vector<std::string>& arguments) override;
};

} // namespace dictate
