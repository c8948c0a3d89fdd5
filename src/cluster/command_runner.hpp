#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "byte_stream.hpp"

// Executes a command (argv[0] is the program) somewhere: locally, or on a
// remote host.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Run to completion and return stdout. A non-zero exit is an error
    // carrying the command's stderr.
    virtual Result<std::string> run(const std::vector<std::string>& argv,
                                    int timeout_secs) = 0;

    // Start a long-running command and stream its stdout.
    virtual Result<std::unique_ptr<ByteStream>> open_stream(
        const std::vector<std::string>& argv) = 0;

    // Short label for diagnostics ("local", "user@bastion").
    virtual std::string describe() const = 0;
};
