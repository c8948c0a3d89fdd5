#pragma once

#include <core/cancel_token.hpp>
#include "command_runner.hpp"

// Runs commands as local child processes (fork/exec with piped output).
// When given a token, run() aborts the command once it is cancelled.
class LocalRunner : public CommandRunner {
public:
    explicit LocalRunner(const CancelToken* cancel = nullptr);

    Result<std::string> run(const std::vector<std::string>& argv,
                            int timeout_secs) override;

    Result<std::unique_ptr<ByteStream>> open_stream(
        const std::vector<std::string>& argv) override;

    std::string describe() const override { return "local"; }

private:
    const CancelToken* cancel_;
};
