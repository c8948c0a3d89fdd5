#pragma once

#include <memory>
#include <core/cancel_token.hpp>
#include <cluster/command_runner.hpp>
#include "session.hpp"

// Runs commands on the bastion host, one exec channel per command. The SSH
// session is opened on first use and re-opened after it drops. When given a
// token, run() aborts the command once it is cancelled.
class SshRunner : public CommandRunner {
public:
    explicit SshRunner(const BastionConfig& config, const CancelToken* cancel = nullptr);

    Result<std::string> run(const std::vector<std::string>& argv,
                            int timeout_secs) override;

    Result<std::unique_ptr<ByteStream>> open_stream(
        const std::vector<std::string>& argv) override;

    std::string describe() const override;

private:
    Result<ExecChannel> start(const std::vector<std::string>& argv);

    BastionConfig config_;
    std::shared_ptr<SessionManager> session_;
    const CancelToken* cancel_;
};
