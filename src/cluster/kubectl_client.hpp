#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "cluster_client.hpp"
#include "command_runner.hpp"

// ClusterClient backed by the kubectl binary. Output is requested as
// tab-separated jsonpath so it can be parsed without a JSON library.
class KubectlClient : public ClusterClient {
public:
    KubectlClient(const KubectlConfig& config, std::shared_ptr<CommandRunner> runner);

    Result<std::vector<Pod>> list_pods(const std::string& ns) override;
    Result<PodStatus> pod_status(const std::string& ns, const std::string& name) override;
    Result<std::unique_ptr<ByteStream>> stream_logs(const LogRequest& req) override;

    // Command builders
    std::vector<std::string> list_pods_argv(const std::string& ns) const;
    std::vector<std::string> pod_status_argv(const std::string& ns, const std::string& name) const;
    std::vector<std::string> logs_argv(const LogRequest& req) const;

    // Output parsers
    static Result<std::vector<Pod>> parse_pod_list(const std::string& output);
    static Result<PodStatus> parse_pod_status(const std::string& output);

private:
    std::vector<std::string> base_argv() const;

    KubectlConfig config_;
    std::shared_ptr<CommandRunner> runner_;
};
