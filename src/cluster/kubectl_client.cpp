#include "kubectl_client.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

// One line per pod: namespace \t name \t container=image;container=image;
static const char* POD_LIST_TEMPLATE =
    "jsonpath={range .items[*]}{.metadata.namespace}{\"\\t\"}{.metadata.name}{\"\\t\"}"
    "{range .spec.containers[*]}{.name}{\"=\"}{.image}{\";\"}{end}{\"\\n\"}{end}";

// phase \t Ready-condition-status
static const char* POD_STATUS_TEMPLATE =
    "jsonpath={.status.phase}{\"\\t\"}{.status.conditions[?(@.type==\"Ready\")].status}";

KubectlClient::KubectlClient(const KubectlConfig& config, std::shared_ptr<CommandRunner> runner)
    : config_(config), runner_(std::move(runner)) {}

// ── Command builders ────────────────────────────────────────

std::vector<std::string> KubectlClient::base_argv() const {
    std::vector<std::string> argv{config_.path};
    if (!config_.context.empty()) {
        argv.push_back("--context");
        argv.push_back(config_.context);
    }
    if (!config_.kubeconfig.empty()) {
        argv.push_back("--kubeconfig");
        argv.push_back(config_.kubeconfig);
    }
    return argv;
}

std::vector<std::string> KubectlClient::list_pods_argv(const std::string& ns) const {
    auto argv = base_argv();
    argv.push_back("get");
    argv.push_back("pods");
    if (ns.empty()) {
        argv.push_back("--all-namespaces");
    } else {
        argv.push_back("-n");
        argv.push_back(ns);
    }
    argv.push_back("-o");
    argv.push_back(POD_LIST_TEMPLATE);
    return argv;
}

std::vector<std::string> KubectlClient::pod_status_argv(const std::string& ns,
                                                        const std::string& name) const {
    auto argv = base_argv();
    argv.insert(argv.end(), {"get", "pod", name, "-n", ns, "-o", POD_STATUS_TEMPLATE});
    return argv;
}

std::vector<std::string> KubectlClient::logs_argv(const LogRequest& req) const {
    auto argv = base_argv();
    argv.insert(argv.end(), {"logs", req.pod_name, "-n", req.pod_namespace,
                             "-c", req.container,
                             "--since-time=" + format_rfc3339(req.since_time)});
    if (req.follow) argv.push_back("-f");
    return argv;
}

// ── Parsers ─────────────────────────────────────────────────

Result<std::vector<Pod>> KubectlClient::parse_pod_list(const std::string& output) {
    std::vector<Pod> pods;

    for (auto line : split(output, '\n')) {
        // Tabs are field separators here, so only strip CR
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        auto fields = split(line, '\t');
        if (fields.size() < 2 || fields.size() > 3 || fields[0].empty() || fields[1].empty()) {
            return Result<std::vector<Pod>>::Err("malformed pod record: " + line);
        }

        Pod pod;
        pod.pod_namespace = fields[0];
        pod.name = fields[1];
        std::string containers = fields.size() == 3 ? fields[2] : "";
        for (const auto& entry : split(containers, ';')) {
            if (entry.empty()) continue;
            auto eq = entry.find('=');
            if (eq == std::string::npos || eq == 0) {
                return Result<std::vector<Pod>>::Err(
                    fmt::format("malformed container entry in pod {}: {}", pod.name, entry));
            }
            pod.containers.push_back({entry.substr(0, eq), entry.substr(eq + 1)});
        }
        pods.push_back(std::move(pod));
    }

    return Result<std::vector<Pod>>::Ok(std::move(pods));
}

Result<PodStatus> KubectlClient::parse_pod_status(const std::string& output) {
    std::string line = output;
    trim(line);
    if (line.empty()) return Result<PodStatus>::Err("empty pod status");

    auto fields = split(line, '\t');
    PodStatus status;
    status.phase = fields[0];
    trim(status.phase);
    if (fields.size() > 1) {
        std::string ready = fields[1];
        trim(ready);
        status.ready = (ready == "True");
    }
    if (status.phase.empty()) return Result<PodStatus>::Err("pod status has no phase: " + line);
    return Result<PodStatus>::Ok(status);
}

// ── ClusterClient ───────────────────────────────────────────

Result<std::vector<Pod>> KubectlClient::list_pods(const std::string& ns) {
    auto out = runner_->run(list_pods_argv(ns), config_.timeout);
    if (out.is_err()) return Result<std::vector<Pod>>::Err(out.error);

    auto pods = parse_pod_list(out.value);
    if (pods.is_ok()) {
        logtap_debug(fmt::format("kubectl: listed {} pods via {}", pods.value.size(), runner_->describe()));
    }
    return pods;
}

Result<PodStatus> KubectlClient::pod_status(const std::string& ns, const std::string& name) {
    auto out = runner_->run(pod_status_argv(ns, name), config_.timeout);
    if (out.is_err()) return Result<PodStatus>::Err(out.error);
    return parse_pod_status(out.value);
}

Result<std::unique_ptr<ByteStream>> KubectlClient::stream_logs(const LogRequest& req) {
    return runner_->open_stream(logs_argv(req));
}
