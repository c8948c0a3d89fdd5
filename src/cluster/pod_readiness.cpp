#include "pod_readiness.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <thread>

Result<void> wait_for_pod_ready(ClusterClient& client,
                                const std::string& ns,
                                const std::string& pod,
                                const ReadinessOptions& opts,
                                CancelToken* cancel) {
    auto deadline = std::chrono::steady_clock::now() + opts.timeout;
    std::string last_phase;

    while (true) {
        if (cancel && cancel->cancelled()) return Result<void>::Err("cancelled");

        auto status = client.pod_status(ns, pod);
        if (status.is_err()) return Result<void>::Err(status.error);

        if (status.value.phase != last_phase) {
            logtap_debug(fmt::format("pod {}/{} phase {} ready={}",
                                     ns, pod, status.value.phase, status.value.ready));
            last_phase = status.value.phase;
        }

        if (status.value.phase == "Running" && status.value.ready) {
            return Result<void>::Ok();
        }
        if (status.value.phase == "Succeeded" || status.value.phase == "Failed") {
            return Result<void>::Err(fmt::format("pod {} already in terminal phase {}",
                                                 pod, status.value.phase));
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return Result<void>::Err(fmt::format("timed out waiting for pod {}", pod));
        }

        auto wait = std::min<std::chrono::milliseconds>(
            opts.poll_interval,
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (cancel) {
            if (cancel->wait_for(wait)) return Result<void>::Err("cancelled");
        } else {
            std::this_thread::sleep_for(wait);
        }
    }
}

ReadinessCheck make_readiness_check(ReadinessOptions opts) {
    return [opts](ClusterClient& client, const std::string& ns,
                  const std::string& pod, CancelToken* cancel) {
        return wait_for_pod_ready(client, ns, pod, opts, cancel);
    };
}
