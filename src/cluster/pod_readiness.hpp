#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <core/cancel_token.hpp>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "cluster_client.hpp"

struct ReadinessOptions {
    std::chrono::milliseconds poll_interval{READY_POLL_MS};
    std::chrono::milliseconds timeout{READY_TIMEOUT_SECS * 1000};
};

// Blocks until the pod is ready or can no longer become ready.
using ReadinessCheck = std::function<Result<void>(ClusterClient& client,
                                                  const std::string& ns,
                                                  const std::string& pod,
                                                  CancelToken* cancel)>;

// Polls pod_status() until the pod is Running with Ready=True.
// Fails on a terminal phase (Succeeded/Failed), on timeout, on cancel, or
// when the status query itself fails.
Result<void> wait_for_pod_ready(ClusterClient& client,
                                const std::string& ns,
                                const std::string& pod,
                                const ReadinessOptions& opts,
                                CancelToken* cancel = nullptr);

ReadinessCheck make_readiness_check(ReadinessOptions opts);
