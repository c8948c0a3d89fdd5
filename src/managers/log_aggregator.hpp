#pragma once

#include <chrono>
#include <ostream>
#include <string>
#include <core/cancel_token.hpp>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <cluster/cluster_client.hpp>
#include <cluster/pod_readiness.hpp>
#include "muter.hpp"
#include "pod_locator.hpp"

struct AggregatorOptions {
    int retry_limit = DEFAULT_RETRY_LIMIT;
    std::chrono::milliseconds retry_delay{DEFAULT_RETRY_DELAY_MS};
    ReadinessCheck readiness = make_readiness_check(ReadinessOptions{});
    StreamOpener opener = default_stream_opener();
};

// Streams the logs of the first container running a given image to one
// output, retrying the whole locate-and-stream sequence on failure.
//
// One aggregator per watched image. Mute state lives here, so it survives
// retries and reconnects. The output is owned by the caller and must outlive
// the aggregator.
class LogAggregator : public Muter {
public:
    explicit LogAggregator(std::ostream& output, AggregatorOptions opts = AggregatorOptions{});

    // Best effort: up to retry_limit attempts, retry_delay apart. Returns
    // after the first attempt whose stream ends cleanly, after the last
    // failed attempt, or once `cancel` fires. Errors are logged, never
    // returned.
    void stream_logs(ClusterClient& client, const std::string& image,
                     CancelToken* cancel = nullptr);

    // A single locate-and-stream attempt.
    Result<void> stream_once(ClusterClient& client, const std::string& image,
                             CancelToken* cancel = nullptr);

    std::chrono::system_clock::time_point creation_time() const { return creation_time_; }
    int retry_limit() const { return opts_.retry_limit; }
    std::chrono::milliseconds retry_delay() const { return opts_.retry_delay; }

private:
    std::chrono::system_clock::time_point creation_time_;
    std::ostream& output_;
    AggregatorOptions opts_;
    PodLocator locator_;
};
