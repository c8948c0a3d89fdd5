#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/cancel_token.hpp>
#include <core/types.hpp>
#include <cluster/cluster_client.hpp>
#include <cluster/pod_readiness.hpp>

// Opens the byte stream for a log request. Injected so tests can hand back
// scripted streams.
using StreamOpener = std::function<Result<std::unique_ptr<ByteStream>>(
    ClusterClient& client, const LogRequest& req)>;

// Default opener: ClusterClient::stream_logs().
StreamOpener default_stream_opener();

// The container picked for streaming, with its open log stream.
struct LocatedStream {
    std::string pod_namespace;
    std::string pod_name;
    std::string container;
    std::unique_ptr<ByteStream> stream;

    // "[<pod> <container>]"
    std::string header() const;
};

// Finds the first container running `image` across the cluster and opens a
// following log stream on it.
class PodLocator {
public:
    PodLocator(ReadinessCheck readiness, StreamOpener opener);

    // First match in listing order (pods), then spec order (containers).
    // Exact string comparison on the image reference.
    static std::optional<std::pair<const Pod*, const Container*>> find_container(
        const std::vector<Pod>& pods, const std::string& image);

    // List -> match -> wait ready -> open. Every failure is wrapped with the
    // step that produced it; a missing image is "image <image> not found".
    Result<LocatedStream> locate(ClusterClient& client,
                                 const std::string& image,
                                 std::chrono::system_clock::time_point since,
                                 CancelToken* cancel = nullptr);

private:
    ReadinessCheck readiness_;
    StreamOpener opener_;
};
