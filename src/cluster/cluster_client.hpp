#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "byte_stream.hpp"
#include "types.hpp"

// The slice of the Kubernetes API the log streamer needs.
class ClusterClient {
public:
    virtual ~ClusterClient() = default;

    // List pods in `ns`, or in all namespaces when `ns` is empty.
    // Uninitialized pods are included.
    virtual Result<std::vector<Pod>> list_pods(const std::string& ns) = 0;

    virtual Result<PodStatus> pod_status(const std::string& ns,
                                         const std::string& name) = 0;

    // Open the container log described by `req`.
    virtual Result<std::unique_ptr<ByteStream>> stream_logs(const LogRequest& req) = 0;
};
