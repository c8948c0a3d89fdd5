#include "pod_locator.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

StreamOpener default_stream_opener() {
    return [](ClusterClient& client, const LogRequest& req) {
        return client.stream_logs(req);
    };
}

std::string LocatedStream::header() const {
    return fmt::format("[{} {}]", pod_name, container);
}

PodLocator::PodLocator(ReadinessCheck readiness, StreamOpener opener)
    : readiness_(std::move(readiness)), opener_(std::move(opener)) {}

std::optional<std::pair<const Pod*, const Container*>> PodLocator::find_container(
    const std::vector<Pod>& pods, const std::string& image) {
    for (const auto& p : pods) {
        for (const auto& c : p.containers) {
            logtap_debug(fmt::format("Found container {} with image {}", c.name, c.image));
            if (c.image == image) return std::make_pair(&p, &c);
        }
    }
    return std::nullopt;
}

Result<LocatedStream> PodLocator::locate(ClusterClient& client,
                                         const std::string& image,
                                         std::chrono::system_clock::time_point since,
                                         CancelToken* cancel) {
    using R = Result<LocatedStream>;

    auto pods = client.list_pods("");
    if (pods.is_err()) return R::Err(wrap_error("getting pods", pods.error));

    logtap_log(fmt::format("Looking for logs to stream for {}", image));
    auto match = find_container(pods.value, image);
    if (!match) return R::Err(fmt::format("image {} not found", image));

    const Pod& pod = *match->first;
    const Container& container = *match->second;
    logtap_log(fmt::format("Trying to stream logs from pod: {} container: {}", pod.name, container.name));

    if (readiness_) {
        auto ready = readiness_(client, pod.pod_namespace, pod.name, cancel);
        if (ready.is_err()) return R::Err(wrap_error("waiting for pod ready", ready.error));
    }

    LogRequest req;
    req.pod_namespace = pod.pod_namespace;
    req.pod_name = pod.name;
    req.container = container.name;
    req.follow = true;
    req.since_time = since;

    auto stream = opener_(client, req);
    if (stream.is_err()) {
        return R::Err(wrap_error("setting up container log stream", stream.error));
    }
    if (!stream.value) return R::Err("setting up container log stream: no stream returned");

    LocatedStream located;
    located.pod_namespace = pod.pod_namespace;
    located.pod_name = pod.name;
    located.container = container.name;
    located.stream = std::move(stream.value);
    return R::Ok(std::move(located));
}
