#pragma once

#include <chrono>
#include <string>
#include <vector>

// Snapshot of a pod's spec as returned by a listing. Never cached: every
// stream attempt re-lists.
struct Container {
    std::string name;
    std::string image;
};

struct Pod {
    std::string pod_namespace;
    std::string name;
    std::vector<Container> containers;           // spec order
};

struct PodStatus {
    std::string phase;                           // Pending, Running, Succeeded, Failed, Unknown
    bool ready = false;                          // Ready condition is "True"
};

// Parameters for a container log fetch
struct LogRequest {
    std::string pod_namespace;
    std::string pod_name;
    std::string container;
    bool follow = true;
    std::chrono::system_clock::time_point since_time;
};
