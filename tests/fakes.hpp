#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <cluster/byte_stream.hpp>
#include <cluster/cluster_client.hpp>
#include <cluster/command_runner.hpp>

// Hands out pre-scripted chunks, one per read(). After the last chunk it
// reports `error` if set, blocks until cancel() if `block_at_end`, or ends.
class ScriptedStream : public ByteStream {
public:
    explicit ScriptedStream(std::vector<std::string> chunks,
                            std::string error = "",
                            bool block_at_end = false)
        : chunks_(std::move(chunks)), error_(std::move(error)), block_at_end_(block_at_end) {}

    // Called with the chunk index just before that chunk is returned
    std::function<void(size_t)> on_chunk;

    Result<size_t> read(char* buf, size_t len) override {
        if (cancelled_) return Result<size_t>::Ok(0);

        if (next_ < chunks_.size()) {
            if (offset_ == 0 && on_chunk) on_chunk(next_);
            const std::string& chunk = chunks_[next_];
            size_t n = std::min(len, chunk.size() - offset_);
            chunk.copy(buf, n, offset_);
            offset_ += n;
            if (offset_ >= chunk.size()) {
                next_++;
                offset_ = 0;
            }
            return Result<size_t>::Ok(n);
        }

        if (!error_.empty()) return Result<size_t>::Err(error_);

        if (block_at_end_) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return cancelled_.load(); });
        }
        return Result<size_t>::Ok(0);
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        *cancel_seen = true;
        cv_.notify_all();
    }

    // Outlives the stream, for callers that hand ownership away
    std::shared_ptr<std::atomic<bool>> cancel_seen = std::make_shared<std::atomic<bool>>(false);

private:
    std::vector<std::string> chunks_;
    std::string error_;
    bool block_at_end_;
    size_t next_ = 0;
    size_t offset_ = 0;
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

inline Pod make_pod(const std::string& ns, const std::string& name,
                    std::vector<Container> containers) {
    Pod p;
    p.pod_namespace = ns;
    p.name = name;
    p.containers = std::move(containers);
    return p;
}

class FakeClusterClient : public ClusterClient {
public:
    Result<std::vector<Pod>> pods = Result<std::vector<Pod>>::Ok({});

    // Returned in order; the last one repeats
    std::vector<Result<PodStatus>> statuses;

    // Used by stream_logs(); a null handler is an error
    std::function<Result<std::unique_ptr<ByteStream>>(const LogRequest&)> on_stream;

    int list_calls = 0;
    int status_calls = 0;
    std::vector<std::string> listed_namespaces;
    std::vector<LogRequest> log_requests;

    Result<std::vector<Pod>> list_pods(const std::string& ns) override {
        list_calls++;
        listed_namespaces.push_back(ns);
        return pods;
    }

    Result<PodStatus> pod_status(const std::string&, const std::string&) override {
        size_t i = static_cast<size_t>(status_calls++);
        if (statuses.empty()) return Result<PodStatus>::Err("no status scripted");
        return statuses[std::min(i, statuses.size() - 1)];
    }

    Result<std::unique_ptr<ByteStream>> stream_logs(const LogRequest& req) override {
        log_requests.push_back(req);
        if (!on_stream) return Result<std::unique_ptr<ByteStream>>::Err("no stream scripted");
        return on_stream(req);
    }
};

inline Result<PodStatus> status_of(const std::string& phase, bool ready) {
    PodStatus s;
    s.phase = phase;
    s.ready = ready;
    return Result<PodStatus>::Ok(s);
}

// Records every command and answers from a queue of canned results.
class FakeRunner : public CommandRunner {
public:
    std::vector<Result<std::string>> outputs;
    std::vector<std::vector<std::string>> commands;
    std::vector<int> timeouts;
    std::vector<std::vector<std::string>> streamed;

    Result<std::string> run(const std::vector<std::string>& argv, int timeout_secs) override {
        commands.push_back(argv);
        timeouts.push_back(timeout_secs);
        if (outputs.empty()) return Result<std::string>::Err("no output scripted");
        auto out = outputs.front();
        outputs.erase(outputs.begin());
        return out;
    }

    Result<std::unique_ptr<ByteStream>> open_stream(const std::vector<std::string>& argv) override {
        streamed.push_back(argv);
        return Result<std::unique_ptr<ByteStream>>::Ok(
            std::make_unique<ScriptedStream>(std::vector<std::string>{"line\n"}));
    }

    std::string describe() const override { return "fake"; }
};
