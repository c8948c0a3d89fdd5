#include "log_aggregator.hpp"
#include "stream_reader.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <thread>

LogAggregator::LogAggregator(std::ostream& output, AggregatorOptions opts)
    : creation_time_(std::chrono::system_clock::now()),
      output_(output),
      opts_(std::move(opts)),
      locator_(opts_.readiness, opts_.opener) {
    opts_.retry_limit = std::max(1, opts_.retry_limit);
    opts_.retry_delay = std::max(std::chrono::milliseconds(0), opts_.retry_delay);
}

void LogAggregator::stream_logs(ClusterClient& client, const std::string& image,
                                CancelToken* cancel) {
    for (int i = 0; i < opts_.retry_limit; i++) {
        if (cancel && cancel->cancelled()) {
            logtap_log(fmt::format("Streaming {} cancelled", image));
            return;
        }

        auto result = stream_once(client, image, cancel);
        if (result.is_ok()) return;

        logtap_log(fmt::format("Error getting logs ({}/{}): {}", i + 1, opts_.retry_limit, result.error));

        // No pause after the final attempt
        if (i + 1 >= opts_.retry_limit) break;
        if (cancel) {
            if (cancel->wait_for(opts_.retry_delay)) {
                logtap_log(fmt::format("Streaming {} cancelled", image));
                return;
            }
        } else {
            std::this_thread::sleep_for(opts_.retry_delay);
        }
    }

    logtap_log(fmt::format("Giving up on {} after {} attempts", image, opts_.retry_limit));
}

Result<void> LogAggregator::stream_once(ClusterClient& client, const std::string& image,
                                        CancelToken* cancel) {
    auto located = locator_.locate(client, image, creation_time_, cancel);
    if (located.is_err()) return Result<void>::Err(located.error);

    ByteStream& stream = *located.value.stream;
    if (cancel) cancel->set_hook([&stream] { stream.cancel(); });

    StreamReader reader(output_, *this);
    auto result = reader.forward(located.value.header(), stream);

    if (cancel) cancel->clear_hook();

    if (result.is_err()) return Result<void>::Err(wrap_error("streaming request", result.error));
    return Result<void>::Ok();
}
