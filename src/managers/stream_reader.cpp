#include "stream_reader.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

StreamReader::StreamReader(std::ostream& output, const Muter& muter)
    : output_(output), muter_(muter) {}

Result<void> StreamReader::forward(const std::string& header, ByteStream& stream) {
    std::string pending;
    char buf[STREAM_READ_BUF_SIZE];

    while (true) {
        auto n = stream.read(buf, sizeof(buf));
        if (n.is_err()) {
            return Result<void>::Err(wrap_error("reading bytes from log stream", n.error));
        }
        if (n.value == 0) break;

        pending.append(buf, n.value);

        // Emit every complete line, keep the remainder for the next read
        size_t start = 0;
        size_t nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            if (!muter_.is_muted()) {
                auto w = write_line(header, pending.data() + start, nl - start + 1);
                if (w.is_err()) return w;
            }
            start = nl + 1;
        }
        pending.erase(0, start);
    }

    if (!pending.empty()) {
        logtap_debug(fmt::format("{} dropped {} trailing bytes without newline", header, pending.size()));
    }
    logtap_log(fmt::format("{} exited", header));
    return Result<void>::Ok();
}

Result<void> StreamReader::write_line(const std::string& header, const char* data, size_t len) {
    output_ << header << ' ';
    output_.write(data, static_cast<std::streamsize>(len));
    output_.flush();
    if (!output_) {
        return Result<void>::Err("writing to out");
    }
    return Result<void>::Ok();
}
