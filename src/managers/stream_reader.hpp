#pragma once

#include <ostream>
#include <string>
#include <core/types.hpp>
#include <cluster/byte_stream.hpp>
#include "muter.hpp"

// Splits a byte stream into lines and writes each one to the sink as
// "<header> <line>", unless the muter is muted at that moment. Muted lines
// are dropped, not queued.
class StreamReader {
public:
    StreamReader(std::ostream& output, const Muter& muter);

    // Runs until end of stream (success) or a read/write error.
    // A trailing fragment with no newline at end of stream is not forwarded.
    Result<void> forward(const std::string& header, ByteStream& stream);

private:
    Result<void> write_line(const std::string& header, const char* data, size_t len);

    std::ostream& output_;
    const Muter& muter_;
};
