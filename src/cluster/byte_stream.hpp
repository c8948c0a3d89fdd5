#pragma once

#include <cstddef>
#include <core/types.hpp>

// A readable, long-lived byte source such as a followed container log.
// Closed on destruction.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Blocks until at least one byte is available, the stream ends, or it
    // fails. Returns the byte count; 0 means end of stream.
    virtual Result<size_t> read(char* buf, size_t len) = 0;

    // Unblocks a pending read() from another thread; it and every later
    // read() report end of stream.
    virtual void cancel() = 0;
};
