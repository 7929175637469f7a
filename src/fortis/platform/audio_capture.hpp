#pragma once

#include "audio_chunk.hpp"
#include "error.hpp"

#include <expected>

// Hardware side of the capture source. Implementations deliver raw S16_LE
// samples from their real-time callback into the ring buffer they were
// constructed with and must not block or allocate there.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual std::expected<void, Error> open(const DeviceDescriptor& device,
                                            const CaptureFormat& format) = 0;
    virtual void close() = 0;
    virtual bool is_capturing() const = 0;
};
