#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <system_error>
#include <vector>
#include "codec.hpp"
#include "error.hpp"
#include "header.hpp"
#include "packet.hpp"

namespace byteframe {

// How far to skip after a frame whose checksum did not match.
enum class ResyncPolicy : uint8_t {
    SKIP_HEADER = 0,   // drop the 9 header bytes, rescan the payload
    SKIP_FRAME  = 1    // drop header and declared payload
};

struct DecoderConfig {
    size_t max_payload{kMaxPayloadLen};
    ResyncPolicy on_checksum_mismatch{ResyncPolicy::SKIP_HEADER};
    // Emit a DESYNCHRONIZED event for every byte skipped while searching.
    bool report_desync{false};
    // Consumed prefix size above which the buffer is compacted.
    size_t compact_threshold{4096};
};

struct DecoderStats {
    uint64_t packets{0};
    uint64_t bytes_skipped{0};
    uint64_t checksum_errors{0};
    uint64_t opcode_errors{0};
    uint64_t malformed_errors{0};
    uint64_t oversize_errors{0};
};

// Either a decoded packet (ec is clear) or a per-frame error.
struct DecodeEvent {
    std::error_code ec;
    Packet packet;

    bool ok() const { return !ec; }
};

// Incremental decoder for one byte stream. Not thread safe; use one
// instance per stream.
class FrameDecoder {
public:
    enum class State : uint8_t {
        SEARCHING,
        HEADER_PENDING,
        PAYLOAD_PENDING,
        COMPLETE
    };

    FrameDecoder() = default;
    explicit FrameDecoder(const DecoderConfig& cfg) : cfg_(cfg) {}

    void push(const uint8_t* data, size_t len);
    void push(const std::vector<uint8_t>& chunk) { push(chunk.data(), chunk.size()); }

    // Runs the state machine until one event is available. nullopt means the
    // buffered bytes are not enough to make progress.
    std::optional<DecodeEvent> next();

    // Appends every event currently available; returns how many were added.
    size_t poll(std::vector<DecodeEvent>& out);

    // Bytes held but not yet consumed, i.e. a partial frame or trailing junk.
    size_t buffered() const { return buf_.size() - rd_; }
    State state() const { return state_; }
    const DecoderStats& stats() const { return stats_; }
    const DecoderConfig& config() const { return cfg_; }

    // Drops all buffered bytes and returns to SEARCHING. Stats are kept.
    void reset();

private:
    const uint8_t* cursor() const { return buf_.data() + rd_; }
    void consume(size_t n);
    void compact();
    DecodeEvent error_event(FrameError e);
    void end_skip_run();

    DecoderConfig cfg_;
    DecoderStats stats_;
    State state_{State::SEARCHING};
    std::vector<uint8_t> buf_;
    size_t rd_{0};
    Header hdr_;
    size_t skip_run_{0};
};

const char* state_name(FrameDecoder::State s);

} // namespace byteframe
