#include "frame_decoder.hpp"
#include "logging.hpp"

namespace byteframe {

const char *state_name(FrameDecoder::State s) {
  switch (s) {
  case FrameDecoder::State::SEARCHING:
    return "searching";
  case FrameDecoder::State::HEADER_PENDING:
    return "header-pending";
  case FrameDecoder::State::PAYLOAD_PENDING:
    return "payload-pending";
  case FrameDecoder::State::COMPLETE:
    return "complete";
  }
  return "unknown";
}

void FrameDecoder::push(const uint8_t *data, size_t len) {
  if (len == 0)
    return;
  compact();
  buf_.insert(buf_.end(), data, data + len);
}

void FrameDecoder::consume(size_t n) {
  rd_ += n;
  if (rd_ >= buf_.size()) {
    buf_.clear();
    rd_ = 0;
  }
}

void FrameDecoder::compact() {
  if (rd_ == 0)
    return;
  if (rd_ < cfg_.compact_threshold && rd_ * 2 < buf_.size())
    return;
  buf_.erase(buf_.begin(), buf_.begin() + rd_);
  rd_ = 0;
}

void FrameDecoder::reset() {
  buf_.clear();
  rd_ = 0;
  state_ = State::SEARCHING;
  skip_run_ = 0;
}

DecodeEvent FrameDecoder::error_event(FrameError e) {
  DecodeEvent ev;
  ev.ec = e;
  return ev;
}

void FrameDecoder::end_skip_run() {
  if (skip_run_ == 0)
    return;
  Logger::instance().log(LogLevel::WARN,
                         "resynchronized after skipping %zu bytes", skip_run_);
  skip_run_ = 0;
}

std::optional<DecodeEvent> FrameDecoder::next() {
  for (;;) {
    switch (state_) {
    case State::SEARCHING:
      if (buffered() < kMagicLen)
        return std::nullopt;
      if (is_magic(cursor())) {
        end_skip_run();
        state_ = State::HEADER_PENDING;
        break;
      }
      // slide by one byte so a magic starting inside a false candidate is
      // still found
      consume(1);
      skip_run_++;
      stats_.bytes_skipped++;
      if (cfg_.report_desync)
        return error_event(FrameError::DESYNCHRONIZED);
      break;

    case State::HEADER_PENDING: {
      if (buffered() < kHeaderLen)
        return std::nullopt;
      // magic already matched in SEARCHING
      hdr_ = unpack(cursor());
      if (hdr_.length > cfg_.max_payload) {
        stats_.oversize_errors++;
        Logger::instance().log(LogLevel::DEBUG,
                               "declared length %u above cap %zu, rescanning",
                               (unsigned)hdr_.length, cfg_.max_payload);
        consume(1);
        state_ = State::SEARCHING;
        return error_event(FrameError::PAYLOAD_TOO_LARGE);
      }
      state_ = State::PAYLOAD_PENDING;
      break;
    }

    case State::PAYLOAD_PENDING:
      if (buffered() < kHeaderLen + hdr_.length)
        return std::nullopt;
      state_ = State::COMPLETE;
      break;

    case State::COMPLETE: {
      const size_t frame_len = kHeaderLen + hdr_.length;
      DecodeEvent ev;
      auto pkt = decode_frame(hdr_, cursor() + kHeaderLen, hdr_.length, ev.ec);
      state_ = State::SEARCHING;

      if (ev.ec == FrameError::CHECKSUM_MISMATCH) {
        stats_.checksum_errors++;
        size_t skip =
            cfg_.on_checksum_mismatch == ResyncPolicy::SKIP_FRAME ? frame_len
                                                                  : kHeaderLen;
        Logger::instance().log(
            LogLevel::WARN,
            "checksum mismatch opcode=0x%02x len=%u, discarding %zu bytes",
            (unsigned)hdr_.opcode, (unsigned)hdr_.length, skip);
        consume(skip);
        return ev;
      }

      // checksum verified: the framing is trusted, consume the whole frame
      consume(frame_len);
      if (ev.ec) {
        if (ev.ec == FrameError::UNKNOWN_OPCODE)
          stats_.opcode_errors++;
        else if (ev.ec == FrameError::MALFORMED_PACKET)
          stats_.malformed_errors++;
        Logger::instance().log(LogLevel::WARN, "dropping frame opcode=0x%02x: %s",
                               (unsigned)hdr_.opcode, ev.ec.message().c_str());
        return ev;
      }
      stats_.packets++;
      ev.packet = std::move(*pkt);
      return ev;
    }
    }
  }
}

size_t FrameDecoder::poll(std::vector<DecodeEvent> &out) {
  size_t n = 0;
  while (auto ev = next()) {
    out.push_back(std::move(*ev));
    n++;
  }
  return n;
}

} // namespace byteframe
