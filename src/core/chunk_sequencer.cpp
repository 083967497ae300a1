/**
 * @file chunk_sequencer.cpp
 * @brief Implementation of lazy chunk splitting
 */

#include <kcenon/blob_transfer/core/chunk_sequencer.h>

#include <kcenon/blob_transfer/core/logging.h>

#include <algorithm>

namespace kcenon::blob_transfer {

chunk_sequencer::chunk_sequencer(source_stream& source,
                                 uint32_t chunk_size,
                                 std::optional<uint64_t> total_length,
                                 chunk_encryptor* encryptor,
                                 uint64_t base_offset)
    : source_(source),
      chunk_size_(chunk_size),
      total_length_(total_length),
      encryptor_(encryptor),
      next_offset_(base_offset) {
    if (chunk_size_ == 0) {
        pending_error_ = error{error_code::invalid_argument, "chunk size must be greater than zero"};
        finished_ = true;
    }
}

auto chunk_sequencer::has_next() -> bool {
    prime();
    return pending_.has_value() || pending_error_.has_value();
}

auto chunk_sequencer::next() -> result<chunk> {
    prime();

    if (pending_error_) {
        auto err = std::move(*pending_error_);
        pending_error_.reset();
        return unexpected(std::move(err));
    }

    if (!pending_) {
        return unexpected(error{error_code::invalid_state, "no more chunks available"});
    }

    chunk c = std::move(*pending_);
    pending_.reset();
    ++emitted_;
    return c;
}

auto chunk_sequencer::read_block() -> result<byte_buffer> {
    uint64_t want = chunk_size_;
    if (total_length_) {
        want = std::min<uint64_t>(want, *total_length_ - std::min(consumed_, *total_length_));
    }

    byte_buffer block(static_cast<std::size_t>(want));
    std::size_t filled = 0;
    while (filled < block.size()) {
        auto got = source_.read(std::span<std::byte>(block.data() + filled, block.size() - filled));
        if (!got) {
            return unexpected(error{error_code::source_read_error, got.error().message,
                                    consumed_ + filled});
        }
        if (got.value() == 0) {
            break;
        }
        filled += got.value();
    }

    block.resize(filled);
    consumed_ += filled;
    return block;
}

auto chunk_sequencer::encode(byte_buffer raw, bool final_chunk) -> result<byte_buffer> {
    if (!encryptor_) {
        return raw;
    }

    auto body = encryptor_->update(raw);
    if (!body) {
        return unexpected(body.error());
    }
    if (!final_chunk) {
        return body;
    }

    if (finalized_) {
        return unexpected(error{error_code::encoding_error, "encryptor already finalized"});
    }
    finalized_ = true;

    auto tail = encryptor_->finalize();
    if (!tail) {
        return unexpected(tail.error());
    }

    auto payload = std::move(body.value());
    payload.insert(payload.end(), tail.value().begin(), tail.value().end());
    return payload;
}

void chunk_sequencer::prime() {
    while (!pending_ && !pending_error_ && !finished_) {
        byte_buffer raw;
        if (lookahead_) {
            raw = std::move(*lookahead_);
            lookahead_.reset();
        } else {
            auto block = read_block();
            if (!block) {
                BT_LOG_ERROR(log_category::sequencer, block.error().message);
                pending_error_ = block.error();
                finished_ = true;
                return;
            }
            raw = std::move(block.value());
        }

        bool final_chunk = false;
        if (raw.size() < chunk_size_) {
            final_chunk = true;
        } else if (total_length_) {
            final_chunk = consumed_ >= *total_length_;
        } else {
            auto ahead = read_block();
            if (!ahead) {
                BT_LOG_ERROR(log_category::sequencer, ahead.error().message);
                pending_error_ = ahead.error();
                finished_ = true;
                return;
            }
            final_chunk = ahead.value().empty();
            if (!final_chunk) {
                lookahead_ = std::move(ahead.value());
            }
        }

        auto payload = encode(std::move(raw), final_chunk);
        if (!payload) {
            BT_LOG_ERROR(log_category::sequencer, payload.error().message);
            pending_error_ = error{payload.error().code, payload.error().message, next_offset_};
            finished_ = true;
            return;
        }

        if (final_chunk) {
            finished_ = true;
        }

        // Block-cipher buffering can leave a chunk with nothing to send
        if (payload.value().empty()) {
            continue;
        }

        auto size = payload.value().size();
        pending_.emplace(next_index_++, next_offset_, std::move(payload.value()), final_chunk);
        next_offset_ += size;
    }
}

}  // namespace kcenon::blob_transfer
