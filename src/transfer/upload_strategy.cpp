/**
 * @file upload_strategy.cpp
 * @brief Block, page and append blob upload rules
 */

#include <kcenon/blob_transfer/transfer/upload_strategy.h>

#include <kcenon/blob_transfer/core/checksum.h>
#include <kcenon/blob_transfer/core/logging.h>

#include <iomanip>
#include <sstream>

namespace kcenon::blob_transfer {

namespace {

/**
 * @brief MD5 of the payload when content validation is on
 */
auto content_md5_for(const chunk& c, bool validate_content)
    -> result<std::optional<std::string>> {
    if (!validate_content) {
        return std::optional<std::string>{};
    }
    auto md5 = checksum::md5_base64(std::span<const std::byte>(c.payload));
    if (!md5) {
        return unexpected(error{md5.error().code, md5.error().message, c.offset});
    }
    return std::optional<std::string>{std::move(md5.value())};
}

/**
 * @brief Attach the chunk offset to an endpoint error
 */
auto with_offset(const error& err, uint64_t offset) -> unexpected {
    return unexpected(error{err.code, err.message, offset});
}

}  // namespace

auto block_id_for_offset(uint64_t offset) -> std::string {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(32) << offset;
    return checksum::base64_encode(oss.str());
}

// ============================================================================
// block_blob_uploader
// ============================================================================

block_blob_uploader::block_blob_uploader(remote_blob_endpoint& endpoint,
                                         const transfer_spec& spec)
    : endpoint_(&endpoint), lease_id_(spec.lease_id), validate_content_(spec.validate_content) {}

auto block_blob_uploader::upload(const chunk& c) -> result<commit_token> {
    auto md5 = content_md5_for(c, validate_content_);
    if (!md5) {
        return unexpected(md5.error());
    }

    put_block_request request;
    request.block_id = block_id_for_offset(c.offset);
    request.data = std::span<const std::byte>(c.payload);
    request.content_md5 = std::move(md5.value());
    request.lease_id = lease_id_;

    if (auto staged = endpoint_->put_block(request); !staged) {
        return with_offset(staged.error(), c.offset);
    }

    return commit_token{block_id_token{std::move(request.block_id)}};
}

auto block_blob_uploader::commit(const std::vector<ordered_commit_token>& tokens)
    -> result<commit_outcome> {
    put_block_list_request request;
    request.block_ids.reserve(tokens.size());
    for (const auto& entry : tokens) {
        const auto* id = std::get_if<block_id_token>(&entry.token);
        if (!id) {
            return unexpected(error{error_code::internal_error,
                                    "non-block token in block blob commit", entry.offset});
        }
        request.block_ids.push_back(id->block_id);
    }
    request.lease_id = lease_id_;

    auto committed = endpoint_->put_block_list(request);
    if (!committed) {
        return unexpected(committed.error());
    }
    return commit_outcome{std::move(committed.value().etag),
                          std::move(committed.value().last_modified)};
}

// ============================================================================
// page_blob_uploader
// ============================================================================

page_blob_uploader::page_blob_uploader(remote_blob_endpoint& endpoint,
                                       const transfer_spec& spec,
                                       bool parallel)
    : endpoint_(&endpoint),
      lease_id_(spec.lease_id),
      validate_content_(spec.validate_content),
      chain_etag_(!parallel),
      if_match_(spec.if_match) {
    if (parallel && if_match_) {
        BT_LOG_WARN(log_category::strategy,
                    "if_match precondition is not applied to parallel page uploads");
        if_match_.reset();
    }
}

auto page_blob_uploader::upload(const chunk& c) -> result<commit_token> {
    if (c.offset % transfer_spec::page_alignment != 0) {
        return unexpected(error{error_code::precondition_violation,
                                "page offset is not 512-byte aligned", c.offset});
    }
    if (c.payload.empty() || c.payload.size() % transfer_spec::page_alignment != 0) {
        return unexpected(error{error_code::precondition_violation,
                                "page length is not a positive multiple of 512", c.offset});
    }

    auto md5 = content_md5_for(c, validate_content_);
    if (!md5) {
        return unexpected(md5.error());
    }

    update_page_request request;
    request.range_start = c.offset;
    request.range_end = c.offset + c.payload.size() - 1;
    request.data = std::span<const std::byte>(c.payload);
    if (chain_etag_) {
        request.if_match = if_match_;
    }
    request.content_md5 = std::move(md5.value());
    request.lease_id = lease_id_;

    auto written = endpoint_->update_page(request);
    if (!written) {
        return with_offset(written.error(), c.offset);
    }

    if (chain_etag_) {
        if_match_ = written.value().etag;
    }

    return commit_token{page_commit_token{std::move(written.value().etag),
                                          std::move(written.value().last_modified)}};
}

auto page_blob_uploader::commit(const std::vector<ordered_commit_token>& tokens)
    -> result<commit_outcome> {
    // Pages are durable once written; report the metadata of the last range
    if (tokens.empty()) {
        return commit_outcome{};
    }
    const auto* last = std::get_if<page_commit_token>(&tokens.back().token);
    if (!last) {
        return unexpected(error{error_code::internal_error,
                                "non-page token in page blob commit", tokens.back().offset});
    }
    return commit_outcome{last->etag, last->last_modified};
}

// ============================================================================
// append_blob_uploader
// ============================================================================

append_blob_uploader::append_blob_uploader(remote_blob_endpoint& endpoint,
                                           const transfer_spec& spec)
    : endpoint_(&endpoint),
      lease_id_(spec.lease_id),
      validate_content_(spec.validate_content),
      max_size_(spec.max_size_condition) {}

auto append_blob_uploader::upload(const chunk& c) -> result<commit_token> {
    auto md5 = content_md5_for(c, validate_content_);
    if (!md5) {
        return unexpected(md5.error());
    }

    append_block_request request;
    request.data = std::span<const std::byte>(c.payload);
    request.append_position = next_position_;
    request.max_size = max_size_;
    request.content_md5 = std::move(md5.value());
    request.lease_id = lease_id_;

    auto appended = endpoint_->append_block(request);
    if (!appended) {
        return with_offset(appended.error(), c.offset);
    }

    next_position_ = appended.value().append_offset + c.payload.size();

    return commit_token{append_commit_token{*next_position_,
                                            std::move(appended.value().etag),
                                            std::move(appended.value().last_modified)}};
}

auto append_blob_uploader::commit(const std::vector<ordered_commit_token>& tokens)
    -> result<commit_outcome> {
    if (tokens.empty()) {
        return commit_outcome{};
    }
    const auto* last = std::get_if<append_commit_token>(&tokens.back().token);
    if (!last) {
        return unexpected(error{error_code::internal_error,
                                "non-append token in append blob commit", tokens.back().offset});
    }
    return commit_outcome{last->etag, last->last_modified};
}

// ============================================================================
// Variant dispatch
// ============================================================================

auto make_upload_strategy(const transfer_spec& spec,
                          remote_blob_endpoint& endpoint,
                          bool parallel) -> upload_strategy {
    switch (spec.kind) {
        case blob_kind::page:
            return page_blob_uploader(endpoint, spec, parallel);
        case blob_kind::append:
            return append_blob_uploader(endpoint, spec);
        case blob_kind::block:
        default:
            return block_blob_uploader(endpoint, spec);
    }
}

auto upload(upload_strategy& strategy, const chunk& c) -> result<commit_token> {
    return std::visit([&c](auto& uploader) { return uploader.upload(c); }, strategy);
}

auto commit(upload_strategy& strategy, const std::vector<ordered_commit_token>& tokens)
    -> result<commit_outcome> {
    return std::visit([&tokens](auto& uploader) { return uploader.commit(tokens); }, strategy);
}

}  // namespace kcenon::blob_transfer
