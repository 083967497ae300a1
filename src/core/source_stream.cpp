/**
 * @file source_stream.cpp
 * @brief Implementation of memory and file source streams
 */

#include <kcenon/blob_transfer/core/source_stream.h>

#include <algorithm>
#include <cstring>

namespace kcenon::blob_transfer {

// memory_source_stream implementation

memory_source_stream::memory_source_stream(std::span<const std::byte> data) : data_(data) {}

auto memory_source_stream::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (position_ >= data_.size()) {
        return std::size_t{0};
    }

    auto available = static_cast<std::size_t>(data_.size() - position_);
    auto count = std::min(buffer.size(), available);
    std::memcpy(buffer.data(), data_.data() + position_, count);
    position_ += count;
    return count;
}

auto memory_source_stream::seek(uint64_t position) -> result<void> {
    if (position > data_.size()) {
        return unexpected(error{error_code::source_seek_error,
                                "seek beyond end of buffer: " + std::to_string(position)});
    }
    position_ = position;
    return {};
}

auto memory_source_stream::tell() const -> result<uint64_t> {
    return position_;
}

// file_source_stream implementation

file_source_stream::file_source_stream(std::ifstream file, uint64_t size)
    : file_(std::move(file)), size_(size) {}

auto file_source_stream::open(const std::filesystem::path& path) -> result<file_source_stream> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected(
            error{error_code::invalid_argument, "file not found: " + path.string()});
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(
            error{error_code::source_read_error, "cannot get file size: " + path.string()});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::source_read_error, "cannot open file: " + path.string()});
    }

    return file_source_stream(std::move(file), size);
}

auto file_source_stream::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (buffer.empty()) {
        return std::size_t{0};
    }

    file_.read(reinterpret_cast<char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    auto bytes_read = static_cast<std::size_t>(file_.gcount());

    if (file_.bad()) {
        return unexpected(error{error_code::source_read_error, "file read failed"});
    }

    // A short read sets eofbit and failbit; clear them so tell/seek keep working
    if (file_.eof()) {
        file_.clear();
    }

    return bytes_read;
}

auto file_source_stream::seek(uint64_t position) -> result<void> {
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(position), std::ios::beg);
    if (!file_.good()) {
        return unexpected(error{error_code::source_seek_error,
                                "seek failed: " + std::to_string(position)});
    }
    return {};
}

auto file_source_stream::tell() const -> result<uint64_t> {
    auto pos = file_.tellg();
    if (pos < 0) {
        return unexpected(error{error_code::source_seek_error, "tell failed"});
    }
    return static_cast<uint64_t>(pos);
}

}  // namespace kcenon::blob_transfer
