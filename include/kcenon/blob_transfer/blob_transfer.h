/**
 * @file blob_transfer.h
 * @brief Main header for the blob_transfer library
 * @version 0.1.0
 *
 * This is the primary include file for the blob_transfer library.
 * Include this header to access the chunked upload engine.
 *
 * @code
 * #include <kcenon/blob_transfer/blob_transfer.h>
 *
 * using namespace kcenon::blob_transfer;
 *
 * auto spec = transfer_spec::builder()
 *     .with_kind(blob_kind::block)
 *     .with_source_length(file.size())
 *     .with_parallelism(4)
 *     .build();
 *
 * transfer_coordinator coordinator(spec.value(), endpoint);
 * auto result = coordinator.run(file);
 * @endcode
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H
#define KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/core/chunk_types.h"
#include "kcenon/blob_transfer/core/source_stream.h"
#include "kcenon/blob_transfer/core/transfer_spec.h"

// Encryption
#include "kcenon/blob_transfer/encryption/chunk_encryptor.h"

// Transfer engine
#include "kcenon/blob_transfer/transfer/remote_blob_endpoint.h"
#include "kcenon/blob_transfer/transfer/progress.h"
#include "kcenon/blob_transfer/transfer/transfer_coordinator.h"

// Adapters
#include "kcenon/blob_transfer/adapters/thread_pool_adapter.h"

namespace kcenon::blob_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H
