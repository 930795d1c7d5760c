#pragma once

#include "directup/upload/transport.hpp"

#include <cstddef>

namespace directup::net {

/**
 * @brief HTTP PUT of one object to its write URL, streamed in chunks
 *
 * Progress is reported after every chunk on the calling thread. The
 * timeout covers the whole attempt (connect, body, response).
 * Cancellation closes the connection mid-transfer.
 */
class BeastObjectTransport : public upload::ObjectTransport {
public:
    explicit BeastObjectTransport(std::size_t chunk_size = 1024 * 1024)
        : chunk_size_(chunk_size == 0 ? 1 : chunk_size) {}

    upload::TransferOutcome put(const upload::WriteCredential& credential,
                                const upload::UploadFile& file,
                                const upload::ProgressCallback& on_progress,
                                const CancellationToken& cancel,
                                std::chrono::milliseconds timeout) override;

private:
    std::size_t chunk_size_;
};

} // namespace directup::net
