/**
 * @file uploader.hpp
 * @brief Entry point of the direct-to-storage upload pipeline
 *
 * PIPELINE:
 * validate -> one credential request for the whole batch -> bounded
 * parallel transfers with retry -> mandatory server confirmation -> summary
 *
 * THREAD SAFETY:
 * upload_files() blocks the calling thread until the batch is terminal.
 * Several batches may run concurrently on one DirectUploader; each call
 * owns its queue, active set and result lists.
 *
 * EXAMPLE:
 * events::EventBus bus;
 * events::EventDispatcher dispatcher(bus);
 * events::ObserverBridge bridge(bus, observer);
 * DirectUploader uploader(config, broker, transport, dispatcher);
 * auto summary = uploader.upload_files(files, "session-42");
 */

#pragma once

#include "directup/config/config.hpp"
#include "directup/core/cancellation.hpp"
#include "directup/events/dispatcher.hpp"
#include "directup/upload/broker.hpp"
#include "directup/upload/classifier.hpp"
#include "directup/upload/transport.hpp"
#include "directup/upload/types.hpp"

#include <string>
#include <vector>

namespace directup::upload {

class DirectUploader {
public:
    DirectUploader(config::UploaderConfig config,
                   CredentialBroker& broker,
                   ObjectTransport& transport,
                   events::EventDispatcher& dispatcher);

    /**
     * Uploads every file into `collection_id`. Never throws for per-file
     * problems: they come back in `failed`. `success` is true only when no
     * file failed and the server confirmed everything that was uploaded.
     */
    BatchResult upload_files(const std::vector<UploadFile>& files,
                             const std::string& collection_id,
                             const CancellationToken& cancel = {});

    [[nodiscard]] const config::UploaderConfig& config() const noexcept { return config_; }

private:
    config::UploaderConfig config_;
    FileClassifier classifier_;
    CredentialBroker& broker_;
    ObjectTransport& transport_;
    events::EventDispatcher& dispatcher_;
};

} // namespace directup::upload
