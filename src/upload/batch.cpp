#include "directup/upload/batch.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace directup::upload {
namespace {

bool is_allowed(BatchState current, BatchState target) {
    static const std::unordered_map<BatchState, std::vector<BatchState>> transitions {
        {BatchState::Created, {BatchState::Validating}},
        {BatchState::Validating, {BatchState::AwaitingCredentials, BatchState::Complete}},
        {BatchState::AwaitingCredentials, {BatchState::Transferring}},
        {BatchState::Transferring, {BatchState::Confirming, BatchState::Complete}},
        {BatchState::Confirming, {BatchState::Complete}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

const char* to_string(BatchState state) {
    switch (state) {
        case BatchState::Created: return "created";
        case BatchState::Validating: return "validating";
        case BatchState::AwaitingCredentials: return "awaiting_credentials";
        case BatchState::Transferring: return "transferring";
        case BatchState::Confirming: return "confirming";
        case BatchState::Complete: return "complete";
        case BatchState::Failed: return "failed";
    }
    return "unknown";
}

directup::Result<void> UploadBatch::transition_to(BatchState next_state) {
    if (next_state == BatchState::Failed) {
        if (is_terminal()) {
            return directup::Fail<void>(ErrorKind::Internal, "Batch " + collection_id_ + " already terminal");
        }
        state_ = next_state;
        return directup::Ok();
    }
    if (!is_allowed(state_, next_state)) {
        return directup::Fail<void>(ErrorKind::Internal, std::string("Illegal batch transition ") +
                                                        to_string(state_) + " -> " + to_string(next_state));
    }
    spdlog::debug("[Batch] collection={} {} -> {}", collection_id_, to_string(state_), to_string(next_state));
    state_ = next_state;
    return directup::Ok();
}

void UploadBatch::fail(std::string reason) {
    if (is_terminal()) {
        return;
    }
    failure_reason_ = std::move(reason);
    state_ = BatchState::Failed;
}

} // namespace directup::upload
