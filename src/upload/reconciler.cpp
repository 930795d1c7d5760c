#include "directup/upload/reconciler.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>

namespace directup::upload {

Reconciliation ConfirmationReconciler::reconcile(const std::string& collection_id,
                                                 std::vector<CompletedUpload> completed) {
    Reconciliation out;
    if (completed.empty()) {
        spdlog::debug("[Reconciler] collection={} nothing to confirm", collection_id);
        return out;
    }

    std::vector<ConfirmationItem> items;
    items.reserve(completed.size());
    for (const auto& upload : completed) {
        items.push_back(ConfirmationItem{upload.filename, upload.key, upload.size});
    }

    auto response = broker_.confirm_uploads(collection_id, items, timeout_);
    if (response.is_error()) {
        out.error = "Upload confirmation failed: " + response.error().message;
        spdlog::error("[Reconciler] collection={} {}", collection_id, out.error);
        reporter_.confirmation_completed(items.size(), std::nullopt, out.error);
        reporter_.error("confirmation", out.error);
        demote_all(out, completed, out.error);
        return out;
    }

    ConfirmationResult verdict = std::move(response.value());
    reporter_.confirmation_completed(items.size(), verdict, verdict.error);

    std::unordered_map<std::string, const DeletedFile*> deleted;
    for (const auto& file : verdict.deleted_files) {
        deleted.emplace(file.key, &file);
    }

    std::vector<CompletedUpload> kept;
    kept.reserve(completed.size());
    for (auto& upload : completed) {
        const auto it = deleted.find(upload.key);
        if (it == deleted.end()) {
            kept.push_back(std::move(upload));
            continue;
        }
        const DeletedFile& rejection = *it->second;
        const std::string reason = rejection.reason.empty() ? "Rejected by server" : rejection.reason;
        spdlog::warn("[Reconciler] collection={} key={} deleted by server: {}",
                     collection_id, upload.key, reason);
        out.security_violation = true;
        out.demoted.push_back(FailedUpload{upload.filename, upload.key, reason, FailureKind::Security,
                                           upload.attempts});
        reporter_.security_violation(upload.filename, upload.key, reason);
        reporter_.error(kSecuritySource, upload.filename + ": " + reason);
        deleted.erase(it);
    }

    for (const auto& [key, rejection] : deleted) {
        spdlog::warn("[Reconciler] collection={} server deleted unknown key={} ({})",
                     collection_id, key, rejection->reason);
    }

    const std::size_t accounted = verdict.confirmed_count + verdict.deleted_count;
    if (accounted != items.size() || verdict.deleted_count != verdict.deleted_files.size()) {
        out.error = "Confirmation counts inconsistent: submitted " + std::to_string(items.size()) +
                    ", confirmed " + std::to_string(verdict.confirmed_count) + ", deleted " +
                    std::to_string(verdict.deleted_count);
        spdlog::error("[Reconciler] collection={} {}", collection_id, out.error);
        reporter_.error("confirmation", out.error);
        demote_all(out, kept, out.error);
    } else {
        out.confirmed = std::move(kept);
    }

    if (verdict.size_mismatch) {
        spdlog::warn("[Reconciler] collection={} size mismatch declared={} actual={}",
                     collection_id, verdict.total_declared_size, verdict.total_actual_size);
    }

    out.confirmation = std::move(verdict);
    return out;
}

void ConfirmationReconciler::demote_all(Reconciliation& out, std::vector<CompletedUpload>& pending,
                                        const std::string& error) {
    for (auto& upload : pending) {
        out.demoted.push_back(FailedUpload{upload.filename, upload.key, error, FailureKind::Confirmation,
                                           upload.attempts});
    }
    pending.clear();
}

} // namespace directup::upload
