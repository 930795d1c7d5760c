#pragma once

#include "directup/upload/broker.hpp"
#include "directup/upload/reporter.hpp"
#include "directup/upload/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace directup::upload {

struct Reconciliation {
    std::vector<CompletedUpload> confirmed;
    std::vector<FailedUpload> demoted;      ///< Rejected or unverifiable, in submission order
    std::optional<ConfirmationResult> confirmation;
    bool security_violation = false;
    std::string error;                      ///< Set when the confirmation call itself failed
};

/**
 * @brief Turns the client's optimistic completed set into the server's verdict
 *
 * Confirmation is mandatory: when the broker call fails, or its counts do
 * not add up, nothing locally completed survives. Deleted files are
 * reported as security violations, separately from ordinary errors.
 */
class ConfirmationReconciler {
public:
    ConfirmationReconciler(CredentialBroker& broker, ProgressReporter& reporter,
                           std::chrono::milliseconds timeout)
        : broker_(broker), reporter_(reporter), timeout_(timeout) {}

    Reconciliation reconcile(const std::string& collection_id, std::vector<CompletedUpload> completed);

private:
    void demote_all(Reconciliation& out, std::vector<CompletedUpload>& pending, const std::string& error);

    CredentialBroker& broker_;
    ProgressReporter& reporter_;
    std::chrono::milliseconds timeout_;
};

} // namespace directup::upload
