#pragma once

#include <string>

#include "daemon/document_store.hpp"

namespace daybreak {

// Archive records outlive the regular retention window.
constexpr int kArchiveRetentionDays = 90;

struct PruneResult {
    int deletedChecklist = 0;
    int deletedTodos = 0;
    int deletedArchives = 0;
    int failures = 0;

    int total() const { return deletedChecklist + deletedTodos + deletedArchives; }
};

// RetentionPruner deletes history older than the retention window.
// Templates, unfinished todos and records whose date cannot be read are
// never deleted.
class RetentionPruner {
public:
    explicit RetentionPruner(DocumentStore &store);

    // Removes non-template checklist items and completed todos dated before
    // 'cutoff', and archive records dated before 'archiveCutoff'.
    PruneResult prune(const std::string &cutoff, const std::string &archiveCutoff);

    // today - retentionDays, with retentionDays clamped to [7, 365].
    static std::string cutoffFor(const std::string &today, int retentionDays);
    static std::string archiveCutoffFor(const std::string &today);

private:
    DocumentStore &m_store;
};

} // namespace daybreak
