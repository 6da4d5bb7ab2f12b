/**
 * Example: Offline integrity check of a chainledger database
 *
 * Usage: verify_chain <database> [project_id...]
 *
 * Replays every progress chain (or only the named projects) and the audit trail.
 * Exits 0 when every chain is intact, 2 when any finding is reported, 1 on error.
 */

#include <chainledger/chainledger.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace chainledger;
using namespace chainledger::ledger;

namespace {

    bool report(const std::string &label, const VerificationResult &result) {
        std::cout << (result.is_valid ? "[ OK ] " : "[FAIL] ") << label << " (" << result.records_checked
                  << " records)" << std::endl;
        for (const auto &finding : result.findings) {
            std::cout << "       " << findingKindName(finding.kind) << " seq=" << finding.sequence
                      << " id=" << finding.record_id << std::endl;
            std::cout << "         expected " << (finding.expected.empty() ? "<none>" : finding.expected)
                      << std::endl;
            std::cout << "         actual   " << finding.actual << std::endl;
        }
        return result.is_valid;
    }

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <database> [project_id...]" << std::endl;
        return 1;
    }

    Ledger ledger;
    auto opened = ledger.open(argv[1]);
    if (!opened.is_ok()) {
        std::cerr << "Cannot open " << argv[1] << ": " << opened.error().message.c_str() << std::endl;
        return 1;
    }

    std::vector<std::string> projects(argv + 2, argv + argc);
    if (projects.empty()) {
        auto scopes = ledger.getStorage().progressScopes();
        if (!scopes.is_ok()) {
            std::cerr << "Cannot list projects: " << scopes.error().message.c_str() << std::endl;
            return 1;
        }
        projects = scopes.value();
    }

    bool all_valid = true;
    for (const auto &project : projects) {
        auto result = ledger.verifyProgress(project);
        if (!result.is_ok()) {
            std::cerr << "Verification of " << project << " failed: " << result.error().message.c_str() << std::endl;
            return 1;
        }
        all_valid = report("progress " + project, result.value()) && all_valid;
    }

    auto audit = ledger.verifyAudit();
    if (!audit.is_ok()) {
        std::cerr << "Verification of the audit trail failed: " << audit.error().message.c_str() << std::endl;
        return 1;
    }
    all_valid = report("audit trail", audit.value()) && all_valid;

    auto checkpoint = ledger.getStorage().latestCheckpoint(RecordKind::Audit, AUDIT_SCOPE_ID);
    if (checkpoint.is_ok() && checkpoint.value()) {
        std::cout << "Audit records through sequence " << checkpoint.value()->purged_through_sequence
                  << " were purged before " << checkpoint.value()->cutoff.toIso8601() << std::endl;
    }

    ledger.close();
    return all_valid ? 0 : 2;
}
