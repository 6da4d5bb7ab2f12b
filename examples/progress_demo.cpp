/**
 * Example: Recording construction progress with a tamper-evident audit trail
 *
 * This demo shows how to:
 * 1. Open a ledger and report progress for a project
 * 2. Record ordinary actions in the global audit trail
 * 3. Query, summarize and export the audit trail
 * 4. Verify both chains
 */

#include <chainledger/chainledger.hpp>
#include <iostream>
#include <memory>
#include <set>
#include <string>

using namespace chainledger;
using namespace chainledger::ledger;

// ===========================================
// Helpers
// ===========================================

void printSeparator(const std::string &title) {
    std::cout << "\n=== " << title << " ===" << std::endl;
}

ProgressPayload makeReport(const std::string &percent, const std::string &date, const std::string &remarks) {
    ProgressPayload payload;
    payload.reported_percent = Percent::parse(percent).value();
    payload.report_date = Date::parse(date).value();
    payload.remarks = remarks;
    return payload;
}

void printVerification(const std::string &label, const VerificationResult &result) {
    std::cout << label << ": " << (result.is_valid ? "VALID" : "INVALID") << " (" << result.records_checked
              << " records checked)" << std::endl;
    for (const auto &finding : result.findings) {
        std::cout << "  " << findingKindName(finding.kind) << " at sequence " << finding.sequence << ": "
                  << finding.message << std::endl;
    }
}

// ===========================================
// Demo
// ===========================================

int main() {
    std::cout << "Chainledger Progress Demo" << std::endl;
    std::cout << "=========================" << std::endl;

    auto projects = std::make_shared<StaticScopeCatalog>(std::set<std::string>{"bridge-4", "depot-east"});

    LedgerOptions opts;
    opts.projects = projects;

    Ledger ledger;
    auto opened = ledger.open(":memory:", opts);
    if (!opened.is_ok()) {
        std::cerr << "Failed to open ledger: " << opened.error().message.c_str() << std::endl;
        return 1;
    }

    printSeparator("Project setup");
    FieldChangesDetail created;
    created.changes.push_back(FieldChange{dp::String("name"), dp::String("Bridge 4")});
    created.changes.push_back(FieldChange{dp::String("status"), dp::String("active")});

    AuditPayload create_project;
    create_project.action = "CREATE_PROJECT";
    create_project.entity_type = "project";
    create_project.entity_id = "bridge-4";
    create_project.detail = created;

    auto setup = ledger.recordAction(create_project, "admin-1");
    if (!setup.is_ok()) {
        std::cerr << "Failed to record action: " << setup.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "Audit #" << setup.value().sequence << " " << setup.value().record_hash << std::endl;

    printSeparator("Progress reports");
    RequestMeta meta;
    meta.ip_address = "192.0.2.44";
    meta.user_agent = "site-tablet/1.0";

    Date today = systemClock()().date();
    const char *percents[] = {"12.5", "30", "47.25"};
    for (int i = 0; i < 3; ++i) {
        Date date = Timestamp(Timestamp::fromDate(today).micros - int64_t(2 - i) * 86400LL * 1000000LL).date();
        auto report = ledger.reportProgress("bridge-4", makeReport(percents[i], date.toString(), "daily walk"),
                                            "engineer-7", meta);
        if (!report.is_ok()) {
            std::cerr << "Report rejected: " << report.error().message.c_str() << std::endl;
            continue;
        }
        std::cout << date.toString() << " -> " << report.value().progress.payload.reported_percent.toCanonical()
                  << "% seq " << report.value().progress.sequence << " hash "
                  << report.value().progress.record_hash.substr(0, 16) << "..." << std::endl;
    }

    // Same date twice is refused and writes nothing
    auto duplicate = ledger.reportProgress("bridge-4", makeReport("50", today.toString(), "again"), "engineer-7");
    std::cout << "Duplicate report: "
              << (duplicate.is_ok() ? std::string("accepted") : duplicate.error().message.c_str()) << std::endl;

    // Unknown projects are refused
    auto unknown = ledger.reportProgress("tunnel-9", makeReport("5", today.toString(), ""), "engineer-7");
    std::cout << "Unknown project: " << (unknown.is_ok() ? std::string("accepted") : unknown.error().message.c_str())
              << std::endl;

    printSeparator("Audit queries");
    storage::AuditFilter filter;
    filter.action = "LOG_PROGRESS";
    auto page = ledger.queryAudit(filter);
    if (page.is_ok()) {
        std::cout << page.value().total << " LOG_PROGRESS entries" << std::endl;
        for (const auto &record : page.value().records)
            std::cout << "  #" << record.sequence << " by " << record.actor_id << " from "
                      << record.payload.ip_address << std::endl;
    }

    auto summary = ledger.auditSummary();
    if (summary.is_ok()) {
        std::cout << "Total actions: " << summary.value().total_actions << std::endl;
        for (const auto &[action, count] : summary.value().by_action)
            std::cout << "  " << action << ": " << count << std::endl;
    }

    storage::AuditFilter everything;
    everything.limit = 2;
    auto exported = ledger.exportAudit(everything);
    if (exported.is_ok())
        std::cout << "Export (newest 2): " << exported.value() << std::endl;

    printSeparator("Verification");
    auto progress_check = ledger.verifyProgress("bridge-4");
    if (progress_check.is_ok())
        printVerification("bridge-4", progress_check.value());
    auto audit_check = ledger.verifyAudit();
    if (audit_check.is_ok())
        printVerification("audit trail", audit_check.value());

    ledger.close();
    std::cout << "\nDemo complete." << std::endl;
    return 0;
}
