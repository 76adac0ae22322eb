#include "irodori/batch.hpp"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace irodori {

BatchReport summarize(const std::vector<BuildOutcome>& outcomes) {
    BatchReport report;
    report.total = outcomes.size();
    for (const auto& o : outcomes) {
        report.elapsed_ms += o.elapsed_ms;
        if (o.solver_invoked) report.solver_runs++;

        switch (o.status) {
        case BuildStatus::Accepted:
            report.accepted++;
            report.by_tier[static_cast<size_t>(o.puzzle->difficulty.tier)]++;
            report.by_grade[static_cast<size_t>(o.puzzle->quality.grade)]++;
            break;
        case BuildStatus::Rejected:
            report.rejected++;
            report.by_reason[static_cast<size_t>(reason_of(*o.rejection))]++;
            break;
        case BuildStatus::Error:
            report.errors++;
            break;
        }
    }
    return report;
}

std::string format_report(const BatchReport& report, const std::vector<BuildOutcome>& outcomes) {
    std::ostringstream oss;
    oss << "=== Batch report ===\n";
    oss << "Candidates: " << report.total << "\n";
    oss << "Accepted:   " << report.accepted << "\n";
    oss << "Rejected:   " << report.rejected << "\n";
    if (report.errors > 0) {
        oss << "Errors:     " << report.errors << "\n";
    }
    oss << "Solver runs: " << report.solver_runs << "\n";
    oss << "Time:       " << std::fixed << std::setprecision(1) << report.elapsed_ms / 1000.0
        << "s\n";

    if (report.accepted > 0) {
        oss << "\nAccepted by tier:\n";
        for (size_t i = 0; i < TIER_COUNT; ++i) {
            if (report.by_tier[i] == 0) continue;
            oss << "  " << std::left << std::setw(12) << to_string(static_cast<Tier>(i))
                << std::right << report.by_tier[i] << "\n";
        }

        oss << "\nAccepted by quality:\n";
        for (size_t i = 0; i < QUALITY_GRADE_COUNT; ++i) {
            if (report.by_grade[i] == 0) continue;
            oss << "  " << std::left << std::setw(12) << to_string(static_cast<QualityGrade>(i))
                << std::right << report.by_grade[i] << "\n";
        }
    }

    if (report.rejected > 0) {
        oss << "\nRejected by reason:\n";
        for (size_t i = 0; i < REJECT_REASON_COUNT; ++i) {
            if (report.by_reason[i] == 0) continue;
            oss << "  " << std::left << std::setw(20) << to_string(static_cast<RejectReason>(i))
                << std::right << report.by_reason[i] << "\n";
        }
    }

    bool header = false;
    for (const auto& o : outcomes) {
        if (o.status == BuildStatus::Accepted) continue;
        if (!header) {
            oss << "\nNot accepted:\n";
            header = true;
        }
        oss << "  " << o.name << ": ";
        if (o.status == BuildStatus::Rejected) {
            oss << describe(*o.rejection);
        } else {
            oss << "error: " << o.error;
        }
        oss << "\n";
    }
    return oss.str();
}

BatchRunner::BatchRunner(const Config& config, size_t jobs)
    : builder_(config)
    , jobs_(jobs) {
    if (jobs_ == 0) {
        jobs_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

void BatchRunner::set_verbose(bool enabled) {
    verbose_ = enabled;
    builder_.set_verbose(enabled);
}

std::vector<BuildOutcome> BatchRunner::run(const std::vector<Candidate>& candidates) {
    std::vector<BuildOutcome> outcomes(candidates.size());
    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};

    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= candidates.size()) break;

            const auto& candidate = candidates[i];
            try {
                outcomes[i] = builder_.build(candidate, &stopped_);
            } catch (const std::exception& e) {
                outcomes[i] = BuildOutcome{};
                outcomes[i].name = candidate.name;
                outcomes[i].status = BuildStatus::Error;
                outcomes[i].error = e.what();
                if (verbose_) {
                    std::ostringstream oss;
                    oss << "% [verbose] " << candidate.name << ": error: " << e.what() << "\n";
                    std::cerr << oss.str();
                }
            }
            done.fetch_add(1, std::memory_order_relaxed);
        }
    };

    size_t worker_count = std::min(jobs_, std::max<size_t>(1, candidates.size()));
    if (verbose_) {
        std::ostringstream oss;
        oss << "% [verbose] batch: " << candidates.size() << " candidates, "
            << worker_count << " workers\n";
        std::cerr << oss.str();
    }

    if (worker_count == 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (size_t t = 0; t < worker_count; ++t) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    if (verbose_) {
        std::ostringstream oss;
        oss << "% [verbose] batch: finished " << done.load() << " candidates\n";
        std::cerr << oss.str();
    }
    return outcomes;
}

} // namespace irodori
