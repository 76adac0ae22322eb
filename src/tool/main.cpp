#include "irodori/batch.hpp"
#include "candidate_reader.hpp"
#include "puzzle_writer.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <unistd.h>

irodori::BatchRunner* g_current_runner = nullptr;

void stop_handler(int) {
    if (g_current_runner) {
        g_current_runner->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <file>...\n";
    std::cerr << "  -t SEC            Timeout per candidate in seconds (default 30)\n";
    std::cerr << "  -T SEC            Timeout for the whole batch in seconds\n";
    std::cerr << "  -j N              Number of worker threads (default: all cores)\n";
    std::cerr << "  -o FILE           Write accepted puzzles to FILE instead of stdout\n";
    std::cerr << "  --min-distance D  Minimum perceptual distance between colors (default 35)\n";
    std::cerr << "  --max-colors N    Maximum palette size (default 6)\n";
    std::cerr << "  --max-runs N      Maximum runs per line (default 15)\n";
    std::cerr << "  --max-nodes N     Search node budget per candidate (default 200000)\n";
    std::cerr << "  -s                Print solve statistics to stderr\n";
    std::cerr << "  -v                Verbose mode\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const std::vector<irodori::BuildOutcome>& outcomes) {
    if (!g_print_stats) return;
    for (const auto& o : outcomes) {
        if (!o.solver_invoked) continue;
        const auto& t = o.trace;
        std::cerr << "% " << o.name << ": simple=" << t.simple_overlap_cells
                  << " edge=" << t.edge_alignment_cells
                  << " cross=" << t.cross_line_cells
                  << " passes=" << t.propagation_passes
                  << " lines=" << t.line_visits
                  << " branches=" << t.branch_count
                  << " nodes=" << t.node_count
                  << " fails=" << t.contradiction_count
                  << " max_depth=" << t.backtrack_depth
                  << " time=" << o.elapsed_ms << "ms\n";
    }
}

int main(int argc, char* argv[]) {
    irodori::Config config;
    std::vector<const char*> filenames;
    const char* output = nullptr;
    size_t jobs = 0;
    int batch_timeout_sec = 0;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            config.timeout = std::chrono::milliseconds(
                static_cast<long long>(std::atof(argv[++i]) * 1000.0));
        } else if (std::strcmp(argv[i], "-T") == 0 && i + 1 < argc) {
            batch_timeout_sec = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-j") == 0 && i + 1 < argc) {
            jobs = static_cast<size_t>(std::max(0, std::atoi(argv[++i])));
        } else if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "--min-distance") == 0 && i + 1 < argc) {
            config.min_color_distance = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "--max-colors") == 0 && i + 1 < argc) {
            config.max_colors = static_cast<size_t>(std::max(0, std::atoi(argv[++i])));
        } else if (std::strcmp(argv[i], "--max-runs") == 0 && i + 1 < argc) {
            config.max_runs_per_line = static_cast<size_t>(std::max(0, std::atoi(argv[++i])));
        } else if (std::strcmp(argv[i], "--max-nodes") == 0 && i + 1 < argc) {
            config.max_search_nodes = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filenames.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (filenames.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::vector<irodori::Candidate> candidates;
        for (const char* filename : filenames) {
            auto parsed = irodori::tool::parse_file(filename);
            for (auto& c : parsed) {
                candidates.push_back(std::move(c));
            }
        }

        irodori::BatchRunner runner(config, jobs);
        runner.set_verbose(g_verbose);
        g_current_runner = &runner;

        // 中断・全体タイムアウト
        std::signal(SIGINT, stop_handler);
        if (batch_timeout_sec > 0) {
            std::signal(SIGALRM, stop_handler);
            alarm(batch_timeout_sec);
        }

        auto outcomes = runner.run(candidates);
        g_current_runner = nullptr;

        print_stats(outcomes);

        if (output) {
            std::ofstream out(output);
            if (!out) {
                throw std::runtime_error(std::string("Cannot open file: ") + output);
            }
            irodori::tool::write_puzzles(out, outcomes);
        } else {
            irodori::tool::write_puzzles(std::cout, outcomes);
        }

        std::cerr << irodori::format_report(irodori::summarize(outcomes), outcomes);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
