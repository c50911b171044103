// letters_per_group.cpp - CLI tool for per-partition compact letter displays
//
// Pipeline: observation table -> per-partition Dunn test (Holm/Bonferroni)
//           -> compact letter display -> letters table (+ JSON summary).
//
// Usage: ./letters_per_group --input <csv|parquet> --output <csv|parquet> [options]

#include "analysis/letters_report.hpp"
#include "analysis/multiple_comparison.hpp"
#include "io/observation_reader.hpp"
#include "io/report_writer.hpp"

#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ===========================================================================
// Options
// ===========================================================================
namespace {

struct CliOptions {
    std::string input_path;
    std::string output_path;
    std::string summary_path;
    std::string alpha = "0.05";
    std::string adjust = "holm";
    std::string order;
    ObservationColumns columns;
};

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> items;
    std::istringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

double parse_alpha(const std::string& text) {
    double alpha = 0.0;
    if (!detail::parse_double(text, alpha) || !(alpha > 0.0 && alpha <= 1.0)) {
        throw std::invalid_argument("--alpha must be a number in (0, 1], got '" + text + "'");
    }
    return alpha;
}

// ===========================================================================
// Pipeline, instantiated for numeric or text group ids
// ===========================================================================
template <typename G>
int run(const CliOptions& opts) {
    LettersReportConfig<G> config;
    config.alpha = parse_alpha(opts.alpha);
    config.adjust = parse_adjust_method(opts.adjust);
    for (const auto& item : split_list(opts.order)) {
        G id{};
        detail::parse_group_cell(item, id);
        config.category_order.push_back(id);
    }

    auto observations = read_observations<G>(opts.input_path, opts.columns);
    std::cout << "Read " << observations.size() << " observations from "
              << opts.input_path << "\n";

    auto report = compute_letters_per_group(observations, config);

    for (const auto& part : report.partitions) {
        std::cout << "  " << part.partition << ": " << part.group_count << " groups, "
                  << part.observation_count << " obs, KW H=" << part.kruskal_wallis.statistic
                  << " p=" << part.kruskal_wallis.p_value << "\n";
        if (part.dropped_nan > 0) {
            std::cerr << "WARNING: " << part.partition << ": dropped " << part.dropped_nan
                      << " missing values\n";
        }
    }
    for (const auto& s : report.skipped_partitions) {
        std::cerr << "  SKIP: " << s.partition << " (" << s.reason << ")\n";
    }

    write_letters_table(opts.output_path, report.rows);
    std::cout << "Wrote " << report.rows.size() << " rows to " << opts.output_path << "\n";

    if (!opts.summary_path.empty()) {
        write_json_summary(opts.summary_path, report, config);
        std::cout << "Wrote summary to " << opts.summary_path << "\n";
    }
    return 0;
}

}  // anonymous namespace

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <path> --output <path> [options]\n"
              << "\n"
              << "  --input          Observation table (.csv or .parquet)\n"
              << "  --output         Letters table (.csv or .parquet)\n"
              << "  --summary        JSON summary with pairwise results (optional)\n"
              << "  --alpha          Significance level (default 0.05)\n"
              << "  --adjust         P-value adjustment: holm, bonferroni (default holm)\n"
              << "  --partition-col  Partition column (default Enzyme)\n"
              << "  --group-col      Group column (default Treatment)\n"
              << "  --value-col      Value column (default Viability)\n"
              << "  --order          Comma-separated group presentation order\n"
              << "  --help           Show this message\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    CliOptions opts;

    // Parse CLI args
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--input" && i + 1 < argc) {
            opts.input_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            opts.output_path = argv[++i];
        } else if (arg == "--summary" && i + 1 < argc) {
            opts.summary_path = argv[++i];
        } else if (arg == "--alpha" && i + 1 < argc) {
            opts.alpha = argv[++i];
        } else if (arg == "--adjust" && i + 1 < argc) {
            opts.adjust = argv[++i];
        } else if (arg == "--partition-col" && i + 1 < argc) {
            opts.columns.partition = argv[++i];
        } else if (arg == "--group-col" && i + 1 < argc) {
            opts.columns.group = argv[++i];
        } else if (arg == "--value-col" && i + 1 < argc) {
            opts.columns.value = argv[++i];
        } else if (arg == "--order" && i + 1 < argc) {
            opts.order = argv[++i];
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Validate required args
    if (opts.input_path.empty()) {
        std::cerr << "Missing required argument: --input\n";
        print_usage(argv[0]);
        return 1;
    }
    if (opts.output_path.empty()) {
        std::cerr << "Missing required argument: --output\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        if (group_column_is_numeric(opts.input_path, opts.columns)) {
            return run<double>(opts);
        }
        return run<std::string>(opts);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
