#include "errors.hpp"
#include "language.hpp"
#include "line_processor.hpp"
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <chrono>
#include <omp.h>
#include <memory>

struct Args {
    std::string lang_path;
    std::string input_path;
    std::string output_path;
    datelang::LineOptions options;
    bool normalize = true;
    int limit = -1;
    bool threads_set = false;
    int threads = 4;
};

Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--lang" && i + 1 < argc) {
            args.lang_path = argv[++i];
        } else if (arg == "--input" && i + 1 < argc) {
            args.input_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--mode" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!datelang::parse_mode(value, args.options.mode)) {
                std::cerr << "Unknown mode '" << value << "', using translate" << std::endl;
            }
        } else if (arg == "--keep-formatting") {
            args.options.keep_formatting = true;
        } else if (arg == "--strip-timezone") {
            args.options.strip_timezone = true;
        } else if (arg == "--no-normalize") {
            args.normalize = false;
        } else if (arg == "--limit" && i + 1 < argc) {
            args.limit = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            args.threads = std::stoi(argv[++i]);
            args.threads_set = true;
        }
    }
    return args;
}

int main(int argc, char* argv[]) {
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(NULL);

    Args args = parse_args(argc, argv);

    if (args.lang_path.empty() || args.input_path.empty()) {
        std::cerr << "Usage: " << argv[0] << " --lang <file.json> --input <file> [--output <file>]"
                  << " [--mode translate|search|applicable] [--keep-formatting] [--strip-timezone]"
                  << " [--no-normalize] [--limit <n>] [--threads <n>]" << std::endl;
        return 1;
    }

    if (args.threads_set) {
        omp_set_num_threads(args.threads);
    }

    // 1. Load language
    std::unique_ptr<datelang::Language> language;
    try {
        auto info = datelang::load_language_info(args.lang_path);
        std::string shortname = info.name;
        language = std::make_unique<datelang::Language>(shortname, std::move(info));
    } catch (const datelang::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (!language->validate_info(std::cerr)) {
        std::cerr << "Error: invalid language file: " << args.lang_path << std::endl;
        return 1;
    }

    datelang::Settings settings;
    settings.normalize = args.normalize;

    // 2. Read Input
    std::vector<std::string> lines;
    {
        std::ifstream infile(args.input_path);
        if (!infile.is_open()) {
            std::cerr << "Error opening input file: " << args.input_path << std::endl;
            return 1;
        }
        std::string line;
        while (std::getline(infile, line)) {
            if (!line.empty()) {
                if (line.back() == '\r') line.pop_back();
                lines.push_back(line);
                if (args.limit > 0 && lines.size() >= static_cast<size_t>(args.limit)) break;
            }
        }
    }
    std::cout << "Loaded " << lines.size() << " lines." << std::endl;

    // 3. Process. Caches of the shared language fill on first use.
    std::vector<std::string> results(lines.size());
    std::vector<std::string> errors(lines.size());

    auto start_proc = std::chrono::high_resolution_clock::now();

    #pragma omp parallel for schedule(dynamic, 100)
    for (int64_t i = 0; i < static_cast<int64_t>(lines.size()); ++i) {
        results[i] = datelang::process_line(*language, args.options, settings, i, lines[i], errors[i]);
    }

    auto end_proc = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double>(end_proc - start_proc).count();

    size_t failed = 0;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (!errors[i].empty()) {
            std::cerr << "Error on line " << i << ": " << errors[i] << std::endl;
            failed++;
        }
    }

    std::cout << "Processed " << lines.size() << " lines in " << duration << "s" << std::endl;
    if (duration > 0.0) {
        std::cout << "Speed: " << (lines.size() / duration) << " lines/sec" << std::endl;
    }

    // 4. Output
    if (!args.output_path.empty()) {
        std::ofstream outfile(args.output_path);
        if (!outfile.is_open()) {
            std::cerr << "Error opening output file: " << args.output_path << std::endl;
            return 1;
        }
        for (const auto& res : results) {
            outfile << res << "\n";
        }
        std::cout << "Done. Saved to " << args.output_path << std::endl;
    } else {
        for (const auto& res : results) {
            std::cout << res << "\n";
        }
    }

    if (failed > 0) {
        std::cerr << failed << " of " << lines.size() << " lines failed" << std::endl;
        return 1;
    }
    return 0;
}
