#include <getopt.h>

#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "ultrabar/aggregate_samples.hpp"

static void usage(const char* prog) {
    std::cerr
      << "Usage: " << prog
      << " -a DIR -o PREFIX [-x] [-v]\n\n"
      << "  -a, --input           directory containing one extraction/clustering subdirectory per sample\n"
      << "  -o, --output          prefix of the output paths\n"
      << "  -x, --stop-on-error   stop at the first failed sample\n"
      << "  -v, --verbose         verbose mode\n"
      << "  -h, --help            prints this menu\n";
}

int main(int argc, char* argv[]) {
    std::string input_root, output_prefix;
    ultrabar::AggregateSamplesOptions options;

    const char* optstring = "a:o:xvh";
    struct option longopts[] = {
        {"input",         required_argument, nullptr, 'a'},
        {"output",        required_argument, nullptr, 'o'},
        {"stop-on-error", no_argument,       nullptr, 'x'},
        {"verbose",       no_argument,       nullptr, 'v'},
        {"help",          no_argument,       nullptr, 'h'},
        {nullptr,         0,                 nullptr,  0 }
    };

    int c;
    while ((c = getopt_long(argc, argv, optstring, longopts, nullptr)) != -1) {
        switch (c) {
          case 'a': input_root = optarg;                      break;
          case 'o': output_prefix = optarg;                   break;
          case 'x': options.stop_on_error = true;             break;
          case 'v': spdlog::set_level(spdlog::level::debug);  break;
          case 'h': usage(argv[0]); return 0;
          default:  usage(argv[0]); return 1;
        }
    }

    if (input_root.empty() || output_prefix.empty()) {
        usage(argv[0]);
        return 1;
    }

    try {
        auto report = ultrabar::aggregate_samples(input_root, output_prefix, options);
        if (!report.failures.empty()) {
            spdlog::error("{} of {} samples failed", report.failures.size(), report.failures.size() + report.samples.size());
            return 1;
        }
    } catch (std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
