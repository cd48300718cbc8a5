#include <getopt.h>

#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "ultrabar/extraction.hpp"
#include "ultrabar/TagReference.hpp"

static void usage(const char* prog) {
    std::cerr
      << "Usage: " << prog
      << " -1 R1 -2 R2 -b REFERENCE -o DIR [-s SAMPLE] [-c COLUMN] [-e] [-n] [-t] [-v]\n\n"
      << "  -1, --r1              FASTQ file for the first reads (may be gzipped)\n"
      << "  -2, --r2              FASTQ file for the second reads (may be gzipped)\n"
      << "  -b, --reference       CSV file of reference guides, with 'Position' and guide sequence columns\n"
      << "  -o, --output          output directory for this sample\n"
      << "  -s, --sample          sample identifier (default: name of the output directory)\n"
      << "  -c, --tag-column      column of guide sequences in the reference (default: [gRNA_complete])\n"
      << "  -e, --expected-only   only pass expected reads on to clustering\n"
      << "  -n, --no-name-check   do not require matching read names in R1 and R2\n"
      << "  -t, --trim-read-id    use the read name instead of the full header line as the read identifier\n"
      << "  -v, --verbose         verbose mode\n"
      << "  -h, --help            prints this menu\n";
}

int main(int argc, char* argv[]) {
    std::string fastq1, fastq2, reference_path, output_dir;
    ultrabar::RunExtractionOptions options;
    ultrabar::LoadTagReferenceOptions ref_options;

    const char* optstring = "1:2:b:o:s:c:entvh";
    struct option longopts[] = {
        {"r1",            required_argument, nullptr, '1'},
        {"r2",            required_argument, nullptr, '2'},
        {"reference",     required_argument, nullptr, 'b'},
        {"output",        required_argument, nullptr, 'o'},
        {"sample",        required_argument, nullptr, 's'},
        {"tag-column",    required_argument, nullptr, 'c'},
        {"expected-only", no_argument,       nullptr, 'e'},
        {"no-name-check", no_argument,       nullptr, 'n'},
        {"trim-read-id",  no_argument,       nullptr, 't'},
        {"verbose",       no_argument,       nullptr, 'v'},
        {"help",          no_argument,       nullptr, 'h'},
        {nullptr,         0,                 nullptr,  0 }
    };

    int c;
    while ((c = getopt_long(argc, argv, optstring, longopts, nullptr)) != -1) {
        switch (c) {
          case '1': fastq1 = optarg;                          break;
          case '2': fastq2 = optarg;                          break;
          case 'b': reference_path = optarg;                  break;
          case 'o': output_dir = optarg;                      break;
          case 's': options.sample_id = optarg;               break;
          case 'c': ref_options.sequence_column = optarg;     break;
          case 'e': options.write.expected_only = true;       break;
          case 'n': options.process.check_names = false;      break;
          case 't': options.short_read_id = true;             break;
          case 'v': spdlog::set_level(spdlog::level::debug);  break;
          case 'h': usage(argv[0]); return 0;
          default:  usage(argv[0]); return 1;
        }
    }

    if (fastq1.empty() || fastq2.empty() || reference_path.empty() || output_dir.empty()) {
        usage(argv[0]);
        return 1;
    }

    try {
        auto reference = ultrabar::load_tag_reference(reference_path, ref_options);
        spdlog::debug("Loaded {} first-position and {} second-position guides", reference.size_first(), reference.size_second());
        ultrabar::run_extraction(fastq1, fastq2, reference, output_dir, options);
    } catch (std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
