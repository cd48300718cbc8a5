#ifndef ULTRABAR_ULTRABAR_HPP
#define ULTRABAR_ULTRABAR_HPP

#include "utils.hpp"
#include "reverse_complement.hpp"
#include "AnchorTemplate.hpp"
#include "FastqReader.hpp"
#include "process_data.hpp"
#include "csv_io.hpp"
#include "TagReference.hpp"
#include "ExtractedRecord.hpp"
#include "PairedReadExtractor.hpp"
#include "extraction.hpp"
#include "merge.hpp"
#include "aggregate.hpp"
#include "aggregate_samples.hpp"

/**
 * @file ultrabar.hpp
 * @brief Umbrella header for the **ultrabar** library.
 *
 * @namespace ultrabar
 * @brief Extraction and aggregation of clonal barcodes from dual-guide sequencing data.
 */

#endif
