/**
 * @file csvprof.h
 * @brief csvprof - structure and field profiling for delimited text files.
 * @version 0.1.0
 *
 * This is the main public header for the csvprof library. Include this single
 * header to access all public functionality.
 *
 * @example
 * @code
 * csvprof::DialectDetector detector("data.csv");
 * detector.analyze();
 *
 * csvprof::StandardClassifier classifier;
 * csvprof::FieldProfiler profiler(classifier);
 * for (const auto& p : profiler.profile_file(detector)) {
 *     std::cout << p.name << ": " << csvprof::value_type_to_string(p.type) << "\n";
 * }
 * @endcode
 */

#ifndef CSVPROF_H
#define CSVPROF_H

#define CSVPROF_VERSION_MAJOR 0
#define CSVPROF_VERSION_MINOR 1
#define CSVPROF_VERSION_PATCH 0
#define CSVPROF_VERSION_STRING "0.1.0"

#include "error.h"
#include "dialect.h"
#include "io_util.h"
#include "record_reader.h"
#include "value_classifier.h"
#include "frequency_scanner.h"
#include "field_statistics.h"
#include "field_profile.h"

#endif // CSVPROF_H
