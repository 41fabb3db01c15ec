/**
 * @file fuzz_record_reader.cpp
 * @brief LibFuzzer target for the record reader and value classifier.
 */

#include "record_reader.h"
#include "value_classifier.h"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (size < 2)
    return 0;

  // First byte picks the escape style, the rest is the input
  csvprof::Dialect dialect = csvprof::Dialect::csv();
  if (data[0] & 1) {
    dialect.double_quote = false;
    dialect.escape_char = '\\';
  }

  std::istringstream in(std::string(reinterpret_cast<const char*>(data + 1), size - 1));
  csvprof::ErrorCollector errors(csvprof::ErrorMode::PERMISSIVE);
  csvprof::RecordReader reader(in, dialect, &errors);
  csvprof::StandardClassifier classifier;

  std::vector<std::string> fields;
  while (reader.next(fields)) {
    for (const auto& field : fields) {
      (void)classifier.classify(field);
    }
  }

  return 0;
}
