/**
 * @file fuzz_dialect_detection.cpp
 * @brief LibFuzzer target for fuzz testing delimiter scoring and line
 * ending detection.
 */

#include "dialect.h"

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (size == 0)
    return 0;
  // 16KB limit: detection only examines the sample at the start of a file,
  // so a smaller limit allows faster fuzzing without losing coverage
  constexpr size_t MAX_INPUT_SIZE = 16 * 1024;
  if (size > MAX_INPUT_SIZE)
    size = MAX_INPUT_SIZE;

  std::string_view sample(reinterpret_cast<const char*>(data), size);

  csvprof::DialectDetector detector("fuzz-input");
  auto candidates = detector.score_candidates(sample);
  (void)candidates.front().delimited();
  (void)csvprof::DialectDetector::detect_line_ending(sample);

  return 0;
}
