/**
 * @file profile_benchmarks.cpp
 * @brief Benchmarks for value classification, frequency scanning and
 * dialect detection.
 */

#include <benchmark/benchmark.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

#include "csvprof.h"

using namespace csvprof;

namespace {

std::vector<std::string> generate_values(size_t count) {
    std::vector<std::string> result;
    result.reserve(count);

    std::mt19937 gen(42);  // Fixed seed for reproducibility
    std::uniform_int_distribution<int> kind(0, 4);
    std::uniform_int_distribution<int> num(-100000, 100000);

    char buffer[32];
    for (size_t i = 0; i < count; ++i) {
        switch (kind(gen)) {
            case 0: result.push_back(std::to_string(num(gen))); break;
            case 1:
                snprintf(buffer, sizeof(buffer), "%.4f", num(gen) / 7.0);
                result.push_back(buffer);
                break;
            case 2: result.push_back("2024-01-15T10:30:00Z"); break;
            case 3: result.push_back("unknown"); break;
            default: result.push_back("programmer"); break;
        }
    }
    return result;
}

std::string generate_csv(size_t rows) {
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> num(0, 999);
    static const char* roles[] = {"pm", "programmer", "dba", "sysadmin", "qa", "manager"};

    std::ostringstream out;
    out << "id,role,score,name\n";
    for (size_t i = 0; i < rows; ++i) {
        out << i << ",\"" << roles[num(gen) % 6] << "\"," << num(gen) << ".5,user"
            << num(gen) << '\n';
    }
    return out.str();
}

// Writes the generated file once per process
const std::string& bench_file() {
    static const std::string path = [] {
        auto p = std::filesystem::temp_directory_path() /
                 ("csvprof_bench_" + std::to_string(getpid()) + ".csv");
        std::ofstream file(p, std::ios::binary);
        file << generate_csv(100000);
        return p.string();
    }();
    return path;
}

} // namespace

static void BM_Classify(benchmark::State& state) {
    StandardClassifier classifier;
    auto values = generate_values(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        for (const auto& v : values) {
            benchmark::DoNotOptimize(classifier.classify(v));
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Classify)->Arg(1000)->Arg(100000);

static void BM_InferType(benchmark::State& state) {
    StandardClassifier classifier;
    FieldStatistics stats(classifier);
    auto values = generate_values(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        benchmark::DoNotOptimize(stats.infer_type(values));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_InferType)->Arg(1000)->Arg(100000);

static void BM_ReadRecords(benchmark::State& state) {
    std::string data = generate_csv(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        std::istringstream in(data);
        RecordReader reader(in, Dialect::csv());
        std::vector<std::string> fields;
        while (reader.next(fields)) {
        }
        benchmark::DoNotOptimize(reader.records_read());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(data.size()));
}
BENCHMARK(BM_ReadRecords)->Arg(1000)->Arg(100000);

static void BM_FieldFreq(benchmark::State& state) {
    const std::string& path = bench_file();
    auto options = ScanOptions::for_delimiter(',', true);

    for (auto _ : state) {
        auto result = get_field_freq(path, static_cast<size_t>(state.range(0)), options);
        benchmark::DoNotOptimize(result.records_scanned);
    }
}
BENCHMARK(BM_FieldFreq)->Arg(1)->Arg(3)->Unit(benchmark::kMillisecond);

static void BM_DetectDialect(benchmark::State& state) {
    const std::string& path = bench_file();

    for (auto _ : state) {
        DialectDetector detector(path);
        detector.analyze();
        benchmark::DoNotOptimize(detector.record_count());
    }
}
BENCHMARK(BM_DetectDialect)->Unit(benchmark::kMillisecond);

static void BM_ProfileFile(benchmark::State& state) {
    const std::string& path = bench_file();
    StandardClassifier classifier;
    FieldProfiler profiler(classifier);

    for (auto _ : state) {
        DialectDetector detector(path);
        auto profiles = profiler.profile_file(detector);
        benchmark::DoNotOptimize(profiles.size());
    }
}
BENCHMARK(BM_ProfileFile)->Unit(benchmark::kMillisecond);
