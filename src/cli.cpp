/**
 * csvprof - Command-line front end for the csvprof library
 *
 * Prints the detected dialect of a delimited file, or the profile of one or
 * all of its fields. All analysis is done by the library; this file only
 * maps flags onto option structs and formats the results.
 */

#include "csvprof.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

using namespace std;

constexpr const char* VERSION = CSVPROF_VERSION_STRING;
constexpr size_t DEFAULT_TOP_VALUES = 10;

void printVersion() {
  cout << "csvprof version " << VERSION << '\n';
}

void printUsage(const char* prog) {
  cerr << "csvprof - Profile the structure and fields of delimited files\n\n";
  cerr << "Usage: " << prog << " <command> [options] <file>\n\n";
  cerr << "Commands:\n";
  cerr << "  dialect       Detect delimiter, quoting, header and record counts\n";
  cerr << "  field         Profile one field (requires -f)\n";
  cerr << "  profile       Profile every field\n";
  cerr << "\nOptions:\n";
  cerr << "  -f <num>      Field number, starting at 0 (for field)\n";
  cerr << "  -d <delim>    Field delimiter (disables auto-detection)\n";
  cerr << "                Values: comma, tab, semicolon, pipe, or single character\n";
  cerr << "  -q <char>     Quote character (default: \")\n";
  cerr << "  -H            Input has a header row\n";
  cerr << "  -N            Input has no header row\n";
  cerr << "  -T <type>     Field type (for field): integer, float, timestamp, string, unknown\n";
  cerr << "  -m <num>      Maximum distinct values to collect (default: "
       << csvprof::MAX_FREQ_SIZE_DEFAULT << ")\n";
  cerr << "  -n <num>      Most frequent values to print (default: " << DEFAULT_TOP_VALUES
       << ")\n";
  cerr << "  -u <list>     Comma-separated markers for unknown values\n";
  cerr << "  -h            Show this help message\n";
  cerr << "  -v            Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " dialect data.csv\n";
  cerr << "  " << prog << " field -f 2 -T string data.csv\n";
  cerr << "  " << prog << " profile -d pipe -H data.psv\n";
}

static bool parseDelimiter(const string& value, char& delimiter) {
  if (value == "comma") delimiter = ',';
  else if (value == "tab" || value == "\\t") delimiter = '\t';
  else if (value == "semicolon") delimiter = ';';
  else if (value == "pipe") delimiter = '|';
  else if (value.size() == 1) delimiter = value[0];
  else return false;
  return true;
}

static bool parseCount(const char* text, size_t& out) {
  char* endptr;
  long val = strtol(text, &endptr, 10);
  if (endptr == text || *endptr != '\0' || val < 0) return false;
  out = static_cast<size_t>(val);
  return true;
}

static set<string> parseMarkers(const string& list) {
  set<string> markers;
  size_t start = 0;
  while (start <= list.size()) {
    size_t end = list.find(',', start);
    if (end == string::npos) end = list.size();
    string marker = list.substr(start, end - start);
    transform(marker.begin(), marker.end(), marker.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });
    if (!marker.empty()) markers.insert(marker);
    start = end + 1;
  }
  return markers;
}

static string formatDelimiter(char delim) {
  switch (delim) {
  case ',':
    return "comma";
  case '\t':
    return "tab";
  case ';':
    return "semicolon";
  case '|':
    return "pipe";
  case ':':
    return "colon";
  default:
    return string(1, delim);
  }
}

static void printDiagnostics(const csvprof::ErrorCollector& errors) {
  for (const auto& err : errors.errors()) {
    cerr << err.to_string() << '\n';
  }
}

static void printProfile(const csvprof::FieldProfile& p, size_t top_values) {
  cout << "Field " << p.field_number << ": " << p.name << '\n';
  cout << "  Type:          " << csvprof::value_type_to_string(p.type)
       << (p.type_inferred ? " (inferred)" : "") << '\n';
  cout << "  Case:          " << csvprof::field_case_to_string(p.field_case) << '\n';
  cout << "  Min value:     " << p.min_value.value_or("") << '\n';
  cout << "  Max value:     " << p.max_value.value_or("") << '\n';
  cout << "  Min length:    ";
  if (p.min_length) cout << *p.min_length;
  cout << '\n';
  cout << "  Max length:    " << p.max_length << '\n';
  cout << "  Records:       " << p.records_scanned << '\n';
  cout << "  Distinct:      " << p.distinct_count << (p.truncated ? " (truncated)" : "") << '\n';
  cout << "  Unknown:       " << p.unknown_count << '\n';

  if (top_values == 0 || p.freq.empty()) return;

  vector<pair<string, size_t>> top(p.freq.begin(), p.freq.end());
  sort(top.begin(), top.end(), [](const auto& a, const auto& b) {
    return a.second != b.second ? a.second > b.second : a.first < b.first;
  });
  if (top.size() > top_values) top.resize(top_values);

  cout << "  Top values:\n";
  for (const auto& [value, count] : top) {
    cout << "    " << count << "\t" << value << '\n';
  }
}

int cmdDialect(csvprof::DialectDetector& detector) {
  csvprof::ErrorCollector errors;
  detector.analyze(&errors);
  printDiagnostics(errors);

  const auto& info = detector.info();
  cout << "Detected dialect:\n";
  cout << "  Format:       " << csvprof::format_type_to_string(info.format_type) << "\n";
  cout << "  Delimiter:    " << formatDelimiter(info.dialect.delimiter) << "\n";
  cout << "  Quoting:      " << (info.quoting ? "yes" : "no") << "\n";
  cout << "  Line ending:  " << csvprof::line_ending_to_string(info.dialect.line_ending) << "\n";
  cout << "  Has header:   " << (info.has_header ? "yes" : "no") << "\n";
  cout << "  Records:      " << info.record_count << "\n";
  cout << "  Fields:       " << info.field_count << "\n";
  return 0;
}

int cmdField(csvprof::DialectDetector& detector, const csvprof::FieldProfiler& profiler,
             size_t field_number, optional<csvprof::ValueType> type, size_t max_freq,
             size_t top_values) {
  csvprof::ErrorCollector errors;
  detector.analyze(&errors);
  auto options = csvprof::ScanOptions::from_info(detector.info(), max_freq);
  auto profile = profiler.profile_field(detector.path(), field_number, options, type, &errors);
  printDiagnostics(errors);
  printProfile(profile, top_values);
  return 0;
}

int cmdProfile(csvprof::DialectDetector& detector, const csvprof::FieldProfiler& profiler,
               size_t max_freq, size_t top_values) {
  csvprof::ErrorCollector errors;
  auto profiles = profiler.profile_file(detector, max_freq, &errors);
  printDiagnostics(errors);
  for (const auto& p : profiles) {
    printProfile(p, top_values);
  }
  return 0;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
    printUsage(argv[0]);
    return 0;
  }
  if (strcmp(argv[1], "-v") == 0 || strcmp(argv[1], "--version") == 0) {
    printVersion();
    return 0;
  }

  string command = argv[1];
  optind = 2;

  csvprof::DialectHints hints;
  csvprof::ClassifierOptions classifier_options;
  optional<csvprof::ValueType> type;
  optional<size_t> field_number;
  size_t max_freq = csvprof::MAX_FREQ_SIZE_DEFAULT;
  size_t top_values = DEFAULT_TOP_VALUES;

  int c;
  while ((c = getopt(argc, argv, "f:d:q:HNT:m:n:u:hv")) != -1) {
    switch (c) {
    case 'f': {
      size_t val;
      if (!parseCount(optarg, val)) {
        cerr << "Error: Invalid field number '" << optarg << "'\n";
        return 1;
      }
      field_number = val;
      break;
    }
    case 'd': {
      char delimiter;
      if (!parseDelimiter(optarg, delimiter)) {
        cerr << "Error: Delimiter must be a name or a single character\n";
        return 1;
      }
      hints.delimiter = delimiter;
      break;
    }
    case 'q':
      if (strlen(optarg) == 1) {
        hints.quote_char = optarg[0];
      } else {
        cerr << "Error: Quote character must be a single character\n";
        return 1;
      }
      break;
    case 'H':
      hints.has_header = true;
      break;
    case 'N':
      hints.has_header = false;
      break;
    case 'T':
      try {
        type = csvprof::parse_value_type(optarg);
      } catch (const std::invalid_argument& e) {
        cerr << "Error: " << e.what() << "\n";
        return 1;
      }
      break;
    case 'm':
      if (!parseCount(optarg, max_freq) || max_freq == 0) {
        cerr << "Error: Invalid maximum frequency size '" << optarg << "'\n";
        return 1;
      }
      break;
    case 'n':
      if (!parseCount(optarg, top_values)) {
        cerr << "Error: Invalid value count '" << optarg << "'\n";
        return 1;
      }
      break;
    case 'u':
      classifier_options.unknown_markers = parseMarkers(optarg);
      break;
    case 'h':
      printUsage(argv[0]);
      return 0;
    case 'v':
      printVersion();
      return 0;
    default:
      printUsage(argv[0]);
      return 1;
    }
  }

  if (type && command != "field") {
    cerr << "Error: -T applies to the field command only\n";
    return 1;
  }

  if (optind >= argc) {
    cerr << "Error: No input file\n";
    printUsage(argv[0]);
    return 1;
  }
  const string filename = argv[optind];

  csvprof::StandardClassifier classifier(classifier_options);
  csvprof::FieldProfiler profiler(classifier);
  csvprof::DialectDetector detector(filename, hints);

  int result = 0;
  try {
    if (command == "dialect") {
      result = cmdDialect(detector);
    } else if (command == "field") {
      if (!field_number) {
        cerr << "Error: -f option required for field command\n";
        return 1;
      }
      result = cmdField(detector, profiler, *field_number, type, max_freq, top_values);
    } else if (command == "profile") {
      result = cmdProfile(detector, profiler, max_freq, top_values);
    } else {
      cerr << "Error: Unknown command '" << command << "'\n";
      printUsage(argv[0]);
      return 1;
    }
  } catch (const csvprof::IoError& e) {
    cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::out_of_range& e) {
    cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  cout.flush();
  return result;
}
