#include "field_profile.h"

#include <utility>

namespace csvprof {

FieldProfiler::FieldProfiler(const ValueClassifier& classifier, const StatisticsOptions& options)
    : stats_(classifier, options) {}

FieldProfile FieldProfiler::profile_values(const std::string& name,
                                           const FieldFrequency& frequency,
                                           std::optional<ValueType> declared_type) const {
    const FrequencyMap& freq = frequency.freq;

    FieldProfile profile;
    profile.name = name;
    profile.type_inferred = !declared_type.has_value();
    profile.type = declared_type ? *declared_type : stats_.infer_type(freq);
    profile.field_case = stats_.get_case(profile.type, freq);
    profile.min_value = stats_.get_min(profile.type, freq);
    profile.max_value = stats_.get_max(profile.type, freq);
    profile.min_length = stats_.get_min_length(freq);
    profile.max_length = stats_.get_max_length(freq);
    profile.distinct_count = freq.size();
    profile.unknown_count = stats_.count_unknown(freq);
    profile.records_scanned = frequency.records_scanned;
    profile.truncated = frequency.truncated;
    profile.freq = freq;
    return profile;
}

FieldProfile FieldProfiler::profile_field(const std::string& path, size_t field_number,
                                          const ScanOptions& options,
                                          std::optional<ValueType> declared_type,
                                          ErrorCollector* errors) const {
    std::optional<std::string> name =
        get_field_name(path, field_number, options.has_header, options.dialect);
    FieldFrequency frequency = get_field_freq(path, field_number, options, errors);

    FieldProfile profile =
        profile_values(name.value_or("field_num_" + std::to_string(field_number)), frequency,
                       declared_type);
    profile.field_number = field_number;
    return profile;
}

std::vector<FieldProfile> FieldProfiler::profile_file(DialectDetector& detector,
                                                      size_t max_freq_size,
                                                      ErrorCollector* errors) const {
    detector.analyze(errors);
    const DialectInfo& info = detector.info();
    ScanOptions options = ScanOptions::from_info(info, max_freq_size);

    std::vector<FieldProfile> profiles;
    profiles.reserve(info.field_count);
    for (size_t i = 0; i < info.field_count; ++i) {
        profiles.push_back(profile_field(detector.path(), i, options, std::nullopt, errors));
    }
    return profiles;
}

} // namespace csvprof
