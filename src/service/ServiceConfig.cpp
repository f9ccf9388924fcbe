// Repository: Reelforge
// Component: Service Configuration
// Purpose: Parse and validate ServiceConfig from JSON.
// Copyright (c) 2025 Reelforge

#include "reelforge/service/ServiceConfig.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace reelforge::service {

namespace {
  // The schema is fixed and flat, so fields are pulled out with regexes.
  // Each Extract* returns false if the field is absent; a present but
  // unparseable field sets *bad instead.

  bool ExtractInt64(const std::string& json, const std::string& field_name, int64_t& out_value,
                    bool* bad) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?[0-9A-Za-z.+\"]+)");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }
    const std::string raw = match[1].str();
    if (!std::regex_match(raw, std::regex(R"(-?\d+)"))) {
      *bad = true;
      return false;
    }
    try {
      out_value = std::stoll(raw);
      return true;
    } catch (const std::exception&) {
      *bad = true;
      return false;
    }
  }

  bool ExtractDouble(const std::string& json, const std::string& field_name, double& out_value,
                     bool* bad) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?[0-9A-Za-z.+\"]+)");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }
    const std::string raw = match[1].str();
    if (!std::regex_match(raw, std::regex(R"(-?\d+(\.\d+)?)"))) {
      *bad = true;
      return false;
    }
    try {
      out_value = std::stod(raw);
      return true;
    } catch (const std::exception&) {
      *bad = true;
      return false;
    }
  }

  bool ExtractString(const std::string& json, const std::string& field_name,
                     std::string& out_value) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\"([^\"]+)\"");
    std::smatch match;
    if (std::regex_search(json, match, pattern)) {
      out_value = match[1].str();
      return true;
    }
    return false;
  }

  // ["a", "b"] -> {a, b}. Only string elements are accepted.
  bool ExtractStringArray(const std::string& json, const std::string& field_name,
                          std::vector<std::string>& out_values, bool* bad) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\\[([^\\]]*)\\]");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }
    const std::string body = match[1].str();
    if (!std::regex_match(body, std::regex(R"(\s*("[^"]*"\s*(,\s*"[^"]*"\s*)*)?)"))) {
      *bad = true;
      return false;
    }
    std::vector<std::string> values;
    const std::regex element("\"([^\"]*)\"");
    for (auto it = std::sregex_iterator(body.begin(), body.end(), element);
         it != std::sregex_iterator(); ++it) {
      values.push_back((*it)[1].str());
    }
    out_values = std::move(values);
    return true;
  }

  bool ExtractNestedObject(const std::string& json, const std::string& field_name,
                           std::string& out_json) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\\{");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }

    size_t start_pos = match.position() + match.length() - 1;  // '{'
    int brace_count = 1;
    size_t pos = start_pos + 1;
    while (pos < json.length() && brace_count > 0) {
      if (json[pos] == '{') brace_count++;
      else if (json[pos] == '}') brace_count--;
      pos++;
    }

    if (brace_count == 0) {
      out_json = json.substr(start_pos, pos - start_pos);
      return true;
    }
    return false;
  }

  std::string JoinQuoted(const std::vector<std::string>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
      if (i > 0) oss << ",";
      oss << "\"" << values[i] << "\"";
    }
    oss << "]";
    return oss.str();
  }
}  // namespace

std::optional<ServiceConfig> ServiceConfig::FromJson(const std::string& json_str) {
  if (json_str.find('{') == std::string::npos) {
    return std::nullopt;
  }

  ServiceConfig config;
  bool bad = false;
  int64_t v = 0;
  double d = 0.0;

  ExtractString(json_str, "listen_address", config.listen_address);

  std::string encode_json;
  if (ExtractNestedObject(json_str, "encode", encode_json)) {
    std::string frame_rate;
    if (ExtractString(encode_json, "frame_rate", frame_rate)) {
      auto fps = media::ParseRationalFps(frame_rate);
      if (!fps) return std::nullopt;
      config.fps = *fps;
    }
    if (ExtractInt64(encode_json, "video_bitrate_bps", v, &bad)) config.video_bitrate_bps = v;
    if (ExtractInt64(encode_json, "audio_sample_rate", v, &bad)) {
      config.audio.sample_rate = static_cast<int>(v);
    }
    if (ExtractInt64(encode_json, "audio_channels", v, &bad)) {
      config.audio.channel_count = static_cast<int>(v);
    }
    if (ExtractInt64(encode_json, "audio_bitrate_bps", v, &bad)) config.audio.bitrate_bps = v;
  }

  std::string rate_json;
  if (ExtractNestedObject(json_str, "rate_limit", rate_json)) {
    if (ExtractInt64(rate_json, "max_requests", v, &bad)) {
      config.rate_limit.max_requests = static_cast<int>(v);
    }
    if (ExtractInt64(rate_json, "window_ms", v, &bad)) config.rate_limit.window_ms = v;
    if (ExtractInt64(rate_json, "block_duration_ms", v, &bad)) {
      config.rate_limit.block_duration_ms = v;
    }
    if (ExtractInt64(rate_json, "cleanup_interval_ms", v, &bad)) {
      config.rate_limit_cleanup_interval_ms = v;
    }
  }

  std::string abuse_json;
  if (ExtractNestedObject(json_str, "abuse", abuse_json)) {
    if (ExtractInt64(abuse_json, "max_file_size_bytes", v, &bad)) {
      if (v <= 0) return std::nullopt;
      config.abuse.max_file_size_bytes = static_cast<uint64_t>(v);
    }
    if (ExtractDouble(abuse_json, "max_duration_seconds", d, &bad)) {
      config.abuse.max_duration_seconds = d;
    }
    if (ExtractInt64(abuse_json, "max_concurrent_jobs", v, &bad)) {
      if (v <= 0) return std::nullopt;
      config.abuse.max_concurrent_jobs = static_cast<size_t>(v);
    }
    ExtractStringArray(abuse_json, "allowed_formats", config.abuse.allowed_formats, &bad);
    ExtractStringArray(abuse_json, "denied_filename_patterns",
                       config.abuse.denied_filename_patterns, &bad);
  }

  std::string jobs_json;
  if (ExtractNestedObject(json_str, "jobs", jobs_json)) {
    if (ExtractInt64(jobs_json, "retention_ms", v, &bad)) config.jobs.retention_ms = v;
    if (ExtractInt64(jobs_json, "sweep_interval_ms", v, &bad)) config.jobs.sweep_interval_ms = v;
    if (ExtractInt64(jobs_json, "max_metrics_history", v, &bad)) {
      if (v <= 0) return std::nullopt;
      config.jobs.max_metrics_history = static_cast<size_t>(v);
    }
    if (ExtractInt64(jobs_json, "throughput_window_ms", v, &bad)) {
      config.jobs.throughput_window_ms = v;
    }
  }

  if (bad || !config.IsValid()) {
    return std::nullopt;
  }
  return config;
}

std::string ServiceConfig::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"listen_address\":\"" << listen_address << "\","
      << "\"encode\":{"
      << "\"frame_rate\":\"" << media::FormatRationalFps(fps) << "\","
      << "\"video_bitrate_bps\":" << video_bitrate_bps << ","
      << "\"audio_sample_rate\":" << audio.sample_rate << ","
      << "\"audio_channels\":" << audio.channel_count << ","
      << "\"audio_bitrate_bps\":" << audio.bitrate_bps
      << "},"
      << "\"rate_limit\":{"
      << "\"max_requests\":" << rate_limit.max_requests << ","
      << "\"window_ms\":" << rate_limit.window_ms << ","
      << "\"block_duration_ms\":" << rate_limit.block_duration_ms << ","
      << "\"cleanup_interval_ms\":" << rate_limit_cleanup_interval_ms
      << "},"
      << "\"abuse\":{"
      << "\"max_file_size_bytes\":" << abuse.max_file_size_bytes << ","
      << "\"max_duration_seconds\":" << abuse.max_duration_seconds << ","
      << "\"max_concurrent_jobs\":" << abuse.max_concurrent_jobs << ","
      << "\"allowed_formats\":" << JoinQuoted(abuse.allowed_formats) << ","
      << "\"denied_filename_patterns\":" << JoinQuoted(abuse.denied_filename_patterns)
      << "},"
      << "\"jobs\":{"
      << "\"retention_ms\":" << jobs.retention_ms << ","
      << "\"sweep_interval_ms\":" << jobs.sweep_interval_ms << ","
      << "\"max_metrics_history\":" << jobs.max_metrics_history << ","
      << "\"throughput_window_ms\":" << jobs.throughput_window_ms
      << "}"
      << "}";
  return oss.str();
}

bool ServiceConfig::IsValid() const {
  if (listen_address.empty()) return false;
  if (!fps.IsValid() || video_bitrate_bps <= 0) return false;
  if (!audio.IsValid()) return false;
  if (rate_limit.max_requests <= 0 || rate_limit.window_ms <= 0 ||
      rate_limit.block_duration_ms < 0) {
    return false;
  }
  if (rate_limit_cleanup_interval_ms <= 0) return false;
  if (abuse.max_duration_seconds <= 0 || abuse.max_concurrent_jobs == 0) return false;
  if (jobs.retention_ms <= 0 || jobs.sweep_interval_ms <= 0 || jobs.max_metrics_history == 0 ||
      jobs.throughput_window_ms <= 0) {
    return false;
  }
  return true;
}

}  // namespace reelforge::service
