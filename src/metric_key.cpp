#include "metric_key.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <functional>
#include <stdexcept>

namespace {

bool name_start(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool name_char(char c) { return name_start(c) || (c >= '0' && c <= '9'); }

std::string escape_label_value(const std::string& v) {
  std::string out;
  out.reserve(v.size());
  for (char c : v) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        out += c;
    }
  }
  return out;
}

inline void hash_combine(size_t& seed, size_t h) {
  seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // namespace

bool valid_metric_name(const std::string& name) {
  if (name.empty()) return false;
  if (!(name_start(name[0]) || name[0] == ':')) return false;
  return std::all_of(name.begin() + 1, name.end(),
                     [](char c) { return name_char(c) || c == ':'; });
}

bool valid_label_name(const std::string& name) {
  if (name.empty() || !name_start(name[0])) return false;
  return std::all_of(name.begin() + 1, name.end(), name_char);
}

bool reserved_label_name(const std::string& name) {
  return name == "le" || name == "quantile" || name.rfind("__", 0) == 0;
}

void check_label_names(const std::string& metric, const Labels& labels) {
  for (const auto& kv : labels) {
    const std::string& k = kv.first;
    if (!valid_label_name(k)) {
      throw std::invalid_argument(
          fmt::format("invalid label name '{}' on metric '{}'", k, metric));
    }
    if (reserved_label_name(k)) {
      throw std::invalid_argument(
          fmt::format("label name '{}' is reserved (metric '{}')", k, metric));
    }
  }
}

MetricKey MetricKey::make(const std::string& name, const Labels& labels) {
  if (!valid_metric_name(name)) {
    throw std::invalid_argument(fmt::format("invalid metric name '{}'", name));
  }
  check_label_names(name, labels);
  LabelPairs pairs(labels.begin(), labels.end());
  std::sort(pairs.begin(), pairs.end());
  return MetricKey(name, std::move(pairs));
}

std::string MetricKey::render_labels(const std::string& extra_name,
                                     const std::string& extra_value) const {
  if (labels_.empty() && extra_name.empty()) return "";
  std::string out = "{";
  bool first = true;
  for (const auto& [k, v] : labels_) {
    if (!first) out += ',';
    out += fmt::format("{}=\"{}\"", k, escape_label_value(v));
    first = false;
  }
  if (!extra_name.empty()) {
    if (!first) out += ',';
    out += fmt::format("{}=\"{}\"", extra_name, escape_label_value(extra_value));
  }
  out += '}';
  return out;
}

std::string MetricKey::render(const std::string& prefix) const {
  return prefix + name_ + render_labels();
}

size_t MetricKeyHash::operator()(const MetricKey& k) const noexcept {
  std::hash<std::string> h;
  size_t seed = h(k.name());
  for (const auto& [lk, lv] : k.labels()) {
    hash_combine(seed, h(lk));
    hash_combine(seed, h(lv));
  }
  return seed;
}
