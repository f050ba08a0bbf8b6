#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

using LabelPairs = std::vector<std::pair<std::string, std::string>>;

// Identity of one metric series: name plus a canonical (sorted by label name) label set.
class MetricKey {
public:
  // Validates name and labels; throws std::invalid_argument on the first violation.
  static MetricKey make(const std::string& name, const Labels& labels = {});

  const std::string& name() const { return name_; }
  const LabelPairs& labels() const { return labels_; }

  // `{a="1",b="2"}`, or "" without labels. An extra pair (e.g. le) is appended last.
  std::string render_labels(const std::string& extra_name = "",
                            const std::string& extra_value = "") const;
  // `<prefix><name>{...}`
  std::string render(const std::string& prefix = "") const;

  bool operator==(const MetricKey& o) const { return name_ == o.name_ && labels_ == o.labels_; }
  bool operator!=(const MetricKey& o) const { return !(*this == o); }
  bool operator<(const MetricKey& o) const {
    if (name_ != o.name_) return name_ < o.name_;
    return labels_ < o.labels_;
  }

private:
  MetricKey(std::string name, LabelPairs labels)
      : name_(std::move(name)), labels_(std::move(labels)) {}

  std::string name_;
  LabelPairs labels_;
};

struct MetricKeyHash {
  size_t operator()(const MetricKey& k) const noexcept;
};

bool valid_metric_name(const std::string& name);
bool valid_label_name(const std::string& name);
// Reserved for the exposition format itself (le, quantile) or internal use (__*).
bool reserved_label_name(const std::string& name);
// Throws std::invalid_argument naming `metric` on the first invalid or reserved label name.
void check_label_names(const std::string& metric, const Labels& labels);
