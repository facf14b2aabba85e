#include <keyco/core/metrics.h>

#include <algorithm>
#include <sstream>

namespace keyco {
namespace {

void AppendEscaped(std::ostringstream& oss, const std::string& v) {
    for (char c : v) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"': oss << "\\\""; break;
            case '\n': oss << "\\n"; break;
            default: oss << c; break;
        }
    }
}

std::string LabelText(const MetricLabels& labels) {
    if (labels.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [k, v] : labels) {
        if (!first) {
            oss << ',';
        }
        first = false;
        oss << k << "=\"";
        AppendEscaped(oss, v);
        oss << '"';
    }
    oss << '}';
    return oss.str();
}

void WriteHeader(std::ostringstream& oss, const std::string& name, const std::string& help, const char* type) {
    oss << "# HELP " << name << ' ' << help << '\n';
    oss << "# TYPE " << name << ' ' << type << '\n';
}

} // namespace

Histogram::Histogram(std::vector<double> bounds) : bounds_(std::move(bounds)) {
    std::sort(bounds_.begin(), bounds_.end());
    bounds_.erase(std::unique(bounds_.begin(), bounds_.end()), bounds_.end());
    counts_.assign(bounds_.size(), 0);
}

void Histogram::Observe(double v) {
    std::lock_guard<std::mutex> lk(mu_);
    sum_ += v;
    ++count_;
    auto it = std::lower_bound(bounds_.begin(), bounds_.end(), v);
    if (it != bounds_.end()) {
        ++counts_[static_cast<std::size_t>(it - bounds_.begin())];
    }
}

Histogram::Snapshot Histogram::Take() const {
    std::lock_guard<std::mutex> lk(mu_);
    return Snapshot{bounds_, counts_, sum_, count_};
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const std::string& help, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& fam = counters_[name];
    if (fam.help.empty()) {
        fam.help = help;
    }
    auto& slot = fam.series[labels];
    if (!slot) {
        slot = std::make_unique<Counter>();
    }
    return *slot;
}

Gauge& MetricsRegistry::GetGauge(const std::string& name, const std::string& help, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& fam = gauges_[name];
    if (fam.help.empty()) {
        fam.help = help;
    }
    auto& slot = fam.series[labels];
    if (!slot) {
        slot = std::make_unique<Gauge>();
    }
    return *slot;
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name, const std::string& help,
                                         const std::vector<double>& bounds, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& fam = histograms_[name];
    if (fam.help.empty()) {
        fam.help = help;
    }
    auto& slot = fam.series[labels];
    if (!slot) {
        slot = std::make_unique<Histogram>(bounds);
    }
    return *slot;
}

std::string MetricsRegistry::ToPrometheusText() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;

    for (const auto& [name, fam] : counters_) {
        WriteHeader(oss, name, fam.help, "counter");
        for (const auto& [labels, c] : fam.series) {
            oss << name << LabelText(labels) << ' ' << c->Value() << '\n';
        }
    }

    for (const auto& [name, fam] : gauges_) {
        WriteHeader(oss, name, fam.help, "gauge");
        for (const auto& [labels, g] : fam.series) {
            oss << name << LabelText(labels) << ' ' << g->Value() << '\n';
        }
    }

    for (const auto& [name, fam] : histograms_) {
        WriteHeader(oss, name, fam.help, "histogram");
        for (const auto& [labels, h] : fam.series) {
            auto snap = h->Take();
            std::uint64_t cumulative = 0;
            for (std::size_t i = 0; i < snap.bounds.size(); ++i) {
                cumulative += snap.counts[i];
                auto with_le = labels;
                std::ostringstream le;
                le << snap.bounds[i];
                with_le["le"] = le.str();
                oss << name << "_bucket" << LabelText(with_le) << ' ' << cumulative << '\n';
            }
            auto inf = labels;
            inf["le"] = "+Inf";
            oss << name << "_bucket" << LabelText(inf) << ' ' << snap.count << '\n';
            oss << name << "_sum" << LabelText(labels) << ' ' << snap.sum << '\n';
            oss << name << "_count" << LabelText(labels) << ' ' << snap.count << '\n';
        }
    }

    return oss.str();
}

} // namespace keyco
