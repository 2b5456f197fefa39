#include "hib/metrics.hpp"
#include "hib/log.hpp"

#include <cstdio>

#include <prometheus/text_serializer.h>

namespace hib {

MetricsExporter::MetricsExporter(std::filesystem::path prom_file, std::chrono::seconds interval,
                                 const std::map<std::string, std::string>& const_labels)
    : prom_file_(std::move(prom_file))
    , interval_(interval)
    , registry_(std::make_shared<prometheus::Registry>()) {
    auto counter_family = [&](const char* name, const char* help) -> auto& {
        return prometheus::BuildCounter().Name(name).Help(help).Labels(const_labels).Register(*registry_);
    };

    auto& transfers = counter_family("hib_transfers_total", "Transfers finished, by direction and result");
    auto& bytes = counter_family("hib_transfer_bytes_total", "Bytes moved by successful transfers");
    for (auto direction : {Direction::Backup, Direction::Upload}) {
        std::string dir = direction_name(direction);
        bytes_[direction] = &bytes.Add({{"direction", dir}});
        for (auto outcome : {Outcome::Success, Outcome::Failed, Outcome::Skipped}) {
            transfers_[{direction, outcome}] =
                &transfers.Add({{"direction", dir}, {"result", outcome_name(outcome)}});
        }
    }

    retries_ = &counter_family("hib_retries_total", "Transfer attempts beyond the first").Add({});
    skipped_ = &counter_family("hib_skipped_total",
                               "Candidates skipped because local state already matched").Add({});

    in_flight_ = &prometheus::BuildGauge()
        .Name("hib_transfers_in_flight")
        .Help("Transfers currently executing")
        .Labels(const_labels)
        .Register(*registry_)
        .Add({});

    duration_ = &prometheus::BuildHistogram()
        .Name("hib_transfer_duration_seconds")
        .Help("Duration of one transfer attempt in seconds")
        .Labels(const_labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    std::lock_guard lock(mutex_);
    if (!stopping_) return;
    stopping_ = false;
    writer_ = std::thread([this] {
        std::unique_lock lock(mutex_);
        while (!wake_.wait_for(lock, interval_, [this] { return stopping_; })) {
            lock.unlock();
            write_file();
            lock.lock();
        }
    });
}

void MetricsExporter::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    wake_.notify_all();
    if (writer_.joinable()) writer_.join();
    write_file();
}

bool MetricsExporter::write_file() {
    std::string text = prometheus::TextSerializer().Serialize(registry_->Collect());
    std::string tmp = prom_file_.string() + ".tmp";

    FILE* out = std::fopen(tmp.c_str(), "w");
    if (!out) {
        log_warn("metrics: cannot open %s", tmp.c_str());
        return false;
    }
    bool written = std::fwrite(text.data(), 1, text.size(), out) == text.size();
    written = (std::fclose(out) == 0) && written;
    if (!written) {
        log_warn("metrics: short write to %s", tmp.c_str());
        std::remove(tmp.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp, prom_file_, ec);
    if (ec) {
        log_warn("metrics: cannot replace %s: %s", prom_file_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace hib
