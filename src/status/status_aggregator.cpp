#include "status/status_aggregator.h"

#include <chrono>
#include <cstdio>

#include "common/logging.h"
#include "common/utils.h"
#include "status/system_stats.h"

std::unique_ptr<StatusAggregator> StatusAggregator::Create(StatusConfig config,
                                                           RuntimeProbe probe) {
    return std::make_unique<StatusAggregator>(std::move(config), std::move(probe));
}

StatusAggregator::StatusAggregator(StatusConfig config, RuntimeProbe probe)
    : config_(std::move(config)),
      probe_(std::move(probe)),
      temp_warned_(false),
      battery_warned_(false),
      abort_(true) {}

StatusAggregator::~StatusAggregator() { Stop(); }

void StatusAggregator::Start() {
    if (worker_) {
        return;
    }
    abort_ = false;
    worker_ = std::make_unique<Worker>("StatusPoll", [this]() {
        Poll();
        std::unique_lock<std::mutex> lock(wait_mtx_);
        cond_var_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms), [this] {
            return abort_.load();
        });
    });
    worker_->Run();
}

void StatusAggregator::Stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mtx_);
        abort_ = true;
    }
    cond_var_.notify_all();
    worker_.reset();
}

StatusSnapshot StatusAggregator::Poll() {
    StatusSnapshot snapshot;
    snapshot.cpu_temp_c = SystemStats::ReadCpuTempC(config_.thermal_path);
    snapshot.free_gb = SystemStats::ReadFreeGb(config_.storage_path);
    snapshot.battery_v = SystemStats::ReadBatteryV(config_.battery_path, config_.battery_scale);
    snapshot.sampled_at = Utils::UnixTimeNow();
    if (probe_) {
        probe_(snapshot);
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        CheckThresholds(snapshot);
        latest_ = snapshot;
    }
    Next(snapshot);
    return snapshot;
}

std::optional<StatusSnapshot> StatusAggregator::latest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return latest_;
}

void StatusAggregator::CheckThresholds(StatusSnapshot &snapshot) {
    bool too_hot = snapshot.cpu_temp_c && *snapshot.cpu_temp_c > config_.temp_warn_c;
    if (too_hot && !temp_warned_) {
        WARN_PRINT("CPU temperature %.1f°C exceeds %.1f°C", *snapshot.cpu_temp_c,
                   config_.temp_warn_c);
    }
    temp_warned_ = too_hot;
    snapshot.temp_warning = too_hot;

    bool battery_low = config_.battery_warn_v > 0 && snapshot.battery_v &&
                       *snapshot.battery_v < config_.battery_warn_v;
    if (battery_low && !battery_warned_) {
        WARN_PRINT("Battery voltage %.2f V is below %.2f V", *snapshot.battery_v,
                   config_.battery_warn_v);
    }
    battery_warned_ = battery_low;
    snapshot.battery_warning = battery_low;
}

std::string StatusAggregator::FormatStatusLine(const StatusSnapshot &snapshot) {
    auto format = [](const std::optional<double> &value, const char *fmt) -> std::string {
        if (!value) {
            return "--";
        }
        char buf[32];
        snprintf(buf, sizeof(buf), fmt, *value);
        return buf;
    };

    return "FPS: " + format(snapshot.preview_fps, "%.1f") +
           " | CPU: " + format(snapshot.cpu_temp_c, "%.1f°C") +
           " | Free: " + format(snapshot.free_gb, "%.1f GB") +
           " | Batt: " + format(snapshot.battery_v, "%.2f V");
}
