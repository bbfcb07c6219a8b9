#ifndef STATUS_AGGREGATOR_H_
#define STATUS_AGGREGATOR_H_

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "common/interface/subject.h"
#include "common/worker.h"

struct StatusSnapshot {
    std::optional<double> preview_fps;
    std::optional<double> capture_fps;
    std::optional<double> cpu_temp_c;
    std::optional<double> free_gb;
    std::optional<double> battery_v;
    double sampled_at = 0.0;
    bool recording = false;
    bool temp_warning = false;
    bool battery_warning = false;
};

struct StatusConfig {
    std::string thermal_path = "/sys/class/thermal/thermal_zone0/temp";
    std::string storage_path = "/";
    std::string battery_path;
    double battery_scale = 1e-6;
    int interval_ms = 1000;
    double temp_warn_c = 80.0;
    double battery_warn_v = 0.0;
};

class StatusAggregator : public Subject<StatusSnapshot> {
  public:
    // Fills the runtime fields (fps, recording) of a snapshot being sampled.
    using RuntimeProbe = std::function<void(StatusSnapshot &)>;

    static std::unique_ptr<StatusAggregator> Create(StatusConfig config,
                                                    RuntimeProbe probe = nullptr);

    StatusAggregator(StatusConfig config, RuntimeProbe probe);
    ~StatusAggregator();

    void Start();
    void Stop();

    StatusSnapshot Poll();
    std::optional<StatusSnapshot> latest() const;

    static std::string FormatStatusLine(const StatusSnapshot &snapshot);

  private:
    StatusConfig config_;
    RuntimeProbe probe_;
    mutable std::mutex mtx_;
    std::optional<StatusSnapshot> latest_;
    bool temp_warned_;
    bool battery_warned_;

    std::atomic<bool> abort_;
    std::mutex wait_mtx_;
    std::condition_variable cond_var_;
    std::unique_ptr<Worker> worker_;

    // Called with mtx_ held, Poll() runs on the poller and on request threads.
    void CheckThresholds(StatusSnapshot &snapshot);
};

#endif // STATUS_AGGREGATOR_H_
