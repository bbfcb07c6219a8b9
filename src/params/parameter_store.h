#ifndef PARAMETER_STORE_H_
#define PARAMETER_STORE_H_

#include <atomic>
#include <mutex>
#include <vector>

#include "common/interface/subject.h"
#include "params/parameter_set.h"

/*
 * Holds the live capture/preview settings. The stored set is always valid: an
 * update either applies every field of the patch or none of them. Observers are
 * notified after the new set is visible through Get().
 */
class ParameterStore : public Subject<ParameterUpdate> {
  public:
    static const int kMinFps = 5;
    static const int kMaxFps = 120;
    static const int kMaxExposureUs = 1000000;
    static constexpr float kMaxGain = 16.0f;
    static constexpr double kMaxBaselineMm = 1000.0;
    static const std::vector<Resolution> &SupportedResolutions();

    // Throws ParameterError if `initial` is not valid.
    explicit ParameterStore(ParameterSet initial = ParameterSet());

    ParameterSet Get() const;
    // Throws ParameterError naming the first invalid field, or with reason LOCKED
    // when the resolution changes while it is locked.
    ParameterChange Update(const ParameterPatch &patch);
    // Puts back a set an observer failed to apply. Observers are not notified.
    void Restore(const ParameterSet &params);

    // Recording locks the resolution so the encoder frame size stays constant.
    void LockResolution(bool locked);
    bool resolution_locked() const;

    static void Validate(const ParameterSet &params);
    static ParameterSet Apply(const ParameterSet &current, const ParameterPatch &patch);
    static ParameterChange Diff(const ParameterSet &before, const ParameterSet &after);

  private:
    mutable std::mutex mtx_;
    ParameterSet params_;
    std::atomic<bool> resolution_locked_;
};

#endif // PARAMETER_STORE_H_
