#ifndef SYSTEM_STATS_H_
#define SYSTEM_STATS_H_

#include <optional>
#include <string>

// sysfs and filesystem readings. An unreadable source yields no value.
class SystemStats {
  public:
    static constexpr const char *kThermalPath = "/sys/class/thermal/thermal_zone0/temp";

    // thermal_zone files report milli-degrees Celsius.
    static std::optional<double> ReadCpuTempC(const std::string &path = kThermalPath);
    static std::optional<double> ReadFreeGb(const std::string &path = "/");
    // `scale` converts the raw integer into volts, e.g. 1e-6 for voltage_now
    // (microvolts) or 1e-3 for an hwmon in*_input (millivolts).
    static std::optional<double> ReadBatteryV(const std::string &path, double scale);

    static std::optional<long long> ParseInteger(const std::string &text);
};

#endif // SYSTEM_STATS_H_
