#ifndef TIMESTAMP_LOG_H_
#define TIMESTAMP_LOG_H_

#include <cstdint>
#include <fstream>
#include <string>

// `frame_idx,unix_time` CSV written next to each recording.
class TimestampLog {
  public:
    TimestampLog();
    ~TimestampLog();

    bool Open(const std::string &path);
    bool Append(uint64_t frame_idx, double unix_time);
    void Close();
    bool is_open() const;

  private:
    std::ofstream file_;
};

#endif // TIMESTAMP_LOG_H_
