#ifndef ERRORS_H_
#define ERRORS_H_

#include <stdexcept>
#include <string>

class CaptureError : public std::runtime_error {
  public:
    explicit CaptureError(const std::string &message)
        : std::runtime_error(message) {}
};

class RecordingError : public std::runtime_error {
  public:
    explicit RecordingError(const std::string &message)
        : std::runtime_error(message) {}
};

class ParameterError : public std::runtime_error {
  public:
    enum class Reason {
        INVALID,
        LOCKED
    };

    ParameterError(std::string field, const std::string &message, Reason reason = Reason::INVALID)
        : std::runtime_error(field + ": " + message),
          field_(std::move(field)),
          reason_(reason) {}

    const std::string &field() const { return field_; }
    Reason reason() const { return reason_; }

  private:
    std::string field_;
    Reason reason_;
};

#endif // ERRORS_H_
