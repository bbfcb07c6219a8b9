#include "common/worker.h"

#include <pthread.h>

#include "common/logging.h"

Worker::Worker(std::string name, std::function<void()> executing_function)
    : abort_(true),
      name_(name),
      executing_function_(executing_function) {}

Worker::~Worker() { Release(); }

void Worker::Release() {
    abort_.store(true);
    if (thread_.joinable()) {
        thread_.join();
        DEBUG_PRINT("'%s' was released!", name_.c_str());
    }
}

void Worker::Run() {
    if (thread_.joinable()) {
        return;
    }
    abort_.store(false);
    thread_ = std::thread([this]() {
        Thread();
    });
    // linux limits thread names to 15 characters
    pthread_setname_np(thread_.native_handle(), name_.substr(0, 15).c_str());
}

void Worker::Thread() {
    while (!abort_.load()) {
        executing_function_();
    }
}
