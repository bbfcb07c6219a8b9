#ifndef WORKER_H_
#define WORKER_H_

#include <atomic>
#include <functional>
#include <string>
#include <thread>

class Worker {
  public:
    Worker(std::string name, std::function<void()> executing_function);
    ~Worker();
    void Release();
    void Run();

  private:
    std::atomic<bool> abort_;
    std::string name_;
    std::function<void()> executing_function_;
    std::thread thread_;

    void Thread();
};

#endif
