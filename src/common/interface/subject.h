#ifndef SUBJECT_H_
#define SUBJECT_H_

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

template <typename T> class Observable {
  public:
    Observable(){};
    ~Observable(){};
    using OnMessageFunc = std::function<void(T &)>;

    void Subscribe(OnMessageFunc func) {
        std::lock_guard<std::mutex> lock(mtx_);
        subscribed_func_ = func;
    }

    void UnSubscribe() {
        std::lock_guard<std::mutex> lock(mtx_);
        subscribed_func_ = nullptr;
    }

    void Notify(T &message) {
        OnMessageFunc func;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            func = subscribed_func_;
        }
        if (func) {
            func(message);
        }
    }

  private:
    std::mutex mtx_;
    OnMessageFunc subscribed_func_;
};

/*
 * Observers are invoked synchronously on the publishing thread, in the order
 * they subscribed.
 */
template <typename T> class Subject {
  public:
    virtual ~Subject(){};
    virtual void Next(T &message) {
        std::vector<std::weak_ptr<Observable<T>>> observers;
        {
            std::lock_guard<std::mutex> lock(observers_mtx_);
            RemoveExpiredObservers();
            observers = observers_;
        }
        for (auto &weak : observers) {
            if (auto observer = weak.lock()) {
                observer->Notify(message);
            }
        }
    }

    virtual std::shared_ptr<Observable<T>> AsObservable() {
        auto observer = std::make_shared<Observable<T>>();
        std::lock_guard<std::mutex> lock(observers_mtx_);
        observers_.push_back(observer);
        return observer;
    }

    virtual void UnSubscribe() {
        std::lock_guard<std::mutex> lock(observers_mtx_);
        for (auto &weak : observers_) {
            if (auto observer = weak.lock()) {
                observer->UnSubscribe();
            }
        }
        observers_.clear();
    }

  protected:
    std::mutex observers_mtx_;
    std::vector<std::weak_ptr<Observable<T>>> observers_;

    void RemoveExpiredObservers() {
        auto new_end = std::remove_if(observers_.begin(), observers_.end(),
                                      [](const std::weak_ptr<Observable<T>> &observer) {
                                          return observer.expired();
                                      });
        observers_.erase(new_end, observers_.end());
    }
};

#endif
