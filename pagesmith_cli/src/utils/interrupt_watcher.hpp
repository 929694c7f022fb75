#ifndef PAGESMITH_INTERRUPT_WATCHER_HPP
#define PAGESMITH_INTERRUPT_WATCHER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>
#include <utility>

/**
 * @brief Turns an interrupt flag into a callback on an ordinary thread.
 *
 * @details A signal handler may only store to a lock-free atomic. The watcher
 * polls that flag and runs @p on_interrupt outside signal context, so the
 * callback is free to take locks. The callback repeats on every poll while
 * the flag stays set, so a stop requested before the work started is not
 * lost. The thread is stopped and joined on destruction.
 */
class InterruptWatcher {
public:
    InterruptWatcher(const std::atomic<bool>& flag, std::function<void()> on_interrupt,
                     const std::chrono::milliseconds poll = std::chrono::milliseconds(50))
        : thread_([&flag, callback = std::move(on_interrupt), poll](const std::stop_token& st) {
              while (!st.stop_requested()) {
                  if (flag.load()) {
                      callback();
                  }
                  std::this_thread::sleep_for(poll);
              }
          }) {}

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    std::jthread thread_;
};

#endif // PAGESMITH_INTERRUPT_WATCHER_HPP
