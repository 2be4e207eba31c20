#pragma once

#include "Module.h"
#include "Utilities.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace cl {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Derived classes implement runLoop(), which should return once isStopSet()
 * becomes true. Derived destructors must call stop() themselves: the hooks
 * are virtual and cannot be reached from ~Service().
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_RUNNING = -1;
  static constexpr const int32_t E_START = -2;

  explicit Service(const std::string &name);
  ~Service() override;

  bool isStopSet() const { return isStopSet_; }
  bool isRunning() const { return isRunning_; }

  Roe<void> start();
  void stop();

protected:
  virtual void runLoop() = 0;

  /**
   * Called in the caller's thread before the service thread starts.
   * An error aborts start().
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called after the stop flag is set and before joining, to unblock a
   * runLoop() that waits on something other than the stop flag.
   */
  virtual void onStopping() {}

  // Called in the caller's thread after the service thread has joined
  virtual void onStop() {}

  /**
   * Wait up to `duration`, waking early when stop() is called.
   * @return false if stop was requested
   */
  bool sleepUnlessStopped(std::chrono::milliseconds duration);

private:
  std::atomic<bool> isStopSet_{ true };
  std::atomic<bool> isRunning_{ false };
  std::mutex waitMutex_;
  std::condition_variable waitCv_;
  std::thread thread_;
};

} // namespace cl
