#include "Service.h"

namespace cl {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  // Derived part is gone by now; only make sure the thread is not leaked
  isStopSet_ = true;
  waitCv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

Service::Roe<void> Service::start() {
  if (isRunning_) {
    return Error(E_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_START, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (!isRunning_) {
    return;
  }

  log().info << "Stopping service";

  {
    std::lock_guard<std::mutex> lock(waitMutex_);
    isStopSet_ = true;
  }
  waitCv_.notify_all();
  onStopping();

  if (thread_.joinable()) {
    thread_.join();
  }

  onStop();
  isRunning_ = false;

  log().info << "Service stopped";
}

bool Service::sleepUnlessStopped(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(waitMutex_);
  waitCv_.wait_for(lock, duration, [this] { return isStopSet_.load(); });
  return !isStopSet_;
}

} // namespace cl
