#include <taskd/shutdown.hpp>
#include <taskd/store.hpp>

#include <algorithm>
#include <utility>

namespace taskd {

namespace {
// The handler that owns the process signals, if any.
std::atomic<ShutdownHandler*> g_signal_owner{nullptr};
}  // namespace

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();
}

void ShutdownHandler::RegisterStore(TaskStore* store) {
  if (!store) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(stores_.begin(), stores_.end(), store) == stores_.end()) {
    stores_.push_back(store);
  }
}

void ShutdownHandler::UnregisterStore(TaskStore* store) {
  std::lock_guard<std::mutex> lock(mutex_);
  stores_.erase(std::remove(stores_.begin(), stores_.end(), store), stores_.end());
}

void ShutdownHandler::SignalHandler(int signum) {
  ShutdownHandler* owner = g_signal_owner.load();
  if (!owner) return;

  int expected = 0;
  owner->signal_.compare_exchange_strong(expected, signum);
  owner->Shutdown();
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (handlers_installed_) {
    return true;  // Already installed
  }

  ShutdownHandler* expected = nullptr;
  if (!g_signal_owner.compare_exchange_strong(expected, this)) {
    return false;
  }

  struct sigaction sa;
  sa.sa_handler = SignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;  // Restart interrupted syscalls

  if (sigaction(SIGTERM, &sa, &old_sigterm_) != 0) {
    g_signal_owner.store(nullptr);
    return false;
  }
  if (sigaction(SIGINT, &sa, &old_sigint_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    g_signal_owner.store(nullptr);
    return false;
  }
  if (sigaction(SIGHUP, &sa, &old_sighup_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    g_signal_owner.store(nullptr);
    return false;
  }

  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!handlers_installed_) {
    return;
  }

  sigaction(SIGTERM, &old_sigterm_, nullptr);
  sigaction(SIGINT, &old_sigint_, nullptr);
  sigaction(SIGHUP, &old_sighup_, nullptr);

  ShutdownHandler* expected = this;
  g_signal_owner.compare_exchange_strong(expected, nullptr);
  handlers_installed_ = false;
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!shutdown_requested_.compare_exchange_strong(expected, true)) {
    return false;
  }

  // Copy under lock so callbacks and Close() run unlocked.
  std::vector<TaskStore*> stores_copy;
  std::vector<std::function<void()>> callbacks_copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stores_copy.swap(stores_);
    callbacks_copy = callbacks_;
  }

  // Stop taking requests before the stores go away.
  for (const auto& callback : callbacks_copy) {
    if (callback) {
      callback();
    }
  }

  for (TaskStore* store : stores_copy) {
    store->Close();
  }
  return true;
}

bool ShutdownHandler::IsShutdownRequested() const {
  return shutdown_requested_.load();
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

ShutdownHandler& GlobalShutdownHandler() {
  static ShutdownHandler instance;
  return instance;
}

}  // namespace taskd
