#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <vector>

namespace taskd {

class TaskStore;  // Forward declaration

/**
 * ShutdownHandler stops the server and closes task stores on SIGTERM,
 * SIGINT or SIGHUP.
 *
 * Usage:
 *   1. Register stores with RegisterStore()
 *   2. Register teardown that must precede store close (e.g. quitting the
 *      event loop) with OnShutdown()
 *   3. Call InstallSignalHandlers()
 *
 * Thread-safe: All methods can be called from any thread.
 */
class ShutdownHandler {
 public:
  ShutdownHandler() = default;
  ~ShutdownHandler();

  // Non-copyable, non-movable
  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /**
   * Register a store to close on shutdown.
   * The store pointer must remain valid until UnregisterStore() or shutdown.
   */
  void RegisterStore(TaskStore* store);

  void UnregisterStore(TaskStore* store);

  /**
   * Route SIGTERM, SIGINT and SIGHUP to Shutdown().
   * Only one handler per process can own the signals; returns false if
   * another handler already does or sigaction fails.
   */
  bool InstallSignalHandlers();

  /** Restore the signal dispositions saved by InstallSignalHandlers(). */
  void RestoreSignalHandlers();

  /**
   * Run shutdown callbacks in registration order, then close all registered
   * stores. Idempotent: returns false if shutdown already ran.
   */
  bool Shutdown();

  bool IsShutdownRequested() const;

  /** Signal that triggered shutdown, or 0 if none did. */
  int ShutdownSignal() const { return signal_.load(); }

  void OnShutdown(std::function<void()> callback);

 private:
  static void SignalHandler(int signum);

  std::mutex mutex_;
  std::vector<TaskStore*> stores_;
  std::vector<std::function<void()>> callbacks_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<int> signal_{0};
  bool handlers_installed_ = false;

  // Original signal handlers to restore
  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

/**
 * Process-wide shutdown handler.
 */
ShutdownHandler& GlobalShutdownHandler();

}  // namespace taskd
