#pragma once

#include <TesseraAsync/Library.h>

#include <functional>

namespace TesseraAsync {
/**
 * @brief Runs tasks in background threads on behalf of an
 * {@link AsyncSystem}.
 *
 * Implemented by the host application, which decides how many threads to use
 * and how they are scheduled.
 */
class TESSERAASYNC_API ITaskProcessor {
public:
  virtual ~ITaskProcessor() = default;

  /**
   * @brief Starts a task that executes the given function in a background
   * thread.
   *
   * @param f The function to execute
   */
  virtual void startTask(std::function<void()> f) = 0;
};
} // namespace TesseraAsync
