#pragma once

#include "ImmediateScheduler.h"

#include <async++.h>

#include <memory>

namespace TesseraAsync {

class ITaskProcessor;

namespace Impl {
//! @cond Doxygen_Suppress

// An async++ scheduler that hands every task to an ITaskProcessor.
class TaskScheduler {
public:
  TaskScheduler(const std::shared_ptr<ITaskProcessor>& pTaskProcessor);
  void schedule(async::task_run_handle t);

  ImmediateScheduler<TaskScheduler> immediate{this};

private:
  std::shared_ptr<ITaskProcessor> _pTaskProcessor;
};

// The schedulers shared by every copy of an AsyncSystem.
struct AsyncSystemSchedulers {
  AsyncSystemSchedulers(const std::shared_ptr<ITaskProcessor>& pTaskProcessor)
      : workerThread(pTaskProcessor) {}

  TaskScheduler workerThread;
};

//! @endcond
} // namespace Impl
} // namespace TesseraAsync
