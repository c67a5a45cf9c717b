#include <TesseraAsync/ITaskProcessor.h>
#include <TesseraAsync/Impl/TaskScheduler.h>

#include <async++.h>

#include <memory>
#include <utility>

using namespace TesseraAsync::Impl;

TaskScheduler::TaskScheduler(
    const std::shared_ptr<TesseraAsync::ITaskProcessor>& pTaskProcessor)
    : _pTaskProcessor(pTaskProcessor) {}

void TaskScheduler::schedule(async::task_run_handle t) {
  // std::function must be copyable, but task_run_handle is move-only, so it
  // travels to the task processor inside a shared_ptr.
  struct Receiver {
    async::task_run_handle taskHandle;
  };

  std::shared_ptr<Receiver> pReceiver = std::make_shared<Receiver>();
  pReceiver->taskHandle = std::move(t);

  this->_pTaskProcessor->startTask([this, pReceiver]() mutable {
    auto scope = this->immediate.scope();
    pReceiver->taskHandle.run();
  });
}
