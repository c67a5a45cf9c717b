#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/ITaskProcessor.h>
#include <TesseraAsync/Impl/TaskScheduler.h>

#include <memory>

namespace TesseraAsync {
AsyncSystem::AsyncSystem(
    const std::shared_ptr<ITaskProcessor>& pTaskProcessor) noexcept
    : _pSchedulers(std::make_shared<Impl::AsyncSystemSchedulers>(pTaskProcessor)) {
}

bool AsyncSystem::operator==(const AsyncSystem& rhs) const noexcept {
  return this->_pSchedulers == rhs._pSchedulers;
}

} // namespace TesseraAsync
