#pragma once

#include <async++.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace TesseraAsync {
namespace Impl {
//! @cond Doxygen_Suppress

// Runs a task right away when the calling thread is already being dispatched
// by the wrapped scheduler, and defers to that scheduler otherwise.
template <typename TScheduler> class ImmediateScheduler {
public:
  explicit ImmediateScheduler(TScheduler* pScheduler) noexcept
      : _pScheduler(pScheduler) {}

  void schedule(async::task_run_handle t) {
    std::vector<TScheduler*>& inSuitable =
        ImmediateScheduler<TScheduler>::getSchedulersCurrentlyDispatching();
    if (std::find(inSuitable.begin(), inSuitable.end(), this->_pScheduler) !=
        inSuitable.end()) {
      t.run();
    } else {
      this->_pScheduler->schedule(std::move(t));
    }
  }

  // Marks the current thread as dispatched by the scheduler for the lifetime
  // of the scope.
  class SchedulerScope {
  public:
    SchedulerScope(TScheduler* pScheduler = nullptr) : _pScheduler(pScheduler) {
      if (this->_pScheduler) {
        ImmediateScheduler<TScheduler>::getSchedulersCurrentlyDispatching()
            .push_back(this->_pScheduler);
      }
    }

    ~SchedulerScope() noexcept { this->reset(); }

    SchedulerScope(SchedulerScope&& rhs) noexcept
        : _pScheduler(rhs._pScheduler) {
      rhs._pScheduler = nullptr;
    }

    SchedulerScope& operator=(SchedulerScope&& rhs) noexcept {
      std::swap(this->_pScheduler, rhs._pScheduler);
      return *this;
    }

    SchedulerScope(const SchedulerScope&) = delete;
    SchedulerScope& operator=(const SchedulerScope&) = delete;

    void reset() noexcept {
      if (this->_pScheduler) {
        std::vector<TScheduler*>& inSuitable =
            ImmediateScheduler<TScheduler>::getSchedulersCurrentlyDispatching();
        if (!inSuitable.empty() && inSuitable.back() == this->_pScheduler) {
          inSuitable.pop_back();
        }
        this->_pScheduler = nullptr;
      }
    }

  private:
    TScheduler* _pScheduler;
  };

  SchedulerScope scope() { return SchedulerScope(this->_pScheduler); }

private:
  TScheduler* _pScheduler;

  static std::vector<TScheduler*>&
  getSchedulersCurrentlyDispatching() noexcept {
    static thread_local std::vector<TScheduler*> schedulersCurrentlyDispatching;
    return schedulersCurrentlyDispatching;
  }
};

//! @endcond
} // namespace Impl
} // namespace TesseraAsync
