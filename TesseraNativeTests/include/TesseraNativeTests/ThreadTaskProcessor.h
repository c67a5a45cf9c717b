#pragma once

#include <TesseraAsync/ITaskProcessor.h>

#include <functional>
#include <thread>

namespace TesseraNativeTests {
class ThreadTaskProcessor : public TesseraAsync::ITaskProcessor {
public:
  virtual void startTask(std::function<void()> f) override {
    std::thread(f).detach();
  }
};
} // namespace TesseraNativeTests
