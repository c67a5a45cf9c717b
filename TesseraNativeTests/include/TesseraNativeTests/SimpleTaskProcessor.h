#pragma once

#include <TesseraAsync/ITaskProcessor.h>

#include <functional>

namespace TesseraNativeTests {
class SimpleTaskProcessor : public TesseraAsync::ITaskProcessor {
public:
  virtual void startTask(std::function<void()> f) override { f(); }
};
} // namespace TesseraNativeTests
