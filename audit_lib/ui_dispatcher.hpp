#pragma once
#include <functional>

// Hands work over to the interface's execution context.
// post() may be called from any thread; tasks run on the interface
// context in the order they were posted.
class UiDispatcher {
public:
  virtual ~UiDispatcher() = default;
  virtual void post(std::function<void()> task) = 0;
};
