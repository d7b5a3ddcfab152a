#pragma once

#include "uidgen/core/unique_id.h"

#include <functional>
#include <utility>
#include <vector>

namespace uidgen::core {

// IUniqueIdListener is notified of every identifier a UuidGenerator produces.
//
// Contract:
// - on_generated() is called exactly once per generate() call, synchronously, on the
//   generating thread, in generation order, before generate() returns.
// - Exceptions thrown by on_generated() propagate out of generate() unchanged.
class IUniqueIdListener {
 public:
  virtual ~IUniqueIdListener() = default;

  virtual void on_generated(const UniqueId& id) = 0;

 protected:
  IUniqueIdListener() = default;
  IUniqueIdListener(const IUniqueIdListener&) = default;
  IUniqueIdListener& operator=(const IUniqueIdListener&) = default;
  IUniqueIdListener(IUniqueIdListener&&) = default;
  IUniqueIdListener& operator=(IUniqueIdListener&&) = default;
};

// CallbackListener adapts a callable to IUniqueIdListener.
class CallbackListener final : public IUniqueIdListener {
 public:
  using Callback = std::function<void(const UniqueId&)>;

  explicit CallbackListener(Callback callback) : callback_(std::move(callback)) {}

  void on_generated(const UniqueId& id) override;

 private:
  Callback callback_;
};

// CompositeListener forwards each notification to every added listener, in the order
// they were added. Holds references (not ownership); listeners must outlive it.
// If a listener throws, later listeners are not notified for that identifier.
class CompositeListener final : public IUniqueIdListener {
 public:
  void add(IUniqueIdListener& listener) { listeners_.push_back(&listener); }
  [[nodiscard]] bool empty() const { return listeners_.empty(); }
  [[nodiscard]] std::size_t size() const { return listeners_.size(); }

  void on_generated(const UniqueId& id) override;

 private:
  std::vector<IUniqueIdListener*> listeners_;
};

}  // namespace uidgen::core
