#include "uidgen/core/listener.h"

namespace uidgen::core {

void CallbackListener::on_generated(const UniqueId& id) {
  if (callback_) {
    callback_(id);
  }
}

void CompositeListener::on_generated(const UniqueId& id) {
  for (IUniqueIdListener* listener : listeners_) {
    listener->on_generated(id);
  }
}

}  // namespace uidgen::core
