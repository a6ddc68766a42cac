#pragma once

#include "core/model/TradeTypes.h"

namespace fvgscan {
namespace core {

class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual void emit(const NotificationEvent& event) = 0;
};

} // namespace core
} // namespace fvgscan
