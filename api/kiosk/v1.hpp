#pragma once

#include "config/config.pb.h"
#include "kiosk/v1/kiosk.pb.h"

namespace kiosk::v1 {
using RuntimeConfig = ::kiosk::runtime::config::RuntimeConfig;
}
