#pragma once

// Public message types: the exported discovery report and the runtime config.

#include "config/config.pb.h"
#include "scout/discovery/v1/device.pb.h"

namespace scout::discovery::v1 {
using RuntimeConfig = ::scout::runtime::config::RuntimeConfig;
}
