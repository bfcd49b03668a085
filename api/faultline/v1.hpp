#pragma once

#include "config/config.pb.h"

#include "internal/error/code.hpp"
#include "internal/error/context.hpp"
#include "internal/error/error.hpp"
#include "internal/error/field.hpp"
#include "internal/error/kind.hpp"
#include "internal/error/metadata.hpp"

#include "internal/display/display_mode.hpp"
#include "internal/render/renderer.hpp"

#include "internal/protocol/http_status.hpp"
#include "internal/protocol/mapping_registry.hpp"
#include "internal/protocol/problem_details.hpp"

#include "internal/telemetry/sinks.hpp"

namespace faultline::v1 {
using namespace ::faultline;
using namespace ::faultline::display;
using namespace ::faultline::protocol;
using namespace ::faultline::render;
using namespace ::faultline::telemetry;
using ::faultline::runtime::config::RuntimeConfig;
}
