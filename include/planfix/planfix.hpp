#pragma once

#include "planfix/geodesy.hpp"
#include "planfix/logging.hpp"
#include "planfix/plan_store.hpp"
#include "planfix/plan_transform.hpp"
#include "planfix/result.hpp"
#include "planfix/saved_plan.hpp"
#include "planfix/transform_engine.hpp"
#include "planfix/types.hpp"
#include "planfix/viewport.hpp"

namespace planfix {

constexpr const char* VERSION = "0.1.0";

} // namespace planfix
