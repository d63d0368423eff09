#pragma once

#include "flowstead/core/v1/types.pb.h"

#include "flowstead/history/v1/history.pb.h"

#include "flowstead/runtime/v1/task.pb.h"

#include "flowstead/services/v1/task_service.pb.h"
#include "flowstead/services/v1/workflow_service.pb.h"

namespace flowstead::v1 {
using namespace ::flowstead::core::v1;
using namespace ::flowstead::history::v1;
using namespace ::flowstead::runtime::v1;
using namespace ::flowstead::services::v1;
}
