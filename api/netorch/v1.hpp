#pragma once

#include "netorch/v1/types.pb.h"
#include "netorch/v1/orchestrator_service.pb.h"
