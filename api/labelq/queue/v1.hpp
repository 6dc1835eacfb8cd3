#pragma once

#include "labelq/queue/v1/types.pb.h"

#include "labelq/queue/v1/admin_service.pb.h"
#include "labelq/queue/v1/queue_service.pb.h"
