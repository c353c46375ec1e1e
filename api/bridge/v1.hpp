#pragma once

#include "bridge/v1/types.pb.h"

#include "bridge/v1/admin_service.pb.h"
#include "bridge/v1/bridge_service.pb.h"
#include "bridge/v1/relay_service.pb.h"

#include "bridge/v1/admin_service.grpc.pb.h"
#include "bridge/v1/bridge_service.grpc.pb.h"
#include "bridge/v1/relay_service.grpc.pb.h"
