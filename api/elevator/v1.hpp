#pragma once

#include "elevator/v1/types.pb.h"

#include "elevator/v1/admin_service.pb.h"
#include "elevator/v1/dispatch_service.pb.h"

#include "elevator/v1/admin_service.grpc.pb.h"
#include "elevator/v1/dispatch_service.grpc.pb.h"
