#pragma once

#include "streamgate/v1/types.pb.h"

#include "streamgate/v1/admin_service.pb.h"
#include "streamgate/v1/catalog_service.pb.h"
#include "streamgate/v1/ledger_service.pb.h"
#include "streamgate/v1/origin_service.pb.h"

#include "streamgate/v1/admin_service.grpc.pb.h"
#include "streamgate/v1/catalog_service.grpc.pb.h"
#include "streamgate/v1/ledger_service.grpc.pb.h"
#include "streamgate/v1/origin_service.grpc.pb.h"
