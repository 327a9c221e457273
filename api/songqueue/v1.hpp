#pragma once

#include "songqueue/v1/types.pb.h"

#include "songqueue/v1/catalog_service.pb.h"
#include "songqueue/v1/request_service.pb.h"
