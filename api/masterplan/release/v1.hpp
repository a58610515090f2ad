#pragma once

#include "masterplan/release/v1/draft.pb.h"
#include "masterplan/release/v1/geometry.pb.h"
#include "masterplan/release/v1/job.pb.h"
#include "masterplan/release/v1/manifest.pb.h"

#include "masterplan/services/v1/publish_service.grpc.pb.h"
#include "masterplan/services/v1/publish_service.pb.h"

namespace masterplan::release::v1 {
using namespace ::masterplan::services::v1;
}
