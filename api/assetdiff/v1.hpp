#pragma once

#include "assetdiff/jobs/v1/job.pb.h"
#include "assetdiff/report/v1/report.pb.h"
#include "assetdiff/tool/v1/asset_tool.pb.h"

#include "assetdiff/services/v1/intake_service.pb.h"
#include "assetdiff/services/v1/intake_service.grpc.pb.h"

namespace assetdiff::v1 {
using namespace ::assetdiff::jobs::v1;
using namespace ::assetdiff::report::v1;
using namespace ::assetdiff::tool::v1;
using namespace ::assetdiff::services::v1;
}
