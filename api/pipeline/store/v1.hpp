#pragma once

#include "pipeline/store/v1/types.pb.h"
#include "pipeline/store/v1/geometry.pb.h"
#include "pipeline/store/v1/project.pb.h"
#include "pipeline/store/v1/job.pb.h"
#include "pipeline/store/v1/state.pb.h"
