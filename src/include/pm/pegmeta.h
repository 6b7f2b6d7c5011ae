// Umbrella header for the pegmeta library
#pragma once

#include <pm/batch.h>
#include <pm/closure.h>
#include <pm/core_policy.h>
#include <pm/discover.h>
#include <pm/errors.h>
#include <pm/launch.h>
#include <pm/log.h>
#include <pm/metadata.h>
#include <pm/model.h>
#include <pm/path_segments.h>
