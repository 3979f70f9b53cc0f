#pragma once

#include "dcm/core/date.h"
#include "dcm/core/result.h"
#include "dcm/storage/snapshot_store.h"

#include <string>

// read_snapshot returns the stored period snapshot re-rendered as indented JSON,
// or an error message when none is stored or the stored text does not parse.
dcm::core::Result<std::string, std::string> read_snapshot(
    const dcm::storage::ISnapshotStore& store, const dcm::core::Date& period_date);
