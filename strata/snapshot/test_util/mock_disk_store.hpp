// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include <gmock/gmock.h>

#include <strata/core/common/bytes.hpp>
#include <strata/snapshot/disk_store.hpp>
#include <strata/snapshot/state_key.hpp>

namespace strata::snapshot::test_util {

//! \brief gMock mock class for DiskStore
class MockDiskStore : public DiskStore {
  public:
    MOCK_METHOD((std::optional<Bytes>), read, (const StateKey&), (const, override));
    MOCK_METHOD((std::shared_ptr<const DiskStore>), commit, (const WriteBuffer&), (const, override));
};

}  // namespace strata::snapshot::test_util
