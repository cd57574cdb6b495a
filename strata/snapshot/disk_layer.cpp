// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "disk_layer.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <strata/core/common/util.hpp>
#include <strata/infra/common/ensure.hpp>
#include <strata/infra/common/log.hpp>
#include <strata/snapshot/diff_layer.hpp>
#include <strata/snapshot/errors.hpp>

namespace strata::snapshot {

DiskLayer::DiskLayer(const Hash& root,
                     StateVersion version,
                     BlockNum block_num,
                     std::shared_ptr<const DiskStore> store,
                     std::shared_ptr<const WriteBuffer> buffer,
                     std::shared_ptr<Context> context)
    : root_{root},
      version_{version},
      block_num_{block_num},
      store_{std::move(store)},
      buffer_{buffer ? std::move(buffer) : std::make_shared<const WriteBuffer>()},
      context_{std::move(context)} {
    ensure(store_ != nullptr, "disk layer requires a backing store");
    ensure(context_ != nullptr, "disk layer requires a context");
}

std::optional<Bytes> DiskLayer::read(const StateKey& key) const {
    if (const Bytes* value{buffer_->find(key)}) {
        if (value->empty()) return std::nullopt;
        return *value;
    }
    if (buffer_->is_destructed(key)) {
        return std::nullopt;
    }
    context_->metrics.mark(context_->metrics.disk_reads);
    return store_->read(key);
}

Bytes DiskLayer::node(const Hash& owner, ByteView path, const Hash& expected_hash) const {
    Bytes blob{read(StateKey::trie_node(owner, path)).value_or(Bytes{})};
    const Hash actual{blob.empty() ? Hash{} : keccak256_as_bytes32(blob)};
    if (actual != expected_hash) {
        STRATA_ERROR_M("Unexpected trie node in disk layer", {"owner", to_hex(owner, true),
                                                               "path", to_hex(path, true),
                                                               "expect", to_hex(expected_hash, true),
                                                               "got", to_hex(actual, true)});
        throw UnexpectedNodeError{"disk", expected_hash, actual, owner, path};
    }
    return blob;
}

bool DiskLayer::exceeds_limits(const WriteBuffer& buffer) const {
    return buffer.memory() > context_->config.aggregator_memory_limit ||
           buffer.items() > context_->config.aggregator_item_limit;
}

std::shared_ptr<DiskLayer> DiskLayer::commit(const DiffLayer& bottom, bool force) {
    if (is_stale()) {
        throw SnapshotException{SnapshotError::kStaleLayer, "commit on disk layer " + to_hex(root_, true)};
    }
    ensure_invariant(bottom.version() > version_, [&] {
        return "flattened layer version " + std::to_string(bottom.version()) +
               " not above disk layer version " + std::to_string(version_);
    });

    auto buffer{std::make_shared<WriteBuffer>(*buffer_)};
    buffer->merge(bottom.writes(), bottom.destructs());

    std::shared_ptr<const DiskStore> store{store_};
    if (force || exceeds_limits(*buffer)) {
        const auto start{std::chrono::steady_clock::now()};
        store = store_->commit(*buffer);
        const auto elapsed{
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start)};
        STRATA_DEBUG_M("Committed write buffer to disk", {"version", std::to_string(bottom.version()),
                                                          "block", std::to_string(bottom.block_num()),
                                                          "items", std::to_string(buffer->items()),
                                                          "size", human_size(buffer->memory()),
                                                          "forced", force ? "true" : "false",
                                                          "elapsed", std::to_string(elapsed.count()) + "us"});
        context_->metrics.mark(context_->metrics.buffer_flushes);
        buffer = std::make_shared<WriteBuffer>();
    }

    auto disk{std::make_shared<DiskLayer>(bottom.root(), bottom.version(), bottom.block_num(),
                                          std::move(store), std::move(buffer), context_)};
    stale_.store(true, std::memory_order_release);
    return disk;
}

}  // namespace strata::snapshot
