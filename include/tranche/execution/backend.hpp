#pragma once

#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/storage/rocksdb/storage.hpp>

namespace tranche::execution {

using encoder_t = tranche::schema::encoding::encoder<
    tranche::schema::encoding::scale_encoder_tag>;
using storage_t =
    tranche::storage::storage<tranche::storage::rocksdb_storage_tag>;

}  // namespace tranche::execution
