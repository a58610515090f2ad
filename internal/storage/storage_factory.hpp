#pragma once

#include "blob_store.hpp"
#include "config/config.pb.h"

namespace masterplan::storage {

/*
  Builds the blob stores from configuration.

      auto stores = StorageFactory::Build(config.storage());
      stores.releases->Write(key, buffer);
*/

class StorageFactory {
public:
  struct Stores {
    // project artifacts: releases and uploads
    BlobStorePtr releases;
    // per-job scratch output, always local
    BlobStorePtr scratch;
  };

  static Stores Build(const masterplan::runtime::config::StorageConfig& cfg);
};

} // namespace masterplan::storage
