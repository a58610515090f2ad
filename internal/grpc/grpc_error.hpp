#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace masterplan::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    ValidationError                     -> INVALID_ARGUMENT (all errors joined)
    NotFound                            -> NOT_FOUND
    ConcurrencyError                    -> ABORTED   (draft already has a job)
    InvalidState, SourceAssetError,
    GeometryError                       -> FAILED_PRECONDITION
    StorageError                        -> UNAVAILABLE
    Cancelled                           -> CANCELLED
    anything else                       -> INTERNAL

  Job failures never reach here; they end up in JobState.error.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace masterplan::grpc
