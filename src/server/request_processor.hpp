#pragma once

#include "protocol/chunk_key.hpp"
#include "protocol/grid.hpp"
#include "protocol/request_header.hpp"
#include "protocol/payload.hpp"
#include "server/chunk_session.hpp"
#include "server/chunk_source.hpp"

namespace terrastream::server {

struct PreparedResponse {
    protocol::SessionKey key;
    protocol::Grid grid;          // sampled grid; becomes the session entry once delivered
    protocol::Payload payload;    // full grid or a delta against the session entry
    bool incremental = false;     // payload is a delta
};

// Processing step of one request: load the native chunk, sample it at the
// requested LOD and choose a full or incremental payload. The session is
// only read here; the caller records the grid after delivery succeeds.
// Throws InvalidRequest for an unusable LOD.
PreparedResponse prepare_response(const protocol::RequestHeader& header,
                                  const ChunkSession& session,
                                  ChunkSource& source);

} // namespace terrastream::server
