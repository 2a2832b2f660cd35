#include "request_processor.hpp"
#include "protocol/diff.hpp"
#include "server/lod_sampler.hpp"
#include <utility>

namespace terrastream::server {

using namespace terrastream::protocol;

PreparedResponse prepare_response(const RequestHeader& header,
                                  const ChunkSession& session,
                                  ChunkSource& source) {
    PreparedResponse response;
    response.key = header.key();

    // Validate the LOD before touching the data source
    header.lod().stride(source.chunk_size());

    Grid native = source.load_chunk(header.cx, header.cy);
    response.grid = sample_lod(native, header.lod());

    const Grid* previous = session.last_sent(response.key);
    if (!header.force_full() && previous) {
        response.payload = compute_delta(previous->to_payload(), response.grid.to_payload());
        response.incremental = true;
    } else {
        response.payload = response.grid.to_payload();
    }
    return response;
}

} // namespace terrastream::server
