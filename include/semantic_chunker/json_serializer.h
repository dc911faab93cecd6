#pragma once

#include "semantic_chunker/semantic_chunker.h"

#include <string>

namespace semantic_chunker {

class JsonSerializer {
public:
    // Output document: { document, total_pages, total_chunks, chunking_config,
    // detailed_statistics, chunks }. Absent optionals are written as null.
    static std::string serialize_result(const ChunkingResult& result, bool pretty = true);

    // Throws std::runtime_error if the file cannot be written
    static void write_result(const ChunkingResult& result, const std::string& output_path,
                             bool pretty = true);
};

} // namespace semantic_chunker
