#pragma once

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace semantic_chunker {

using JsonDocument = rapidjson::Document;
using JsonValue = rapidjson::Value;
using JsonAllocator = rapidjson::MemoryPoolAllocator<>;

// Helper class for building the output document
class JsonBuilder {
public:
    JsonBuilder() : doc_(std::make_unique<JsonDocument>()) {
        doc_->SetObject();
    }

    JsonDocument& document() { return *doc_; }
    JsonAllocator& allocator() { return doc_->GetAllocator(); }

    // Copies `text` into the document's allocator
    JsonValue string(const std::string& text) {
        return JsonValue(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator());
    }

    JsonValue optional_string(const std::optional<std::string>& text) {
        return text ? string(*text) : JsonValue(rapidjson::kNullType);
    }

    JsonValue string_array(const std::vector<std::string>& items) {
        JsonValue array(rapidjson::kArrayType);
        for (const auto& item : items) {
            array.PushBack(string(item), allocator());
        }
        return array;
    }

    std::string serialize(bool pretty = true) const {
        rapidjson::StringBuffer buffer;

        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 2);
            doc_->Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            doc_->Accept(writer);
        }

        return std::string(buffer.GetString(), buffer.GetSize());
    }

private:
    std::unique_ptr<JsonDocument> doc_;
};

} // namespace semantic_chunker
