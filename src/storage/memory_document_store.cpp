#include "nicknym/storage/memory_document_store.hpp"
#include "nicknym/utils/tools.hpp"

namespace nicknym {
namespace storage {

Result<Document> MemoryDocumentStore::CreateDoc(const json& content) {
    auto revResult = ComputeRevision(content);
    if (!revResult.ok()) {
        return revResult.error();
    }

    Document doc;
    doc.id = utils::GenerateDocID();
    doc.rev = revResult.value();
    doc.content = content;

    std::lock_guard<std::mutex> lock(mutex_);
    docs_[doc.id] = doc;
    return doc;
}

Result<Document> MemoryDocumentStore::GetDoc(const std::string& docId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = docs_.find(docId);
    if (it == docs_.end()) {
        return Error(ErrorCode::StorageFailure, "Document not found: " + docId);
    }
    return it->second;
}

Error MemoryDocumentStore::PutDoc(Document& doc) {
    auto revResult = ComputeRevision(doc.content);
    if (!revResult.ok()) {
        return revResult.error();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = docs_.find(doc.id);
    if (it == docs_.end()) {
        return Error(ErrorCode::StorageFailure, "Document not found: " + doc.id);
    }
    doc.rev = revResult.value();
    it->second = doc;
    return Error();
}

Error MemoryDocumentStore::DeleteDoc(const std::string& docId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (docs_.erase(docId) == 0) {
        return Error(ErrorCode::StorageFailure, "Document not found: " + docId);
    }
    return Error();
}

Error MemoryDocumentStore::CreateIndex(const std::string& name, const std::vector<std::string>& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    Error err = CheckIndexDefinition(indexes_, name, fields);
    if (err.hasError()) {
        return err;
    }
    indexes_[name] = fields;
    return Error();
}

Result<std::vector<Document>> MemoryDocumentStore::GetFromIndex(const std::string& name,
                                                                const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto indexIt = indexes_.find(name);
    if (indexIt == indexes_.end()) {
        return Error(ErrorCode::StorageFailure, "Index does not exist: " + name);
    }
    if (indexIt->second.size() != values.size()) {
        return Error(ErrorCode::InvalidArgument, "Wrong number of values for index " + name);
    }

    std::vector<Document> result;
    for (const auto& pair : docs_) {
        if (MatchesIndex(pair.second.content, indexIt->second, values)) {
            result.push_back(pair.second);
        }
    }
    return result;
}

std::vector<std::string> MemoryDocumentStore::ListIndexes() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& pair : indexes_) {
        names.push_back(pair.first);
    }
    return names;
}

std::string MemoryDocumentStore::Location() const {
    return "memory";
}

} // namespace storage
} // namespace nicknym
