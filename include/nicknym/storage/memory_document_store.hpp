#pragma once

#include "nicknym/storage/document_store.hpp"
#include <map>
#include <mutex>

namespace nicknym {
namespace storage {

// 内存文档存储实现
class MemoryDocumentStore : public DocumentStore {
public:
    MemoryDocumentStore() = default;

    Result<Document> CreateDoc(const json& content) override;
    Result<Document> GetDoc(const std::string& docId) override;
    Error PutDoc(Document& doc) override;
    Error DeleteDoc(const std::string& docId) override;
    Error CreateIndex(const std::string& name, const std::vector<std::string>& fields) override;
    Result<std::vector<Document>> GetFromIndex(const std::string& name,
                                               const std::vector<std::string>& values) override;
    std::vector<std::string> ListIndexes() override;
    std::string Location() const override;

private:
    std::mutex mutex_;
    std::map<std::string, Document> docs_;
    std::map<std::string, std::vector<std::string>> indexes_;
};

} // namespace storage
} // namespace nicknym
