#pragma once

#include "nicknym/storage/document_store.hpp"
#include <map>
#include <mutex>
#include <string>

namespace nicknym {
namespace storage {

// 文件系统文档存储：
//   <baseDir>/docs/<id>.json  每个文档一个文件 {"id","rev","content"}
//   <baseDir>/indexes.json    索引定义
// 读取时校验修订号，不一致视为本地数据损坏。
class FileDocumentStore : public DocumentStore {
public:
    explicit FileDocumentStore(const std::string& baseDir);

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
    std::string docPath(const std::string& docId) const;
    std::string indexPath() const;

    Error ensureDirs();
    Result<Document> readDoc(const std::string& path);
    Error writeDoc(const Document& doc);
    Error loadIndexes();
    Error saveIndexes();

    std::string baseDir_;
    std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> indexes_;
    bool indexesLoaded_ = false;
};

} // namespace storage
} // namespace nicknym
