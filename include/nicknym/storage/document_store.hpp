#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "nicknym/types.hpp"

namespace nicknym {
namespace storage {

using json = nlohmann::json;

// 存储中的一条文档
struct Document {
    std::string id;
    std::string rev;    // 内容的SHA-256，写入时更新
    json content;
};

// 带二级索引的本地文档存储接口
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // 以新ID创建文档
    virtual Result<Document> CreateDoc(const json& content) = 0;

    virtual Result<Document> GetDoc(const std::string& docId) = 0;

    // 写入已有文档，doc.rev 会被更新
    virtual Error PutDoc(Document& doc) = 0;

    virtual Error DeleteDoc(const std::string& docId) = 0;

    // 创建索引。同名同字段重复创建不是错误
    virtual Error CreateIndex(const std::string& name, const std::vector<std::string>& fields) = 0;

    // 按索引字段的值查询，values 与索引字段一一对应
    virtual Result<std::vector<Document>> GetFromIndex(const std::string& name,
                                                       const std::vector<std::string>& values) = 0;

    virtual std::vector<std::string> ListIndexes() = 0;

    virtual std::string Location() const = 0;
};

// 文档内容是否满足索引条件。
// 字符串按原值比较，布尔值索引为 "1"/"0"，数组只要有一个元素相等即可。
bool MatchesIndex(const json& content,
                  const std::vector<std::string>& fields,
                  const std::vector<std::string>& values);

// 计算文档修订号
Result<std::string> ComputeRevision(const json& content);

// 校验索引定义，同名索引字段不同时返回错误
Error CheckIndexDefinition(const std::map<std::string, std::vector<std::string>>& indexes,
                           const std::string& name,
                           const std::vector<std::string>& fields);

} // namespace storage
} // namespace nicknym
