#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "nicknym/types.hpp"

namespace nicknym {
namespace utils {

// 计算数据的SHA-256哈希
Result<std::vector<uint8_t>> CalculateSHA256Hash(const std::vector<uint8_t>& data);

// 将字节数组转换为十六进制字符串
std::string HexEncode(const std::vector<uint8_t>& data);

// 生成新的随机文档ID（去掉横线的uuid）
std::string GenerateDocID();

// 从 "Name <user@example.org>" 形式的用户ID中提取地址
std::string AddressFromUserID(const std::string& userId);

// 把查询参数拼到URL后面，参数值需已转义
std::string AppendQuery(const std::string& url, const std::string& query);

// 去掉URL末尾的斜杠
std::string TrimTrailingSlash(const std::string& url);

// 将vector转换为字符串表示（用于日志记录）
std::string VectorToString(const std::vector<std::string>& vec);

} // namespace utils
} // namespace nicknym
