#include "nicknym/storage/document_store.hpp"
#include "nicknym/utils/tools.hpp"

namespace nicknym {
namespace storage {

namespace {

// 字段值是否等于索引值
bool fieldMatches(const json& field, const std::string& value) {
    if (field.is_string()) {
        return field.get<std::string>() == value;
    }
    if (field.is_boolean()) {
        return (field.get<bool>() ? "1" : "0") == value;
    }
    if (field.is_number_integer()) {
        return std::to_string(field.get<int64_t>()) == value;
    }
    if (field.is_array()) {
        for (const auto& element : field) {
            if (fieldMatches(element, value)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

bool MatchesIndex(const json& content,
                  const std::vector<std::string>& fields,
                  const std::vector<std::string>& values) {
    if (fields.size() != values.size() || !content.is_object()) {
        return false;
    }

    for (size_t i = 0; i < fields.size(); ++i) {
        auto it = content.find(fields[i]);
        if (it == content.end() || !fieldMatches(*it, values[i])) {
            return false;
        }
    }
    return true;
}

Result<std::string> ComputeRevision(const json& content) {
    std::string serialized = content.dump();
    auto hashResult = utils::CalculateSHA256Hash(
        std::vector<uint8_t>(serialized.begin(), serialized.end()));
    if (!hashResult.ok()) {
        return hashResult.error();
    }
    return utils::HexEncode(hashResult.value());
}

Error CheckIndexDefinition(const std::map<std::string, std::vector<std::string>>& indexes,
                           const std::string& name,
                           const std::vector<std::string>& fields) {
    if (name.empty() || fields.empty()) {
        return Error(ErrorCode::InvalidArgument, "Index needs a name and at least one field");
    }
    auto it = indexes.find(name);
    if (it != indexes.end() && it->second != fields) {
        return Error(ErrorCode::InvalidArgument,
                     "Index " + name + " already exists with fields " + utils::VectorToString(it->second));
    }
    return Error();
}

} // namespace storage
} // namespace nicknym
