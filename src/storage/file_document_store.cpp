#include "nicknym/storage/file_document_store.hpp"
#include "nicknym/utils/logger.hpp"
#include "nicknym/utils/tools.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace nicknym {
namespace storage {

namespace fs = std::filesystem;

FileDocumentStore::FileDocumentStore(const std::string& baseDir)
    : baseDir_(baseDir) {}

std::string FileDocumentStore::docPath(const std::string& docId) const {
    return baseDir_ + "/docs/" + docId + ".json";
}

std::string FileDocumentStore::indexPath() const {
    return baseDir_ + "/indexes.json";
}

Error FileDocumentStore::ensureDirs() {
    std::error_code ec;
    fs::create_directories(baseDir_ + "/docs", ec);
    if (ec) {
        return Error(ErrorCode::StorageFailure,
                     "Failed to create store directory " + baseDir_ + ": " + ec.message());
    }
    return Error();
}

Result<Document> FileDocumentStore::readDoc(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::StorageFailure, "Document not found: " + path);
    }

    try {
        json stored = json::parse(file);
        Document doc;
        doc.id = stored.at("id").get<std::string>();
        doc.rev = stored.at("rev").get<std::string>();
        doc.content = stored.at("content");

        auto revResult = ComputeRevision(doc.content);
        if (!revResult.ok()) {
            return revResult.error();
        }
        if (revResult.value() != doc.rev) {
            return Error(ErrorCode::StorageFailure, "Document revision mismatch, store corrupted: " + path);
        }
        return doc;
    } catch (const json::exception& e) {
        return Error(ErrorCode::StorageFailure, "Failed to parse document " + path + ": " + e.what());
    }
}

Error FileDocumentStore::writeDoc(const Document& doc) {
    Error err = ensureDirs();
    if (err.hasError()) {
        return err;
    }

    json stored = {
        {"id", doc.id},
        {"rev", doc.rev},
        {"content", doc.content}
    };

    // 先写临时文件再改名，避免写到一半的文档
    std::string path = docPath(doc.id);
    std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file) {
            return Error(ErrorCode::StorageFailure, "Failed to create file: " + tmpPath);
        }
        file << stored.dump();
        if (!file) {
            return Error(ErrorCode::StorageFailure, "Failed to write file: " + tmpPath);
        }
    }

    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        return Error(ErrorCode::StorageFailure, "Failed to store document " + doc.id + ": " + ec.message());
    }
    return Error();
}

Error FileDocumentStore::loadIndexes() {
    if (indexesLoaded_) {
        return Error();
    }

    std::ifstream file(indexPath());
    if (file) {
        try {
            json stored = json::parse(file);
            indexes_ = stored.get<std::map<std::string, std::vector<std::string>>>();
        } catch (const json::exception& e) {
            return Error(ErrorCode::StorageFailure, std::string("Failed to parse index definitions: ") + e.what());
        }
    }
    indexesLoaded_ = true;
    return Error();
}

Error FileDocumentStore::saveIndexes() {
    Error err = ensureDirs();
    if (err.hasError()) {
        return err;
    }

    std::ofstream file(indexPath(), std::ios::trunc);
    if (!file) {
        return Error(ErrorCode::StorageFailure, "Failed to write index definitions: " + indexPath());
    }
    file << json(indexes_).dump();
    return Error();
}

Result<Document> FileDocumentStore::CreateDoc(const json& content) {
    auto revResult = ComputeRevision(content);
    if (!revResult.ok()) {
        return revResult.error();
    }

    Document doc;
    doc.id = utils::GenerateDocID();
    doc.rev = revResult.value();
    doc.content = content;

    std::lock_guard<std::mutex> lock(mutex_);
    Error err = writeDoc(doc);
    if (err.hasError()) {
        return err;
    }
    return doc;
}

Result<Document> FileDocumentStore::GetDoc(const std::string& docId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return readDoc(docPath(docId));
}

Error FileDocumentStore::PutDoc(Document& doc) {
    auto revResult = ComputeRevision(doc.content);
    if (!revResult.ok()) {
        return revResult.error();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(docPath(doc.id))) {
        return Error(ErrorCode::StorageFailure, "Document not found: " + doc.id);
    }
    doc.rev = revResult.value();
    return writeDoc(doc);
}

Error FileDocumentStore::DeleteDoc(const std::string& docId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::remove(docPath(docId), ec)) {
        if (ec) {
            return Error(ErrorCode::StorageFailure, "Failed to remove document " + docId + ": " + ec.message());
        }
        return Error(ErrorCode::StorageFailure, "Document not found: " + docId);
    }
    return Error();
}

Error FileDocumentStore::CreateIndex(const std::string& name, const std::vector<std::string>& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    Error err = loadIndexes();
    if (err.hasError()) {
        return err;
    }
    err = CheckIndexDefinition(indexes_, name, fields);
    if (err.hasError()) {
        return err;
    }
    if (indexes_.count(name) > 0) {
        return Error();
    }
    indexes_[name] = fields;
    return saveIndexes();
}

Result<std::vector<Document>> FileDocumentStore::GetFromIndex(const std::string& name,
                                                              const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(mutex_);
    Error err = loadIndexes();
    if (err.hasError()) {
        return err;
    }

    auto indexIt = indexes_.find(name);
    if (indexIt == indexes_.end()) {
        return Error(ErrorCode::StorageFailure, "Index does not exist: " + name);
    }
    if (indexIt->second.size() != values.size()) {
        return Error(ErrorCode::InvalidArgument, "Wrong number of values for index " + name);
    }

    std::vector<Document> result;
    std::string docsDir = baseDir_ + "/docs";
    if (!fs::exists(docsDir)) {
        return result;
    }

    try {
        for (const auto& entry : fs::directory_iterator(docsDir)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") {
                continue;
            }
            auto docResult = readDoc(entry.path().string());
            if (!docResult.ok()) {
                return docResult.error();
            }
            if (MatchesIndex(docResult.value().content, indexIt->second, values)) {
                result.push_back(docResult.value());
            }
        }
    } catch (const fs::filesystem_error& e) {
        return Error(ErrorCode::StorageFailure, std::string("Failed to list documents: ") + e.what());
    }

    return result;
}

std::vector<std::string> FileDocumentStore::ListIndexes() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    Error err = loadIndexes();
    if (err.hasError()) {
        utils::GetLogger().Error("Failed to load index definitions",
            utils::LogContext().With("store", baseDir_).With("error", err.what()));
        return names;
    }
    for (const auto& pair : indexes_) {
        names.push_back(pair.first);
    }
    return names;
}

std::string FileDocumentStore::Location() const {
    return baseDir_;
}

} // namespace storage
} // namespace nicknym
