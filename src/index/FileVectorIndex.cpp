#include "index/FileVectorIndex.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

using namespace tl::index;
using namespace tl::index::model;

FileVectorIndex::FileVectorIndex(std::filesystem::path file) : file_(std::move(file)) {
    load();
}

void FileVectorIndex::load() {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) return;

    try {
        const auto j = nlohmann::json::parse(util::readFileToString(file_));
        std::scoped_lock lock(mutex_);
        for (const auto& r : j.at("records")) {
            auto rec = r.get<EmbeddingRecord>();
            records_.emplace(rec.chunkHash, std::move(rec));
        }
        log::Registry::index()->debug("[FileVectorIndex] Loaded {} records from {}", records_.size(), file_.string());
    } catch (const nlohmann::json::exception& e) {
        log::Registry::index()->error("[FileVectorIndex] Corrupt index file {}: {}", file_.string(), e.what());
        throw SnapshotError("Corrupt embedding index " + file_.string() + ": " + e.what());
    } catch (const ProtocolError& e) {
        log::Registry::index()->error("[FileVectorIndex] Corrupt record in {}: {}", file_.string(), e.what());
        throw SnapshotError("Corrupt embedding index " + file_.string() + ": " + e.what());
    }
}

void FileVectorIndex::flush() {
    nlohmann::json j;
    {
        std::scoped_lock lock(mutex_);
        j["records"] = nlohmann::json::array();
        for (const auto& [_, rec] : records_) j["records"].push_back(rec);
    }
    util::writeFileAtomic(file_, j.dump());
}
