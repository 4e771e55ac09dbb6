#pragma once

#include "index/MemoryVectorIndex.hpp"

#include <filesystem>

namespace tl::index {

// MemoryVectorIndex persisted as JSON; flush() writes a temp file and renames it into place.
class FileVectorIndex final : public MemoryVectorIndex {
public:
    explicit FileVectorIndex(std::filesystem::path file);

    void flush() override;

    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;

    void load();
};

}
