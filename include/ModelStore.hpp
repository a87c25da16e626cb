#pragma once

#include <cstddef>
#include <string>

namespace faceAI {

// Read-only memory mapping of a model file, unmapped on destruction
class MappedModel {
public:
    // Throws ModelLoadError if the file cannot be opened or mapped
    explicit MappedModel(const std::string& path);
    ~MappedModel();

    MappedModel(const MappedModel&) = delete;
    MappedModel& operator=(const MappedModel&) = delete;
    MappedModel(MappedModel&& other) noexcept;
    MappedModel& operator=(MappedModel&& other) noexcept;

    const void* data() const { return data_; }
    size_t size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    void release();

    std::string path_;
    void* data_ = nullptr;
    size_t size_ = 0;
};

// Supplies model blobs by name from a directory
class ModelStore {
public:
    explicit ModelStore(const std::string& modelsDir);

    // Absolute names are used as-is, relative names resolve against the directory
    std::string resolve(const std::string& modelName) const;

    // Throws ModelLoadError for a missing or unmappable file
    MappedModel open(const std::string& modelName) const;

    const std::string& directory() const { return models_dir_; }

private:
    std::string models_dir_;
};

} // namespace faceAI
