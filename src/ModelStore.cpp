#include "ModelStore.hpp"
#include "FaceAIError.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace faceAI {

MappedModel::MappedModel(const std::string& path) : path_(path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd == -1) {
        throw ModelLoadError("failed to open " + path + ": " + std::string(strerror(errno)));
    }

    struct stat sb;
    if (fstat(fd, &sb) == -1) {
        std::string reason = strerror(errno);
        close(fd);
        throw ModelLoadError("failed to stat " + path + ": " + reason);
    }

    if (sb.st_size <= 0) {
        close(fd);
        throw ModelLoadError("model file is empty: " + path);
    }

    void* addr = mmap(nullptr, static_cast<size_t>(sb.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
    if (addr == MAP_FAILED) {
        std::string reason = strerror(errno);
        close(fd);
        throw ModelLoadError("failed to map " + path + ": " + reason);
    }

    // The mapping stays valid after the descriptor is closed
    close(fd);
    data_ = addr;
    size_ = static_cast<size_t>(sb.st_size);
}

MappedModel::~MappedModel() {
    release();
}

MappedModel::MappedModel(MappedModel&& other) noexcept
    : path_(std::move(other.path_)),
      data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)) {}

MappedModel& MappedModel::operator=(MappedModel&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        data_ = std::exchange(other.data_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

void MappedModel::release() {
    if (data_ != nullptr) {
        munmap(data_, size_);
        data_ = nullptr;
        size_ = 0;
    }
}

ModelStore::ModelStore(const std::string& modelsDir) : models_dir_(modelsDir) {}

std::string ModelStore::resolve(const std::string& modelName) const {
    fs::path modelPath(modelName);
    if (modelPath.is_absolute()) {
        return modelPath.string();
    }
    return (fs::path(models_dir_) / modelPath).string();
}

MappedModel ModelStore::open(const std::string& modelName) const {
    std::string path = resolve(modelName);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ModelLoadError("model file not found: " + path);
    }
    return MappedModel(path);
}

} // namespace faceAI
