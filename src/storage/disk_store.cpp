#include "disk_store.hpp"
#include <fstream>
#include <stdexcept>
#include "../codec/json_codec.hpp"
#include "../core/logger/logger.hpp"

namespace Trawl {
namespace Storage {

using Trawl::Core::Logger;

DiskStore::DiskStore(const std::string& base_path) : base_path_(base_path) {
    std::error_code ec;
    std::filesystem::create_directories(base_path_, ec);
    if (ec) {
        Logger::error("Failed to create storage directory: " + base_path + " (" + ec.message() +
                      ")");
    }
}

std::filesystem::path DiskStore::path_for(const std::string& id) const {
    if (id.empty() || id.find_first_of("/\\") != std::string::npos || id.find("..") != std::string::npos)
        throw std::runtime_error("invalid job id: " + id);
    return base_path_ / (id + ".json");
}

void DiskStore::save(const Engine::JobResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::filesystem::create_directories(base_path_);

    auto path = path_for(result.id);
    auto tmp  = path;
    tmp += ".tmp";
    try {
        {
            std::ofstream file(tmp, std::ios::out | std::ios::trunc);
            if (!file.is_open())
                throw std::runtime_error("Write Error: " + tmp.string());
            file << Codec::dump(Codec::to_json(result), 2);
            if (!file)
                throw std::runtime_error("Write Error: " + tmp.string());
        }
        std::filesystem::rename(tmp, path);
    } catch (const std::exception&) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        throw;
    }
    Logger::success("Saved: " + path.string());
}

std::optional<Engine::JobResult> DiskStore::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::filesystem::path       path;
    try {
        path = path_for(id);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
    if (!std::filesystem::exists(path))
        return std::nullopt;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::error("Read Error: " + path.string());
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        Logger::error("Corrupt job record: " + path.string());
        return std::nullopt;
    }
    try {
        return Codec::result_from_json(j);
    } catch (const std::runtime_error& e) {
        Logger::error(path.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool DiskStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code             ec;
    std::filesystem::path       path;
    try {
        path = path_for(id);
    } catch (const std::runtime_error&) {
        return false;
    }
    bool removed = std::filesystem::remove(path, ec);
    if (ec)
        Logger::error("FS Error: " + ec.message());
    return removed;
}

std::vector<std::string> DiskStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    ids;
    std::error_code             ec;
    for (const auto& entry : std::filesystem::directory_iterator(base_path_, ec)) {
        if (entry.path().extension() == ".json")
            ids.push_back(entry.path().stem().string());
    }
    if (ec)
        Logger::error("FS Error: " + ec.message());
    return ids;
}

}  // namespace Storage
}  // namespace Trawl
