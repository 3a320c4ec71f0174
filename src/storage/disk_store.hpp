#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include "store.hpp"

namespace Trawl {
namespace Storage {

// One pretty-printed JSON document per job: <base_path>/<id>.json.
class DiskStore : public Store {
public:
    explicit DiskStore(const std::string& base_path);
    ~DiskStore() override = default;

    void                             save(const Engine::JobResult& result) override;
    std::optional<Engine::JobResult> load(const std::string& id) override;
    bool                             remove(const std::string& id) override;
    std::vector<std::string>         list() override;

private:
    std::filesystem::path base_path_;
    std::mutex            mutex_;

    std::filesystem::path path_for(const std::string& id) const;
};

}  // namespace Storage
}  // namespace Trawl
